#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <nlohmann/json.hpp>

// Length-prefixed frames: [u8 type][u32 big-endian length][payload]
enum class FrameType : uint8_t {
    Text = 0x01,
    Binary = 0x02,
    Close = 0x08
};

struct Frame {
    FrameType type = FrameType::Text;
    std::vector<uint8_t> payload;

    std::string text() const { return std::string(payload.begin(), payload.end()); }
};

constexpr uint32_t kMaxFramePayload = 10 * 1024 * 1024;

// Robust I/O helpers to avoid partial reads/writes on TCP
bool read_exact(int fd, void* buf, size_t nbytes);
bool write_all(int fd, const void* buf, size_t nbytes);

// False on EOF, I/O error, unknown type or an oversized length
bool read_frame(int fd, Frame& frame);
bool write_frame(int fd, FrameType type, const uint8_t* data, size_t length);
bool write_text_frame(int fd, const std::string& text);
bool write_close_frame(int fd);
bool send_json(int fd, const nlohmann::json& message);

// Base64 through OpenSSL EVP. decode accepts an optional "data:...;base64," prefix
// and embedded whitespace.
std::string base64_encode(const std::vector<uint8_t>& data);
bool base64_decode(const std::string& text, std::vector<uint8_t>& data);
