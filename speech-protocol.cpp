#include "speech-protocol.h"
#include <cstring>
#include <cerrno>
#include <sys/socket.h>
#include <arpa/inet.h>
#include <openssl/evp.h>

bool read_exact(int fd, void* buf, size_t nbytes) {
    uint8_t* p = static_cast<uint8_t*>(buf);
    size_t off = 0;
    while (off < nbytes) {
        ssize_t m = recv(fd, p + off, nbytes - off, 0);
        if (m < 0 && errno == EINTR) continue;
        if (m <= 0) return false;
        off += static_cast<size_t>(m);
    }
    return true;
}

bool write_all(int fd, const void* buf, size_t nbytes) {
    const uint8_t* p = static_cast<const uint8_t*>(buf);
    size_t off = 0;
    while (off < nbytes) {
        ssize_t m = send(fd, p + off, nbytes - off, MSG_NOSIGNAL);
        if (m < 0 && errno == EINTR) continue;
        if (m <= 0) return false;
        off += static_cast<size_t>(m);
    }
    return true;
}

bool read_frame(int fd, Frame& frame) {
    uint8_t header[5];
    if (!read_exact(fd, header, sizeof(header))) return false;

    uint8_t type = header[0];
    if (type != static_cast<uint8_t>(FrameType::Text) &&
        type != static_cast<uint8_t>(FrameType::Binary) &&
        type != static_cast<uint8_t>(FrameType::Close)) {
        return false;
    }

    uint32_t length_be;
    memcpy(&length_be, header + 1, 4);
    uint32_t length = ntohl(length_be);
    if (length > kMaxFramePayload) return false;

    frame.type = static_cast<FrameType>(type);
    frame.payload.resize(length);
    if (length > 0 && !read_exact(fd, frame.payload.data(), length)) return false;
    return true;
}

bool write_frame(int fd, FrameType type, const uint8_t* data, size_t length) {
    if (length > kMaxFramePayload) return false;
    uint8_t header[5];
    header[0] = static_cast<uint8_t>(type);
    uint32_t length_be = htonl(static_cast<uint32_t>(length));
    memcpy(header + 1, &length_be, 4);
    if (!write_all(fd, header, sizeof(header))) return false;
    if (length > 0 && !write_all(fd, data, length)) return false;
    return true;
}

bool write_text_frame(int fd, const std::string& text) {
    return write_frame(fd, FrameType::Text, reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

bool write_close_frame(int fd) {
    return write_frame(fd, FrameType::Close, nullptr, 0);
}

bool send_json(int fd, const nlohmann::json& message) {
    // Replace invalid UTF-8 from model output instead of throwing
    return write_text_frame(fd, message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

std::string base64_encode(const std::vector<uint8_t>& data) {
    if (data.empty()) return "";
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data.data(), static_cast<int>(data.size()));
    out.resize(n > 0 ? static_cast<size_t>(n) : 0);
    return out;
}

bool base64_decode(const std::string& text, std::vector<uint8_t>& data) {
    data.clear();

    size_t start = 0;
    if (text.compare(0, 5, "data:") == 0) {
        size_t comma = text.find(',');
        if (comma == std::string::npos) return false;
        start = comma + 1;
    }

    std::string clean;
    clean.reserve(text.size() - start);
    for (size_t i = start; i < text.size(); ++i) {
        char c = text[i];
        if (c == ' ' || c == '\n' || c == '\r' || c == '\t') continue;
        clean.push_back(c);
    }
    if (clean.empty() || clean.size() % 4 != 0) return false;

    data.resize(3 * (clean.size() / 4));
    int n = EVP_DecodeBlock(data.data(), reinterpret_cast<const unsigned char*>(clean.data()),
                            static_cast<int>(clean.size()));
    if (n < 0) {
        data.clear();
        return false;
    }

    // EVP_DecodeBlock counts padding as zero bytes
    size_t padding = 0;
    if (clean[clean.size() - 1] == '=') padding++;
    if (clean[clean.size() - 2] == '=') padding++;
    data.resize(static_cast<size_t>(n) - padding);
    return true;
}
