#pragma once

#include <vector>
#include <cstddef>
#include <cstdint>

// Per-connection audio accumulator driven by start/stop control messages.
// Owned by one connection handler; not thread-safe.
class AudioIngestBuffer {
public:
    AudioIngestBuffer(size_t min_usable_bytes, size_t max_buffer_bytes);

    // Clears any previous audio and begins listening
    void on_start();

    // Appends while listening. Returns false when the frame was dropped.
    bool on_audio_frame(const uint8_t* data, size_t length);

    // Stops listening and hands over the accumulated audio; the buffer is left empty
    std::vector<uint8_t> on_stop();

    // Disconnect in the middle of a capture must be finalized like a stop
    bool needs_finalize_on_disconnect() const { return listening_ && !buffer_.empty(); }

    // Shorter captures carry no usable speech and are answered with an empty result
    bool is_usable(const std::vector<uint8_t>& audio) const { return audio.size() >= min_usable_bytes_; }

    bool is_listening() const { return listening_; }
    size_t size() const { return buffer_.size(); }
    size_t dropped_bytes() const { return dropped_bytes_; }

private:
    size_t min_usable_bytes_;
    size_t max_buffer_bytes_;
    bool listening_ = false;
    std::vector<uint8_t> buffer_;
    size_t dropped_bytes_ = 0;
};
