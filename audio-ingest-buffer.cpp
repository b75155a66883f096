#include "audio-ingest-buffer.h"
#include <utility>

AudioIngestBuffer::AudioIngestBuffer(size_t min_usable_bytes, size_t max_buffer_bytes)
    : min_usable_bytes_(min_usable_bytes), max_buffer_bytes_(max_buffer_bytes) {}

void AudioIngestBuffer::on_start() {
    buffer_.clear();
    dropped_bytes_ = 0;
    listening_ = true;
}

bool AudioIngestBuffer::on_audio_frame(const uint8_t* data, size_t length) {
    if (!listening_ || length == 0) {
        return false;
    }
    if (max_buffer_bytes_ > 0 && buffer_.size() + length > max_buffer_bytes_) {
        dropped_bytes_ += length;
        return false;
    }
    buffer_.insert(buffer_.end(), data, data + length);
    return true;
}

std::vector<uint8_t> AudioIngestBuffer::on_stop() {
    listening_ = false;
    std::vector<uint8_t> out = std::move(buffer_);
    buffer_.clear();
    return out;
}
