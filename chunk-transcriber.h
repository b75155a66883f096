#pragma once

#include "inference-backend.h"
#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>

class ModelCoordinator;

// Sub-range of a finalized capture submitted to the recognizer in one call.
// overlap_length is the span shared with the previous chunk (0 for the first).
struct AudioChunk {
    size_t index = 0;
    size_t start_offset = 0;
    size_t length = 0;
    size_t overlap_length = 0;
};

struct TranscriptFragment {
    size_t chunk_index = 0;
    std::string text;
};

enum class TranscriptStatus {
    Ok,
    Empty,
    Failed
};

struct TranscriptResult {
    TranscriptStatus status = TranscriptStatus::Empty;
    std::string text;
    std::string reason;          // set for Failed
    size_t chunks_planned = 0;
    size_t chunks_recognized = 0;

    static TranscriptResult ok(const std::string& text) {
        TranscriptResult r; r.status = TranscriptStatus::Ok; r.text = text; return r;
    }
    static TranscriptResult empty() { return TranscriptResult(); }
    static TranscriptResult failed(const std::string& reason) {
        TranscriptResult r; r.status = TranscriptStatus::Failed; r.reason = reason; return r;
    }
};

struct ChunkingConfig {
    int max_chunk_ms = 10000;  // per-call ceiling
    int overlap_ms = 500;
    int min_chunk_ms = 300;    // windows shorter than this are not recognized
};

// Consecutive windows of chunk_bytes, each starting overlap_bytes before the
// previous one ended. A buffer that fits in one window yields a single chunk.
std::vector<AudioChunk> plan_chunks(size_t total_bytes, size_t chunk_bytes, size_t overlap_bytes);

// Stitching cleanup: collapse repeated sentence-ending marks, collapse whitespace
// runs, drop whitespace before punctuation. Applying it twice changes nothing.
std::string normalize_transcript(const std::string& text);

std::string trim_whitespace(const std::string& text);

class ChunkTranscriber {
public:
    ChunkTranscriber(ModelCoordinator& coordinator, const AudioFormat& format, const ChunkingConfig& config);

    TranscriptResult transcribe(const std::vector<uint8_t>& audio, const std::string& who);

    const AudioFormat& format() const { return format_; }
    size_t chunk_bytes() const { return chunk_bytes_; }
    size_t overlap_bytes() const { return overlap_bytes_; }
    size_t min_chunk_bytes() const { return min_chunk_bytes_; }

private:
    ModelCoordinator& coordinator_;
    AudioFormat format_;
    size_t chunk_bytes_;
    size_t overlap_bytes_;
    size_t min_chunk_bytes_;

    TranscriptResult transcribe_single(const std::vector<uint8_t>& audio, const std::string& who);
    TranscriptResult transcribe_chunked(const std::vector<uint8_t>& audio, const std::string& who);
};
