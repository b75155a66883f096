#include "chunk-transcriber.h"
#include "model-coordinator.h"
#include <iostream>
#include <algorithm>

static bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// UTF-8 encodings of the full-width marks produced by CJK models
static const char* const kSentenceEnders[] = { ".", "!", "?", "\xE3\x80\x82", "\xEF\xBC\x81", "\xEF\xBC\x9F" };
static const char* const kOtherPunctuation[] = { ",", ";", ":", "\xEF\xBC\x8C", "\xEF\xBC\x9B", "\xEF\xBC\x9A", "\xE3\x80\x81" };

static size_t match_any(const std::string& s, size_t pos, const char* const* marks, size_t n_marks) {
    for (size_t i = 0; i < n_marks; ++i) {
        const std::string mark(marks[i]);
        if (s.compare(pos, mark.size(), mark) == 0) return mark.size();
    }
    return 0;
}

static size_t sentence_ender_at(const std::string& s, size_t pos) {
    return match_any(s, pos, kSentenceEnders, sizeof(kSentenceEnders) / sizeof(kSentenceEnders[0]));
}

static size_t punctuation_at(const std::string& s, size_t pos) {
    size_t n = sentence_ender_at(s, pos);
    if (n) return n;
    return match_any(s, pos, kOtherPunctuation, sizeof(kOtherPunctuation) / sizeof(kOtherPunctuation[0]));
}

// "。 。。" -> "。", "!! !" -> "!"
static std::string collapse_repeated_enders(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    size_t i = 0;
    while (i < in.size()) {
        size_t n = sentence_ender_at(in, i);
        if (n == 0) {
            out.push_back(in[i++]);
            continue;
        }
        const std::string mark = in.substr(i, n);
        out += mark;
        i += n;
        for (;;) {
            size_t j = i;
            while (j < in.size() && is_space(in[j])) ++j;
            if (in.compare(j, mark.size(), mark) == 0) {
                i = j + mark.size();
            } else {
                break;
            }
        }
    }
    return out;
}

static std::string collapse_whitespace(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    bool pending_space = false;
    for (char c : in) {
        if (is_space(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) out.push_back(' ');
        pending_space = false;
        out.push_back(c);
    }
    return out;
}

static std::string drop_space_before_punctuation(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] == ' ' && punctuation_at(in, i + 1) > 0) continue;
        out.push_back(in[i]);
    }
    return out;
}

std::vector<AudioChunk> plan_chunks(size_t total_bytes, size_t chunk_bytes, size_t overlap_bytes) {
    std::vector<AudioChunk> chunks;
    if (total_bytes == 0) return chunks;

    if (chunk_bytes == 0 || total_bytes <= chunk_bytes) {
        AudioChunk only;
        only.length = total_bytes;
        chunks.push_back(only);
        return chunks;
    }
    if (overlap_bytes >= chunk_bytes) overlap_bytes = 0;

    size_t start = 0;
    for (size_t index = 0;; ++index) {
        size_t end = std::min(start + chunk_bytes, total_bytes);
        AudioChunk c;
        c.index = index;
        c.start_offset = start;
        c.length = end - start;
        c.overlap_length = index == 0 ? 0 : overlap_bytes;
        chunks.push_back(c);
        if (end >= total_bytes) break;
        start = end - overlap_bytes;
    }
    return chunks;
}

std::string trim_whitespace(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) return "";
    size_t end = text.find_last_not_of(" \t\n\r\f\v");
    return text.substr(start, end - start + 1);
}

std::string normalize_transcript(const std::string& text) {
    std::string result = collapse_repeated_enders(text);
    result = collapse_whitespace(result);
    result = drop_space_before_punctuation(result);
    return result;
}

ChunkTranscriber::ChunkTranscriber(ModelCoordinator& coordinator, const AudioFormat& format,
                                   const ChunkingConfig& config)
    : coordinator_(coordinator), format_(format),
      chunk_bytes_(format.bytes_for_ms(config.max_chunk_ms)),
      overlap_bytes_(format.bytes_for_ms(config.overlap_ms)),
      min_chunk_bytes_(format.bytes_for_ms(config.min_chunk_ms)) {
    if (overlap_bytes_ >= chunk_bytes_) {
        std::cout << "⚠️ Chunk overlap (" << config.overlap_ms << "ms) is not shorter than the chunk ("
                  << config.max_chunk_ms << "ms) - overlap disabled" << std::endl;
        overlap_bytes_ = 0;
    }
}

TranscriptResult ChunkTranscriber::transcribe(const std::vector<uint8_t>& audio, const std::string& who) {
    if (audio.empty()) {
        return TranscriptResult::empty();
    }
    if (chunk_bytes_ == 0 || audio.size() <= chunk_bytes_) {
        return transcribe_single(audio, who);
    }
    return transcribe_chunked(audio, who);
}

TranscriptResult ChunkTranscriber::transcribe_single(const std::vector<uint8_t>& audio, const std::string& who) {
    std::string text, error;
    if (!coordinator_.recognize(audio.data(), audio.size(), format_, text, error, who)) {
        TranscriptResult r = TranscriptResult::failed(error);
        r.chunks_planned = 1;
        return r;
    }

    TranscriptResult r = TranscriptResult::empty();
    std::string trimmed = trim_whitespace(text);
    if (!trimmed.empty()) r = TranscriptResult::ok(trimmed);
    r.chunks_planned = 1;
    r.chunks_recognized = 1;
    return r;
}

TranscriptResult ChunkTranscriber::transcribe_chunked(const std::vector<uint8_t>& audio, const std::string& who) {
    std::vector<AudioChunk> chunks = plan_chunks(audio.size(), chunk_bytes_, overlap_bytes_);
    std::cout << "✂️ [" << who << "] Long capture (" << format_.seconds_for_bytes(audio.size())
              << "s) split into " << chunks.size() << " chunks" << std::endl;

    std::vector<TranscriptFragment> fragments;
    size_t attempted = 0;
    size_t failures = 0;

    for (const auto& chunk : chunks) {
        if (chunk.length < min_chunk_bytes_) {
            // Trailing speech shorter than the floor is dropped, not merged into the previous window
            std::cout << "⏭️ [" << who << "] Skipping chunk " << chunk.index + 1 << " ("
                      << format_.seconds_for_bytes(chunk.length) << "s below floor)" << std::endl;
            continue;
        }

        attempted++;
        std::string text, error;
        if (!coordinator_.recognize(audio.data() + chunk.start_offset, chunk.length, format_, text, error, who)) {
            failures++;
            std::cout << "⚠️ [" << who << "] Chunk " << chunk.index + 1 << "/" << chunks.size()
                      << " failed: " << error << std::endl;
            continue;
        }

        std::string trimmed = trim_whitespace(text);
        if (!trimmed.empty()) {
            TranscriptFragment fragment;
            fragment.chunk_index = chunk.index;
            fragment.text = trimmed;
            fragments.push_back(fragment);
        }
    }

    TranscriptResult result = TranscriptResult::empty();
    if (fragments.empty()) {
        if (attempted > 0 && failures == attempted) {
            result = TranscriptResult::failed("all " + std::to_string(attempted) + " chunks failed");
        }
    } else {
        std::string joined;
        for (const auto& f : fragments) {
            if (!joined.empty()) joined.push_back(' ');
            joined += f.text;
        }
        std::string normalized = normalize_transcript(joined);
        if (!normalized.empty()) result = TranscriptResult::ok(normalized);
    }

    result.chunks_planned = chunks.size();
    result.chunks_recognized = attempted - failures;
    return result;
}
