#pragma once

#include <string>
#include <vector>
#include <list>
#include <unordered_map>
#include <mutex>
#include <cstdint>

// Bounded least-recently-used store of synthesized audio, keyed by a SHA-256
// digest of (trimmed text, voice identity). Shared by every connection; all
// access goes through the internal mutex.
class SynthesisCache {
public:
    explicit SynthesisCache(size_t max_entries);

    // Hit copies the audio out and promotes the entry to most recently used
    bool lookup(const std::string& text, const std::string& voice_key, std::vector<uint8_t>& audio);

    // Inserts or overwrites; evicts least recently used entries beyond the bound
    void store(const std::string& text, const std::string& voice_key, const std::vector<uint8_t>& audio);

    // Stores only if the voice has not been invalidated since `generation` was read.
    // Audio synthesized from a replaced sample is refused.
    bool store(const std::string& text, const std::string& voice_key, const std::vector<uint8_t>& audio,
               uint64_t generation);

    // Read before synthesis starts; invalidate_voice() advances it
    uint64_t generation(const std::string& voice_key) const;

    // Drops every entry synthesized for a voice (used when a voice sample is replaced)
    size_t invalidate_voice(const std::string& voice_key);

    bool contains(const std::string& text, const std::string& voice_key) const;
    size_t size() const;
    size_t max_entries() const { return max_entries_; }
    bool enabled() const { return max_entries_ > 0; }

    struct Stats {
        uint64_t hits = 0;
        uint64_t misses = 0;
        uint64_t evictions = 0;
        uint64_t stores = 0;
        uint64_t stale_refused = 0;
    };
    Stats stats() const;

    static std::string make_key(const std::string& text, const std::string& voice_key);

private:
    struct Entry {
        std::string key;
        std::string voice_key;
        std::vector<uint8_t> audio;
    };

    size_t max_entries_;
    std::list<Entry> entries_;   // front = most recently used
    std::unordered_map<std::string, std::list<Entry>::iterator> index_;
    std::unordered_map<std::string, uint64_t> generations_;   // voice key -> invalidation count
    Stats stats_;
    mutable std::mutex mutex_;
};

// Lowercase hex SHA-256 of data (OpenSSL EVP). Empty string on failure.
std::string sha256_hex(const std::string& data);
std::string sha256_hex(const std::vector<uint8_t>& data);
