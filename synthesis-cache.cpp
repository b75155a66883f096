#include "synthesis-cache.h"
#include "chunk-transcriber.h"
#include <sstream>
#include <iomanip>
#include <openssl/evp.h>

static std::string sha256_hex_raw(const void* data, size_t length) {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) return "";

    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        return "";
    }

    if (EVP_DigestUpdate(ctx, data, length) != 1) {
        EVP_MD_CTX_free(ctx);
        return "";
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx, digest, &digest_len) != 1) {
        EVP_MD_CTX_free(ctx);
        return "";
    }

    EVP_MD_CTX_free(ctx);

    std::ostringstream ss;
    for (unsigned int i = 0; i < digest_len; i++) {
        ss << std::hex << std::setfill('0') << std::setw(2) << (int)digest[i];
    }
    return ss.str();
}

std::string sha256_hex(const std::string& data) {
    return sha256_hex_raw(data.data(), data.size());
}

std::string sha256_hex(const std::vector<uint8_t>& data) {
    return sha256_hex_raw(data.data(), data.size());
}

SynthesisCache::SynthesisCache(size_t max_entries) : max_entries_(max_entries) {}

std::string SynthesisCache::make_key(const std::string& text, const std::string& voice_key) {
    return sha256_hex(trim_whitespace(text) + "|" + voice_key);
}

bool SynthesisCache::lookup(const std::string& text, const std::string& voice_key, std::vector<uint8_t>& audio) {
    const std::string key = make_key(text, voice_key);
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = index_.find(key);
    if (it == index_.end()) {
        stats_.misses++;
        return false;
    }

    entries_.splice(entries_.begin(), entries_, it->second);
    audio = it->second->audio;
    stats_.hits++;
    return true;
}

void SynthesisCache::store(const std::string& text, const std::string& voice_key, const std::vector<uint8_t>& audio) {
    store(text, voice_key, audio, generation(voice_key));
}

uint64_t SynthesisCache::generation(const std::string& voice_key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = generations_.find(voice_key);
    return it == generations_.end() ? 0 : it->second;
}

bool SynthesisCache::store(const std::string& text, const std::string& voice_key, const std::vector<uint8_t>& audio,
                           uint64_t generation) {
    if (max_entries_ == 0) return false;

    const std::string key = make_key(text, voice_key);
    std::lock_guard<std::mutex> lock(mutex_);

    auto gen = generations_.find(voice_key);
    if ((gen == generations_.end() ? 0 : gen->second) != generation) {
        stats_.stale_refused++;
        return false;
    }

    auto it = index_.find(key);
    if (it != index_.end()) {
        it->second->audio = audio;
        it->second->voice_key = voice_key;
        entries_.splice(entries_.begin(), entries_, it->second);
        stats_.stores++;
        return true;
    }

    while (entries_.size() >= max_entries_ && !entries_.empty()) {
        index_.erase(entries_.back().key);
        entries_.pop_back();
        stats_.evictions++;
    }

    entries_.push_front(Entry{key, voice_key, audio});
    index_[key] = entries_.begin();
    stats_.stores++;
    return true;
}

size_t SynthesisCache::invalidate_voice(const std::string& voice_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    generations_[voice_key]++;
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->voice_key == voice_key) {
            index_.erase(it->key);
            it = entries_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    return removed;
}

bool SynthesisCache::contains(const std::string& text, const std::string& voice_key) const {
    const std::string key = make_key(text, voice_key);
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.count(key) > 0;
}

size_t SynthesisCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

SynthesisCache::Stats SynthesisCache::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}
