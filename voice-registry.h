#pragma once

#include "inference-backend.h"
#include "database.h"
#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <cstdint>

// Built-in voices come from configuration (name -> piper speaker id). Cloned
// voices are rows in the voices table with their sample at <voices_dir>/<id>.wav.
// A cloned voice registered under a built-in name shadows the built-in one.
class VoiceRegistry {
public:
    VoiceRegistry(Database& database, const std::string& voices_dir,
                  const std::map<std::string, int>& builtin_voices);

    // Creates the voices directory if needed
    bool init();

    bool register_voice(const std::string& voice_id, const std::string& display_name,
                        const std::vector<uint8_t>& sample, VoiceIdentity& voice, std::string& error);

    bool find(const std::string& voice_id, VoiceIdentity& voice) const;

    // Built-in voices first (by name), then cloned voices newest first
    std::vector<VoiceIdentity> list() const;
    std::vector<VoiceIdentity> cloned_by_recency() const;

    const std::string& voices_dir() const { return voices_dir_; }

    static bool is_valid_voice_id(const std::string& voice_id);

private:
    Database& database_;
    std::string voices_dir_;
    std::map<std::string, int> builtin_voices_;
    std::mutex register_mutex_;

    std::string sample_path_for(const std::string& voice_id) const;
    static VoiceIdentity from_record(const VoiceRecord& record);
};
