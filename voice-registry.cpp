#include "voice-registry.h"
#include <iostream>
#include <fstream>
#include <cstdio>
#include <cstring>
#include <cerrno>
#include <sys/stat.h>
#include <sys/types.h>

VoiceRegistry::VoiceRegistry(Database& database, const std::string& voices_dir,
                             const std::map<std::string, int>& builtin_voices)
    : database_(database), voices_dir_(voices_dir), builtin_voices_(builtin_voices) {}

bool VoiceRegistry::init() {
    struct stat st{};
    if (stat(voices_dir_.c_str(), &st) == 0) {
        if (!S_ISDIR(st.st_mode)) {
            std::cout << "❌ Voices path is not a directory: " << voices_dir_ << std::endl;
            return false;
        }
        return true;
    }
    if (mkdir(voices_dir_.c_str(), 0755) != 0 && errno != EEXIST) {
        std::cout << "❌ Failed to create voices directory " << voices_dir_ << ": " << strerror(errno) << std::endl;
        return false;
    }
    std::cout << "📁 Created voices directory: " << voices_dir_ << std::endl;
    return true;
}

bool VoiceRegistry::is_valid_voice_id(const std::string& voice_id) {
    if (voice_id.empty() || voice_id.size() > 64) return false;
    for (char c : voice_id) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
        if (!ok) return false;
    }
    return true;
}

std::string VoiceRegistry::sample_path_for(const std::string& voice_id) const {
    return voices_dir_ + "/" + voice_id + ".wav";
}

VoiceIdentity VoiceRegistry::from_record(const VoiceRecord& record) {
    VoiceIdentity voice;
    voice.id = record.voice_id;
    voice.display_name = record.display_name;
    voice.sample_path = record.sample_path;
    voice.builtin = false;
    return voice;
}

bool VoiceRegistry::register_voice(const std::string& voice_id, const std::string& display_name,
                                   const std::vector<uint8_t>& sample, VoiceIdentity& voice, std::string& error) {
    if (!is_valid_voice_id(voice_id)) {
        error = "invalid voice_id (allowed: letters, digits, '_' and '-', up to 64 characters)";
        return false;
    }
    if (sample.empty()) {
        error = "voice_sample is empty";
        return false;
    }

    std::lock_guard<std::mutex> lock(register_mutex_);

    // Staged next to the final path; renamed into place only once the record is stored
    const std::string final_path = sample_path_for(voice_id);
    const std::string tmp_path = final_path + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            error = "cannot write voice sample: " + tmp_path;
            return false;
        }
        out.write(reinterpret_cast<const char*>(sample.data()), static_cast<std::streamsize>(sample.size()));
        if (!out) {
            error = "cannot write voice sample: " + tmp_path;
            std::remove(tmp_path.c_str());
            return false;
        }
    }
    if (!database_.upsert_voice(voice_id, display_name, final_path)) {
        std::remove(tmp_path.c_str());
        error = "failed to persist voice record";
        return false;
    }

    if (std::rename(tmp_path.c_str(), final_path.c_str()) != 0) {
        error = std::string("cannot store voice sample: ") + strerror(errno);
        std::remove(tmp_path.c_str());
        return false;
    }

    voice.id = voice_id;
    voice.display_name = display_name;
    voice.sample_path = final_path;
    voice.builtin = false;
    voice.speaker_id = 0;

    std::cout << "✅ Registered voice " << voice_id << " (" << display_name << ", "
              << sample.size() << " bytes)" << std::endl;
    return true;
}

bool VoiceRegistry::find(const std::string& voice_id, VoiceIdentity& voice) const {
    VoiceRecord record;
    if (database_.get_voice(voice_id, record)) {
        voice = from_record(record);
        return true;
    }

    auto it = builtin_voices_.find(voice_id);
    if (it != builtin_voices_.end()) {
        voice = VoiceIdentity();
        voice.id = it->first;
        voice.display_name = it->first;
        voice.speaker_id = it->second;
        voice.builtin = true;
        return true;
    }
    return false;
}

std::vector<VoiceIdentity> VoiceRegistry::cloned_by_recency() const {
    std::vector<VoiceIdentity> voices;
    for (const auto& record : database_.get_all_voices()) {
        voices.push_back(from_record(record));
    }
    return voices;
}

std::vector<VoiceIdentity> VoiceRegistry::list() const {
    std::vector<VoiceIdentity> cloned = cloned_by_recency();
    std::vector<VoiceIdentity> voices;

    for (const auto& [name, speaker] : builtin_voices_) {
        bool shadowed = false;
        for (const auto& c : cloned) {
            if (c.id == name) { shadowed = true; break; }
        }
        if (shadowed) continue;

        VoiceIdentity voice;
        voice.id = name;
        voice.display_name = name;
        voice.speaker_id = speaker;
        voice.builtin = true;
        voices.push_back(voice);
    }

    voices.insert(voices.end(), cloned.begin(), cloned.end());
    return voices;
}
