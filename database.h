#pragma once

#include <string>
#include <memory>
#include <vector>
#include <mutex>
#include <cstdint>
#include <sqlite3.h>

struct VoiceRecord {
    std::string voice_id;
    std::string display_name;
    std::string sample_path;
    std::string created_at;
    int64_t registered_seq = 0;  // higher = registered more recently
};

class Database {
public:
    Database();
    ~Database();

    bool init(const std::string& db_path = "speech_service.db");
    void close();

    // Cloned voice identities
    bool upsert_voice(const std::string& voice_id, const std::string& display_name,
                      const std::string& sample_path);
    bool get_voice(const std::string& voice_id, VoiceRecord& record);
    std::vector<VoiceRecord> get_all_voices(); // most recently registered first

    // Speech service status: "starting", "running", "stopped", "error"
    std::string get_speech_service_status();
    bool set_speech_service_status(const std::string& status);

    // Generic system configuration values
    std::string get_config_value(const std::string& key, const std::string& fallback = "");
    bool set_config_value(const std::string& key, const std::string& value);

private:
    sqlite3* db_;
    mutable std::mutex db_mutex_;  // Thread safety for database operations
    bool create_tables();
    std::string get_current_timestamp();
};
