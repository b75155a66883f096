#include "database.h"
#include <iostream>
#include <chrono>
#include <sstream>
#include <iomanip>
#include <ctime>

Database::Database() : db_(nullptr) {}

Database::~Database() {
    close();
}

bool Database::init(const std::string& db_path) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::cerr << "Cannot open database: " << sqlite3_errmsg(db_) << std::endl;
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    // Enable WAL mode for better performance
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);

    return create_tables();
}

void Database::close() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool Database::create_tables() {
    const char* voices_sql = R"(
        CREATE TABLE IF NOT EXISTS voices (
            voice_id TEXT PRIMARY KEY,
            display_name TEXT NOT NULL,
            sample_path TEXT NOT NULL,
            registered_seq INTEGER NOT NULL,
            created_at TEXT NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_voices_seq ON voices(registered_seq);
    )";

    // Create system configuration table
    const char* system_config_sql = R"(
        CREATE TABLE IF NOT EXISTS system_config (
            key TEXT PRIMARY KEY,
            value TEXT NOT NULL,
            updated_at DATETIME DEFAULT CURRENT_TIMESTAMP
        );
        INSERT OR IGNORE INTO system_config (key, value) VALUES ('speech_service_status', 'stopped');
    )";

    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, voices_sql, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::cerr << "SQL error creating voices table: " << err_msg << std::endl;
        sqlite3_free(err_msg);
        return false;
    }

    rc = sqlite3_exec(db_, system_config_sql, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::cerr << "SQL error: " << err_msg << std::endl;
        sqlite3_free(err_msg);
        return false;
    }

    return true;
}

bool Database::upsert_voice(const std::string& voice_id, const std::string& display_name,
                            const std::string& sample_path) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return false;

    // Re-registering an id replaces the record and makes it the newest voice
    const char* sql = R"(
        INSERT OR REPLACE INTO voices (voice_id, display_name, sample_path, registered_seq, created_at)
        VALUES (?, ?, ?, (SELECT COALESCE(MAX(registered_seq), 0) + 1 FROM voices), ?)
    )";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "SQL error preparing voice upsert: " << sqlite3_errmsg(db_) << std::endl;
        return false;
    }

    std::string timestamp = get_current_timestamp();
    sqlite3_bind_text(stmt, 1, voice_id.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, display_name.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 3, sample_path.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 4, timestamp.c_str(), -1, SQLITE_STATIC);

    bool success = sqlite3_step(stmt) == SQLITE_DONE;
    if (!success) {
        std::cerr << "SQL error storing voice " << voice_id << ": " << sqlite3_errmsg(db_) << std::endl;
    }
    sqlite3_finalize(stmt);
    return success;
}

static VoiceRecord read_voice_row(sqlite3_stmt* stmt) {
    VoiceRecord record;
    const char* id = (const char*)sqlite3_column_text(stmt, 0);
    const char* name = (const char*)sqlite3_column_text(stmt, 1);
    const char* path = (const char*)sqlite3_column_text(stmt, 2);
    const char* created = (const char*)sqlite3_column_text(stmt, 4);
    record.voice_id = id ? id : "";
    record.display_name = name ? name : "";
    record.sample_path = path ? path : "";
    record.registered_seq = sqlite3_column_int64(stmt, 3);
    record.created_at = created ? created : "";
    return record;
}

bool Database::get_voice(const std::string& voice_id, VoiceRecord& record) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return false;

    const char* sql = "SELECT voice_id, display_name, sample_path, registered_seq, created_at FROM voices WHERE voice_id = ?";
    sqlite3_stmt* stmt;
    bool found = false;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) == SQLITE_OK) {
        sqlite3_bind_text(stmt, 1, voice_id.c_str(), -1, SQLITE_STATIC);
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            record = read_voice_row(stmt);
            found = true;
        }
        sqlite3_finalize(stmt);
    }

    return found;
}

std::vector<VoiceRecord> Database::get_all_voices() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    std::vector<VoiceRecord> voices;
    if (!db_) return voices;

    const char* sql = "SELECT voice_id, display_name, sample_path, registered_seq, created_at FROM voices ORDER BY registered_seq DESC";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) == SQLITE_OK) {
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            voices.push_back(read_voice_row(stmt));
        }
        sqlite3_finalize(stmt);
    }

    return voices;
}

std::string Database::get_speech_service_status() {
    return get_config_value("speech_service_status", "stopped");
}

bool Database::set_speech_service_status(const std::string& status) {
    return set_config_value("speech_service_status", status);
}

std::string Database::get_config_value(const std::string& key, const std::string& fallback) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return fallback;

    const char* sql = "SELECT value FROM system_config WHERE key = ?";
    sqlite3_stmt* stmt;
    std::string value = fallback;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) == SQLITE_OK) {
        sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_STATIC);
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            const char* text = (const char*)sqlite3_column_text(stmt, 0);
            if (text) {
                value = text;
            }
        }
        sqlite3_finalize(stmt);
    }

    return value;
}

bool Database::set_config_value(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return false;

    const char* sql = "INSERT OR REPLACE INTO system_config (key, value, updated_at) VALUES (?, ?, CURRENT_TIMESTAMP)";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) == SQLITE_OK) {
        sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 2, value.c_str(), -1, SQLITE_STATIC);
        int result = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        return result == SQLITE_DONE;
    }

    return false;
}

std::string Database::get_current_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);

    std::stringstream ss;
    ss << std::put_time(std::gmtime(&time_t), "%Y-%m-%d %H:%M:%S");
    return ss.str();
}
