#pragma once

#include "inference-backend.h"
#include "chunk-transcriber.h"
#include "preload-scheduler.h"
#include "speech-connection.h"
#include <string>
#include <memory>
#include <map>
#include <list>
#include <thread>
#include <mutex>
#include <atomic>
#include <cstdint>

class Database;
class VoiceRegistry;
class ModelCoordinator;
class SynthesisCache;
class ForegroundTracker;
class SynthesisService;

struct SpeechServiceConfig {
    std::string host = "0.0.0.0";
    int port = 10095;                   // 0 = ephemeral (tests)
    std::string database_path = "speech_service.db";
    std::string voices_dir = "cloned_voices";
    std::string scratch_dir = "";       // transient files; empty = $TMPDIR or /tmp
    std::map<std::string, int> builtin_voices = {{"default", 0}};
    ChunkingConfig chunking;
    int min_audio_ms = 2000;
    int max_capture_ms = 600000;        // 10 min
    size_t cache_size = 50;
    bool preload_enabled = true;
    PreloadConfig preload;
    bool verbose = false;
};

// Owns the shared speech objects and the TCP listener. Every accepted socket is
// served by a SpeechConnection on its own thread.
class SpeechService {
public:
    explicit SpeechService(const SpeechServiceConfig& config);
    ~SpeechService();

    SpeechService(const SpeechService&) = delete;
    SpeechService& operator=(const SpeechService&) = delete;

    // Opens the database and marks the service as starting
    bool init();
    void mark_error();

    // Takes ownership of the loaded backends, opens the listener and starts preload
    bool start(std::unique_ptr<SpeechRecognizer> recognizer, std::unique_ptr<SpeechSynthesizer> synthesizer);
    void stop();
    bool is_running() const { return running_.load(); }

    int bound_port() const { return bound_port_; }

    // Serves one already-connected socket on the calling thread (does not close it)
    void serve_socket(int socket, const std::string& tag);

    ModelCoordinator* coordinator() { return coordinator_.get(); }

    void log_stats() const;

private:
    SpeechServiceConfig config_;
    std::atomic<bool> running_{false};
    int server_socket_ = -1;
    int bound_port_ = -1;

    std::unique_ptr<Database> database_;
    std::unique_ptr<VoiceRegistry> registry_;
    std::unique_ptr<ModelCoordinator> coordinator_;
    std::unique_ptr<SynthesisCache> cache_;
    std::unique_ptr<ForegroundTracker> foreground_;
    std::unique_ptr<ChunkTranscriber> transcriber_;
    std::unique_ptr<SynthesisService> synthesis_;
    std::unique_ptr<PreloadScheduler> preload_;
    std::unique_ptr<SpeechContext> context_;
    ConnectionConfig connection_config_;

    std::thread accept_thread_;

    struct ClientThread {
        int socket;
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };
    std::list<ClientThread> clients_;
    std::mutex clients_mutex_;
    std::atomic<uint64_t> total_connections_{0};

    bool open_listener();
    void run_accept_loop();
    void reap_finished_clients();
};
