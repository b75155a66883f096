#include "speech-service.h"
#include "database.h"
#include "voice-registry.h"
#include "model-coordinator.h"
#include "synthesis-cache.h"
#include "foreground-tracker.h"
#include "synthesis-service.h"
#include <iostream>
#include <cstring>
#include <cerrno>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>

SpeechService::SpeechService(const SpeechServiceConfig& config) : config_(config) {}

SpeechService::~SpeechService() {
    stop();
}

bool SpeechService::init() {
    database_ = std::make_unique<Database>();
    if (!database_->init(config_.database_path)) {
        std::cout << "❌ Failed to initialize database: " << config_.database_path << std::endl;
        database_.reset();
        return false;
    }
    database_->set_speech_service_status("starting");

    registry_ = std::make_unique<VoiceRegistry>(*database_, config_.voices_dir, config_.builtin_voices);
    if (!registry_->init()) {
        database_->set_speech_service_status("error");
        return false;
    }
    return true;
}

void SpeechService::mark_error() {
    if (database_) {
        database_->set_speech_service_status("error");
    }
}

bool SpeechService::start(std::unique_ptr<SpeechRecognizer> recognizer,
                          std::unique_ptr<SpeechSynthesizer> synthesizer) {
    if (running_.load()) {
        std::cout << "⚠️ Speech service already running" << std::endl;
        return false;
    }
    if (!database_ && !init()) {
        return false;
    }

    AudioFormat format;  // 16 kHz mono PCM16 on the recognition path
    coordinator_ = std::make_unique<ModelCoordinator>(std::move(recognizer), std::move(synthesizer), config_.scratch_dir);
    cache_ = std::make_unique<SynthesisCache>(config_.cache_size);
    foreground_ = std::make_unique<ForegroundTracker>();
    transcriber_ = std::make_unique<ChunkTranscriber>(*coordinator_, format, config_.chunking);
    synthesis_ = std::make_unique<SynthesisService>(*coordinator_, *cache_, *registry_, *foreground_,
                                                    config_.scratch_dir, config_.verbose);
    PreloadConfig preload_config = config_.preload;
    preload_config.verbose = config_.verbose;
    preload_ = std::make_unique<PreloadScheduler>(*synthesis_, *registry_, *foreground_, preload_config);
    context_ = std::make_unique<SpeechContext>(SpeechContext{*transcriber_, *synthesis_, *coordinator_, *cache_, *foreground_});

    connection_config_.min_audio_bytes = format.bytes_for_ms(config_.min_audio_ms);
    connection_config_.max_buffer_bytes = format.bytes_for_ms(config_.max_capture_ms);
    connection_config_.verbose = config_.verbose;

    if (!open_listener()) {
        database_->set_speech_service_status("error");
        return false;
    }

    running_.store(true);
    accept_thread_ = std::thread(&SpeechService::run_accept_loop, this);

    if (config_.preload_enabled && coordinator_->synthesizer_ready()) {
        preload_->start();
    } else if (config_.preload_enabled) {
        std::cout << "⚠️ Preload disabled: no synthesizer ready" << std::endl;
    }

    database_->set_speech_service_status("running");
    std::cout << "🎤 Speech service started" << std::endl;
    std::cout << "📡 Listening on " << config_.host << ":" << bound_port_ << std::endl;
    std::cout << "💾 Database: " << config_.database_path << std::endl;
    std::cout << "🧩 Chunking: " << transcriber_->chunk_bytes() << " bytes per call, "
              << transcriber_->overlap_bytes() << " overlap, min capture "
              << connection_config_.min_audio_bytes << " bytes" << std::endl;
    std::cout << "🗄️ Synthesis cache: " << (cache_->enabled() ? std::to_string(cache_->max_entries()) + " entries" : "disabled")
              << std::endl;
    return true;
}

void SpeechService::stop() {
    bool was_running = running_.exchange(false);

    if (preload_) {
        preload_->stop();
    }

    if (server_socket_ >= 0) {
        shutdown(server_socket_, SHUT_RDWR);
        close(server_socket_);
        server_socket_ = -1;
    }
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }

    // Unblock every connection reader, then wait for in-flight work to finish
    std::list<ClientThread> clients;
    {
        std::lock_guard<std::mutex> lk(clients_mutex_);
        clients.swap(clients_);
    }
    for (auto& c : clients) {
        shutdown(c.socket, SHUT_RDWR);
    }
    for (auto& c : clients) {
        if (c.thread.joinable()) c.thread.join();
        close(c.socket);
    }

    if (was_running) {
        log_stats();
        if (database_) {
            database_->set_speech_service_status("stopped");
        }
        std::cout << "🛑 Speech service stopped" << std::endl;
    }
}

bool SpeechService::open_listener() {
    server_socket_ = socket(AF_INET, SOCK_STREAM, 0);
    if (server_socket_ < 0) {
        std::cout << "❌ Failed to create TCP server socket: " << strerror(errno) << std::endl;
        return false;
    }

    int opt = 1;
    setsockopt(server_socket_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    struct sockaddr_in server_addr;
    memset(&server_addr, 0, sizeof(server_addr));
    server_addr.sin_family = AF_INET;
    server_addr.sin_port = htons(static_cast<uint16_t>(config_.port));
    if (inet_pton(AF_INET, config_.host.c_str(), &server_addr.sin_addr) != 1) {
        std::cout << "❌ Invalid listen address: " << config_.host << std::endl;
        close(server_socket_);
        server_socket_ = -1;
        return false;
    }

    if (bind(server_socket_, (struct sockaddr*)&server_addr, sizeof(server_addr)) < 0) {
        std::cout << "❌ Failed to bind TCP server socket to port " << config_.port << ": " << strerror(errno) << std::endl;
        close(server_socket_);
        server_socket_ = -1;
        return false;
    }

    if (listen(server_socket_, 16) < 0) {
        std::cout << "❌ Failed to listen on TCP server socket" << std::endl;
        close(server_socket_);
        server_socket_ = -1;
        return false;
    }

    socklen_t len = sizeof(server_addr);
    if (getsockname(server_socket_, (struct sockaddr*)&server_addr, &len) == 0) {
        bound_port_ = ntohs(server_addr.sin_port);
    } else {
        bound_port_ = config_.port;
    }
    return true;
}

void SpeechService::run_accept_loop() {
    while (running_.load()) {
        struct sockaddr_in client_addr;
        socklen_t client_len = sizeof(client_addr);

        int client_socket = accept(server_socket_, (struct sockaddr*)&client_addr, &client_len);
        if (client_socket < 0) {
            if (running_.load() && errno != EINTR) {
                std::cout << "⚠️ Failed to accept TCP connection: " << strerror(errno) << std::endl;
            }
            continue;
        }

        reap_finished_clients();

        char ip[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &client_addr.sin_addr, ip, sizeof(ip));
        const std::string tag = std::string(ip) + ":" + std::to_string(ntohs(client_addr.sin_port));
        total_connections_++;

        auto done = std::make_shared<std::atomic<bool>>(false);
        std::lock_guard<std::mutex> lk(clients_mutex_);
        if (!running_.load()) {
            close(client_socket);
            break;
        }
        clients_.push_back(ClientThread{client_socket, std::thread([this, client_socket, tag, done]() {
            serve_socket(client_socket, tag);
            // Peer sees EOF now; the descriptor itself is closed by the reaper or stop()
            shutdown(client_socket, SHUT_RDWR);
            done->store(true);
        }), done});
    }
}

void SpeechService::reap_finished_clients() {
    std::lock_guard<std::mutex> lk(clients_mutex_);
    for (auto it = clients_.begin(); it != clients_.end();) {
        if (it->done->load()) {
            if (it->thread.joinable()) it->thread.join();
            close(it->socket);
            it = clients_.erase(it);
        } else {
            ++it;
        }
    }
}

void SpeechService::serve_socket(int socket, const std::string& tag) {
    SpeechConnection connection(socket, tag, *context_, connection_config_);
    connection.run();
}

void SpeechService::log_stats() const {
    std::cout << "📊 Speech service: " << total_connections_.load() << " connections" << std::endl;
    if (coordinator_) coordinator_->log_metrics();
    if (cache_) {
        SynthesisCache::Stats s = cache_->stats();
        std::cout << "📊 Synthesis cache: " << cache_->size() << "/" << cache_->max_entries() << " entries, "
                  << s.hits << " hits, " << s.misses << " misses, " << s.evictions << " evictions" << std::endl;
    }
    if (preload_) preload_->log_stats();
}
