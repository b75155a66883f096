#pragma once

#include "audio-ingest-buffer.h"
#include "speech-protocol.h"
#include <string>
#include <vector>
#include <cstdint>

class ChunkTranscriber;
class SynthesisService;
class ModelCoordinator;
class SynthesisCache;
class ForegroundTracker;

// Shared process-wide objects handed to every connection
struct SpeechContext {
    ChunkTranscriber& transcriber;
    SynthesisService& synthesis;
    ModelCoordinator& coordinator;
    SynthesisCache& cache;
    ForegroundTracker& foreground;
};

struct ConnectionConfig {
    size_t min_audio_bytes = 64000;       // 2 s @16kHz PCM16
    size_t max_buffer_bytes = 19200000;   // 10 min
    bool verbose = false;
};

// Serves one client socket until it closes. Every request gets exactly one
// terminal response; malformed requests are answered with an error frame and
// the connection stays open. Does not close the socket.
class SpeechConnection {
public:
    SpeechConnection(int socket, const std::string& tag, SpeechContext& context, const ConnectionConfig& config);

    void run();

    bool peer_gone() const { return peer_gone_; }

private:
    int socket_;
    std::string tag_;
    SpeechContext& ctx_;
    ConnectionConfig config_;
    AudioIngestBuffer ingest_;
    bool peer_gone_ = false;
    uint64_t frames_received_ = 0;

    void handle_text(const std::string& text);
    void handle_audio(const std::vector<uint8_t>& payload);
    void handle_control(const nlohmann::json& message);
    void handle_action(const std::string& action, const nlohmann::json& message);

    void finalize_capture(const char* reason);

    void handle_synthesize(const nlohmann::json& message);
    void handle_clone_and_speak(const nlohmann::json& message);
    void handle_register_voice(const nlohmann::json& message);
    void handle_list_voices();
    void handle_check_status();

    void reply(const nlohmann::json& message);
    void reply_error(const std::string& error);
};
