#include "speech-connection.h"
#include "chunk-transcriber.h"
#include "synthesis-service.h"
#include "synthesis-cache.h"
#include "model-coordinator.h"
#include "foreground-tracker.h"
#include <iostream>

using json = nlohmann::json;

static const std::vector<std::string> kSupportedActions = {
    "synthesize", "clone_and_speak", "register_voice", "list_voices", "check_status"
};

static json synthesis_reply(const SynthesisOutcome& outcome) {
    return json{
        {"success", true},
        {"audio", base64_encode(outcome.audio)},
        {"format", outcome.format},
        {"voice_id", outcome.voice_id},
        {"cached", outcome.cached}
    };
}

SpeechConnection::SpeechConnection(int socket, const std::string& tag, SpeechContext& context,
                                   const ConnectionConfig& config)
    : socket_(socket), tag_(tag), ctx_(context), config_(config),
      ingest_(config.min_audio_bytes, config.max_buffer_bytes) {}

void SpeechConnection::run() {
    std::cout << "🔗 [" << tag_ << "] Connection opened" << std::endl;

    bool closed_by_peer = false;
    Frame frame;
    while (read_frame(socket_, frame)) {
        if (frame.type == FrameType::Close) {
            closed_by_peer = true;
            break;
        }
        if (frame.type == FrameType::Binary) {
            handle_audio(frame.payload);
        } else {
            handle_text(frame.text());
        }
    }

    // Best-effort transcript for a capture cut off by the disconnect
    if (ingest_.needs_finalize_on_disconnect()) {
        finalize_capture("disconnect");
    }

    if (closed_by_peer && !peer_gone_) {
        write_close_frame(socket_);
    }

    std::cout << "📤 [" << tag_ << "] Connection closed (" << frames_received_ << " audio frames)" << std::endl;
}

void SpeechConnection::reply(const json& message) {
    if (peer_gone_) return;
    if (!send_json(socket_, message)) {
        peer_gone_ = true;
        std::cout << "⚠️ [" << tag_ << "] Peer gone, discarding further responses" << std::endl;
    }
}

void SpeechConnection::reply_error(const std::string& error) {
    reply(json{{"error", error}});
}

void SpeechConnection::handle_audio(const std::vector<uint8_t>& payload) {
    frames_received_++;
    if (!ingest_.is_listening()) {
        if (config_.verbose) {
            std::cout << "🔇 [" << tag_ << "] Audio frame ignored (not listening)" << std::endl;
        }
        return;
    }
    const bool first_drop = ingest_.dropped_bytes() == 0;
    if (!ingest_.on_audio_frame(payload.data(), payload.size()) && first_drop && ingest_.dropped_bytes() > 0) {
        std::cout << "⚠️ [" << tag_ << "] Audio buffer full (" << ingest_.size()
                  << " bytes), dropping frames" << std::endl;
    }
}

void SpeechConnection::handle_text(const std::string& text) {
    json message;
    try {
        message = json::parse(text);
    } catch (const json::parse_error&) {
        if (config_.verbose) {
            std::cout << "⚠️ [" << tag_ << "] Invalid JSON: " << text.substr(0, 100) << std::endl;
        }
        reply_error("invalid JSON");
        return;
    }

    if (!message.is_object()) {
        reply_error("message must be a JSON object");
        return;
    }

    try {
        if (message.contains("action")) {
            if (!message["action"].is_string()) {
                reply_error("action must be a string");
                return;
            }
            handle_action(message["action"].get<std::string>(), message);
        } else if (message.contains("type") || message.contains("is_speaking")) {
            handle_control(message);
        } else {
            reply_error("message has neither type nor action");
        }
    } catch (const json::exception& e) {
        // Field of the wrong JSON type
        reply_error(std::string("invalid request: ") + e.what());
    }
}

void SpeechConnection::handle_control(const json& message) {
    if (message.contains("type")) {
        const std::string type = message["type"].is_string() ? message["type"].get<std::string>() : "";
        if (type == "start") {
            ingest_.on_start();
            std::cout << "🎤 [" << tag_ << "] Capture started" << std::endl;
            reply(json{{"type", "ready"}});
            return;
        }
        if (type == "stop") {
            finalize_capture("stop");
            return;
        }
        reply_error("unknown message type: " + (type.empty() ? message["type"].dump() : type));
        return;
    }

    const json& speaking = message["is_speaking"];
    if (speaking.is_boolean() && !speaking.get<bool>()) {
        finalize_capture("is_speaking=false");
        return;
    }
    reply_error("is_speaking only accepts false; send {\"type\":\"start\"} to begin");
}

void SpeechConnection::finalize_capture(const char* reason) {
    std::vector<uint8_t> audio = ingest_.on_stop();
    const double seconds = ctx_.transcriber.format().seconds_for_bytes(audio.size());
    std::cout << "⏹️ [" << tag_ << "] Capture finalized by " << reason << ": " << audio.size()
              << " bytes (" << seconds << "s)" << std::endl;

    std::string text;
    if (!ingest_.is_usable(audio)) {
        std::cout << "⚠️ [" << tag_ << "] Capture too short (" << audio.size() << " < "
                  << config_.min_audio_bytes << " bytes), skipping recognition" << std::endl;
    } else {
        ForegroundScope foreground(ctx_.foreground);
        TranscriptResult result = ctx_.transcriber.transcribe(audio, tag_);
        switch (result.status) {
            case TranscriptStatus::Ok:
                text = result.text;
                std::cout << "📝 [" << tag_ << "] Transcript: " << text << std::endl;
                break;
            case TranscriptStatus::Empty:
                std::cout << "⚠️ [" << tag_ << "] Empty transcript" << std::endl;
                break;
            case TranscriptStatus::Failed:
                std::cout << "❌ [" << tag_ << "] Recognition failed: " << result.reason << std::endl;
                break;
        }
    }

    reply(json{{"text", text}, {"is_final", true}});
}

void SpeechConnection::handle_action(const std::string& action, const json& message) {
    if (action == "synthesize") {
        handle_synthesize(message);
    } else if (action == "clone_and_speak") {
        handle_clone_and_speak(message);
    } else if (action == "register_voice") {
        handle_register_voice(message);
    } else if (action == "list_voices") {
        handle_list_voices();
    } else if (action == "check_status") {
        handle_check_status();
    } else {
        reply(json{{"error", "unknown action: " + action}, {"supported_actions", kSupportedActions}});
    }
}

void SpeechConnection::handle_synthesize(const json& message) {
    const std::string text = message.value("text", std::string());
    const std::string voice_id = message.value("voice_id", std::string("default"));
    const float emo_alpha = message.value("emo_alpha", 1.0f);
    const bool use_emo_text = message.value("use_emo_text", false);

    SynthesisOutcome outcome;
    std::string error;
    if (!ctx_.synthesis.synthesize(text, voice_id, emo_alpha, use_emo_text, outcome, error, tag_)) {
        reply_error(error);
        return;
    }
    reply(synthesis_reply(outcome));
}

void SpeechConnection::handle_clone_and_speak(const json& message) {
    const std::string text = message.value("text", std::string());
    const std::string sample_b64 = message.value("voice_sample", std::string());
    const std::string voice_label = message.value("voice_id", std::string("clone"));
    const float emo_alpha = message.value("emo_alpha", 1.0f);
    const bool use_emo_text = message.value("use_emo_text", false);

    if (sample_b64.empty()) {
        reply_error("voice_sample is required");
        return;
    }
    std::vector<uint8_t> sample;
    if (!base64_decode(sample_b64, sample)) {
        reply_error("invalid voice_sample (expected base64)");
        return;
    }

    SynthesisOutcome outcome;
    std::string error;
    if (!ctx_.synthesis.clone_and_speak(text, sample, voice_label, emo_alpha, use_emo_text, outcome, error, tag_)) {
        reply_error(error);
        return;
    }
    reply(synthesis_reply(outcome));
}

void SpeechConnection::handle_register_voice(const json& message) {
    const std::string sample_b64 = message.value("voice_sample", std::string());
    const std::string voice_id = message.value("voice_id", std::string("default"));
    const std::string voice_name = message.value("voice_name", std::string("Unnamed"));

    if (sample_b64.empty()) {
        reply_error("voice_sample is required");
        return;
    }
    std::vector<uint8_t> sample;
    if (!base64_decode(sample_b64, sample)) {
        reply_error("invalid voice_sample (expected base64)");
        return;
    }

    std::string error;
    if (!ctx_.synthesis.register_voice(voice_id, voice_name, sample, error, tag_)) {
        reply_error(error);
        return;
    }
    reply(json{{"success", true}, {"voice_id", voice_id}, {"message", "voice registered"}});
}

void SpeechConnection::handle_list_voices() {
    json voices = json::array();
    for (const auto& voice : ctx_.synthesis.list_voices()) {
        voices.push_back(json{{"id", voice.id}, {"name", voice.display_name}, {"builtin", voice.builtin}});
    }
    reply(json{{"success", true}, {"voices", voices}});
}

void SpeechConnection::handle_check_status() {
    const ModelCoordinator& c = ctx_.coordinator;
    const bool has_model = c.has_recognizer() || c.has_synthesizer();
    const bool model_ready = has_model &&
        (!c.has_recognizer() || c.recognizer_ready()) &&
        (!c.has_synthesizer() || c.synthesizer_ready());

    reply(json{
        {"success", true},
        {"model_ready", model_ready},
        {"has_model", has_model},
        {"recognizer_ready", c.recognizer_ready()},
        {"synthesizer_ready", c.synthesizer_ready()},
        {"cache_entries", ctx_.cache.size()},
        {"queued", c.queued()}
    });
}
