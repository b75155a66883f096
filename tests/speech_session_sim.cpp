#include "sim_support.h"
#include "../speech-service.h"
#include "../speech-protocol.h"
#include "../model-coordinator.h"
#include "../synthesis-cache.h"
#include <memory>
#include <cstring>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <sys/time.h>

// End-to-end sessions against a running SpeechService on an ephemeral port,
// with scripted model backends.

using json = nlohmann::json;

struct ServiceRig {
    std::string dir;
    FakeRecognizer* recognizer = nullptr;
    FakeSynthesizer* synthesizer = nullptr;
    std::unique_ptr<SpeechService> service;

    bool start(std::chrono::milliseconds recognizer_delay = std::chrono::milliseconds(0)) {
        dir = make_temp_dir("session-sim");
        if (dir.empty()) return false;

        SpeechServiceConfig cfg;
        cfg.host = "127.0.0.1";
        cfg.port = 0;
        cfg.database_path = ":memory:";
        cfg.voices_dir = dir + "/voices";
        cfg.scratch_dir = dir;
        cfg.builtin_voices = {{"v1", 0}};
        cfg.preload_enabled = false;

        auto rec = std::make_unique<FakeRecognizer>(nullptr, recognizer_delay);
        auto syn = std::make_unique<FakeSynthesizer>();
        recognizer = rec.get();
        synthesizer = syn.get();

        service = std::make_unique<SpeechService>(cfg);
        if (!service->init()) return false;
        return service->start(std::move(rec), std::move(syn));
    }

    ~ServiceRig() {
        if (service) service->stop();
        service.reset();
        if (!dir.empty()) {
            remove_tree(dir + "/voices");
            remove_tree(dir);
        }
    }

    int connect_client() const {
        int fd = socket(AF_INET, SOCK_STREAM, 0);
        if (fd < 0) return -1;
        // A server that never answers fails the case instead of hanging it
        struct timeval tv;
        tv.tv_sec = 10;
        tv.tv_usec = 0;
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(static_cast<uint16_t>(service->bound_port()));
        inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
        if (connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
            close(fd);
            return -1;
        }
        return fd;
    }
};

static bool send_message(int fd, const json& message) {
    return write_text_frame(fd, message.dump());
}

static bool send_audio(int fd, size_t bytes) {
    std::vector<uint8_t> pcm(bytes, 0);
    return write_frame(fd, FrameType::Binary, pcm.data(), pcm.size());
}

static bool receive_message(int fd, json& message) {
    Frame frame;
    if (!read_frame(fd, frame) || frame.type != FrameType::Text) return false;
    message = json::parse(frame.text(), nullptr, false);
    return !message.is_discarded();
}

static int test_short_capture_yields_empty_final() {
    ServiceRig rig;
    SIM_CHECK(rig.start(), "service started");
    int fd = rig.connect_client();
    SIM_CHECK(fd >= 0, "client connected");

    json reply;
    SIM_CHECK(send_message(fd, {{"type", "start"}}), "send start");
    SIM_CHECK(receive_message(fd, reply) && reply["type"] == "ready", "ready after start");
    for (int i = 0; i < 3; ++i) {
        SIM_CHECK(send_audio(fd, 16000), "send 16 KB frame");
    }
    SIM_CHECK(send_message(fd, {{"type", "stop"}}), "send stop");
    SIM_CHECK(receive_message(fd, reply), "final received");
    SIM_CHECK(reply["text"] == "" && reply["is_final"] == true, "empty final for a short capture: " << reply.dump());
    SIM_CHECK(rig.recognizer->calls() == 0, "recognizer never invoked");
    close(fd);
    return 0;
}

static int test_usable_capture_is_transcribed() {
    ServiceRig rig;
    SIM_CHECK(rig.start(), "service started");
    int fd = rig.connect_client();
    SIM_CHECK(fd >= 0, "client connected");

    json reply;
    SIM_CHECK(send_audio(fd, 32000), "frame before start");
    SIM_CHECK(send_message(fd, {{"type", "start"}}) && receive_message(fd, reply), "start");
    SIM_CHECK(send_audio(fd, 48000) && send_audio(fd, 48000), "3 s of audio");
    SIM_CHECK(send_message(fd, {{"is_speaking", false}}), "legacy stop");
    SIM_CHECK(receive_message(fd, reply), "final received");
    SIM_CHECK(reply["text"] == "chunk0" && reply["is_final"] == true, "transcript: " << reply.dump());
    std::vector<size_t> lengths = rig.recognizer->lengths();
    SIM_CHECK(lengths.size() == 1 && lengths[0] == 96000, "audio before start was not buffered");

    // Stop while idle still answers
    SIM_CHECK(send_message(fd, {{"type", "stop"}}) && receive_message(fd, reply), "idle stop");
    SIM_CHECK(reply["text"] == "" && reply["is_final"] == true, "empty final when idle");
    close(fd);
    return 0;
}

static int test_synthesis_is_cached() {
    ServiceRig rig;
    SIM_CHECK(rig.start(), "service started");
    int fd = rig.connect_client();
    SIM_CHECK(fd >= 0, "client connected");

    json first, second;
    json request = {{"action", "synthesize"}, {"text", "hello"}, {"voice_id", "v1"}};
    SIM_CHECK(send_message(fd, request) && receive_message(fd, first), "first synthesis");
    SIM_CHECK(first["success"] == true && first["cached"] == false, "first is synthesized: " << first.dump());
    SIM_CHECK(first["format"] == "wav" && first["voice_id"] == "v1", "format and voice");
    uint64_t acquisitions = rig.service->coordinator()->acquisitions();

    SIM_CHECK(send_message(fd, request) && receive_message(fd, second), "second synthesis");
    SIM_CHECK(second["cached"] == true, "second is served from cache");
    SIM_CHECK(second["audio"] == first["audio"], "identical audio");
    SIM_CHECK(rig.service->coordinator()->acquisitions() == acquisitions, "no model access for a hit");
    SIM_CHECK(rig.synthesizer->calls.load() == 1, "one synthesis call");

    std::vector<uint8_t> audio;
    SIM_CHECK(base64_decode(first["audio"].get<std::string>(), audio), "audio is base64");
    SIM_CHECK(std::string(audio.begin(), audio.end()) == "FAKEWAV|v1|hello", "audio content");

    json reply;
    SIM_CHECK(send_message(fd, {{"action", "synthesize"}, {"text", "   "}, {"voice_id", "v1"}}) &&
              receive_message(fd, reply), "blank text request");
    SIM_CHECK(reply.contains("error"), "blank text rejected");
    SIM_CHECK(send_message(fd, {{"action", "synthesize"}, {"text", "hi"}, {"voice_id", "nobody"}}) &&
              receive_message(fd, reply), "unknown voice request");
    SIM_CHECK(reply["error"] == "unknown voice: nobody", "unknown voice named: " << reply.dump());
    close(fd);
    return 0;
}

static int test_malformed_requests_keep_connection() {
    ServiceRig rig;
    SIM_CHECK(rig.start(), "service started");
    int fd = rig.connect_client();
    SIM_CHECK(fd >= 0, "client connected");

    json reply;
    SIM_CHECK(write_text_frame(fd, "{not json") && receive_message(fd, reply), "bad JSON answered");
    SIM_CHECK(reply["error"] == "invalid JSON", "invalid JSON error");
    SIM_CHECK(write_text_frame(fd, "[1,2]") && receive_message(fd, reply), "array answered");
    SIM_CHECK(reply["error"] == "message must be a JSON object", "non-object error");
    SIM_CHECK(send_message(fd, {{"type", "pause"}}) && receive_message(fd, reply), "unknown type answered");
    SIM_CHECK(reply["error"] == "unknown message type: pause", "unknown type error");

    SIM_CHECK(send_message(fd, {{"action", "dance"}}) && receive_message(fd, reply), "unknown action answered");
    SIM_CHECK(reply.contains("error") && reply["supported_actions"].is_array(), "supported actions listed");
    SIM_CHECK(reply["supported_actions"].size() == 5, "five actions");

    SIM_CHECK(send_message(fd, {{"action", "synthesize"}, {"text", 5}}) && receive_message(fd, reply),
              "wrong field type answered");
    SIM_CHECK(reply.contains("error"), "wrong field type is an error");

    SIM_CHECK(send_message(fd, {{"action", "check_status"}}) && receive_message(fd, reply), "still usable");
    SIM_CHECK(reply["success"] == true && reply["model_ready"] == true, "status: " << reply.dump());
    SIM_CHECK(reply["has_model"] == true && reply["queued"] == 0, "status fields");
    close(fd);
    return 0;
}

static int test_register_and_list_voices() {
    ServiceRig rig;
    SIM_CHECK(rig.start(), "service started");
    int fd = rig.connect_client();
    SIM_CHECK(fd >= 0, "client connected");

    std::vector<uint8_t> sample = {'R', 'I', 'F', 'F', 0, 1, 2, 3};
    json reply;
    SIM_CHECK(send_message(fd, {{"action", "register_voice"}, {"voice_id", "grandma"},
                                {"voice_name", "Grandma"},
                                {"voice_sample", "data:audio/wav;base64," + base64_encode(sample)}}) &&
              receive_message(fd, reply), "register answered");
    SIM_CHECK(reply["success"] == true && reply["voice_id"] == "grandma", "registered: " << reply.dump());

    SIM_CHECK(send_message(fd, {{"action", "register_voice"}, {"voice_id", "x"}, {"voice_sample", "@@@"}}) &&
              receive_message(fd, reply), "bad sample answered");
    SIM_CHECK(reply["error"] == "invalid voice_sample (expected base64)", "bad base64 rejected");

    SIM_CHECK(send_message(fd, {{"action", "list_voices"}}) && receive_message(fd, reply), "list answered");
    const json& voices = reply["voices"];
    SIM_CHECK(voices.size() == 2, "built-in plus cloned: " << reply.dump());
    SIM_CHECK(voices[0]["id"] == "v1" && voices[0]["builtin"] == true, "built-in first");
    SIM_CHECK(voices[1]["id"] == "grandma" && voices[1]["name"] == "Grandma", "cloned voice listed");

    SIM_CHECK(send_message(fd, {{"action", "synthesize"}, {"text", "hi"}, {"voice_id", "grandma"}}) &&
              receive_message(fd, reply), "synthesize with cloned voice");
    SIM_CHECK(reply["success"] == true && reply["voice_id"] == "grandma", "cloned voice synthesized");

    SIM_CHECK(send_message(fd, {{"action", "clone_and_speak"}, {"text", "hey"},
                                {"voice_sample", base64_encode(sample)}}) &&
              receive_message(fd, reply), "clone_and_speak answered");
    SIM_CHECK(reply["success"] == true, "ad hoc clone synthesized: " << reply.dump());
    close(fd);
    return 0;
}

static int test_disconnect_while_listening_finalizes() {
    ServiceRig rig;
    SIM_CHECK(rig.start(), "service started");
    int fd = rig.connect_client();
    SIM_CHECK(fd >= 0, "client connected");

    json reply;
    SIM_CHECK(send_message(fd, {{"type", "start"}}) && receive_message(fd, reply), "start");
    SIM_CHECK(send_audio(fd, 64000), "2 s of audio");
    shutdown(fd, SHUT_WR);

    SIM_CHECK(receive_message(fd, reply), "final sent after half-close");
    SIM_CHECK(reply["is_final"] == true && reply["text"] == "chunk0", "capture transcribed: " << reply.dump());
    SIM_CHECK(rig.recognizer->calls() == 1, "one recognition");
    close(fd);
    return 0;
}

static int test_close_frame_and_oversize() {
    ServiceRig rig;
    SIM_CHECK(rig.start(), "service started");

    int fd = rig.connect_client();
    SIM_CHECK(fd >= 0, "client connected");
    SIM_CHECK(write_close_frame(fd), "send close");
    Frame frame;
    SIM_CHECK(read_frame(fd, frame) && frame.type == FrameType::Close, "close echoed");
    close(fd);

    fd = rig.connect_client();
    SIM_CHECK(fd >= 0, "client reconnected");
    uint8_t header[5] = {static_cast<uint8_t>(FrameType::Binary), 0, 0, 0, 0};
    uint32_t length_be = htonl(kMaxFramePayload + 1);
    memcpy(header + 1, &length_be, 4);
    SIM_CHECK(write_all(fd, header, sizeof(header)), "oversized header sent");
    auto t0 = std::chrono::steady_clock::now();
    SIM_CHECK(!read_frame(fd, frame), "connection dropped on oversized frame");
    auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();
    SIM_CHECK(waited < 5000, "peer saw EOF promptly, not a receive timeout (" << waited << "ms)");
    close(fd);

    fd = rig.connect_client();
    SIM_CHECK(fd >= 0, "client reconnected");
    header[0] = 0x7f;
    memset(header + 1, 0, 4);
    SIM_CHECK(write_all(fd, header, sizeof(header)), "unknown frame type sent");
    t0 = std::chrono::steady_clock::now();
    SIM_CHECK(!read_frame(fd, frame), "connection dropped on unknown frame type");
    waited = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();
    SIM_CHECK(waited < 5000, "EOF after unknown frame type (" << waited << "ms)");
    close(fd);
    return 0;
}

static int test_disconnect_during_recognition() {
    ServiceRig rig;
    SIM_CHECK(rig.start(std::chrono::milliseconds(400)), "service started");
    int fd = rig.connect_client();
    SIM_CHECK(fd >= 0, "client connected");

    json reply;
    SIM_CHECK(send_message(fd, {{"type", "start"}}) && receive_message(fd, reply), "start");
    SIM_CHECK(send_audio(fd, 64000), "2 s of audio");
    SIM_CHECK(send_message(fd, {{"type", "stop"}}), "stop");
    close(fd);   // gone before the transcript is ready

    for (int i = 0; i < 200 && rig.recognizer->calls() == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    SIM_CHECK(rig.recognizer->calls() == 1, "recognition started for the abandoned capture");
    for (int i = 0; i < 300 && rig.service->coordinator()->queued() > 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    SIM_CHECK(rig.service->coordinator()->queued() == 0, "recognition ran to completion");

    int next = rig.connect_client();
    SIM_CHECK(next >= 0, "next client connected");
    SIM_CHECK(send_message(next, {{"action", "check_status"}}) && receive_message(next, reply),
              "next client served");
    SIM_CHECK(reply["success"] == true && reply["queued"] == 0, "status after abandoned call: " << reply.dump());
    close(next);
    return 0;
}

static int test_base64() {
    std::vector<uint8_t> data = {0, 1, 2, 250, 251, 252, 253};
    std::string encoded = base64_encode(data);
    std::vector<uint8_t> back;
    SIM_CHECK(base64_decode(encoded, back) && back == data, "decode");
    SIM_CHECK(base64_decode("data:audio/wav;base64," + encoded, back) && back == data, "data URL prefix");
    SIM_CHECK(base64_decode("aGVs\nbG8=", back) && std::string(back.begin(), back.end()) == "hello", "whitespace");
    SIM_CHECK(!base64_decode("abc", back), "length not a multiple of 4");
    return 0;
}

int main() {
    int failures = 0;
    failures += run_case("short capture yields empty final", test_short_capture_yields_empty_final);
    failures += run_case("usable capture is transcribed", test_usable_capture_is_transcribed);
    failures += run_case("synthesis is cached", test_synthesis_is_cached);
    failures += run_case("malformed requests keep connection", test_malformed_requests_keep_connection);
    failures += run_case("register and list voices", test_register_and_list_voices);
    failures += run_case("disconnect while listening finalizes", test_disconnect_while_listening_finalizes);
    failures += run_case("close frame and oversized frame", test_close_frame_and_oversize);
    failures += run_case("disconnect during recognition", test_disconnect_during_recognition);
    failures += run_case("base64", test_base64);

    if (failures) {
        std::cerr << "❌ " << failures << " session case(s) failed\n";
        return 1;
    }
    std::cout << "All speech session tests passed.\n";
    return 0;
}
