#include "sim_support.h"
#include "../audio-ingest-buffer.h"

// Start/stop accumulation semantics of the per-connection audio buffer

static int test_frames_before_start_are_dropped() {
    AudioIngestBuffer buf(100, 0);
    std::vector<uint8_t> frame(64, 1);
    SIM_CHECK(!buf.is_listening(), "new session must not be listening");
    SIM_CHECK(!buf.on_audio_frame(frame.data(), frame.size()), "frame accepted before start");
    SIM_CHECK(buf.size() == 0, "buffer grew before start");
    return 0;
}

static int test_start_accumulate_stop() {
    AudioIngestBuffer buf(100, 0);
    std::vector<uint8_t> frame(16 * 1024, 7);

    buf.on_start();
    for (int i = 0; i < 3; ++i) {
        SIM_CHECK(buf.on_audio_frame(frame.data(), frame.size()), "frame rejected while listening");
    }
    SIM_CHECK(buf.size() == 48 * 1024, "expected 48 KB buffered");
    SIM_CHECK(buf.needs_finalize_on_disconnect(), "listening with audio must finalize on disconnect");

    std::vector<uint8_t> audio = buf.on_stop();
    SIM_CHECK(audio.size() == 48 * 1024, "stop must hand over everything");
    SIM_CHECK(buf.size() == 0, "buffer must be empty after stop");
    SIM_CHECK(!buf.is_listening(), "stop must end listening");
    SIM_CHECK(!buf.needs_finalize_on_disconnect(), "nothing left to finalize");

    SIM_CHECK(!buf.on_audio_frame(frame.data(), frame.size()), "frame accepted after stop");
    return 0;
}

static int test_restart_clears_previous_capture() {
    AudioIngestBuffer buf(0, 0);
    std::vector<uint8_t> a(10, 1), b(4, 2);
    buf.on_start();
    buf.on_audio_frame(a.data(), a.size());
    buf.on_start();
    buf.on_audio_frame(b.data(), b.size());
    std::vector<uint8_t> audio = buf.on_stop();
    SIM_CHECK(audio == b, "second start must discard the first capture");
    return 0;
}

static int test_minimum_and_cap() {
    AudioIngestBuffer buf(64000, 100);
    std::vector<uint8_t> frame(60, 0);
    buf.on_start();
    SIM_CHECK(buf.on_audio_frame(frame.data(), frame.size()), "first frame fits");
    SIM_CHECK(!buf.on_audio_frame(frame.data(), frame.size()), "frame over the cap must be dropped");
    SIM_CHECK(buf.dropped_bytes() == 60, "dropped bytes counted");
    SIM_CHECK(buf.size() == 60, "cap keeps earlier audio");

    std::vector<uint8_t> audio = buf.on_stop();
    SIM_CHECK(!buf.is_usable(audio), "60 bytes is below the minimum");
    SIM_CHECK(buf.is_usable(std::vector<uint8_t>(64000, 0)), "exactly the minimum is usable");
    return 0;
}

static int test_stop_without_audio() {
    AudioIngestBuffer buf(10, 0);
    std::vector<uint8_t> audio = buf.on_stop();
    SIM_CHECK(audio.empty(), "stop before start yields nothing");
    buf.on_start();
    SIM_CHECK(!buf.needs_finalize_on_disconnect(), "listening but empty needs no finalize");
    return 0;
}

int main() {
    int failures = 0;
    failures += run_case("frames before start are dropped", test_frames_before_start_are_dropped);
    failures += run_case("start/accumulate/stop", test_start_accumulate_stop);
    failures += run_case("restart clears previous capture", test_restart_clears_previous_capture);
    failures += run_case("minimum duration and buffer cap", test_minimum_and_cap);
    failures += run_case("stop without audio", test_stop_without_audio);

    if (failures) {
        std::cerr << "❌ " << failures << " ingest buffer case(s) failed\n";
        return 1;
    }
    std::cout << "All ingest buffer tests passed.\n";
    return 0;
}
