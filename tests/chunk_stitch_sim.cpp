#include "sim_support.h"
#include "../chunk-transcriber.h"
#include "../model-coordinator.h"
#include <memory>

// Chunk planning, per-window recognition and transcript stitching.
// 1000 ms ceiling = 32000 bytes, 250 ms overlap = 8000 bytes, 100 ms floor = 3200 bytes.

static ChunkingConfig test_chunking(int overlap_ms = 250) {
    ChunkingConfig c;
    c.max_chunk_ms = 1000;
    c.overlap_ms = overlap_ms;
    c.min_chunk_ms = 100;
    return c;
}

struct Rig {
    FakeRecognizer* recognizer;
    std::unique_ptr<ModelCoordinator> coordinator;
    std::unique_ptr<ChunkTranscriber> transcriber;

    explicit Rig(FakeRecognizer::Script script, int overlap_ms = 250) {
        auto rec = std::make_unique<FakeRecognizer>(std::move(script));
        recognizer = rec.get();
        coordinator = std::make_unique<ModelCoordinator>(std::move(rec), nullptr);
        transcriber = std::make_unique<ChunkTranscriber>(*coordinator, AudioFormat(), test_chunking(overlap_ms));
    }
};

static int test_plan_chunk_geometry() {
    const size_t C = 32000, O = 8000;
    const size_t lengths[] = {32001, 40000, 56000, 56001, 64000, 100000, 320000};
    for (size_t L : lengths) {
        std::vector<AudioChunk> chunks = plan_chunks(L, C, O);
        size_t expected = (L - O + (C - O) - 1) / (C - O);
        SIM_CHECK(chunks.size() == expected, "chunk count for L=" << L << " got " << chunks.size());
        SIM_CHECK(chunks.front().start_offset == 0, "first chunk starts at 0");
        SIM_CHECK(chunks.back().start_offset + chunks.back().length == L, "last chunk ends at L=" << L);
        for (size_t i = 0; i < chunks.size(); ++i) {
            if (i + 1 < chunks.size()) {
                SIM_CHECK(chunks[i].length == C, "non-last chunk has full length");
                size_t prev_end = chunks[i].start_offset + chunks[i].length;
                SIM_CHECK(prev_end - chunks[i + 1].start_offset == O, "consecutive chunks share the overlap");
                SIM_CHECK(chunks[i + 1].overlap_length == O, "overlap recorded");
            }
            SIM_CHECK(chunks[i].index == i, "indices are sequential");
        }
    }

    SIM_CHECK(plan_chunks(0, C, O).empty(), "nothing to plan for empty audio");
    SIM_CHECK(plan_chunks(C, C, O).size() == 1, "audio at the ceiling is one chunk");
    return 0;
}

static int test_single_call_is_trimmed() {
    Rig rig([](size_t, size_t, std::string& text, std::string&) {
        text = "  hello world \n";
        return true;
    });
    TranscriptResult r = rig.transcriber->transcribe(std::vector<uint8_t>(32000, 0), "t");
    SIM_CHECK(rig.recognizer->calls() == 1, "one recognizer call at the ceiling");
    SIM_CHECK(r.status == TranscriptStatus::Ok, "status ok");
    SIM_CHECK(r.text == "hello world", "trimmed text, got '" << r.text << "'");
    return 0;
}

static int test_single_call_failure() {
    Rig rig([](size_t, size_t, std::string&, std::string& error) {
        error = "boom";
        return false;
    });
    TranscriptResult r = rig.transcriber->transcribe(std::vector<uint8_t>(16000, 0), "t");
    SIM_CHECK(r.status == TranscriptStatus::Failed, "single failure is Failed");
    SIM_CHECK(r.text.empty(), "no text on failure");
    SIM_CHECK(r.reason == "boom", "reason carried through");
    return 0;
}

static int test_chunked_stitch_and_normalize() {
    const std::vector<std::string> script = {"one two.", ". three", "four !!"};
    Rig rig([&](size_t i, size_t, std::string& text, std::string&) {
        text = script.at(i);
        return true;
    });
    TranscriptResult r = rig.transcriber->transcribe(std::vector<uint8_t>(64000, 0), "t");
    SIM_CHECK(rig.recognizer->calls() == 3, "three windows recognized");
    std::vector<size_t> lengths = rig.recognizer->lengths();
    SIM_CHECK(lengths[0] == 32000 && lengths[1] == 32000 && lengths[2] == 16000, "window lengths");
    SIM_CHECK(r.status == TranscriptStatus::Ok, "status ok");
    SIM_CHECK(r.text == "one two. three four!", "stitched text, got '" << r.text << "'");
    SIM_CHECK(r.chunks_planned == 3 && r.chunks_recognized == 3, "chunk accounting");
    return 0;
}

static int test_window_failure_is_dropped() {
    Rig rig([](size_t i, size_t, std::string& text, std::string& error) {
        if (i == 1) { error = "window failed"; return false; }
        text = "part" + std::to_string(i);
        return true;
    });
    TranscriptResult r = rig.transcriber->transcribe(std::vector<uint8_t>(64000, 0), "t");
    SIM_CHECK(rig.recognizer->calls() == 3, "pass continues after a failed window");
    SIM_CHECK(r.status == TranscriptStatus::Ok, "partial result is ok");
    SIM_CHECK(r.text == "part0 part2", "failed window contributes nothing, got '" << r.text << "'");
    SIM_CHECK(r.chunks_recognized == 2, "two windows recognized");
    return 0;
}

static int test_all_windows_fail_or_empty() {
    Rig failing([](size_t, size_t, std::string&, std::string& error) { error = "x"; return false; });
    TranscriptResult r = failing.transcriber->transcribe(std::vector<uint8_t>(64000, 0), "t");
    SIM_CHECK(r.status == TranscriptStatus::Failed, "every window failed");

    Rig silent([](size_t, size_t, std::string& text, std::string&) { text = "   "; return true; });
    r = silent.transcriber->transcribe(std::vector<uint8_t>(64000, 0), "t");
    SIM_CHECK(r.status == TranscriptStatus::Empty, "silence is an empty result, not an error");
    SIM_CHECK(r.text.empty(), "empty text");
    return 0;
}

static int test_short_trailing_window_skipped() {
    // No overlap: windows [0,32000) and [32000,33600); the second is under the 3200-byte floor
    Rig rig(nullptr, 0);
    TranscriptResult r = rig.transcriber->transcribe(std::vector<uint8_t>(33600, 0), "t");
    SIM_CHECK(rig.recognizer->calls() == 1, "short trailing window not recognized");
    SIM_CHECK(r.chunks_planned == 2, "both windows planned");
    SIM_CHECK(r.text == "chunk0", "only the first window's text, got '" << r.text << "'");
    return 0;
}

static int test_normalize_idempotent() {
    const std::vector<std::string> samples = {
        "hello  world . .  again !! ok ?",
        "  a\t\tb \n c  ",
        "\xE4\xBD\xA0\xE5\xA5\xBD\xE3\x80\x82 \xE3\x80\x82\xE3\x80\x82 \xE5\x86\x8D\xE8\xA7\x81 \xEF\xBC\x8C",
        "done. . . . next",
        "",
        "plain text"
    };
    for (const auto& s : samples) {
        std::string once = normalize_transcript(s);
        std::string twice = normalize_transcript(once);
        SIM_CHECK(once == twice, "normalization not idempotent for '" << s << "'");
    }
    SIM_CHECK(normalize_transcript("a  b .") == "a b.", "space before punctuation removed");
    SIM_CHECK(normalize_transcript("what?? ?") == "what?", "repeated question marks collapsed");
    SIM_CHECK(normalize_transcript("\xE5\xA5\xBD\xE3\x80\x82\xE3\x80\x82") == "\xE5\xA5\xBD\xE3\x80\x82",
              "full-width period collapsed");
    return 0;
}

static int test_overlap_not_shorter_than_chunk() {
    auto rec = std::make_unique<FakeRecognizer>();
    ModelCoordinator coordinator(std::move(rec), nullptr);
    ChunkingConfig c;
    c.max_chunk_ms = 500;
    c.overlap_ms = 500;
    ChunkTranscriber t(coordinator, AudioFormat(), c);
    SIM_CHECK(t.overlap_bytes() == 0, "overlap disabled when not shorter than the chunk");
    return 0;
}

int main() {
    int failures = 0;
    failures += run_case("plan chunk geometry", test_plan_chunk_geometry);
    failures += run_case("single call is trimmed", test_single_call_is_trimmed);
    failures += run_case("single call failure", test_single_call_failure);
    failures += run_case("chunked stitch and normalize", test_chunked_stitch_and_normalize);
    failures += run_case("window failure is dropped", test_window_failure_is_dropped);
    failures += run_case("all windows fail or empty", test_all_windows_fail_or_empty);
    failures += run_case("short trailing window skipped", test_short_trailing_window_skipped);
    failures += run_case("normalization idempotent", test_normalize_idempotent);
    failures += run_case("overlap not shorter than chunk", test_overlap_not_shorter_than_chunk);

    if (failures) {
        std::cerr << "❌ " << failures << " chunk/stitch case(s) failed\n";
        return 1;
    }
    std::cout << "All chunk/stitch tests passed.\n";
    return 0;
}
