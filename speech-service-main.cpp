#include "speech-service.h"
#include "whisper-recognizer.h"
#include "piper-synthesizer.h"
#include "clone-command-synthesizer.h"

#include <iostream>
#include <string>
#include <csignal>
#include <cstdlib>
#include <atomic>
#include <memory>
#include <thread>
#include <chrono>
#include <map>
#include <stdexcept>

static std::atomic<bool> g_shutdown(false);

struct SpeechServiceArgs {
    std::string host = "0.0.0.0";
    int port = 10095;
    std::string db_path = "speech_service.db";
    std::string voices_dir = "cloned_voices";
    std::string whisper_model = "models/ggml-base.bin";
    int threads = 4;
    std::string language = "auto";
    bool use_gpu = true;
    std::string piper_model = "models/voice.onnx";
    std::string espeak_data = "espeak-ng-data";
    std::map<std::string, int> voices;   // empty = default=0
    std::string clone_command;
    int max_chunk_ms = 10000;
    int overlap_ms = 500;
    int min_chunk_ms = 300;
    int min_audio_ms = 2000;
    int cache_size = 50;
    bool preload = true;
    int preload_delay_ms = 3000;
    bool verbose = false;
};

static void print_usage(const char* prog) {
    std::cout << "\n🎤 Speech Service (recognition + synthesis)\n\n";
    std::cout << "Usage: " << prog << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --host ADDR                Listen address [0.0.0.0]            (SPEECH_HOST)\n";
    std::cout << "  --port N                   TCP port [10095]                    (SPEECH_PORT)\n";
    std::cout << "  -d, --database PATH        Database path [speech_service.db]   (SPEECH_DATABASE)\n";
    std::cout << "  --voices-dir PATH          Cloned voice samples [cloned_voices] (SPEECH_VOICES_DIR)\n";
    std::cout << "  --whisper-model PATH       Whisper model [models/ggml-base.bin] (SPEECH_WHISPER_MODEL)\n";
    std::cout << "  -t, --threads N            Whisper threads [4]\n";
    std::cout << "  -l, --language LANG        Recognition language [auto]\n";
    std::cout << "  --no-gpu                   Disable GPU for Whisper\n";
    std::cout << "  --piper-model PATH         Piper voice model [models/voice.onnx] (SPEECH_PIPER_MODEL)\n";
    std::cout << "  --espeak-data PATH         eSpeak-ng data path [espeak-ng-data]\n";
    std::cout << "  --voice NAME=SPEAKER       Built-in voice (repeatable) [default=0]\n";
    std::cout << "  --clone-command PATH       Voice cloning program [disabled]   (SPEECH_CLONE_COMMAND)\n";
    std::cout << "  --max-chunk-ms N           Longest audio per recognition call [10000] (SPEECH_MAX_CHUNK_MS)\n";
    std::cout << "  --overlap-ms N             Overlap between chunks [500]       (SPEECH_CHUNK_OVERLAP_MS)\n";
    std::cout << "  --min-chunk-ms N           Shortest chunk worth recognizing [300]\n";
    std::cout << "  --min-audio-ms N           Shortest usable capture [2000]     (SPEECH_MIN_AUDIO_MS)\n";
    std::cout << "  --cache-size N             Synthesis cache entries, 0 disables [50] (SPEECH_CACHE_SIZE)\n";
    std::cout << "  --no-preload               Do not pre-synthesize common phrases (SPEECH_DISABLE_PRELOAD=1)\n";
    std::cout << "  --preload-delay-ms N       Delay before preloading [3000]\n";
    std::cout << "  -v, --verbose              Verbose output\n";
    std::cout << "  -h, --help                 Show this help\n\n";
    std::cout << "Clients speak length-prefixed frames: [u8 type][u32 length][payload].\n";
    std::cout << "Type 1 = JSON control/request, 2 = PCM16 16 kHz mono audio, 8 = close.\n\n";
}

static std::string env_or(const char* name, const std::string& fallback) {
    const char* v = std::getenv(name);
    return (v && *v) ? std::string(v) : fallback;
}

static int env_int_or(const char* name, int fallback) {
    const char* v = std::getenv(name);
    if (!v || !*v) return fallback;
    try {
        return std::stoi(v);
    } catch (const std::exception&) {
        std::cerr << "⚠️ Ignoring invalid " << name << "=" << v << std::endl;
        return fallback;
    }
}

static void apply_environment(SpeechServiceArgs& a) {
    a.host = env_or("SPEECH_HOST", a.host);
    a.port = env_int_or("SPEECH_PORT", a.port);
    a.db_path = env_or("SPEECH_DATABASE", a.db_path);
    a.voices_dir = env_or("SPEECH_VOICES_DIR", a.voices_dir);
    a.whisper_model = env_or("SPEECH_WHISPER_MODEL", a.whisper_model);
    a.piper_model = env_or("SPEECH_PIPER_MODEL", a.piper_model);
    a.clone_command = env_or("SPEECH_CLONE_COMMAND", a.clone_command);
    a.max_chunk_ms = env_int_or("SPEECH_MAX_CHUNK_MS", a.max_chunk_ms);
    a.overlap_ms = env_int_or("SPEECH_CHUNK_OVERLAP_MS", a.overlap_ms);
    a.min_audio_ms = env_int_or("SPEECH_MIN_AUDIO_MS", a.min_audio_ms);
    a.cache_size = env_int_or("SPEECH_CACHE_SIZE", a.cache_size);
    if (env_or("SPEECH_DISABLE_PRELOAD", "") == "1") a.preload = false;
}

static bool parse_voice(const std::string& voice_arg, SpeechServiceArgs& a) {
    size_t eq = voice_arg.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 >= voice_arg.size()) return false;
    a.voices[voice_arg.substr(0, eq)] = std::stoi(voice_arg.substr(eq + 1));
    return true;
}

static bool parse_args(int argc, char** argv, SpeechServiceArgs& a) {
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            auto next = [&]() -> std::string {
                if (i + 1 >= argc) throw std::invalid_argument("missing value for " + arg);
                return argv[++i];
            };

            if (arg == "-h" || arg == "--help") { print_usage(argv[0]); return false; }
            else if (arg == "--host") a.host = next();
            else if (arg == "--port") a.port = std::stoi(next());
            else if (arg == "-d" || arg == "--database") a.db_path = next();
            else if (arg == "--voices-dir") a.voices_dir = next();
            else if (arg == "--whisper-model") a.whisper_model = next();
            else if (arg == "-t" || arg == "--threads") a.threads = std::stoi(next());
            else if (arg == "-l" || arg == "--language") a.language = next();
            else if (arg == "--no-gpu") a.use_gpu = false;
            else if (arg == "--piper-model") a.piper_model = next();
            else if (arg == "--espeak-data") a.espeak_data = next();
            else if (arg == "--voice") {
                std::string voice_arg = next();
                if (!parse_voice(voice_arg, a)) {
                    std::cerr << "❌ Invalid --voice (expected NAME=SPEAKER): " << voice_arg << std::endl;
                    return false;
                }
            }
            else if (arg == "--clone-command") a.clone_command = next();
            else if (arg == "--max-chunk-ms") a.max_chunk_ms = std::stoi(next());
            else if (arg == "--overlap-ms") a.overlap_ms = std::stoi(next());
            else if (arg == "--min-chunk-ms") a.min_chunk_ms = std::stoi(next());
            else if (arg == "--min-audio-ms") a.min_audio_ms = std::stoi(next());
            else if (arg == "--cache-size") a.cache_size = std::stoi(next());
            else if (arg == "--no-preload") a.preload = false;
            else if (arg == "--preload-delay-ms") a.preload_delay_ms = std::stoi(next());
            else if (arg == "-v" || arg == "--verbose") a.verbose = true;
            else {
                std::cerr << "❌ Unknown argument: " << arg << std::endl;
                print_usage(argv[0]);
                return false;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "❌ Invalid arguments: " << e.what() << std::endl;
        return false;
    }

    if (a.max_chunk_ms <= 0 || a.overlap_ms < 0 || a.min_chunk_ms < 0 || a.min_audio_ms < 0 || a.cache_size < 0) {
        std::cerr << "❌ Durations and cache size must not be negative" << std::endl;
        return false;
    }
    if (a.voices.empty()) a.voices["default"] = 0;
    return true;
}

static void on_signal(int) {
    g_shutdown.store(true);
}

int main(int argc, char** argv) {
    SpeechServiceArgs a;
    apply_environment(a);
    if (!parse_args(argc, argv, a)) return 1;

    signal(SIGINT, on_signal);
    signal(SIGTERM, on_signal);
    signal(SIGPIPE, SIG_IGN);

    SpeechServiceConfig cfg;
    cfg.host = a.host;
    cfg.port = a.port;
    cfg.database_path = a.db_path;
    cfg.voices_dir = a.voices_dir;
    cfg.builtin_voices = a.voices;
    cfg.chunking.max_chunk_ms = a.max_chunk_ms;
    cfg.chunking.overlap_ms = a.overlap_ms;
    cfg.chunking.min_chunk_ms = a.min_chunk_ms;
    cfg.min_audio_ms = a.min_audio_ms;
    cfg.cache_size = static_cast<size_t>(a.cache_size);
    cfg.preload_enabled = a.preload;
    cfg.preload.initial_delay = std::chrono::milliseconds(a.preload_delay_ms);
    cfg.verbose = a.verbose;

    SpeechService service(cfg);
    if (!service.init()) {
        std::cout << "❌ Failed to initialize speech service" << std::endl;
        return 1;
    }

    // Eagerly load models so the first client never pays for it
    WhisperRecognizerConfig wcfg;
    wcfg.model_path = a.whisper_model;
    wcfg.language = a.language;
    wcfg.n_threads = a.threads;
    wcfg.use_gpu = a.use_gpu;
    wcfg.verbose = a.verbose;
    auto recognizer = std::make_unique<WhisperRecognizer>(wcfg);
    if (!recognizer->load()) {
        service.mark_error();
        return 1;
    }

    PiperSynthesizerConfig pcfg;
    pcfg.model_path = a.piper_model;
    pcfg.espeak_data_path = a.espeak_data;
    pcfg.verbose = a.verbose;
    auto piper = std::make_unique<PiperSynthesizer>(pcfg);
    if (!piper->load()) {
        service.mark_error();
        return 1;
    }

    std::unique_ptr<SpeechSynthesizer> cloner;
    if (!a.clone_command.empty()) {
        auto clone = std::make_unique<CloneCommandSynthesizer>(a.clone_command, a.verbose);
        if (!clone->is_ready()) {
            std::cout << "⚠️ Clone command is not executable: " << a.clone_command << std::endl;
        }
        cloner = std::move(clone);
    } else {
        std::cout << "ℹ️ Voice cloning disabled (no --clone-command)" << std::endl;
    }

    auto synthesizer = std::make_unique<RoutingSynthesizer>(std::move(piper), std::move(cloner));
    if (!service.start(std::move(recognizer), std::move(synthesizer))) {
        std::cout << "❌ Failed to start speech service" << std::endl;
        return 1;
    }

    std::cout << "🎤 Speech service running. Press Ctrl+C to stop." << std::endl;

    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::cout << "\n🛑 Shutting down..." << std::endl;
    service.stop();
    std::cout << "✅ Speech service shutdown complete" << std::endl;
    return 0;
}
