#include "clone-command-synthesizer.h"
#include <iostream>
#include <sstream>
#include <cstring>
#include <cerrno>
#include <spawn.h>
#include <sys/wait.h>
#include <sys/stat.h>
#include <unistd.h>

extern char** environ;

CloneCommandSynthesizer::CloneCommandSynthesizer(const std::string& command, bool verbose)
    : command_(command), verbose_(verbose) {}

bool CloneCommandSynthesizer::is_ready() const {
    return !command_.empty() && access(command_.c_str(), X_OK) == 0;
}

std::vector<std::string> CloneCommandSynthesizer::build_arguments(const SynthesisRequest& request,
                                                                  const std::string& output_path) {
    std::ostringstream alpha;
    alpha << request.emo_alpha;

    std::vector<std::string> args = {
        "--text", request.text,
        "--speaker", request.voice.sample_path,
        "--output", output_path,
        "--emo-alpha", alpha.str()
    };
    if (request.use_emo_text) {
        args.push_back("--use-emo-text");
    }
    return args;
}

bool CloneCommandSynthesizer::spawn_command(const std::vector<std::string>& args, pid_t& out_pid,
                                            std::string& error) {
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(command_.c_str()));
    for (const auto& s : args) argv.push_back(const_cast<char*>(s.c_str()));
    argv.push_back(nullptr);

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    int rc = posix_spawn(&out_pid, command_.c_str(), &actions, nullptr, argv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    if (rc != 0) {
        error = "failed to spawn '" + command_ + "': " + strerror(rc);
        return false;
    }
    return true;
}

bool CloneCommandSynthesizer::synthesize(const SynthesisRequest& request, const std::string& output_path,
                                         std::string& error) {
    if (command_.empty()) {
        error = "voice cloning is not configured (no clone command)";
        return false;
    }
    if (request.voice.sample_path.empty()) {
        error = "voice '" + request.voice.id + "' has no reference sample";
        return false;
    }

    pid_t pid = -1;
    if (!spawn_command(build_arguments(request, output_path), pid, error)) {
        return false;
    }

    if (verbose_) {
        std::cout << "🚀 Started clone command (PID " << pid << ") for voice " << request.voice.id << std::endl;
    }

    int status = 0;
    pid_t waited;
    do {
        waited = waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);

    if (waited < 0) {
        error = std::string("waitpid failed: ") + strerror(errno);
        return false;
    }
    if (WIFSIGNALED(status)) {
        error = "clone command killed by signal " + std::to_string(WTERMSIG(status));
        return false;
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        error = "clone command exited with status " + std::to_string(WEXITSTATUS(status));
        return false;
    }

    struct stat st{};
    if (stat(output_path.c_str(), &st) != 0 || st.st_size == 0) {
        error = "clone command produced no audio";
        return false;
    }
    return true;
}
