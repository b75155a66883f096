#pragma once

#include "inference-backend.h"
#include <string>
#include <vector>
#include <sys/types.h>

// Synthesizes sample-backed voices by running an external voice-cloning program:
//   <command> --text T --speaker WAV --output OUT --emo-alpha A [--use-emo-text]
// A zero exit status with a non-empty output file is success.
class CloneCommandSynthesizer : public SpeechSynthesizer {
public:
    explicit CloneCommandSynthesizer(const std::string& command, bool verbose = false);

    bool synthesize(const SynthesisRequest& request, const std::string& output_path,
                    std::string& error) override;
    bool is_ready() const override;
    bool supports(const VoiceIdentity& voice) const override { return !voice.sample_path.empty(); }

    const std::string& command() const { return command_; }

    static std::vector<std::string> build_arguments(const SynthesisRequest& request,
                                                    const std::string& output_path);

private:
    std::string command_;
    bool verbose_;

    bool spawn_command(const std::vector<std::string>& args, pid_t& out_pid, std::string& error);
};
