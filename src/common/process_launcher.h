#pragma once

#include <string>
#include <vector>

// Outcome of one child process run
struct ProcessResult {
    bool launched;           // false if fork/exec failed
    int exit_code;           // -1 when killed by a signal or not launched
    bool timed_out;
    std::string stdout_output;
    std::string stderr_output;
    std::string launch_error;

    ProcessResult() : launched(false), exit_code(-1), timed_out(false) {}

    bool succeeded() const {
        return launched && !timed_out && exit_code == 0;
    }
};

// Runs external tools (yt-dlp, ffmpeg) with an argument vector. No shell is
// involved, so URLs and paths need no escaping.
class ProcessLauncher {
public:
    // Launch executable with arguments and wait for it to exit.
    // timeout_seconds <= 0 waits indefinitely; on timeout the child is killed.
    static ProcessResult run(
        const std::string& executable_path,
        const std::vector<std::string>& arguments,
        int timeout_seconds = 0
    );

    // Render a command line for logging
    static std::string describe(const std::string& executable_path, const std::vector<std::string>& arguments);
};
