#include "process_launcher.h"
#include <cerrno>
#include <chrono>
#include <cstring>
#include <sstream>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

// RAII wrapper for a pipe file descriptor
struct FdGuard {
    int fd_;
    explicit FdGuard(int fd = -1) : fd_(fd) {}
    ~FdGuard() { reset(); }
    void reset(int fd = -1) {
        if (fd_ >= 0) close(fd_);
        fd_ = fd;
    }
    int get() const { return fd_; }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;
};

bool makePipe(FdGuard& read_end, FdGuard& write_end) {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0) {
        return false;
    }
    read_end.reset(fds[0]);
    write_end.reset(fds[1]);
    return true;
}

// Read whatever is available; false once the writer closed its end
bool drain(int fd, std::string& sink) {
    char buffer[4096];
    ssize_t n = read(fd, buffer, sizeof(buffer));
    if (n > 0) {
        sink.append(buffer, static_cast<size_t>(n));
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
        return true;
    }
    return false;
}

} // namespace

ProcessResult ProcessLauncher::run(const std::string& executable_path,
                                   const std::vector<std::string>& arguments,
                                   int timeout_seconds) {
    ProcessResult result;

    FdGuard out_read, out_write, err_read, err_write, exec_read, exec_write;
    if (!makePipe(out_read, out_write) || !makePipe(err_read, err_write) || !makePipe(exec_read, exec_write)) {
        result.launch_error = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }

    std::vector<char*> argv;
    argv.reserve(arguments.size() + 2);
    argv.push_back(const_cast<char*>(executable_path.c_str()));
    for (const auto& arg : arguments) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        result.launch_error = std::string("fork failed: ") + std::strerror(errno);
        return result;
    }

    if (pid == 0) {
        // Child: wire stdout/stderr, leave the exec pipe to report failures.
        // dup2 clears O_CLOEXEC on the duplicated descriptors.
        dup2(out_write.get(), STDOUT_FILENO);
        dup2(err_write.get(), STDERR_FILENO);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
        }
        execvp(argv[0], argv.data());
        int exec_errno = errno;
        ssize_t ignored = write(exec_write.get(), &exec_errno, sizeof(exec_errno));
        (void)ignored;
        _exit(127);
    }

    out_write.reset();
    err_write.reset();
    exec_write.reset();

    int exec_errno = 0;
    ssize_t exec_bytes;
    do {
        exec_bytes = read(exec_read.get(), &exec_errno, sizeof(exec_errno));
    } while (exec_bytes < 0 && errno == EINTR);
    if (exec_bytes == static_cast<ssize_t>(sizeof(exec_errno))) {
        waitpid(pid, nullptr, 0);
        result.launch_error = "cannot execute " + executable_path + ": " + std::strerror(exec_errno);
        return result;
    }
    result.launched = true;

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_seconds);
    bool out_open = true;
    bool err_open = true;

    while (out_open || err_open) {
        int wait_ms = -1;
        if (timeout_seconds > 0) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (remaining <= 0) {
                result.timed_out = true;
                break;
            }
            wait_ms = static_cast<int>(remaining);
        }

        struct pollfd fds[2];
        nfds_t count = 0;
        if (out_open) {
            fds[count].fd = out_read.get();
            fds[count].events = POLLIN;
            fds[count].revents = 0;
            ++count;
        }
        if (err_open) {
            fds[count].fd = err_read.get();
            fds[count].events = POLLIN;
            fds[count].revents = 0;
            ++count;
        }

        int ready = poll(fds, count, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ready == 0) continue;

        for (nfds_t i = 0; i < count; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            if (fds[i].fd == out_read.get()) {
                out_open = drain(fds[i].fd, result.stdout_output);
            } else {
                err_open = drain(fds[i].fd, result.stderr_output);
            }
        }
    }

    if (result.timed_out) {
        kill(pid, SIGKILL);
    }

    int status = 0;
    pid_t waited;
    do {
        waited = waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);

    if (waited == pid && WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else {
        result.exit_code = -1;
    }
    return result;
}

std::string ProcessLauncher::describe(const std::string& executable_path, const std::vector<std::string>& arguments) {
    std::ostringstream oss;
    oss << executable_path;
    for (const auto& arg : arguments) {
        if (arg.find(' ') != std::string::npos) {
            oss << " \"" << arg << "\"";
        } else {
            oss << " " << arg;
        }
    }
    return oss.str();
}
