/**
 * @file process.cpp
 * @brief fork/exec/poll process runner.
 */

#include "sandbox/process.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace sandbox_runner {

namespace {

// How long pipes are still drained once the process group has been killed.
constexpr auto kKillDrainGrace = std::chrono::milliseconds(200);

struct Pipe {
    int fds[2] = {-1, -1};

    ~Pipe() {
        close_read();
        close_write();
    }

    bool open() { return pipe2(fds, O_CLOEXEC) == 0; }
    void close_read() { if (fds[0] >= 0) { ::close(fds[0]); fds[0] = -1; } }
    void close_write() { if (fds[1] >= 0) { ::close(fds[1]); fds[1] = -1; } }
};

/// Accumulates bytes from one pipe and emits complete lines.
class LineSplitter {
public:
    LineSplitter(std::vector<std::string>& sink, const ChunkCallback& callback)
        : sink_(sink), callback_(callback) {}

    void feed(const char* data, size_t size) {
        pending_.append(data, size);
        size_t start = 0;
        for (size_t nl = pending_.find('\n'); nl != std::string::npos;
             nl = pending_.find('\n', start)) {
            emit(pending_.substr(start, nl - start + 1));
            start = nl + 1;
        }
        pending_.erase(0, start);
    }

    void finish() {
        if (!pending_.empty()) {
            emit(std::move(pending_));
            pending_.clear();
        }
    }

private:
    void emit(std::string line) {
        if (callback_) callback_(line);
        sink_.push_back(std::move(line));
    }

    std::vector<std::string>& sink_;
    const ChunkCallback& callback_;
    std::string pending_;
};

/// Read whatever is available; returns false once the pipe reached EOF.
bool drain(int fd, LineSplitter& splitter) {
    char buffer[4096];
    while (true) {
        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            splitter.feed(buffer, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
        return false;
    }
}

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags != -1) {
        static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
    }
}

std::vector<std::string> build_environment(const std::map<std::string, std::string>& extra) {
    std::map<std::string, std::string> merged;
    for (char** e = environ; e && *e; ++e) {
        std::string_view entry{*e};
        auto eq = entry.find('=');
        if (eq == std::string_view::npos) continue;
        merged[std::string{entry.substr(0, eq)}] = std::string{entry.substr(eq + 1)};
    }
    for (const auto& [key, value] : extra) {
        merged[key] = value;
    }
    std::vector<std::string> out;
    out.reserve(merged.size());
    for (const auto& [key, value] : merged) {
        out.push_back(key + "=" + value);
    }
    return out;
}

std::vector<char*> to_c_array(std::vector<std::string>& strings) {
    std::vector<char*> out;
    out.reserve(strings.size() + 1);
    for (auto& s : strings) out.push_back(s.data());
    out.push_back(nullptr);
    return out;
}

}  // namespace

Result<ProcessOutput> run_process(const ProcessSpec& spec,
                                  const ChunkCallback& on_stdout,
                                  const ChunkCallback& on_stderr,
                                  std::stop_token stop) {
    if (spec.argv.empty()) {
        return Error{ErrorKind::Io, "empty command line"};
    }

    Pipe out_pipe;
    Pipe err_pipe;
    Pipe exec_pipe;  // reports exec failure errno back to the parent
    if (!out_pipe.open() || !err_pipe.open() || !exec_pipe.open()) {
        return Error{ErrorKind::Io, std::string{"failed to create pipes: "} + std::strerror(errno)};
    }

    // Everything the child needs is prepared before fork().
    auto argv_storage = spec.argv;
    auto argv = to_c_array(argv_storage);
    auto env_storage = build_environment(spec.env);
    auto envp = to_c_array(env_storage);
    std::string cwd = spec.cwd.string();

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        return Error{ErrorKind::Io, std::string{"fork failed: "} + std::strerror(errno)};
    }

    if (pid == 0) {
        setpgid(0, 0);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        dup2(out_pipe.fds[1], STDOUT_FILENO);
        dup2(err_pipe.fds[1], STDERR_FILENO);
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            int err = errno;
            static_cast<void>(::write(exec_pipe.fds[1], &err, sizeof(err)));
            _exit(126);
        }
        execvpe(argv[0], argv.data(), envp.data());
        int err = errno;
        static_cast<void>(::write(exec_pipe.fds[1], &err, sizeof(err)));
        _exit(127);
    }

    // Also set from the parent so a kill can never miss the group.
    static_cast<void>(setpgid(pid, pid));
    out_pipe.close_write();
    err_pipe.close_write();
    exec_pipe.close_write();

    int exec_errno = 0;
    ssize_t n = 0;
    do {
        n = ::read(exec_pipe.fds[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        waitpid(pid, &status, 0);
        return Error{ErrorKind::Io, "failed to start " + spec.argv.front() + ": "
                                        + std::strerror(exec_errno)};
    }

    set_nonblocking(out_pipe.fds[0]);
    set_nonblocking(err_pipe.fds[0]);

    ProcessOutput output;
    LineSplitter out_lines(output.stdout_chunks, on_stdout);
    LineSplitter err_lines(output.stderr_chunks, on_stderr);
    bool out_open = true;
    bool err_open = true;
    bool exited = false;
    int status = 0;

    std::optional<std::chrono::steady_clock::time_point> killed_at;
    auto kill_group = [&] {
        kill(-pid, SIGKILL);
        killed_at = std::chrono::steady_clock::now();
    };

    while (out_open || err_open || !exited) {
        const auto now = std::chrono::steady_clock::now();
        if (!killed_at) {
            if (spec.timeout.count() > 0 && now - started > spec.timeout) {
                output.timed_out = true;
                kill_group();
            } else if (stop.stop_requested()) {
                output.cancelled = true;
                kill_group();
            }
        } else if (exited && now - *killed_at > kKillDrainGrace) {
            break;  // a process outside the group still holds a pipe
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (out_open) fds[nfds++] = pollfd{out_pipe.fds[0], POLLIN, 0};
        if (err_open) fds[nfds++] = pollfd{err_pipe.fds[0], POLLIN, 0};
        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, 50));
        } else {
            usleep(10000);
        }

        if (out_open && !drain(out_pipe.fds[0], out_lines)) {
            out_open = false;
            out_lines.finish();
            out_pipe.close_read();
        }
        if (err_open && !drain(err_pipe.fds[0], err_lines)) {
            err_open = false;
            err_lines.finish();
            err_pipe.close_read();
        }

        if (!exited && waitpid(pid, &status, WNOHANG) == pid) {
            exited = true;
        }
    }
    if (out_open) out_lines.finish();
    if (err_open) err_lines.finish();

    if (WIFEXITED(status)) {
        output.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        output.term_signal = WTERMSIG(status);
        output.exit_code = 128 + output.term_signal;
    }
    output.duration = std::chrono::duration_cast<Duration>(
        std::chrono::steady_clock::now() - started);
    return output;
}

Result<int> run_interactive(const std::vector<std::string>& argv_in) {
    if (argv_in.empty()) {
        return Error{ErrorKind::Io, "empty command line"};
    }
    auto argv_storage = argv_in;
    auto argv = to_c_array(argv_storage);

    const pid_t pid = fork();
    if (pid < 0) {
        return Error{ErrorKind::Io, std::string{"fork failed: "} + std::strerror(errno)};
    }
    if (pid == 0) {
        execvp(argv[0], argv.data());
        _exit(127);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return Error{ErrorKind::Io, std::string{"waitpid failed: "} + std::strerror(errno)};
        }
    }
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    return 128 + WTERMSIG(status);
}

bool find_on_path(std::string_view program) {
    if (program.find('/') != std::string_view::npos) {
        return access(std::string{program}.c_str(), X_OK) == 0;
    }
    const char* path_env = std::getenv("PATH");
    if (!path_env) return false;
    std::string_view path{path_env};
    size_t start = 0;
    while (start <= path.size()) {
        auto end = path.find(':', start);
        if (end == std::string_view::npos) end = path.size();
        std::string dir{path.substr(start, end - start)};
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + std::string{program};
        if (access(candidate.c_str(), X_OK) == 0) return true;
        start = end + 1;
    }
    return false;
}

}  // namespace sandbox_runner
