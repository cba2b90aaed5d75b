#include "process.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>
#include <sstream>
#include <utility>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>     // fork, execvpe, chdir

#include "errors.hpp"

extern char** environ;

namespace page_recorder {

std::string describeCommand(const SpawnSpec& spec) {
    std::string joined;
    for (size_t i = 0; i < spec.argv.size(); ++i) {
        if (i) joined += ' ';
        joined += spec.argv[i];
    }
    return joined;
}

std::string ExitStatus::describe() const {
    if (term_signal != 0) return "killed by signal " + std::to_string(term_signal);
    return "exit code " + std::to_string(exit_code);
}

static ExitStatus decode_wait_status(int status) {
    ExitStatus st;
    if (WIFEXITED(status)) {
        st.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        st.term_signal = WTERMSIG(status);
    }
    return st;
}

// Environment of the child: ours, with the spec's overrides applied.
// Built before fork so the child only runs async-signal-safe calls.
static std::vector<std::string> build_environment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> out;
    for (char** e = environ; e && *e; ++e) {
        std::string kv(*e);
        auto eq = kv.find('=');
        std::string key = eq == std::string::npos ? kv : kv.substr(0, eq);
        if (overrides.count(key)) continue;
        out.push_back(std::move(kv));
    }
    for (const auto& kv : overrides) out.push_back(kv.first + "=" + kv.second);
    return out;
}

static std::vector<char*> to_cvector(std::vector<std::string>& v) {
    std::vector<char*> out;
    out.reserve(v.size() + 1);
    for (auto& s : v) out.push_back(const_cast<char*>(s.c_str()));
    out.push_back(nullptr);
    return out;
}

// --------------------------- PosixProcess ------------------------------------
PosixProcess::PosixProcess(Token, pid_t pid, bool group) : pid_(pid), group_(group) {}

std::shared_ptr<PosixProcess> PosixProcess::spawn(const SpawnSpec& spec) {
    std::vector<std::string> local_argv;
    if (spec.shell) {
        local_argv = { "/bin/sh", "-c", describeCommand(spec) };
    } else {
        local_argv = spec.argv;
    }
    if (local_argv.empty()) throw SpawnError("empty argv; nothing to exec");

    std::vector<std::string> envs = build_environment(spec.env);
    std::vector<char*> cargv = to_cvector(local_argv);
    std::vector<char*> cenv = to_cvector(envs);

    // Reports exec failure (errno) back to the parent; closed by a successful exec.
    int err_pipe[2];
    if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
        throw SpawnError(std::string("pipe: ") + std::strerror(errno));
    }
    int out_pipe[2] = {-1, -1};
    if (spec.on_output && ::pipe2(out_pipe, O_CLOEXEC) != 0) {
        int e = errno;
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);
        throw SpawnError(std::string("pipe: ") + std::strerror(e));
    }

    pid_t pid = ::fork();
    if (pid == -1) {
        int e = errno;
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);
        if (out_pipe[0] >= 0) { ::close(out_pipe[0]); ::close(out_pipe[1]); }
        throw SpawnError(std::string("fork: ") + std::strerror(e));
    }
    if (pid == 0) {
        // Child
        if (spec.new_process_group) ::setpgid(0, 0);
        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        int out_fd = out_pipe[1] >= 0 ? out_pipe[1] : devnull;
        if (out_fd >= 0) {
            ::dup2(out_fd, STDOUT_FILENO);
            ::dup2(out_fd, STDERR_FILENO);
        }
        if (!spec.cwd.empty() && ::chdir(spec.cwd.c_str()) != 0) {
            int e = errno;
            (void)!::write(err_pipe[1], &e, sizeof(e));
            _exit(127);
        }
        ::execvpe(cargv[0], cargv.data(), cenv.data());
        int e = errno;
        (void)!::write(err_pipe[1], &e, sizeof(e));
        _exit(127);
    }

    // Parent
    if (spec.new_process_group) ::setpgid(pid, pid); // closes the race with the child's own call
    ::close(err_pipe[1]);
    if (out_pipe[1] >= 0) ::close(out_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(err_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(err_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        if (out_pipe[0] >= 0) ::close(out_pipe[0]);
        throw SpawnError("cannot start '" + local_argv[0] + "': " + std::strerror(child_errno));
    }

    auto proc = std::make_shared<PosixProcess>(Token{}, pid, spec.new_process_group);
    if (out_pipe[0] >= 0) proc->startOutputReader(out_pipe[0], spec.on_output);
    return proc;
}

PosixProcess::~PosixProcess() {
    if (!tryWait()) {
        std::cerr << "[Spawn] pid " << pid_ << " still running at release, killing" << std::endl;
        signal(SIGKILL);
        int status = 0;
        while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
    }
    if (reader_.joinable()) reader_.join();
}

void PosixProcess::startOutputReader(int fd, std::function<void(const std::string&)> sink) {
    reader_ = std::thread([fd, sink = std::move(sink)]() {
        std::string pending;
        char buf[4096];
        while (true) {
            ssize_t n = ::read(fd, buf, sizeof(buf));
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) break;
            for (ssize_t i = 0; i < n; ++i) {
                char c = buf[i];
                if (c == '\n' || c == '\r') {
                    if (!pending.empty()) sink(pending);
                    pending.clear();
                } else {
                    pending += c;
                }
            }
        }
        if (!pending.empty()) sink(pending);
        ::close(fd);
    });
}

std::optional<ExitStatus> PosixProcess::tryWait() {
    std::lock_guard<std::mutex> lk(mx_);
    if (status_) return status_;
    int status = 0;
    pid_t r = ::waitpid(pid_, &status, WNOHANG);
    if (r == pid_) {
        status_ = decode_wait_status(status);
    } else if (r < 0 && errno == ECHILD) {
        // Reaped elsewhere; nothing left to wait for.
        status_ = ExitStatus{};
    }
    return status_;
}

bool PosixProcess::signal(int sig) {
    std::lock_guard<std::mutex> lk(mx_);
    if (status_) return false;
    pid_t target = group_ ? -pid_ : pid_;
    if (::kill(target, sig) == 0) return true;
    // The group may already be gone while the leader is a zombie
    return group_ && ::kill(pid_, sig) == 0;
}

std::shared_ptr<Process> PosixSpawner::spawn(const SpawnSpec& spec) {
    return PosixProcess::spawn(spec);
}

// --------------------------- waiting / termination ---------------------------
std::optional<ExitStatus> waitForExit(Process& process, TimeSource& clock,
                                      Clock::duration timeout, Millis poll) {
    const auto deadline = clock.now() + timeout;
    while (true) {
        if (auto st = process.tryWait()) return st;
        if (clock.now() >= deadline) return std::nullopt;
        clock.sleepFor(poll);
    }
}

bool terminateGracefully(Process& process, const std::string& name, Clock::duration grace,
                         TimeSource& clock, Millis poll) {
    try {
        if (process.tryWait()) return true;

        std::cout << "[Supervisor] Stopping " << name << " (pid " << process.pid() << ")" << std::endl;
        process.signal(SIGTERM);
        if (waitForExit(process, clock, grace, poll)) return true;

        std::cout << "[Supervisor] Force killing " << name << " (pid " << process.pid() << ")" << std::endl;
        process.signal(SIGKILL);
        if (waitForExit(process, clock, grace, poll)) return true;

        std::cerr << "[Supervisor] " << name << " (pid " << process.pid()
                  << ") did not go away after SIGKILL" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[Supervisor] Error stopping " << name << ": " << e.what() << std::endl;
    }
    return false;
}

} // namespace page_recorder
