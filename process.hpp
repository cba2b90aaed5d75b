#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <sys/types.h> // pid_t

#include "clock.hpp"

namespace page_recorder {

// --------- Launch contract of one external binary ---------
struct SpawnSpec {
    std::vector<std::string> argv;                // argv[0] is looked up in PATH
    std::string cwd;                              // working directory (optional)
    std::map<std::string, std::string> env;       // extra environment (optional)
    bool shell = false;                           // true => run via /bin/sh -c "<joined argv>"
    bool new_process_group = true;                // signals then reach the whole group

    // If set, stdout+stderr of the child are read on a helper thread and handed
    // over line by line. Otherwise both go to /dev/null.
    std::function<void(const std::string&)> on_output;
};

std::string describeCommand(const SpawnSpec& spec);

struct ExitStatus {
    int exit_code = -1;   // valid when term_signal == 0
    int term_signal = 0;  // signal that killed the child, 0 if it exited

    bool success() const { return term_signal == 0 && exit_code == 0; }
    std::string describe() const;
};

// --------- Process handle ---------
class Process {
public:
    virtual ~Process() = default;

    virtual pid_t pid() const = 0;
    // Non-blocking. Once the child is reaped the status is cached.
    virtual std::optional<ExitStatus> tryWait() = 0;
    // Returns false if the child is already reaped or the signal could not be sent.
    virtual bool signal(int sig) = 0;

    bool running() { return !tryWait().has_value(); }
};

class PosixProcess : public Process {
    struct Token {};   // keeps construction inside spawn()

public:
    // Throws SpawnError if fork fails or the executable cannot be started.
    static std::shared_ptr<PosixProcess> spawn(const SpawnSpec& spec);

    PosixProcess(Token, pid_t pid, bool group);
    ~PosixProcess() override;

    PosixProcess(const PosixProcess&) = delete;
    PosixProcess& operator=(const PosixProcess&) = delete;

    pid_t pid() const override { return pid_; }
    std::optional<ExitStatus> tryWait() override;
    bool signal(int sig) override;

private:
    void startOutputReader(int fd, std::function<void(const std::string&)> sink);

    pid_t pid_;
    bool group_;
    mutable std::mutex mx_;
    std::optional<ExitStatus> status_;
    std::thread reader_;
};

// --------- Spawner seam ---------
class ProcessSpawner {
public:
    virtual ~ProcessSpawner() = default;
    virtual std::shared_ptr<Process> spawn(const SpawnSpec& spec) = 0;
};

class PosixSpawner : public ProcessSpawner {
public:
    std::shared_ptr<Process> spawn(const SpawnSpec& spec) override;
};

// --------- Waiting and termination ---------

// Polls until the process exits or `timeout` elapses.
std::optional<ExitStatus> waitForExit(Process& process, TimeSource& clock,
                                      Clock::duration timeout, Millis poll = Millis(100));

// SIGTERM, wait up to `grace`, then SIGKILL and wait until reaped.
// Returns true once the process is gone. Never throws.
bool terminateGracefully(Process& process, const std::string& name, Clock::duration grace,
                         TimeSource& clock, Millis poll = Millis(100));

} // namespace page_recorder
