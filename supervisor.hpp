#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "clock.hpp"
#include "process.hpp"

namespace page_recorder {

// Owns every external process spawned for one job.
class ProcessSupervisor {
public:
    struct Config {
        Millis grace{5000};        // SIGTERM -> SIGKILL delay
        Millis poll_interval{100};
    };

    ProcessSupervisor(const Config& cfg, TimeSource& clock);
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    // Once closed, the process is terminated on arrival instead of tracked.
    void track(std::shared_ptr<Process> process, const std::string& name);

    // Terminates every tracked process concurrently (graceful, then forceful)
    // and clears the set. Never throws.
    void terminateAll();

    // Terminates and forgets a single process, e.g. the render host after a
    // readiness timeout.
    void terminate(const std::shared_ptr<Process>& process);

    // Shutdown path: terminates everything tracked and refuses anything
    // tracked afterwards.
    void close();
    bool closed() const;

    std::size_t activeCount() const;
    std::vector<std::string> trackedNames() const;

private:
    struct ManagedProcess {
        std::shared_ptr<Process> handle;
        std::string name;
        bool termination_requested = false;
    };

    Config cfg_;
    TimeSource& clock_;
    std::mutex terminate_mx_;
    mutable std::mutex mx_;
    std::vector<ManagedProcess> tracked_;
    bool closed_ = false;
};

} // namespace page_recorder
