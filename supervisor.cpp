#include "supervisor.hpp"

#include <algorithm>
#include <iostream>
#include <system_error>
#include <thread>

namespace page_recorder {

ProcessSupervisor::ProcessSupervisor(const Config& cfg, TimeSource& clock)
    : cfg_(cfg), clock_(clock) {}

ProcessSupervisor::~ProcessSupervisor() { terminateAll(); }

void ProcessSupervisor::track(std::shared_ptr<Process> process, const std::string& name) {
    if (!process) return;
    {
        std::lock_guard<std::mutex> lk(mx_);
        if (!closed_) {
            std::cout << "[Supervisor] Tracking " << name << " (pid " << process->pid() << ")" << std::endl;
            tracked_.push_back(ManagedProcess{std::move(process), name});
            return;
        }
    }
    std::cerr << "[Supervisor] Closed, stopping " << name << " (pid " << process->pid() << ")" << std::endl;
    // Failures are logged by the helper.
    terminateGracefully(*process, name, cfg_.grace, clock_, cfg_.poll_interval);
}

void ProcessSupervisor::close() {
    {
        std::lock_guard<std::mutex> lk(mx_);
        closed_ = true;
    }
    terminateAll();
}

bool ProcessSupervisor::closed() const {
    std::lock_guard<std::mutex> lk(mx_);
    return closed_;
}

void ProcessSupervisor::terminateAll() {
    // A second caller (signal path vs. job cleanup) waits for the first to finish.
    std::lock_guard<std::mutex> serial(terminate_mx_);
    std::vector<ManagedProcess> batch;
    {
        std::lock_guard<std::mutex> lk(mx_);
        for (auto& mp : tracked_) {
            if (mp.termination_requested) continue;
            mp.termination_requested = true;
            batch.push_back(mp);
        }
    }
    if (!batch.empty()) {
        std::cout << "[Supervisor] Terminating " << batch.size() << " process(es)" << std::endl;
    }

    // One thread per process so the whole batch finishes within one grace period.
    std::vector<std::thread> workers;
    workers.reserve(batch.size());
    for (const auto& mp : batch) {
        try {
            workers.emplace_back([this, handle = mp.handle, name = mp.name]() {
                terminateGracefully(*handle, name, cfg_.grace, clock_, cfg_.poll_interval);
            });
        } catch (const std::system_error& e) {
            std::cerr << "[Supervisor] No thread for " << mp.name << " (" << e.what()
                      << "), stopping it inline" << std::endl;
            terminateGracefully(*mp.handle, mp.name, cfg_.grace, clock_, cfg_.poll_interval);
        }
    }
    for (auto& t : workers) t.join();

    std::lock_guard<std::mutex> lk(mx_);
    for (auto& mp : tracked_) {
        if (!mp.termination_requested) continue;
        if (mp.handle->running()) {
            std::cerr << "[Supervisor] " << mp.name << " (pid " << mp.handle->pid()
                      << ") survived termination" << std::endl;
        }
    }
    // Entries tracked while the batch ran stay for the next call.
    tracked_.erase(std::remove_if(tracked_.begin(), tracked_.end(),
                                  [](const ManagedProcess& mp) { return mp.termination_requested; }),
                   tracked_.end());
}

void ProcessSupervisor::terminate(const std::shared_ptr<Process>& process) {
    std::lock_guard<std::mutex> serial(terminate_mx_);
    std::string name = "process";
    {
        std::lock_guard<std::mutex> lk(mx_);
        auto it = std::find_if(tracked_.begin(), tracked_.end(),
                               [&](const ManagedProcess& mp) { return mp.handle == process; });
        if (it == tracked_.end()) return;
        if (it->termination_requested) return;
        it->termination_requested = true;
        name = it->name;
    }
    terminateGracefully(*process, name, cfg_.grace, clock_, cfg_.poll_interval);

    std::lock_guard<std::mutex> lk(mx_);
    tracked_.erase(std::remove_if(tracked_.begin(), tracked_.end(),
                                  [&](const ManagedProcess& mp) { return mp.handle == process; }),
                   tracked_.end());
}

std::size_t ProcessSupervisor::activeCount() const {
    std::lock_guard<std::mutex> lk(mx_);
    return tracked_.size();
}

std::vector<std::string> ProcessSupervisor::trackedNames() const {
    std::lock_guard<std::mutex> lk(mx_);
    std::vector<std::string> out;
    out.reserve(tracked_.size());
    for (const auto& mp : tracked_) out.push_back(mp.name);
    return out;
}

} // namespace page_recorder
