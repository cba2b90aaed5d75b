#pragma once

// In-memory stand-ins for the recorder's collaborators.

#include <csignal>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "clock.hpp"
#include "errors.hpp"
#include "page_inspector.hpp"
#include "process.hpp"
#include "scheduler.hpp"
#include "storage_client.hpp"

namespace page_recorder {
namespace testing {

// Time only moves when somebody sleeps (or the test advances it).
class ManualTimeSource : public TimeSource {
public:
    Clock::time_point now() const override {
        std::lock_guard<std::mutex> lk(mx_);
        return Clock::time_point{} + offset_;
    }
    void sleepFor(Clock::duration d) override {
        std::lock_guard<std::mutex> lk(mx_);
        offset_ += d;
        ++sleeps_;
    }
    void advance(Clock::duration d) {
        std::lock_guard<std::mutex> lk(mx_);
        offset_ += d;
    }
    Clock::duration elapsed() const {
        std::lock_guard<std::mutex> lk(mx_);
        return offset_;
    }
    unsigned sleeps() const {
        std::lock_guard<std::mutex> lk(mx_);
        return sleeps_;
    }

private:
    mutable std::mutex mx_;
    Clock::duration offset_{};
    unsigned sleeps_ = 0;
};

// Runs until told to exit; SIGTERM ends it unless it ignores SIGTERM, SIGKILL always does.
class FakeProcess : public Process {
public:
    FakeProcess(pid_t pid, std::vector<std::string> argv) : pid_(pid), argv_(std::move(argv)) {}

    pid_t pid() const override { return pid_; }

    std::optional<ExitStatus> tryWait() override {
        std::lock_guard<std::mutex> lk(mx_);
        ++polls_;
        if (!status_ && exit_after_polls_ && polls_ >= *exit_after_polls_) {
            status_ = ExitStatus{pending_code_, 0};
        }
        return status_;
    }

    bool signal(int sig) override {
        std::lock_guard<std::mutex> lk(mx_);
        if (status_) return false;
        signals_.push_back(sig);
        if (sig == SIGKILL || (sig == SIGTERM && !ignore_term_)) {
            status_ = ExitStatus{-1, sig};
        }
        return true;
    }

    void exitNow(int code) {
        std::lock_guard<std::mutex> lk(mx_);
        if (!status_) status_ = ExitStatus{code, 0};
    }
    // Exits with `code` on the n-th tryWait().
    void exitAfterPolls(unsigned n, int code) {
        std::lock_guard<std::mutex> lk(mx_);
        exit_after_polls_ = n;
        pending_code_ = code;
    }
    void ignoreTerm(bool on = true) {
        std::lock_guard<std::mutex> lk(mx_);
        ignore_term_ = on;
    }

    std::vector<int> signals() const {
        std::lock_guard<std::mutex> lk(mx_);
        return signals_;
    }
    bool exited() const {
        std::lock_guard<std::mutex> lk(mx_);
        return status_.has_value();
    }
    const std::vector<std::string>& argv() const { return argv_; }

private:
    const pid_t pid_;
    const std::vector<std::string> argv_;
    mutable std::mutex mx_;
    std::optional<ExitStatus> status_;
    std::optional<unsigned> exit_after_polls_;
    int pending_code_ = 0;
    unsigned polls_ = 0;
    bool ignore_term_ = false;
    std::vector<int> signals_;
};

class FakeSpawner : public ProcessSpawner {
public:
    // Called after each spawn, outside the spawner's lock.
    std::function<void(const SpawnSpec&, FakeProcess&)> on_spawn;

    std::shared_ptr<Process> spawn(const SpawnSpec& spec) override {
        std::shared_ptr<FakeProcess> proc;
        {
            std::lock_guard<std::mutex> lk(mx_);
            const std::string binary = spec.argv.empty() ? std::string() : spec.argv.front();
            if (failing_.count(binary)) throw SpawnError("cannot start '" + binary + "': No such file or directory");
            proc = std::make_shared<FakeProcess>(next_pid_++, spec.argv);
            specs_.push_back(spec);
            procs_.push_back(proc);
        }
        if (on_spawn) on_spawn(spec, *proc);
        return proc;
    }

    void failOn(const std::string& binary) {
        std::lock_guard<std::mutex> lk(mx_);
        failing_.insert(binary);
    }

    std::size_t spawnCount() const {
        std::lock_guard<std::mutex> lk(mx_);
        return procs_.size();
    }
    std::vector<SpawnSpec> specs() const {
        std::lock_guard<std::mutex> lk(mx_);
        return specs_;
    }
    std::vector<std::shared_ptr<FakeProcess>> processes() const {
        std::lock_guard<std::mutex> lk(mx_);
        return procs_;
    }
    std::shared_ptr<FakeProcess> byBinary(const std::string& binary) const {
        std::lock_guard<std::mutex> lk(mx_);
        for (const auto& p : procs_) {
            if (!p->argv().empty() && p->argv().front() == binary) return p;
        }
        return nullptr;
    }

private:
    mutable std::mutex mx_;
    pid_t next_pid_ = 1000;
    std::set<std::string> failing_;
    std::vector<SpawnSpec> specs_;
    std::vector<std::shared_ptr<FakeProcess>> procs_;
};

inline RenderStatus renderingStatus(double t = 3.5) {
    RenderStatus st;
    st.ready = st.playing = st.media_present = st.media_playing = true;
    st.canvas_present = st.page_loaded = true;
    st.current_time = t;
    return st;
}

// Answers inspect() from a script; once the script is used up, `fallback` repeats.
class FakeInspector : public PageInspector {
public:
    void reset() override {
        std::lock_guard<std::mutex> lk(mx_);
        ++resets_;
    }
    std::optional<RenderStatus> inspect() override {
        std::lock_guard<std::mutex> lk(mx_);
        ++inspections_;
        if (!script_.empty()) {
            auto next = script_.front();
            script_.pop_front();
            return next;
        }
        return fallback_;
    }

    void push(std::optional<RenderStatus> st) {
        std::lock_guard<std::mutex> lk(mx_);
        script_.push_back(st);
    }
    void setFallback(std::optional<RenderStatus> st) {
        std::lock_guard<std::mutex> lk(mx_);
        fallback_ = st;
    }
    unsigned inspections() const {
        std::lock_guard<std::mutex> lk(mx_);
        return inspections_;
    }
    unsigned resets() const {
        std::lock_guard<std::mutex> lk(mx_);
        return resets_;
    }

private:
    mutable std::mutex mx_;
    std::deque<std::optional<RenderStatus>> script_;
    std::optional<RenderStatus> fallback_;
    unsigned inspections_ = 0;
    unsigned resets_ = 0;
};

class FakeStorage : public StorageClient {
public:
    struct Upload {
        std::string object_path;
        std::size_t size = 0;
        std::string content_type;
        std::string cache_control;
    };

    bool fail_upload = false;
    bool fail_sign = false;
    bool fail_update = false;

    void upload(const std::string& object_path, const std::string& bytes,
                const std::string& content_type, const std::string& cache_control) override {
        if (fail_upload) throw StorageError("upload answered 500: boom", 500);
        uploads.push_back(Upload{object_path, bytes.size(), content_type, cache_control});
    }
    std::string createSignedUrl(const std::string& object_path, int expires_in_sec) override {
        if (fail_sign) throw StorageError("sign answered 404: not found", 404);
        signed_expiry.push_back(expires_in_sec);
        return "https://storage.test/object/sign/videos/" + object_path + "?token=t";
    }
    void updateRecord(const std::string& id, const nlohmann::json& fields) override {
        if (fail_update) throw StorageError("metadata update answered 401: denied", 401);
        updates.emplace_back(id, fields);
    }

    std::vector<Upload> uploads;
    std::vector<int> signed_expiry;
    std::vector<std::pair<std::string, nlohmann::json>> updates;
};

// Keeps tasks until the test runs them.
class ManualScheduler : public DeferredScheduler {
public:
    struct Task {
        TaskId id;
        Millis delay;
        std::string name;
        std::function<void()> fn;
    };

    TaskId schedule(Millis delay, const std::string& name, std::function<void()> task) override {
        std::lock_guard<std::mutex> lk(mx_);
        const TaskId id = next_id_++;
        tasks_.push_back(Task{id, delay, name, std::move(task)});
        return id;
    }
    bool cancel(TaskId id) override {
        std::lock_guard<std::mutex> lk(mx_);
        for (auto it = tasks_.begin(); it != tasks_.end(); ++it) {
            if (it->id == id) {
                tasks_.erase(it);
                return true;
            }
        }
        return false;
    }
    std::size_t pending() const override {
        std::lock_guard<std::mutex> lk(mx_);
        return tasks_.size();
    }

    std::vector<Task> tasks() const {
        std::lock_guard<std::mutex> lk(mx_);
        return tasks_;
    }
    void runAll() {
        std::vector<Task> due;
        {
            std::lock_guard<std::mutex> lk(mx_);
            due.swap(tasks_);
        }
        for (auto& t : due) t.fn();
    }

private:
    mutable std::mutex mx_;
    TaskId next_id_ = 1;
    std::vector<Task> tasks_;
};

} // namespace testing
} // namespace page_recorder
