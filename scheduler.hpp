#pragma once

#include <boost/asio.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "clock.hpp"

namespace page_recorder {

// Explicitly scheduled, cancellable delayed actions (deferred file removal).
class DeferredScheduler {
public:
    using TaskId = std::uint64_t;

    virtual ~DeferredScheduler() = default;
    virtual TaskId schedule(Millis delay, const std::string& name, std::function<void()> task) = 0;
    // False if the task already ran or was never scheduled.
    virtual bool cancel(TaskId id) = 0;
    virtual std::size_t pending() const = 0;
};

// Timers on a private io_context served by one thread. Tasks still pending
// at destruction run right away.
class AsioScheduler : public DeferredScheduler {
public:
    AsioScheduler();
    ~AsioScheduler() override;

    AsioScheduler(const AsioScheduler&) = delete;
    AsioScheduler& operator=(const AsioScheduler&) = delete;

    TaskId schedule(Millis delay, const std::string& name, std::function<void()> task) override;
    bool cancel(TaskId id) override;
    std::size_t pending() const override;

private:
    boost::asio::io_context ioc_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    std::thread worker_;

    struct Entry {
        std::shared_ptr<boost::asio::steady_timer> timer;
        std::string name;
        std::function<void()> task;
    };

    static void runTask(const std::string& name, const std::function<void()>& task);

    mutable std::mutex mx_;
    std::map<TaskId, Entry> tasks_;
    std::atomic<TaskId> next_id_{1};
};

} // namespace page_recorder
