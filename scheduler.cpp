#include "scheduler.hpp"

#include <iostream>

namespace page_recorder {

namespace net = boost::asio;

AsioScheduler::AsioScheduler()
    : work_(net::make_work_guard(ioc_)),
      worker_([this]() { ioc_.run(); }) {}

AsioScheduler::~AsioScheduler() {
    work_.reset();
    ioc_.stop();
    if (worker_.joinable()) worker_.join();

    std::map<TaskId, Entry> left;
    {
        std::lock_guard<std::mutex> lk(mx_);
        left.swap(tasks_);
    }
    if (!left.empty()) {
        std::cout << "[Scheduler] Running " << left.size() << " pending task(s) before exit" << std::endl;
    }
    for (auto& kv : left) runTask(kv.second.name, kv.second.task);
}

void AsioScheduler::runTask(const std::string& name, const std::function<void()>& task) {
    try {
        task();
    } catch (const std::exception& e) {
        std::cerr << "[Scheduler] Task '" << name << "' failed: " << e.what() << std::endl;
    }
}

DeferredScheduler::TaskId AsioScheduler::schedule(Millis delay, const std::string& name, std::function<void()> task) {
    const TaskId id = next_id_++;
    auto timer = std::make_shared<net::steady_timer>(ioc_, delay);
    {
        std::lock_guard<std::mutex> lk(mx_);
        tasks_[id] = Entry{timer, name, std::move(task)};
    }
    timer->async_wait([this, id](const boost::system::error_code& ec) {
        if (ec) return;
        Entry entry;
        {
            std::lock_guard<std::mutex> lk(mx_);
            auto it = tasks_.find(id);
            if (it == tasks_.end()) return; // cancelled
            entry = std::move(it->second);
            tasks_.erase(it);
        }
        runTask(entry.name, entry.task);
    });
    return id;
}

bool AsioScheduler::cancel(TaskId id) {
    std::shared_ptr<net::steady_timer> timer;
    {
        std::lock_guard<std::mutex> lk(mx_);
        auto it = tasks_.find(id);
        if (it == tasks_.end()) return false;
        timer = it->second.timer;
        tasks_.erase(it);
    }
    // Cancel on the io thread so it is serialized with the timer's completion.
    net::post(ioc_, [timer]() { timer->cancel(); });
    return true;
}

std::size_t AsioScheduler::pending() const {
    std::lock_guard<std::mutex> lk(mx_);
    return tasks_.size();
}

} // namespace page_recorder
