#include "background.hpp"
#include <iostream>
#include <stdexcept>
#include <system_error>

namespace finly {

BackgroundTasks::~BackgroundTasks() {
    wait_idle();
}

void BackgroundTasks::reap_finished_locked(std::list<Worker>& out) {
    for (auto it = workers_.begin(); it != workers_.end(); ) {
        if (it->done->load()) {
            out.push_back(std::move(*it));
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

void BackgroundTasks::spawn(const std::string& name, Task task) {
    std::list<Worker> finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        reap_finished_locked(finished);
    }
    for (auto& w : finished) {
        if (w.thread.joinable()) w.thread.join();
    }

    auto done = std::make_shared<std::atomic<bool>>(false);
    std::lock_guard<std::mutex> lock(mutex_);
    ++running_;
    Worker w;
    w.done = done;
    try {
        w.thread = std::thread([this, name, done, task = std::move(task)]() {
            try {
                task();
            } catch (const std::exception& e) {
                std::cerr << "[background] " << name << " failed: " << e.what() << '\n';
            } catch (...) {
                std::cerr << "[background] " << name << " failed: unknown exception\n";
            }
            std::lock_guard<std::mutex> guard(mutex_);
            done->store(true);
            --running_;
            idle_cv_.notify_all();
        });
    } catch (const std::system_error&) {
        --running_;
        throw;
    }
    workers_.push_back(std::move(w));
}

void BackgroundTasks::wait_idle() {
    std::list<Worker> to_join;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        idle_cv_.wait(lock, [this] { return running_ == 0; });
        to_join.swap(workers_);
    }
    for (auto& w : to_join) {
        if (w.thread.joinable()) w.thread.join();
    }
}

size_t BackgroundTasks::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

} // namespace finly
