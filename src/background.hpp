#pragma once
#include <atomic>
#include <condition_variable>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace finly {

// Fire-and-forget jobs, one thread each. Callers never wait on a job and
// exceptions escaping a job are logged, not rethrown. Finished threads are
// reaped on the next spawn; the destructor waits for everything still running.
class BackgroundTasks {
public:
    using Task = std::function<void()>;

    BackgroundTasks() = default;
    ~BackgroundTasks();

    BackgroundTasks(const BackgroundTasks&) = delete;
    BackgroundTasks& operator=(const BackgroundTasks&) = delete;

    void spawn(const std::string& name, Task task);

    // Block until no job is running and join all threads.
    void wait_idle();

    size_t running() const;

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void reap_finished_locked(std::list<Worker>& out);

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    std::list<Worker> workers_;
    size_t running_ = 0;
};

} // namespace finly
