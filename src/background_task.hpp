#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>
#include <utility>

// Runs one function on its own thread. wait() blocks until it has returned;
// the destructor joins.
class BackgroundTask {
public:
    explicit BackgroundTask(std::function<void()> f)
        : worker([this, f = std::move(f)] { f(); finish(); })
    {
    }

    ~BackgroundTask()
    {
        if (worker.joinable()) worker.join();
    }

    BackgroundTask(const BackgroundTask&) = delete;
    BackgroundTask& operator=(const BackgroundTask&) = delete;

    void wait()
    {
        std::unique_lock<std::mutex> lock(mtx);
        cv_done.wait(lock, [this] { return finished; });
    }

private:
    void finish()
    {
        {
            std::lock_guard<std::mutex> lock(mtx);
            finished = true;
        }
        cv_done.notify_all();
    }

    std::mutex              mtx;
    std::condition_variable cv_done;
    bool                    finished = false;
    std::thread             worker;   // last: starts after the state above exists
};
