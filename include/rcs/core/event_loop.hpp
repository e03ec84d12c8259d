#pragma once

#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <atomic>
#include <condition_variable>

namespace rcs::core {

using Job = std::function<void()>;

// Event loop untuk menjalankan job secara asynchronous di satu worker thread.
// Job dijalankan berurutan (FIFO); exception dari job dicatat lalu dibuang.
class EventLoop {
public:
    EventLoop();
    ~EventLoop();

    // Non-copyable
    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    // Start/stop loop
    void start();
    void stop();

    // Post job ke queue
    void post(Job job);

    // Process single job di thread pemanggil
    bool processOne();

    // Process all pending jobs
    void processAll();

    bool isRunning() const noexcept { return running_; }

    std::size_t queueSize() const;

private:
    void run();
    static void execute(const Job& job);

    std::queue<Job> job_queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::thread worker_;
    std::atomic<bool> running_{false};
    bool stop_requested_ = false;
};

} // namespace rcs::core
