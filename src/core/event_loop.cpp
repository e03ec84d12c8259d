#include <rcs/core/event_loop.hpp>
#include <rcs/core/logger.hpp>

#include <exception>

namespace rcs::core {

EventLoop::EventLoop() = default;

EventLoop::~EventLoop() {
    stop();
}

void EventLoop::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) return;

    running_ = true;
    stop_requested_ = false;
    worker_ = std::thread(&EventLoop::run, this);
}

void EventLoop::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        stop_requested_ = true;
    }

    cv_.notify_one();
    if (worker_.joinable()) {
        worker_.join();
    }

    running_ = false;
}

void EventLoop::post(Job job) {
    if (!job) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        job_queue_.push(std::move(job));
    }
    cv_.notify_one();
}

bool EventLoop::processOne() {
    std::unique_lock<std::mutex> lock(mutex_);

    if (job_queue_.empty()) {
        return false;
    }

    Job job = std::move(job_queue_.front());
    job_queue_.pop();

    // Jalankan job di luar lock
    lock.unlock();
    execute(job);

    return true;
}

void EventLoop::processAll() {
    while (processOne()) {}
}

std::size_t EventLoop::queueSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return job_queue_.size();
}

void EventLoop::execute(const Job& job) {
    try {
        job();
    }
    catch (const std::exception& e) {
        Logger::error("Error processing job: {}", e.what());
    }
}

void EventLoop::run() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (true) {
        cv_.wait(lock, [this] {
            return !job_queue_.empty() || stop_requested_;
        });

        // Pending jobs are drained before the worker exits
        if (job_queue_.empty() && stop_requested_) break;

        Job job = std::move(job_queue_.front());
        job_queue_.pop();

        lock.unlock();
        execute(job);
        lock.lock();
    }
}

} // namespace rcs::core
