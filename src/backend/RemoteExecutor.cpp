#include "backend/RemoteExecutor.hpp"
#include <exception>

namespace minstrel::backend {

RemoteExecutor::RemoteExecutor(size_t worker_count, size_t queue_limit, std::chrono::milliseconds timeout)
    : queue_limit_(queue_limit), timeout_(timeout) {
    if (worker_count == 0) {
        worker_count = std::thread::hardware_concurrency();
        if (worker_count == 0) worker_count = 4; // Fallback
    }

    util::Logger::info("RemoteExecutor: Initializing with " + std::to_string(worker_count) +
                       " worker threads, timeout " + std::to_string(timeout_.count()) + " ms");

    try {
        for (size_t i = 0; i < worker_count; ++i) {
            workers_.emplace_back([this]() {
                worker_thread();
            });
        }
    } catch (const std::exception& e) {
        // Join what was started; a joinable thread must not outlive the vector
        util::Logger::error("RemoteExecutor: Failed to start workers: " + std::string(e.what()));
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            stop_ = true;
        }
        cv_.notify_all();
        for (auto& worker : workers_) {
            worker.join();
        }
        throw;
    }
}

RemoteExecutor::~RemoteExecutor() {
    util::Logger::info("RemoteExecutor: Shutting down");

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }
    cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    util::Logger::info("RemoteExecutor: Shutdown complete");
}

bool RemoteExecutor::submit_job(Job job) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);

        if (stop_ || job_queue_.size() >= queue_limit_) {
            util::Logger::warn("RemoteExecutor: Queue full (" + std::to_string(job_queue_.size()) +
                               " jobs), rejecting call");
            return false;
        }

        job_queue_.push(std::move(job));
    }

    cv_.notify_one();
    return true;
}

size_t RemoteExecutor::get_queue_size() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return job_queue_.size();
}

void RemoteExecutor::worker_thread() {
    while (true) {
        Job job;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);

            cv_.wait(lock, [this]() {
                return stop_ || !job_queue_.empty();
            });

            // Drain queued calls before exiting so no promise is left unset
            if (stop_ && job_queue_.empty()) {
                break;
            }

            job = std::move(job_queue_.front());
            job_queue_.pop();
        }

        // Execute outside the lock
        if (job) {
            job();
        }
    }
}

} // namespace minstrel::backend
