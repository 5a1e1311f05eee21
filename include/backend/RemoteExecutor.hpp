#pragma once

#include "backend/Errors.hpp"
#include "util/Logger.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace minstrel::backend {

// Fixed pool that runs remote catalog calls with a deadline.
// A caller waits at most timeout() for its call; a call that overruns is
// asked to stop through its stop_token and the caller gets RemoteCallFailure
// while the worker finishes in the background. Jobs therefore must own
// everything they capture.
class RemoteExecutor {
public:
    using Job = std::function<void()>;

    RemoteExecutor(size_t worker_count, size_t queue_limit, std::chrono::milliseconds timeout);

    // Destructor waits for running jobs to complete
    ~RemoteExecutor();

    RemoteExecutor(const RemoteExecutor&) = delete;
    RemoteExecutor& operator=(const RemoteExecutor&) = delete;

    template <typename T>
    T call(const std::string& label, std::function<T(std::stop_token)> fn);

    [[nodiscard]] size_t get_queue_size() const;
    [[nodiscard]] std::chrono::milliseconds timeout() const { return timeout_; }

private:
    // Returns false if queue is full
    [[nodiscard]] bool submit_job(Job job);

    void worker_thread();

    std::vector<std::thread> workers_;

    std::queue<Job> job_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable cv_;

    std::atomic<bool> stop_{false};

    size_t queue_limit_;
    std::chrono::milliseconds timeout_;
};

template <typename T>
T RemoteExecutor::call(const std::string& label, std::function<T(std::stop_token)> fn) {
    auto promise = std::make_shared<std::promise<T>>();
    std::future<T> future = promise->get_future();
    auto stop = std::make_shared<std::stop_source>();

    bool submitted = submit_job([label, promise, stop, fn = std::move(fn)]() {
        try {
            promise->set_value(fn(stop->get_token()));
        } catch (const MinstrelError&) {
            promise->set_exception(std::current_exception());
        } catch (const std::exception& e) {
            promise->set_exception(std::make_exception_ptr(
                RemoteCallFailure(label + ": " + e.what())));
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    });

    if (!submitted) {
        throw RemoteCallFailure(label + ": remote call queue saturated");
    }

    if (future.wait_for(timeout_) != std::future_status::ready) {
        stop->request_stop();
        util::Logger::warn("RemoteExecutor: " + label + " timed out after " +
                           std::to_string(timeout_.count()) + " ms");
        throw RemoteCallFailure(label + ": timed out after " +
                                std::to_string(timeout_.count()) + " ms");
    }

    return future.get();
}

} // namespace minstrel::backend
