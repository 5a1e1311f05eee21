#pragma once

#include <future>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace minstrel::util {

/// Collapses concurrent calls for the same key into one computation.
///
/// The first caller for a key (the leader) runs the function; callers that
/// arrive while it is running block on the leader's shared_future and
/// receive the same value, or the same exception. The key is released as
/// soon as the leader finishes, so a failed computation is not remembered.
template <typename Key, typename Value>
class SingleFlight {
public:
    template <typename Fn>
    Value run(const Key& key, Fn&& fn, bool* was_leader = nullptr) {
        std::shared_ptr<std::promise<Value>> promise;
        std::shared_future<Value> future;

        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = calls_.find(key);
            if (it != calls_.end()) {
                future = it->second;
            } else {
                promise = std::make_shared<std::promise<Value>>();
                future = promise->get_future().share();
                calls_.emplace(key, future);
            }
        }

        if (was_leader) *was_leader = (promise != nullptr);

        if (!promise) {
            return future.get();
        }

        try {
            promise->set_value(fn());
        } catch (...) {
            promise->set_exception(std::current_exception());
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_.erase(key);
        }

        return future.get();
    }

    [[nodiscard]] size_t in_flight() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_.size();
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<Key, std::shared_future<Value>> calls_;
};

} // namespace minstrel::util
