#pragma once

#ifdef __cplusplus

#include "errors.hpp"
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

namespace localdoc {

enum class delivery_kind {
    interim,    // local answer, may be superseded
    confirmed   // final answer after the remote replied
};

template <typename T>
struct delivery {
    delivery_kind kind;
    T value;
};

// ============================================================================
// delivery_channel - two-phase result of a hybrid query
// ============================================================================
//
// A producer pushes at most one interim value, then at most one confirmed
// value, then the channel is finished. It may instead fail. Pushes out of
// that order are dropped, so an interim value can never follow the
// confirmed one. Consumers may subscribe, block on get(), or iterate with
// next().

template <typename T>
class delivery_channel {
public:
    using handler = std::function<void(const delivery<T>&)>;
    using error_handler = std::function<void(std::exception_ptr)>;

    // ------------------------------------------------------------------
    // Producer side
    // ------------------------------------------------------------------

    /// Returns false when the value was dropped.
    bool push_interim(T value) {
        return push(delivery<T>{delivery_kind::interim, std::move(value)});
    }

    /// Delivers the final value and finishes the channel.
    bool push_confirmed(T value) {
        return push(delivery<T>{delivery_kind::confirmed, std::move(value)});
    }

    /// Finishes without a further value.
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (done_) return;
            done_ = true;
        }
        cv_.notify_all();
    }

    void fail(std::exception_ptr error) {
        error_handler on_error;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (done_) return;
            done_ = true;
            error_ = error;
            on_error = on_error_;
        }
        cv_.notify_all();
        if (on_error) on_error(error);
    }

    // ------------------------------------------------------------------
    // Consumer side
    // ------------------------------------------------------------------

    /// Registers callbacks. Deliveries and a failure that already happened
    /// are replayed immediately on the calling thread.
    void subscribe(handler on_delivery, error_handler on_error = nullptr) {
        std::vector<delivery<T>> replay;
        std::exception_ptr failed;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            on_delivery_ = on_delivery;
            on_error_ = on_error;
            replay = deliveries_;
            failed = error_;
        }
        if (on_delivery) {
            for (const auto& d : replay) on_delivery(d);
        }
        if (failed && on_error) on_error(failed);
    }

    /// Waits until finished, then returns the latest value. Rethrows a
    /// failure; throws localdoc_error when finished without any value.
    T get() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return done_; });
        if (error_) std::rethrow_exception(error_);
        if (deliveries_.empty()) {
            throw localdoc_error("Channel finished without a value");
        }
        return deliveries_.back().value;
    }

    /// Next delivery in order, blocking. nullopt once finished and drained;
    /// rethrows a failure after the deliveries that preceded it.
    std::optional<delivery<T>> next() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return read_index_ < deliveries_.size() || done_; });
        if (read_index_ < deliveries_.size()) {
            return deliveries_[read_index_++];
        }
        if (error_) std::rethrow_exception(error_);
        return std::nullopt;
    }

    template <typename Rep, typename Period>
    bool wait_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return done_; });
    }

    bool done() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return done_;
    }

    bool failed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return error_ != nullptr;
    }

    std::vector<delivery<T>> deliveries() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return deliveries_;
    }

private:
    bool push(delivery<T> d) {
        handler on_delivery;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (done_) return false;
            if (d.kind == delivery_kind::interim && !deliveries_.empty()) return false;
            deliveries_.push_back(d);
            if (d.kind == delivery_kind::confirmed) done_ = true;
            on_delivery = on_delivery_;
        }
        cv_.notify_all();
        if (on_delivery) on_delivery(d);
        return true;
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<delivery<T>> deliveries_;
    size_t read_index_ = 0;
    bool done_ = false;
    std::exception_ptr error_;
    handler on_delivery_;
    error_handler on_error_;
};

} // namespace localdoc

#endif // __cplusplus
