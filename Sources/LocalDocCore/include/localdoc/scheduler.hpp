#pragma once

#ifdef __cplusplus

#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace localdoc {

// ============================================================================
// scheduler - where find deliveries and upload completions run
// ============================================================================

struct scheduler {
    using task = std::function<void()>;

    virtual ~scheduler() = default;

    /// Queue or run `fn`. Safe to call from any thread.
    virtual void invoke(task&& fn) = 0;

    /// True when the caller is on the context invoke() dispatches to.
    [[nodiscard]] virtual bool is_on_thread() const noexcept = 0;
};

using shared_scheduler = std::shared_ptr<scheduler>;

// ============================================================================
// immediate_scheduler - the default; runs on the calling thread
// ============================================================================

class immediate_scheduler : public scheduler {
public:
    void invoke(task&& fn) override {
        if (fn) fn();
    }

    [[nodiscard]] bool is_on_thread() const noexcept override { return true; }
};

// ============================================================================
// std_thread_scheduler - one worker thread, FIFO
// ============================================================================
//
// Destruction runs whatever is still queued, then joins.

class std_thread_scheduler : public scheduler {
public:
    std_thread_scheduler() : worker_([this] { drain(); }) {}

    ~std_thread_scheduler() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        wake_.notify_all();
        worker_.join();
    }

    std_thread_scheduler(const std_thread_scheduler&) = delete;
    std_thread_scheduler& operator=(const std_thread_scheduler&) = delete;

    void invoke(task&& fn) override {
        if (!fn) return;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) return;
            tasks_.push_back(std::move(fn));
        }
        wake_.notify_one();
    }

    [[nodiscard]] bool is_on_thread() const noexcept override {
        return std::this_thread::get_id() == worker_.get_id();
    }

private:
    void drain() {
        std::unique_lock<std::mutex> lock(mutex_);
        for (;;) {
            wake_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
            if (tasks_.empty()) return;

            task next = std::move(tasks_.front());
            tasks_.pop_front();
            lock.unlock();
            next();
            lock.lock();
        }
    }

    std::mutex mutex_;
    std::condition_variable wake_;
    std::deque<task> tasks_;
    bool stopping_ = false;
    std::thread worker_; // last: started after the members it uses
};

// ============================================================================
// manual_scheduler - queues until the owner calls process_pending()
// ============================================================================

class manual_scheduler : public scheduler {
public:
    manual_scheduler() : owner_(std::this_thread::get_id()) {}

    void invoke(task&& fn) override {
        if (!fn) return;
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.push_back(std::move(fn));
    }

    /// Runs the queue until empty, including work queued while running.
    /// Returns how many tasks ran.
    size_t process_pending() {
        size_t ran = 0;
        for (;;) {
            std::deque<task> batch;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                batch.swap(tasks_);
            }
            if (batch.empty()) return ran;
            for (auto& fn : batch) {
                fn();
                ++ran;
            }
        }
    }

    size_t pending_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return tasks_.size();
    }

    [[nodiscard]] bool is_on_thread() const noexcept override {
        return std::this_thread::get_id() == owner_;
    }

private:
    std::thread::id owner_;
    mutable std::mutex mutex_;
    std::deque<task> tasks_;
};

} // namespace localdoc

#endif // __cplusplus
