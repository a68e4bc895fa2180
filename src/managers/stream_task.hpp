#pragma once

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <core/types.hpp>
#include <core/cancel_token.hpp>

// A streaming gateway operation running on its own thread.
//
// cancel() is cooperative: the operation notices between chunks, closes its
// channel and finishes with Cancelled. The destructor cancels and joins.
template <typename T>
class StreamTask {
public:
    using Body = std::function<Result<T>(const CancelToken* cancel)>;

    explicit StreamTask(Body body)
        : cancel_(std::make_shared<CancelToken>()) {
        thread_ = std::thread([this, body = std::move(body)] {
            Result<T> r = body(cancel_.get());
            std::lock_guard<std::mutex> lock(mutex_);
            result_ = std::make_unique<Result<T>>(std::move(r));
            cv_.notify_all();
        });
    }

    ~StreamTask() {
        cancel();
        if (thread_.joinable()) thread_.join();
    }

    StreamTask(const StreamTask&) = delete;
    StreamTask& operator=(const StreamTask&) = delete;

    void cancel() { cancel_->cancel(); }
    bool cancelled() const { return cancel_->cancelled(); }

    bool done() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return result_ != nullptr;
    }

    // Blocks until the operation finishes.
    Result<T> wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return result_ != nullptr; });
        return *result_;
    }

private:
    CancelTokenPtr cancel_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::unique_ptr<Result<T>> result_;
    std::thread thread_;    // last: started after the other members exist
};

template <typename T>
using StreamTaskPtr = std::unique_ptr<StreamTask<T>>;
