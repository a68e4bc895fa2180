#pragma once

#include <atomic>
#include <memory>

// Cooperative cancellation flag shared between a caller and a streaming
// operation. Operations poll cancelled() between chunks.
class CancelToken {
public:
    void cancel() { cancelled_.store(true); }
    bool cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

using CancelTokenPtr = std::shared_ptr<CancelToken>;

inline bool is_cancelled(const CancelToken* token) {
    return token && token->cancelled();
}
