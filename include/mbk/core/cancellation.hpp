#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace mbk::core {

/**
 * @brief Cooperative cancellation signal
 *
 * A CancellationSource owns the flag; any number of CancellationToken copies
 * observe it. A default-constructed token is never cancelled.
 *
 * THREAD SAFETY:
 * - cancel() may be called from any thread
 * - wait_for() wakes immediately when cancel() is called
 */
class CancellationToken {
public:
    CancellationToken() = default;

    [[nodiscard]] bool is_cancelled() const noexcept {
        return state_ && state_->cancelled.load();
    }

    /**
     * @brief Sleep for up to @p duration
     *
     * RETURNS: true if the full duration elapsed, false if cancelled first
     */
    template<typename Rep, typename Period>
    bool wait_for(const std::chrono::duration<Rep, Period>& duration) const {
        if (!state_) {
            std::this_thread::sleep_for(duration);
            return true;
        }
        std::unique_lock lock(state_->mutex);
        return !state_->cv.wait_for(lock, duration, [this]() {
            return state_->cancelled.load();
        });
    }

private:
    friend class CancellationSource;

    struct State {
        std::atomic<bool> cancelled{false};
        std::mutex mutex;
        std::condition_variable cv;
    };

    explicit CancellationToken(std::shared_ptr<State> state) : state_(std::move(state)) {}

    std::shared_ptr<State> state_;
};

class CancellationSource {
public:
    CancellationSource() : state_(std::make_shared<CancellationToken::State>()) {}

    [[nodiscard]] CancellationToken token() const { return CancellationToken(state_); }

    void cancel() {
        {
            std::unique_lock lock(state_->mutex);
            state_->cancelled = true;
        }
        state_->cv.notify_all();
    }

    [[nodiscard]] bool is_cancelled() const noexcept { return state_->cancelled.load(); }

private:
    std::shared_ptr<CancellationToken::State> state_;
};

} // namespace mbk::core
