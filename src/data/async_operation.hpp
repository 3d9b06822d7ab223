#pragma once

#include "core/errors.hpp"
#include <boost/asio/compose.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace sqlgraph::data {

// Result of one step of a suspend-capable operation. Anything but Ready
// returns control to the executor; the operation is resumed by polling it
// again.
enum class PollStatus {
    Pending,    // backend still executing; resumed after a backoff delay
    Yielded,    // progress was made; resumed as soon as the executor is free
    Ready
};

namespace detail {

struct CancellationState {
    std::atomic<bool> requested{false};
    std::mutex mutex;
    std::vector<std::weak_ptr<boost::asio::steady_timer>> waiters;
};

} // namespace detail

// Read side of a cancellation signal. A default-constructed token can never
// be cancelled.
class CancellationToken {
public:
    CancellationToken() = default;

    bool is_cancellation_requested() const noexcept {
        return state_ && state_->requested.load(std::memory_order_acquire);
    }

    void throw_if_cancellation_requested() const {
        if (is_cancellation_requested()) {
            throw core::OperationCancelled();
        }
    }

    // Cuts the current wait of `timer` short when cancellation is requested.
    // The cancel runs on the timer's own executor.
    void wake_on_cancel(const std::shared_ptr<boost::asio::steady_timer>& timer) const;

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::CancellationState> state_;
};

class CancellationSource {
public:
    CancellationSource()
        : state_(std::make_shared<detail::CancellationState>()) {}

    // Safe to call from any thread
    void cancel();
    bool is_cancellation_requested() const noexcept {
        return state_->requested.load(std::memory_order_acquire);
    }
    CancellationToken token() const { return CancellationToken(state_); }

private:
    std::shared_ptr<detail::CancellationState> state_;
};

// Poll-driven operation. Each poll() runs the step function once; a failure
// thrown by the step propagates out of poll() and the operation is finished.
// Copies share the same operation.
class AsyncOperationBase {
public:
    PollStatus poll();

    bool is_ready() const noexcept { return core_->ready; }

    // Drives the operation to completion on a private io_context. `token`
    // only shortens backoff waits; the steps observe their own tokens.
    void wait(CancellationToken token = {});

protected:
    explicit AsyncOperationBase(std::function<PollStatus()> step)
        : core_(std::make_shared<Core>(std::move(step))) {}

private:
    struct Core {
        explicit Core(std::function<PollStatus()> s) : step(std::move(s)) {}

        std::function<PollStatus()> step;
        bool ready = false;
        bool failed = false;
    };

    std::shared_ptr<Core> core_;
};

template<typename T>
class AsyncOperation : public AsyncOperationBase {
public:
    using Step = std::function<PollStatus(T& result)>;

    explicit AsyncOperation(Step step)
        : AsyncOperation(std::make_shared<T>(), std::move(step)) {}

    // Already completed operation
    static AsyncOperation from_result(T value) {
        return AsyncOperation([value](T& result) {
            result = value;
            return PollStatus::Ready;
        });
    }

    const T& result() const {
        if (!is_ready()) {
            throw core::InvalidStateError("Asynchronous operation has not completed");
        }
        return *value_;
    }

    T get() {
        wait();
        return *value_;
    }

private:
    AsyncOperation(std::shared_ptr<T> value, Step step)
        : AsyncOperationBase([value, step = std::move(step)]() { return step(*value); }),
          value_(std::move(value)) {}

    std::shared_ptr<T> value_;
};

template<>
class AsyncOperation<void> : public AsyncOperationBase {
public:
    using Step = std::function<PollStatus()>;

    explicit AsyncOperation(Step step)
        : AsyncOperationBase(std::move(step)) {}

    static AsyncOperation completed() {
        return AsyncOperation([]() { return PollStatus::Ready; });
    }

    void get() { wait(); }
};

// Runs `first` to completion, then the operation `next` builds from its
// result. `next` is only invoked once `first` is ready.
template<typename U, typename T, typename Next>
AsyncOperation<U> then(AsyncOperation<T> first, Next next) {
    auto head = std::make_shared<AsyncOperation<T>>(std::move(first));
    auto tail = std::make_shared<std::optional<AsyncOperation<U>>>();
    return AsyncOperation<U>([head, tail, next = std::move(next)](U& result) {
        if (!*tail) {
            PollStatus status = head->poll();
            if (status != PollStatus::Ready) {
                return status;
            }
            tail->emplace(next(head->result()));
        }
        PollStatus status = (*tail)->poll();
        if (status != PollStatus::Ready) {
            return status;
        }
        result = (*tail)->result();
        return PollStatus::Ready;
    });
}

namespace detail {

// Delay before the next poll of an operation whose backend is still
// executing: doubles from kFirstBackoff up to kMaxBackoff
constexpr std::chrono::microseconds kFirstBackoff{200};
constexpr std::chrono::microseconds kMaxBackoff{50000};

std::chrono::microseconds next_backoff(std::chrono::microseconds current) noexcept;

// Composed operation body: polls, then either completes, reposts itself or
// waits on the timer
class PollLoop {
public:
    PollLoop(AsyncOperationBase operation, std::shared_ptr<boost::asio::steady_timer> timer)
        : operation_(std::move(operation)), timer_(std::move(timer)) {}

    template<typename Self>
    void operator()(Self& self, boost::system::error_code = {}) {
        PollStatus status;
        try {
            status = operation_.poll();
        } catch (...) {
            self.complete(std::current_exception());
            return;
        }

        boost::asio::steady_timer& timer = *timer_;
        switch (status) {
        case PollStatus::Ready:
            self.complete(std::exception_ptr());
            return;
        case PollStatus::Yielded:
            backoff_ = std::chrono::microseconds::zero();
            boost::asio::post(timer.get_executor(), std::move(self));
            return;
        case PollStatus::Pending:
            // A cancelled wait (operation_aborted) just polls early
            backoff_ = next_backoff(backoff_);
            timer.expires_after(backoff_);
            timer.async_wait(std::move(self));
            return;
        }
    }

private:
    AsyncOperationBase operation_;
    std::shared_ptr<boost::asio::steady_timer> timer_;
    std::chrono::microseconds backoff_{0};
};

} // namespace detail

// Drives `operation` on `executor` until it is ready. Completes with the
// failure thrown by a step, or a null exception_ptr on success. Cancelling
// `token` wakes a pending backoff wait at once.
template<typename Executor, typename CompletionToken>
auto async_run(const Executor& executor, AsyncOperationBase operation, CancellationToken token,
               CompletionToken&& completion) {
    auto timer = std::make_shared<boost::asio::steady_timer>(executor);
    token.wake_on_cancel(timer);
    return boost::asio::async_compose<CompletionToken, void(std::exception_ptr)>(
        detail::PollLoop(std::move(operation), timer), completion, *timer);
}

} // namespace sqlgraph::data
