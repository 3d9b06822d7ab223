#include "async_operation.hpp"
#include <algorithm>

namespace sqlgraph::data {

void CancellationToken::wake_on_cancel(const std::shared_ptr<boost::asio::steady_timer>& timer) const {
    if (!state_) {
        return;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->requested.load(std::memory_order_acquire)) {
        boost::asio::post(timer->get_executor(), [timer]() { timer->cancel(); });
        return;
    }
    auto& waiters = state_->waiters;
    waiters.erase(std::remove_if(waiters.begin(), waiters.end(),
                                 [](const std::weak_ptr<boost::asio::steady_timer>& w) { return w.expired(); }),
                  waiters.end());
    waiters.push_back(timer);
}

void CancellationSource::cancel() {
    std::vector<std::weak_ptr<boost::asio::steady_timer>> waiters;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->requested.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        waiters.swap(state_->waiters);
    }
    for (auto& waiter : waiters) {
        if (auto timer = waiter.lock()) {
            boost::asio::post(timer->get_executor(), [timer]() { timer->cancel(); });
        }
    }
}

PollStatus AsyncOperationBase::poll() {
    Core& state = *core_;
    if (state.ready) {
        return PollStatus::Ready;
    }
    if (state.failed) {
        throw core::InvalidStateError("Asynchronous operation already failed");
    }

    PollStatus status;
    try {
        status = state.step();
    } catch (...) {
        state.failed = true;
        state.step = nullptr;
        throw;
    }

    if (status == PollStatus::Ready) {
        state.ready = true;
        // Release captured state (executor, cursor) as soon as possible
        state.step = nullptr;
    }
    return status;
}

void AsyncOperationBase::wait(CancellationToken token) {
    if (is_ready()) {
        return;
    }

    boost::asio::io_context io;
    std::exception_ptr failure;
    async_run(io.get_executor(), *this, std::move(token),
              [&failure](std::exception_ptr error) { failure = std::move(error); });
    io.run();

    if (failure) {
        std::rethrow_exception(failure);
    }
}

namespace detail {

std::chrono::microseconds next_backoff(std::chrono::microseconds current) noexcept {
    if (current < kFirstBackoff) {
        return kFirstBackoff;
    }
    return std::min(current * 2, kMaxBackoff);
}

} // namespace detail

} // namespace sqlgraph::data
