#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include <cstddef>
#include <list>

namespace tvremote {

/**
 * @brief Sticky one-shot event for coroutines sharing one io_context
 *
 * Wait() suspends the calling coroutine until Set() is called or the
 * timeout expires and reports which of the two happened. Once set, the
 * event stays set and later waiters resume immediately.
 *
 * Not thread-safe. Owners that hand the event to waiters keep it in a
 * shared_ptr so it outlives every suspended Wait().
 */
class AsyncEvent {
public:
    AsyncEvent() = default;
    AsyncEvent(const AsyncEvent&) = delete;
    AsyncEvent& operator=(const AsyncEvent&) = delete;

    void Set() {
        if (set_) {
            return;
        }
        set_ = true;
        for (auto* timer : waiters_) {
            timer->cancel();
        }
    }

    [[nodiscard]] bool IsSet() const noexcept { return set_; }

    /// @return true if the event was set, false on timeout
    boost::asio::awaitable<bool> Wait(std::chrono::steady_clock::duration timeout) {
        if (set_) {
            co_return true;
        }
        auto executor = co_await boost::asio::this_coro::executor;
        boost::asio::steady_timer timer(executor);
        timer.expires_after(timeout);
        co_await Park(timer);
        co_return set_;
    }

    boost::asio::awaitable<void> Wait() {
        if (set_) {
            co_return;
        }
        auto executor = co_await boost::asio::this_coro::executor;
        boost::asio::steady_timer timer(executor);
        timer.expires_at(boost::asio::steady_timer::time_point::max());
        while (!set_) {
            co_await Park(timer);
        }
    }

    [[nodiscard]] size_t WaiterCount() const noexcept { return waiters_.size(); }

private:
    /// Keeps a parked timer listed for exactly as long as its frame lives.
    class Registration {
    public:
        Registration(std::list<boost::asio::steady_timer*>& waiters, boost::asio::steady_timer& timer)
            : waiters_(waiters)
            , position_(waiters.insert(waiters.end(), &timer)) {}
        ~Registration() { waiters_.erase(position_); }

        Registration(const Registration&) = delete;
        Registration& operator=(const Registration&) = delete;

    private:
        std::list<boost::asio::steady_timer*>& waiters_;
        std::list<boost::asio::steady_timer*>::iterator position_;
    };

    boost::asio::awaitable<void> Park(boost::asio::steady_timer& timer) {
        const Registration registration(waiters_, timer);
        boost::system::error_code ec;
        co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }

    bool set_ = false;
    std::list<boost::asio::steady_timer*> waiters_;
};

}  // namespace tvremote
