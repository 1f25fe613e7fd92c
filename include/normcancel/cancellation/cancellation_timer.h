//
// Created on 2024/11/3.
//

#ifndef CANCELLATION_TIMER_H
#define CANCELLATION_TIMER_H

#include "../auto_reset_event.h"
#include "cancellation_source.h"

#include <boost/lockfree/queue.hpp>

#include <atomic>
#include <chrono>
#include <thread>

namespace normcancel {

namespace detail {

struct timer_entry;

}

/// Background thread that requests cancellation on sources once their
/// deadline has passed.
///
/// Callers hand entries over through a lock-free queue and wake the thread;
/// the thread keeps them in a deadline-ordered heap and sleeps until the
/// earliest one. Cancellation callbacks of a fired source run on the timer
/// thread.
class cancellation_timer {
public:
    using clock = std::chrono::steady_clock;

    /// Owns one scheduled entry. Destroying or cancelling the handle stops
    /// the entry if it has not fired yet.
    class handle {
    public:
        handle() noexcept : m_entry(nullptr) {}
        handle(handle&& other) noexcept : m_entry(other.m_entry) { other.m_entry = nullptr; }
        handle& operator=(handle&& other) noexcept;
        handle(const handle&) = delete;
        handle& operator=(const handle&) = delete;
        ~handle() { cancel(); }

        /// Stops the entry and drops its reference to the source.
        ///
        /// \return
        /// true if the entry was still pending, false if it had already
        /// fired or the handle is empty.
        auto cancel() noexcept -> bool;

        [[nodiscard]] auto is_pending() const noexcept -> bool;

        explicit operator bool() const noexcept { return m_entry != nullptr; }

    private:
        friend class cancellation_timer;

        explicit handle(detail::timer_entry* entry) noexcept : m_entry(entry) {}

        detail::timer_entry* m_entry;
    };

    /// The process-wide timer, started on first use and joined at exit.
    static auto instance() -> cancellation_timer&;

    cancellation_timer(const cancellation_timer&) = delete;
    cancellation_timer& operator=(const cancellation_timer&) = delete;

    ~cancellation_timer();

    /// Arranges for \p source to have cancellation requested at \p deadline.
    /// A deadline in the past fires as soon as the timer thread wakes;
    /// clock::time_point::max() never fires.
    ///
    /// \throw std::bad_alloc
    [[nodiscard]] auto schedule(cancellation_source source, clock::time_point deadline) -> handle;

    template<typename REP, typename PERIOD>
    [[nodiscard]] auto schedule_after(cancellation_source source, const std::chrono::duration<REP, PERIOD>& delay)
        -> handle {
        return schedule(std::move(source), deadline_after(delay));
    }

    /// now() + \p delay, saturated to clock::time_point::max() when the sum
    /// is not representable. \p delay must not be negative or NaN.
    template<typename REP, typename PERIOD>
    [[nodiscard]] static auto deadline_after(const std::chrono::duration<REP, PERIOD>& delay) -> clock::time_point {
        using wide_duration = std::chrono::duration<long double, PERIOD>;
        const auto now = clock::now();
        // Compare in a floating representation; converting delay to
        // clock::duration first can overflow.
        if (wide_duration(delay) >= std::chrono::duration_cast<wide_duration>(clock::time_point::max() - now)) {
            return clock::time_point::max();
        }
        return now + std::chrono::duration_cast<clock::duration>(delay);
    }

private:
    cancellation_timer();

    void run() noexcept;

    std::atomic<bool> m_stop;
    auto_reset_event m_wakeup;
    boost::lockfree::queue<detail::timer_entry*> m_incoming;
    std::thread m_thread;
};

}

#endif //CANCELLATION_TIMER_H
