//
// Created on 2024/11/3.
//

#ifndef MANAGED_CANCELLATION_SOURCE_H
#define MANAGED_CANCELLATION_SOURCE_H

#include "cancellation_registration.h"
#include "cancellation_source.h"
#include "cancellation_timer.h"
#include "cancellation_token.h"

#include <chrono>
#include <cmath>
#include <cstddef>
#include <memory>
#include <span>
#include <stdexcept>
#include <type_traits>
#include <vector>

namespace normcancel {

namespace detail {

/// \throw std::invalid_argument if \p delay is negative or NaN.
template<typename REP, typename PERIOD>
void check_delay(const std::chrono::duration<REP, PERIOD>& delay, const char* message) {
    if constexpr (std::is_floating_point_v<REP>) {
        if (std::isnan(delay.count())) {
            throw std::invalid_argument(message);
        }
    }
    if (delay < std::chrono::duration<REP, PERIOD>::zero()) {
        throw std::invalid_argument(message);
    }
}

}

/// A cancellation_source together with the resources that can trigger it:
/// an optional pending timer and callbacks linked to other tokens.
///
/// Move-only. dispose() (or the destructor) stops the timer, deregisters
/// the linked callbacks and drops the source, after which the token can no
/// longer become cancelled unless it already was.
class managed_cancellation_source {
public:
    /// \throw std::bad_alloc
    managed_cancellation_source();

    managed_cancellation_source(managed_cancellation_source&& other) noexcept = default;
    managed_cancellation_source& operator=(managed_cancellation_source&& other) noexcept;

    managed_cancellation_source(const managed_cancellation_source&) = delete;
    managed_cancellation_source& operator=(const managed_cancellation_source&) = delete;

    ~managed_cancellation_source();

    /// A source that requests cancellation as soon as any of \p tokens is
    /// cancelled. Tokens that can never be cancelled are ignored. If one of
    /// them is already cancelled the returned source is too.
    ///
    /// \throw std::bad_alloc
    static auto create_linked(std::span<const cancellation_token> tokens) -> managed_cancellation_source;

    /// Requests cancellation once \p delay has elapsed, replacing any
    /// earlier pending delay. Does nothing if cancellation was already
    /// requested or the source was disposed.
    ///
    /// A delay too long to represent as a deadline never fires.
    ///
    /// \throw std::invalid_argument if \p delay is negative or NaN.
    template<typename REP, typename PERIOD>
    void cancel_after(const std::chrono::duration<REP, PERIOD>& delay) {
        detail::check_delay(delay, "cancel_after: delay must not be negative or NaN");
        schedule_cancellation(cancellation_timer::deadline_after(delay));
    }

    [[nodiscard]] auto token() const noexcept -> cancellation_token { return m_token; }

    void request_cancellation() const { m_source.request_cancellation(); }

    [[nodiscard]] auto is_cancellation_requested() const noexcept -> bool { return m_token.is_cancellation_requested(); }

    /// False once disposed, unless cancellation was requested before that.
    [[nodiscard]] auto can_be_cancelled() const noexcept -> bool { return m_token.can_be_cancelled(); }

    /// Number of tokens this source is currently linked to.
    [[nodiscard]] auto linked_count() const noexcept -> std::size_t { return m_links.size(); }

    [[nodiscard]] auto has_pending_timer() const noexcept -> bool { return m_timer.is_pending(); }

    /// Releases the timer, the linked callbacks and the source. Calling it
    /// again is harmless. Not synchronised: concurrent callers must
    /// serialise externally.
    void dispose() noexcept;

private:
    void schedule_cancellation(cancellation_timer::clock::time_point deadline);

    cancellation_source m_source;
    cancellation_token m_token;
    cancellation_timer::handle m_timer;
    std::vector<std::unique_ptr<cancellation_registration>> m_links;
};

}

#endif //MANAGED_CANCELLATION_SOURCE_H
