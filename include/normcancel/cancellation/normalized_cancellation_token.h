//
// Created on 2024/11/4.
//

#ifndef NORMALIZED_CANCELLATION_TOKEN_H
#define NORMALIZED_CANCELLATION_TOKEN_H

#include "cancellation_token.h"
#include "managed_cancellation_source.h"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <stdexcept>
#include <utility>
#include <variant>

namespace normcancel {

/// The smallest equivalent of a set of cancellation tokens.
///
/// Holds one of: nothing (a token that can never be cancelled), a token
/// forwarded from the caller, or a managed source it created itself (a
/// timeout or a source linked to several tokens). Only the last case owns
/// anything; dispose() releases it exactly once, however many threads call
/// it. The destructor disposes too.
class normalized_cancellation_token {
public:
    /// A token that can never be cancelled.
    normalized_cancellation_token() noexcept;

    /// Forwards \p token. Nothing is owned.
    explicit normalized_cancellation_token(cancellation_token token) noexcept;

    /// Takes ownership of \p source; token() is the source's token.
    explicit normalized_cancellation_token(managed_cancellation_source&& source) noexcept;

    /// Transfers ownership. \p other is left holding nothing.
    normalized_cancellation_token(normalized_cancellation_token&& other) noexcept;
    normalized_cancellation_token& operator=(normalized_cancellation_token&& other) noexcept;

    normalized_cancellation_token(const normalized_cancellation_token&) = delete;
    normalized_cancellation_token& operator=(const normalized_cancellation_token&) = delete;

    ~normalized_cancellation_token();

    /// A token that is cancelled once \p delay has elapsed. A delay past the
    /// range of the steady clock never expires.
    ///
    /// \throw std::invalid_argument if \p delay is negative or NaN.
    template<typename REP, typename PERIOD>
    [[nodiscard]] static auto timeout(const std::chrono::duration<REP, PERIOD>& delay)
        -> normalized_cancellation_token {
        detail::check_delay(delay, "timeout: delay must not be negative or NaN");
        managed_cancellation_source source;
        source.cancel_after(delay);
        return normalized_cancellation_token{std::move(source)};
    }

    /// \p milliseconds must not be negative.
    [[nodiscard]] static auto timeout(std::int64_t milliseconds) -> normalized_cancellation_token;

    /// Reduces \p tokens to one token:
    /// - tokens that can never be cancelled are dropped;
    /// - none left: a token that can never be cancelled;
    /// - one left: that token, forwarded;
    /// - any already cancelled: the first such one, forwarded;
    /// - otherwise a new source linked to all of them, owned by the result.
    [[nodiscard]] static auto normalize(std::span<const cancellation_token> tokens)
        -> normalized_cancellation_token;

    [[nodiscard]] static auto normalize(std::initializer_list<cancellation_token> tokens)
        -> normalized_cancellation_token {
        return normalize(std::span<const cancellation_token>(tokens.begin(), tokens.size()));
    }

    /// \throw std::invalid_argument if \p tokens is null.
    [[nodiscard]] static auto normalize(const cancellation_token* tokens, std::size_t count)
        -> normalized_cancellation_token;

    /// Stays valid after dispose(). An owned token that was not cancelled
    /// by then can no longer be cancelled.
    [[nodiscard]] auto token() const noexcept -> cancellation_token;

    /// True if this object created the source behind token().
    [[nodiscard]] auto owns_source() const noexcept -> bool {
        return std::holds_alternative<managed_cancellation_source>(m_value);
    }

    [[nodiscard]] auto is_disposed() const noexcept -> bool {
        return m_disposed.load(std::memory_order_acquire);
    }

    /// Releases the owned source, if any. Only the first call does anything,
    /// including when several threads call concurrently.
    void dispose() noexcept;

private:
    std::variant<std::monostate, cancellation_token, managed_cancellation_source> m_value;
    std::atomic<bool> m_disposed;
};

}

#endif //NORMALIZED_CANCELLATION_TOKEN_H
