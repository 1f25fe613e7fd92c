//
// Created on 2024/11/4.
//

#include "../../include/normcancel/cancellation/normalized_cancellation_token.h"
#include "../../include/normcancel/detail/log.h"

#include <algorithm>
#include <iterator>
#include <utility>
#include <vector>

normcancel::normalized_cancellation_token::normalized_cancellation_token() noexcept
    : m_value(std::monostate{})
    , m_disposed(false) {}

normcancel::normalized_cancellation_token::normalized_cancellation_token(cancellation_token token) noexcept
    : m_value(std::move(token))
    , m_disposed(false) {}

normcancel::normalized_cancellation_token::normalized_cancellation_token(managed_cancellation_source&& source) noexcept
    : m_value(std::move(source))
    , m_disposed(false) {}

normcancel::normalized_cancellation_token::normalized_cancellation_token(normalized_cancellation_token&& other) noexcept
    : m_value(std::move(other.m_value))
    , m_disposed(other.m_disposed.load(std::memory_order_acquire)) {
    other.m_value.emplace<std::monostate>();
}

auto normcancel::normalized_cancellation_token::operator=(normalized_cancellation_token&& other) noexcept
    -> normalized_cancellation_token& {
    if (this != &other) {
        dispose();
        m_value = std::move(other.m_value);
        m_disposed.store(other.m_disposed.load(std::memory_order_acquire), std::memory_order_release);
        other.m_value.emplace<std::monostate>();
    }
    return *this;
}

normcancel::normalized_cancellation_token::~normalized_cancellation_token() {
    dispose();
}

auto normcancel::normalized_cancellation_token::timeout(std::int64_t milliseconds) -> normalized_cancellation_token {
    return timeout(std::chrono::milliseconds(milliseconds));
}

auto normcancel::normalized_cancellation_token::normalize(std::span<const cancellation_token> tokens)
    -> normalized_cancellation_token {
    std::vector<cancellation_token> cancellable;
    cancellable.reserve(tokens.size());
    std::copy_if(tokens.begin(), tokens.end(), std::back_inserter(cancellable),
        [](const cancellation_token& token) { return token.can_be_cancelled(); });

    if (cancellable.empty()) {
        detail::logger()->trace("normalize: {} token(s), none cancellable", tokens.size());
        return normalized_cancellation_token{};
    }

    if (cancellable.size() == 1) {
        return normalized_cancellation_token{std::move(cancellable.front())};
    }

    const auto cancelled = std::find_if(cancellable.begin(), cancellable.end(),
        [](const cancellation_token& token) { return token.is_cancellation_requested(); });
    if (cancelled != cancellable.end()) {
        detail::logger()->trace("normalize: forwarding already cancelled token at position {}",
            std::distance(cancellable.begin(), cancelled));
        return normalized_cancellation_token{std::move(*cancelled)};
    }

    detail::logger()->trace("normalize: linking {} cancellable token(s)", cancellable.size());
    return normalized_cancellation_token{managed_cancellation_source::create_linked(cancellable)};
}

auto normcancel::normalized_cancellation_token::normalize(const cancellation_token* tokens, std::size_t count)
    -> normalized_cancellation_token {
    if (tokens == nullptr) {
        throw std::invalid_argument("normalize: token sequence must not be null");
    }
    return normalize(std::span<const cancellation_token>(tokens, count));
}

auto normcancel::normalized_cancellation_token::token() const noexcept -> cancellation_token {
    if (const auto* forwarded = std::get_if<cancellation_token>(&m_value)) {
        return *forwarded;
    }
    if (const auto* owned = std::get_if<managed_cancellation_source>(&m_value)) {
        return owned->token();
    }
    return cancellation_token{};
}

void normcancel::normalized_cancellation_token::dispose() noexcept {
    if (m_disposed.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    if (auto* owned = std::get_if<managed_cancellation_source>(&m_value)) {
        owned->dispose();
        detail::logger()->trace("normalized token released its source");
    }
}
