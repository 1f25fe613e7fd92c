//
// Created on 2024/11/3.
//

#include "../../include/normcancel/cancellation/managed_cancellation_source.h"
#include "../../include/normcancel/detail/log.h"

#include <utility>

normcancel::managed_cancellation_source::managed_cancellation_source()
    : m_source()
    , m_token(m_source.token()) {}

normcancel::managed_cancellation_source& normcancel::managed_cancellation_source::operator=(
    managed_cancellation_source&& other) noexcept {
    if (this != &other) {
        dispose();
        m_source = std::move(other.m_source);
        m_token = std::move(other.m_token);
        m_timer = std::move(other.m_timer);
        m_links = std::move(other.m_links);
    }
    return *this;
}

normcancel::managed_cancellation_source::~managed_cancellation_source() {
    dispose();
}

auto normcancel::managed_cancellation_source::create_linked(std::span<const cancellation_token> tokens)
    -> managed_cancellation_source {
    managed_cancellation_source linked;
    linked.m_links.reserve(tokens.size());

    for (const auto& token : tokens) {
        if (!token.can_be_cancelled()) {
            continue;
        }
        // The callback holds its own source reference so it never points
        // into this object, which may be moved.
        linked.m_links.push_back(std::make_unique<cancellation_registration>(
            token, [source = linked.m_source] { source.request_cancellation(); }));
        if (linked.is_cancellation_requested()) {
            // Linked to an already cancelled token, the rest can't matter.
            break;
        }
    }

    detail::logger()->trace("linked cancellation source created over {} token(s)", linked.m_links.size());
    return linked;
}

void normcancel::managed_cancellation_source::dispose() noexcept {
    m_timer.cancel();
    // Destroying a registration waits for its callback if another thread is
    // running it right now.
    m_links.clear();
    [[maybe_unused]] cancellation_source released = std::move(m_source);
}

void normcancel::managed_cancellation_source::schedule_cancellation(cancellation_timer::clock::time_point deadline) {
    if (!m_source.can_be_cancelled() || m_source.is_cancellation_requested()) {
        return;
    }
    m_timer = cancellation_timer::instance().schedule(m_source, deadline);
}
