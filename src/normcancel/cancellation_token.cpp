//
// Created by Jesson on 2024/10/17.
//

#include "../../include/normcancel/cancellation/cancellation_token.h"
#include "../../include/normcancel/cancellation/cancellation_state.h"
#include "../../include/normcancel/cancellation/operation_cancelled.h"

#include <utility>

normcancel::cancellation_token::cancellation_token() noexcept : m_state(nullptr) {}

normcancel::cancellation_token::cancellation_token(const cancellation_token& other) noexcept : m_state(other.m_state) {
    if (m_state) {
        m_state->add_token_ref();
    }
}

normcancel::cancellation_token::cancellation_token(cancellation_token&& other) noexcept : m_state(other.m_state) {
    other.m_state = nullptr;
}

normcancel::cancellation_token::~cancellation_token() {
    if (m_state) {
        m_state->release_token_ref();
    }
}

normcancel::cancellation_token& normcancel::cancellation_token::operator=(const cancellation_token& other) noexcept {
    if (other.m_state != m_state) {
        if (m_state) {
            m_state->release_token_ref();
        }
        m_state = other.m_state;
        if (m_state) {
            m_state->add_token_ref();
        }
    }
    return *this;
}

normcancel::cancellation_token& normcancel::cancellation_token::operator=(cancellation_token&& other) noexcept {
    if (this != &other) {
        if (m_state) {
            m_state->release_token_ref();
        }
        m_state = other.m_state;
        other.m_state = nullptr;
    }
    return *this;
}

void normcancel::cancellation_token::swap(cancellation_token& other) noexcept {
    std::swap(m_state, other.m_state);
}

bool normcancel::cancellation_token::can_be_cancelled() const noexcept {
    return m_state && m_state->can_be_cancelled();
}

bool normcancel::cancellation_token::is_cancellation_requested() const noexcept {
    return m_state && m_state->is_cancellation_requested();
}

void normcancel::cancellation_token::throw_if_cancellation_requested() const {
    if (is_cancellation_requested()) {
        throw operation_cancelled{};
    }
}

normcancel::cancellation_token::cancellation_token(detail::cancellation_state* state) noexcept : m_state(state) {
    if (m_state) {
        m_state->add_token_ref();
    }
}
