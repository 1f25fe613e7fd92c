//
// Created by Jesson on 2024/10/17.
//

#include "../../include/normcancel/cancellation/cancellation_source.h"
#include "../../include/normcancel/cancellation/cancellation_state.h"
#include "../../include/normcancel/cancellation/cancellation_token.h"

#include <utility>

normcancel::cancellation_source::cancellation_source() : m_state(detail::cancellation_state::create()) {}

normcancel::cancellation_source::cancellation_source(const cancellation_source& other) noexcept : m_state(other.m_state) {
    if (m_state) {
        m_state->add_source_ref();
    }
}

normcancel::cancellation_source::cancellation_source(cancellation_source&& other) noexcept : m_state(other.m_state) {
    other.m_state = nullptr;
}

normcancel::cancellation_source::~cancellation_source() {
    if (m_state) {
        m_state->release_source_ref();
    }
}

normcancel::cancellation_source& normcancel::cancellation_source::operator=(const cancellation_source& other) noexcept {
    if (m_state != other.m_state) {
        if (m_state) {
            m_state->release_source_ref();
        }
        m_state = other.m_state;
        if (m_state) {
            m_state->add_source_ref();
        }
    }
    return *this;
}

normcancel::cancellation_source& normcancel::cancellation_source::operator=(cancellation_source&& other) noexcept {
    if (this != &other) {
        if (m_state) {
            m_state->release_source_ref();
        }
        m_state = other.m_state;
        other.m_state = nullptr;
    }
    return *this;
}

void normcancel::cancellation_source::swap(cancellation_source& other) noexcept {
    std::swap(m_state, other.m_state);
}

bool normcancel::cancellation_source::can_be_cancelled() const noexcept {
    return m_state != nullptr;
}

normcancel::cancellation_token normcancel::cancellation_source::token() const noexcept {
    return cancellation_token(m_state);
}

void normcancel::cancellation_source::request_cancellation() const {
    if (m_state) {
        m_state->request_cancellation();
    }
}

bool normcancel::cancellation_source::is_cancellation_requested() const noexcept {
    return m_state && m_state->is_cancellation_requested();
}
