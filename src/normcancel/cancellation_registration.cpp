//
// Created by Jesson on 2024/10/17.
//

#include "../../include/normcancel/cancellation/cancellation_registration.h"
#include "../../include/normcancel/cancellation/cancellation_state.h"

normcancel::cancellation_registration::~cancellation_registration() {
    if (m_state) {
        m_state->deregister_callback(this);
        m_state->release_token_ref();
    }
}

void normcancel::cancellation_registration::register_callback(cancellation_token&& token) {
    auto* state = token.m_state;
    if (state && state->can_be_cancelled()) {
        m_state = state;
        if (state->try_register_callback(this)) {
            // The token's reference now belongs to this registration.
            token.m_state = nullptr;
        }
        else {
            m_state = nullptr;
            m_callback();
        }
    }
    else {
        m_state = nullptr;
    }
}
