//
// Created by Jesson on 2024/10/3.
//

#ifndef CANCELLATION_STATE_H
#define CANCELLATION_STATE_H

#include <atomic>
#include <cstdint>

namespace normcancel {

class cancellation_registration;

}

namespace normcancel::detail {

struct cancellation_registration_state;

/// Shared state behind cancellation_source, cancellation_token and
/// cancellation_registration. Lifetime is managed by two intrusive
/// ref-counts packed together with the cancellation flags.
class cancellation_state {
public:

    /// \throw std::bad_alloc
    static cancellation_state* create() {
        return new cancellation_state();
    }

    cancellation_state(const cancellation_state&) = delete;
    cancellation_state& operator=(const cancellation_state&) = delete;

    ~cancellation_state();

    /// Reference held by a cancellation_token or cancellation_registration.
    void add_token_ref() noexcept {
        m_state.fetch_add(token_ref_increment, std::memory_order_relaxed);
    }

    void release_token_ref() noexcept {
        const std::uint64_t old_state = m_state.fetch_sub(token_ref_increment, std::memory_order_acq_rel);
        if ((old_state & ref_count_mask) == token_ref_increment) {
            delete this;
        }
    }

    /// Reference held by a cancellation_source.
    void add_source_ref() noexcept {
        m_state.fetch_add(source_ref_increment, std::memory_order_relaxed);
    }

    /// Once the last source reference is gone the state can no longer
    /// become cancelled.
    void release_source_ref() noexcept {
        const std::uint64_t old_state = m_state.fetch_sub(source_ref_increment, std::memory_order_acq_rel);
        if ((old_state & ref_count_mask) == source_ref_increment) {
            delete this;
        }
    }

    /// True if cancellation was already requested or some source
    /// reference is still alive.
    bool can_be_cancelled() const noexcept {
        return (m_state.load(std::memory_order_acquire) & can_be_cancelled_mask) != 0;
    }

    bool is_cancellation_requested() const noexcept {
        return (m_state.load(std::memory_order_acquire) & requested_flag) != 0;
    }

    /// Sets the requested flag and runs every registered callback on the
    /// calling thread. Only the first caller does any work.
    void request_cancellation();

    /// Adds the registration to the callback list.
    ///
    /// \return
    /// false if cancellation had already been requested and the caller
    /// must run the callback itself.
    ///
    /// \throw std::bad_alloc
    bool try_register_callback(cancellation_registration* registration);

    /// Removes a registration previously added by try_register_callback().
    ///
    /// Blocks while another thread is running the callback inside
    /// request_cancellation(). Does not block when called from the
    /// notifying thread itself.
    void deregister_callback(cancellation_registration* registration) noexcept;

private:

    cancellation_state() noexcept
        : m_state(source_ref_increment)
        , m_registration_state(nullptr) {}

    bool is_cancellation_notification_complete() const noexcept {
        return (m_state.load(std::memory_order_acquire) & notification_complete_flag) != 0;
    }

    static constexpr std::uint64_t requested_flag = 1;
    static constexpr std::uint64_t notification_complete_flag = 2;
    static constexpr std::uint64_t source_ref_increment = 4;
    static constexpr std::uint64_t token_ref_increment = UINT64_C(1) << 33;
    static constexpr std::uint64_t can_be_cancelled_mask = token_ref_increment - 1;
    static constexpr std::uint64_t ref_count_mask = ~(requested_flag | notification_complete_flag);

    // - bit 0: cancellation requested.
    // - bit 1: notification of registered callbacks finished.
    // - bits 2-32: cancellation_source ref-count.
    // - bits 33-63: cancellation_token/cancellation_registration ref-count.
    std::atomic<std::uint64_t> m_state;

    std::atomic<cancellation_registration_state*> m_registration_state;
};

}

#endif //CANCELLATION_STATE_H
