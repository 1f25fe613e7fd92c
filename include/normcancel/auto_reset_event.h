//
// Created by Jesson on 2024/10/2.
//

#ifndef AUTO_RESET_EVENT_H
#define AUTO_RESET_EVENT_H

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace normcancel {

/// Event that releases a single waiter per set() and resets itself.
class auto_reset_event {
public:
    using clock = std::chrono::steady_clock;

    explicit auto_reset_event(const bool is_set = false) noexcept : m_is_set(is_set) {}
    ~auto_reset_event() = default;

    auto_reset_event(const auto_reset_event&) = delete;
    auto_reset_event& operator=(const auto_reset_event&) = delete;

    auto set() noexcept -> void;
    auto wait() noexcept -> void;

    /// Waits until the event is set or \p deadline passes.
    ///
    /// \return
    /// true if the event was set (and has been reset by this call),
    /// false on timeout.
    auto wait_until(clock::time_point deadline) noexcept -> bool;

private:
    std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_is_set;
};

}

#endif //AUTO_RESET_EVENT_H
