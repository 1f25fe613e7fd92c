//
// Created by Jesson on 2024/10/17.
//

#include "../../include/normcancel/auto_reset_event.h"

auto normcancel::auto_reset_event::set() noexcept -> void {
    std::unique_lock lock(m_mutex);
    if (!m_is_set) {
        m_is_set = true;
        m_cv.notify_one();
    }
}

auto normcancel::auto_reset_event::wait() noexcept -> void {
    std::unique_lock lock(m_mutex);
    while (!m_is_set) {
        m_cv.wait(lock);
    }
    m_is_set = false;
}

auto normcancel::auto_reset_event::wait_until(clock::time_point deadline) noexcept -> bool {
    std::unique_lock lock(m_mutex);
    if (!m_cv.wait_until(lock, deadline, [this] { return m_is_set; })) {
        return false;
    }
    m_is_set = false;
    return true;
}
