//
// Created by Jesson on 2024/10/17.
//

#include "../../include/normcancel/spin_wait.h"

auto normcancel::spin_wait::spin_one() noexcept -> void {
    if (next_spin_will_yield()) {
        std::this_thread::yield();
    }
    ++m_spin_count;
    if (m_spin_count == 0) {
        // wrapped around, stay in the yielding phase
        m_spin_count = yield_threshold;
    }
}
