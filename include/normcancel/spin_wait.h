//
// Created by Jesson on 2024/10/2.
//

#ifndef SPIN_WAIT_H
#define SPIN_WAIT_H

#include <cstdint>
#include <thread>

namespace normcancel {

/// Back-off helper for short waits on another thread: busy-spins for the
/// first few rounds, then yields the time slice on every round.
class spin_wait {
public:
    spin_wait() noexcept { reset(); }
    auto next_spin_will_yield() const noexcept -> bool { return m_spin_count >= yield_threshold; }
    auto spin_one() noexcept -> void;
    auto reset() noexcept -> void { m_spin_count = std::thread::hardware_concurrency() > 1 ? 0 : yield_threshold; }

private:
    static constexpr std::uint32_t yield_threshold = 10;
    std::uint32_t m_spin_count;
};

}

#endif //SPIN_WAIT_H
