//
// Created on 2024/11/5.
//

#ifndef WAIT_HELPERS_H
#define WAIT_HELPERS_H

#include <normcancel/cancellation/cancellation_token.h>

#include <chrono>
#include <thread>

namespace normcancel::test {

/// Polls \p token until it is cancelled or \p limit elapses.
inline auto wait_for_cancellation(const cancellation_token& token,
                                  std::chrono::milliseconds limit = std::chrono::seconds(5)) -> bool {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (!token.is_cancellation_requested()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

}

#endif //WAIT_HELPERS_H
