//
// Created by Jesson on 2024/10/3.
//

#ifndef CANCELLATION_SOURCE_H
#define CANCELLATION_SOURCE_H

namespace normcancel {

class cancellation_token;

namespace detail {

class cancellation_state;

}

/// Ref-counted handle on a cancellation state that is allowed to request
/// cancellation. Copies share the state; tokens derived from any copy stay
/// cancellable for as long as at least one source reference is alive or
/// cancellation has already been requested.
class cancellation_source {
public:
    /// Allocates a fresh, not yet cancelled state.
    ///
    /// \throw std::bad_alloc
    cancellation_source();

    cancellation_source(const cancellation_source& other) noexcept;
    cancellation_source(cancellation_source&& other) noexcept;
    ~cancellation_source();

    auto operator=(const cancellation_source& other) noexcept -> cancellation_source&;
    auto operator=(cancellation_source&& other) noexcept -> cancellation_source&;

    void swap(cancellation_source& other) noexcept;

    /// False for a moved-from source.
    [[nodiscard]] auto can_be_cancelled() const noexcept -> bool;

    /// A token observing this source. The token of a moved-from source
    /// can never be cancelled.
    [[nodiscard]] auto token() const noexcept -> cancellation_token;

    /// Marks the state cancelled and runs every registered callback on the
    /// calling thread. Only the first call does any work; calls on a
    /// moved-from source are ignored.
    auto request_cancellation() const -> void;

    [[nodiscard]] auto is_cancellation_requested() const noexcept -> bool;

private:
    detail::cancellation_state* m_state;
};

inline void swap(cancellation_source& a, cancellation_source& b) noexcept {
    a.swap(b);
}

}

#endif //CANCELLATION_SOURCE_H
