//
// Created by Jesson on 2024/10/17.
//

#include "../../include/normcancel/cancellation/cancellation_state.h"
#include "../../include/normcancel/cancellation/cancellation_registration.h"
#include "../../include/normcancel/detail/log.h"
#include "../../include/normcancel/spin_wait.h"

#include <cassert>
#include <cstdlib>
#include <exception>
#include <functional>
#include <new>
#include <thread>

namespace normcancel::detail {

struct cancellation_registration_list_chunk {
    static auto allocate(std::uint32_t entry_count) -> cancellation_registration_list_chunk*;
    static void free(cancellation_registration_list_chunk* chunk) noexcept {
        std::free(chunk);
    }

    std::atomic<cancellation_registration_list_chunk*> m_next_chunk;
    cancellation_registration_list_chunk* m_prev_chunk;
    std::atomic<std::int32_t> m_approx_free_count;
    std::uint32_t m_entry_count;
    std::atomic<cancellation_registration*> m_entries[1];
};

struct cancellation_registration_list {
    static auto allocate() -> cancellation_registration_list*;
    static void free(cancellation_registration_list* list) noexcept {
        std::free(list);
    }

    std::atomic<cancellation_registration_list_chunk*> m_approx_tail;
    cancellation_registration_list_chunk m_head_chunk;
};

struct cancellation_registration_result {
    cancellation_registration_result(cancellation_registration_list_chunk* chunk, std::uint32_t entry_id)
        : m_chunk(chunk)
        , m_entry_id(entry_id) {}

    cancellation_registration_list_chunk* m_chunk;
    std::uint32_t m_entry_id;
};

struct cancellation_registration_state {
    static auto allocate() -> cancellation_registration_state*;
    static void free(cancellation_registration_state* state) noexcept {
        std::free(state);
    }

    auto add_registration(cancellation_registration* registration) -> cancellation_registration_result;

    std::thread::id m_notification_thread_id;

    // One list per bucket of threads, so concurrent registrations from
    // different threads rarely touch the same chunk.
    std::uint32_t m_list_count;
    std::atomic<cancellation_registration_list*> m_lists[1];
};

}

auto normcancel::detail::cancellation_registration_list_chunk::allocate(std::uint32_t entry_count)
    -> cancellation_registration_list_chunk* {
    const auto chunk_size = sizeof(cancellation_registration_list_chunk) + (entry_count - 1) * sizeof(m_entries[0]);
    auto* chunk = static_cast<cancellation_registration_list_chunk*>(std::malloc(chunk_size));
    if (!chunk) {
        throw std::bad_alloc{};
    }

    ::new (&chunk->m_next_chunk) std::atomic<cancellation_registration_list_chunk*>(nullptr);
    chunk->m_prev_chunk = nullptr;
    ::new (&chunk->m_approx_free_count) std::atomic<std::int32_t>(static_cast<std::int32_t>(entry_count - 1));
    chunk->m_entry_count = entry_count;
    for (std::uint32_t i = 0; i < entry_count; ++i) {
        ::new (&chunk->m_entries[i]) std::atomic<cancellation_registration*>(nullptr);
    }
    return chunk;
}

auto normcancel::detail::cancellation_registration_list::allocate() -> cancellation_registration_list* {
    constexpr std::uint32_t initial_chunk_size = 16;
    constexpr std::size_t buffer_size =
        sizeof(cancellation_registration_list) +
        (initial_chunk_size - 1) * sizeof(std::atomic<cancellation_registration*>);

    auto* bucket = static_cast<cancellation_registration_list*>(std::malloc(buffer_size));
    if (!bucket) {
        throw std::bad_alloc{};
    }

    ::new (&bucket->m_approx_tail) std::atomic<cancellation_registration_list_chunk*>(&bucket->m_head_chunk);
    ::new (&bucket->m_head_chunk.m_next_chunk) std::atomic<cancellation_registration_list_chunk*>(nullptr);
    bucket->m_head_chunk.m_prev_chunk = nullptr;
    ::new (&bucket->m_head_chunk.m_approx_free_count)
        std::atomic<std::int32_t>(static_cast<std::int32_t>(initial_chunk_size - 1));
    bucket->m_head_chunk.m_entry_count = initial_chunk_size;
    for (std::uint32_t i = 0; i < initial_chunk_size; ++i) {
        ::new (&bucket->m_head_chunk.m_entries[i]) std::atomic<cancellation_registration*>(nullptr);
    }
    return bucket;
}

auto normcancel::detail::cancellation_registration_state::allocate() -> cancellation_registration_state* {
    constexpr std::uint32_t max_list_count = 16;

    auto list_count = std::thread::hardware_concurrency();
    if (list_count > max_list_count) {
        list_count = max_list_count;
    }
    else if (list_count == 0) {
        list_count = 1;
    }

    const std::size_t buffer_size =
        sizeof(cancellation_registration_state) + (list_count - 1) * sizeof(m_lists[0]);

    auto* state = static_cast<cancellation_registration_state*>(std::malloc(buffer_size));
    if (!state) {
        throw std::bad_alloc{};
    }

    ::new (&state->m_notification_thread_id) std::thread::id();
    state->m_list_count = list_count;
    for (std::uint32_t i = 0; i < list_count; ++i) {
        ::new (&state->m_lists[i]) std::atomic<cancellation_registration_list*>(nullptr);
    }
    return state;
}

auto normcancel::detail::cancellation_registration_state::add_registration(
    cancellation_registration* registration) -> cancellation_registration_result {
    const auto thread_id_hash_code = std::hash<std::thread::id>{}(std::this_thread::get_id());
    auto& list_ptr = m_lists[thread_id_hash_code % m_list_count];

    auto* list = list_ptr.load(std::memory_order_acquire);
    if (!list) {
        auto* new_list = cancellation_registration_list::allocate();

        // Pre-claim the first slot.
        registration->m_chunk = &new_list->m_head_chunk;
        registration->m_entry_id = 0;
        new_list->m_head_chunk.m_entries[0].store(registration, std::memory_order_relaxed);

        if (list_ptr.compare_exchange_strong(
                list, new_list, std::memory_order_seq_cst, std::memory_order_acquire)) {
            return {&new_list->m_head_chunk, 0};
        }
        cancellation_registration_list::free(new_list);
    }

    while (true) {
        // Walk to the real end of the chain, then search backwards for a free slot.
        auto* const original_last_chunk = list->m_approx_tail.load(std::memory_order_acquire);

        auto* last_chunk = original_last_chunk;
        for (auto* next = last_chunk->m_next_chunk.load(std::memory_order_acquire);
             next != nullptr;
             next = next->m_next_chunk.load(std::memory_order_acquire)) {
            last_chunk = next;
        }

        if (last_chunk != original_last_chunk) {
            // Racing writes here are fine, the cache converges on the true tail.
            list->m_approx_tail.store(last_chunk, std::memory_order_release);
        }

        for (auto* chunk = last_chunk; chunk != nullptr; chunk = chunk->m_prev_chunk) {
            auto free_count = chunk->m_approx_free_count.load(std::memory_order_relaxed);

            // The count is approximate. Keep decrementing it while the chunk
            // looks full so that every so often we search anyway.
            if (free_count < 1) {
                --free_count;
                chunk->m_approx_free_count.store(free_count, std::memory_order_relaxed);
            }

            constexpr std::int32_t forced_search_threshold = -10;
            if (free_count > 0 || free_count < forced_search_threshold) {
                const std::uint32_t entry_count = chunk->m_entry_count;
                const std::uint32_t id_mask = entry_count - 1;
                const std::uint32_t start_id = free_count > 0
                    ? entry_count - static_cast<std::uint32_t>(free_count)
                    : 0;

                registration->m_chunk = chunk;

                for (std::uint32_t i = 0; i < entry_count; ++i) {
                    const std::uint32_t entry_id = (start_id + i) & id_mask;
                    auto& entry = chunk->m_entries[entry_id];

                    // Cheap relaxed peek first, may be stale either way.
                    auto* entry_value = entry.load(std::memory_order_relaxed);
                    if (!entry_value) {
                        registration->m_entry_id = entry_id;
                        if (entry.compare_exchange_strong(
                                entry_value,
                                registration,
                                std::memory_order_seq_cst,
                                std::memory_order_relaxed)) {
                            const std::int32_t new_free_count = free_count < 0 ? 0 : free_count - 1;
                            chunk->m_approx_free_count.store(new_free_count, std::memory_order_relaxed);
                            return {chunk, entry_id};
                        }
                    }
                }

                chunk->m_approx_free_count.store(0, std::memory_order_relaxed);
            }
        }

        // No free slot anywhere. Append a chunk twice the size of the last one.
        constexpr std::uint32_t max_element_count = 1024;
        const std::uint32_t element_count =
            last_chunk->m_entry_count < max_element_count ? last_chunk->m_entry_count * 2 : max_element_count;

        auto* new_chunk = cancellation_registration_list_chunk::allocate(element_count);
        new_chunk->m_prev_chunk = last_chunk;

        registration->m_chunk = new_chunk;
        registration->m_entry_id = 0;
        new_chunk->m_entries[0].store(registration, std::memory_order_relaxed);

        if (cancellation_registration_list_chunk* old_next = nullptr;
            last_chunk->m_next_chunk.compare_exchange_strong(
                old_next,
                new_chunk,
                std::memory_order_seq_cst,
                std::memory_order_relaxed)) {
            list->m_approx_tail.store(new_chunk, std::memory_order_release);
            return {new_chunk, 0};
        }

        // Another thread appended first; retry against its chunk.
        cancellation_registration_list_chunk::free(new_chunk);
    }
}

normcancel::detail::cancellation_state::~cancellation_state() {
    assert((m_state.load(std::memory_order_relaxed) & ref_count_mask) == 0);

    // The acq_rel ref-count decrement that led here already gives us
    // visibility of every write, relaxed loads are enough.
    if (auto* registration_state = m_registration_state.load(std::memory_order_relaxed)) {
        for (std::uint32_t i = 0; i < registration_state->m_list_count; ++i) {
            if (auto* list = registration_state->m_lists[i].load(std::memory_order_relaxed)) {
                auto* chunk = list->m_head_chunk.m_next_chunk.load(std::memory_order_relaxed);
                cancellation_registration_list::free(list);

                while (chunk) {
                    auto* next = chunk->m_next_chunk.load(std::memory_order_relaxed);
                    cancellation_registration_list_chunk::free(chunk);
                    chunk = next;
                }
            }
        }

        cancellation_registration_state::free(registration_state);
    }
}

void normcancel::detail::cancellation_state::request_cancellation() {
    const auto old_state = m_state.fetch_or(requested_flag, std::memory_order_seq_cst);
    if ((old_state & requested_flag) != 0) {
        return;
    }

    // seq_cst pairs with try_register_callback(): either the registering
    // thread sees the requested flag after publishing its slot, or we see
    // its slot after setting the flag.
    if (auto* const registration_state = m_registration_state.load(std::memory_order_seq_cst)) {
        // Read by deregister_callback() only after it failed to reclaim a slot
        // that we exchanged below, which orders this write before the read.
        registration_state->m_notification_thread_id = std::this_thread::get_id();

        for (std::uint32_t list_index = 0, list_count = registration_state->m_list_count;
             list_index < list_count;
             ++list_index) {
            auto* list = registration_state->m_lists[list_index].load(std::memory_order_seq_cst);
            if (!list) {
                continue;
            }

            auto* chunk = &list->m_head_chunk;
            do {
                for (std::uint32_t entry_index = 0, entry_count = chunk->m_entry_count;
                     entry_index < entry_count;
                     ++entry_index) {
                    auto& entry = chunk->m_entries[entry_index];

                    if (auto* registration = entry.load(std::memory_order_seq_cst)) {
                        // Claim the registration; loses the race to a concurrent
                        // deregister_callback() if the destructor got there first.
                        registration = entry.exchange(nullptr, std::memory_order_seq_cst);
                        if (registration) {
                            try {
                                registration->m_callback();
                            }
                            catch (const std::exception& ex) {
                                logger()->critical("cancellation callback threw: {}", ex.what());
                                std::terminate();
                            }
                            catch (...) {
                                logger()->critical("cancellation callback threw a non-standard exception");
                                std::terminate();
                            }
                        }
                    }
                }

                chunk = chunk->m_next_chunk.load(std::memory_order_seq_cst);
            } while (chunk);
        }

        m_state.fetch_add(notification_complete_flag, std::memory_order_release);
    }
}

bool normcancel::detail::cancellation_state::try_register_callback(cancellation_registration* registration) {
    if (is_cancellation_requested()) {
        return false;
    }

    auto* registration_state = m_registration_state.load(std::memory_order_acquire);
    if (!registration_state) {
        auto* new_registration_state = cancellation_registration_state::allocate();

        // seq_cst so that a later request_cancellation() on another thread
        // sees the registration state if we don't see its flag below.
        if (m_registration_state.compare_exchange_strong(
                registration_state,
                new_registration_state,
                std::memory_order_seq_cst,
                std::memory_order_acquire)) {
            registration_state = new_registration_state;
        }
        else {
            cancellation_registration_state::free(new_registration_state);
        }
    }

    auto result = registration_state->add_registration(registration);

    // Re-check with seq_cst: a concurrent request_cancellation() may have
    // missed the slot we just published.
    if ((m_state.load(std::memory_order_seq_cst) & requested_flag) != 0) {
        auto& entry = result.m_chunk->m_entries[result.m_entry_id];

        // compare_exchange, not exchange: the slot may already have been
        // consumed by the cancelling thread and reused by a third thread.
        auto* old_value = registration;
        if (entry.compare_exchange_strong(old_value, nullptr, std::memory_order_relaxed)) {
            return false;
        }

        // The cancelling thread owns the callback now.
    }

    return true;
}

void normcancel::detail::cancellation_state::deregister_callback(cancellation_registration* registration) noexcept {
    auto* chunk = registration->m_chunk;
    auto& entry = chunk->m_entries[registration->m_entry_id];

    // acquire on failure synchronises with the exchange in
    // request_cancellation() and so with its m_notification_thread_id write.
    auto* old_value = registration;
    if (entry.compare_exchange_strong(old_value, nullptr, std::memory_order_acquire)) {
        const std::int32_t old_free_count = chunk->m_approx_free_count.load(std::memory_order_relaxed);
        if (old_free_count < static_cast<std::int32_t>(chunk->m_entry_count)) {
            const std::int32_t new_free_count = old_free_count < 0 ? 1 : old_free_count + 1;
            chunk->m_approx_free_count.store(new_free_count, std::memory_order_relaxed);
        }
        return;
    }

    // request_cancellation() has taken this registration. Wait for it to
    // finish notifying, unless we are being destroyed from inside a callback
    // on the notifying thread, which would deadlock.
    auto* registration_state = m_registration_state.load(std::memory_order_relaxed);
    if (std::this_thread::get_id() != registration_state->m_notification_thread_id) {
        spin_wait waiter;
        while (!is_cancellation_notification_complete()) {
            waiter.spin_one();
        }
    }
}
