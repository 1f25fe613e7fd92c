//
// Created on 2024/11/3.
//

#include "../../include/normcancel/cancellation/cancellation_timer.h"
#include "../../include/normcancel/config.h"
#include "../../include/normcancel/detail/log.h"

#include <algorithm>
#include <cstdint>
#include <exception>
#include <new>
#include <queue>
#include <utility>
#include <vector>

namespace normcancel::detail {

struct timer_entry {
    static constexpr std::uint32_t pending = 0;
    static constexpr std::uint32_t fired = 1;
    static constexpr std::uint32_t cancelled = 2;

    timer_entry(cancellation_source&& source, cancellation_timer::clock::time_point deadline) noexcept
        : m_source(std::move(source))
        , m_deadline(deadline)
        , m_status(pending)
        , m_ref_count(2) {}

    /// One reference belongs to the handle, one to the timer thread.
    void release() noexcept {
        if (m_ref_count.fetch_sub(1, std::memory_order_acq_rel) == 1) {
            delete this;
        }
    }

    /// Whoever wins the pending transition takes the source.
    auto try_transition(std::uint32_t to) noexcept -> bool {
        std::uint32_t expected = pending;
        return m_status.compare_exchange_strong(expected, to, std::memory_order_acq_rel, std::memory_order_acquire);
    }

    cancellation_source m_source;
    const cancellation_timer::clock::time_point m_deadline;
    std::atomic<std::uint32_t> m_status;
    std::atomic<std::uint32_t> m_ref_count;
};

}

namespace {

using normcancel::detail::timer_entry;

struct later_deadline {
    auto operator()(const timer_entry* a, const timer_entry* b) const noexcept -> bool {
        return a->m_deadline > b->m_deadline;
    }
};

using timer_heap = std::priority_queue<timer_entry*, std::vector<timer_entry*>, later_deadline>;

// Heap size below which cancelled entries are left until they reach the top.
constexpr std::size_t min_compaction_size = 64;

void compact(timer_heap& heap) {
    std::vector<timer_entry*> live;
    live.reserve(heap.size());
    while (!heap.empty()) {
        auto* entry = heap.top();
        heap.pop();
        if (entry->m_status.load(std::memory_order_acquire) == timer_entry::pending) {
            live.push_back(entry);
        }
        else {
            entry->release();
        }
    }
    heap = timer_heap{later_deadline{}, std::move(live)};
}

}

auto normcancel::cancellation_timer::handle::operator=(handle&& other) noexcept -> handle& {
    if (this != &other) {
        cancel();
        m_entry = other.m_entry;
        other.m_entry = nullptr;
    }
    return *this;
}

auto normcancel::cancellation_timer::handle::cancel() noexcept -> bool {
    auto* entry = std::exchange(m_entry, nullptr);
    if (!entry) {
        return false;
    }

    bool stopped = false;
    if (entry->try_transition(detail::timer_entry::cancelled)) {
        // Drop the source reference now rather than when the thread
        // eventually discards the entry.
        [[maybe_unused]] cancellation_source released = std::move(entry->m_source);
        stopped = true;
    }
    entry->release();
    return stopped;
}

auto normcancel::cancellation_timer::handle::is_pending() const noexcept -> bool {
    return m_entry && m_entry->m_status.load(std::memory_order_acquire) == detail::timer_entry::pending;
}

auto normcancel::cancellation_timer::instance() -> cancellation_timer& {
    static cancellation_timer timer;
    return timer;
}

normcancel::cancellation_timer::cancellation_timer()
    : m_stop(false)
    , m_incoming(NORMCANCEL_TIMER_QUEUE_CAPACITY) {
    // The logger must be constructed before this object so that it is
    // still alive when the thread logs during static destruction.
    detail::logger()->debug("starting cancellation timer thread");
    m_thread = std::thread([this] { run(); });
}

normcancel::cancellation_timer::~cancellation_timer() {
    m_stop.store(true, std::memory_order_release);
    m_wakeup.set();
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

auto normcancel::cancellation_timer::schedule(cancellation_source source, clock::time_point deadline) -> handle {
    auto* entry = new detail::timer_entry(std::move(source), deadline);
    if (!m_incoming.push(entry)) {
        // The thread never saw it, drop both references.
        entry->release();
        entry->release();
        throw std::bad_alloc{};
    }
    m_wakeup.set();
    return handle{entry};
}

void normcancel::cancellation_timer::run() noexcept {
    timer_heap heap;
    std::size_t compact_at = min_compaction_size;

    while (!m_stop.load(std::memory_order_acquire)) {
        try {
            m_incoming.consume_all([&heap](timer_entry* entry) { heap.push(entry); });

            if (heap.size() >= compact_at) {
                compact(heap);
                compact_at = std::max(min_compaction_size, heap.size() * 2);
            }
        }
        catch (const std::bad_alloc& ex) {
            detail::logger()->critical("cancellation timer out of memory: {}", ex.what());
            std::terminate();
        }

        const auto now = clock::now();
        while (!heap.empty()) {
            auto* entry = heap.top();
            if (entry->m_status.load(std::memory_order_acquire) != timer_entry::pending) {
                heap.pop();
                entry->release();
                continue;
            }
            if (entry->m_deadline > now) {
                break;
            }
            heap.pop();
            if (entry->try_transition(timer_entry::fired)) {
                const cancellation_source source = std::move(entry->m_source);
                detail::logger()->trace("cancellation timer fired");
                source.request_cancellation();
            }
            entry->release();
        }

        if (heap.empty() || heap.top()->m_deadline == clock::time_point::max()) {
            m_wakeup.wait();
        }
        else {
            m_wakeup.wait_until(heap.top()->m_deadline);
        }
    }

    // Outstanding entries are dropped without firing.
    m_incoming.consume_all([](timer_entry* entry) { entry->release(); });
    while (!heap.empty()) {
        heap.top()->release();
        heap.pop();
    }

    detail::logger()->debug("cancellation timer thread stopped");
}
