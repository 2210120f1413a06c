/**
 * @file RunSummary.h
 * @brief Aggregate outcome counters for one batch run
 */

#pragma once

#include "packfetch/engine/Types.h"

#include <QList>
#include <QMutex>

#include <atomic>

namespace PackFetch {

/**
 * @class RunSummary
 * @brief Counts and identifier lists of terminal outcomes
 *
 * Counters are atomics so the render thread can read them without
 * locking; the identifier lists are guarded by a mutex.
 */
class RunSummary {
public:
    RunSummary() = default;

    RunSummary(const RunSummary&) = delete;
    RunSummary& operator=(const RunSummary&) = delete;

    void setRequested(int count) { m_requested.store(count, std::memory_order_release); }

    void recordCompleted(PackId id);
    void recordFailed(PackId id);

    [[nodiscard]] int requested() const noexcept { return m_requested.load(std::memory_order_acquire); }
    [[nodiscard]] int completed() const noexcept { return m_completed.load(std::memory_order_acquire); }
    [[nodiscard]] int failed() const noexcept { return m_failed.load(std::memory_order_acquire); }
    [[nodiscard]] int finished() const noexcept { return completed() + failed(); }

    /**
     * @brief Share of requested items that reached a terminal status, 0..100
     */
    [[nodiscard]] double overallPercent() const noexcept;

    [[nodiscard]] QList<PackId> completedIds() const;
    [[nodiscard]] QList<PackId> failedIds() const;

private:
    std::atomic<int> m_requested{0};
    std::atomic<int> m_completed{0};
    std::atomic<int> m_failed{0};

    mutable QMutex m_mutex;
    QList<PackId> m_completedIds;
    QList<PackId> m_failedIds;
};

} // namespace PackFetch
