/**
 * @file RunSummary.cpp
 * @brief Implementation of RunSummary
 */

#include "packfetch/engine/RunSummary.h"

#include <QMutexLocker>

#include <algorithm>

namespace PackFetch {

void RunSummary::recordCompleted(PackId id) {
    {
        QMutexLocker locker(&m_mutex);
        m_completedIds.append(id);
    }
    m_completed.fetch_add(1, std::memory_order_acq_rel);
}

void RunSummary::recordFailed(PackId id) {
    {
        QMutexLocker locker(&m_mutex);
        m_failedIds.append(id);
    }
    m_failed.fetch_add(1, std::memory_order_acq_rel);
}

double RunSummary::overallPercent() const noexcept {
    const int total = requested();
    if (total <= 0) return 100.0;
    return std::min(100.0, 100.0 * finished() / total);
}

QList<PackId> RunSummary::completedIds() const {
    QMutexLocker locker(&m_mutex);
    QList<PackId> ids = m_completedIds;
    std::sort(ids.begin(), ids.end());
    return ids;
}

QList<PackId> RunSummary::failedIds() const {
    QMutexLocker locker(&m_mutex);
    QList<PackId> ids = m_failedIds;
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace PackFetch
