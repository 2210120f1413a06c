/**
 * @file ProgressTable.cpp
 * @brief Implementation of the shared progress table
 */

#include "packfetch/engine/ProgressTable.h"

#include <QReadLocker>
#include <QWriteLocker>

#include <algorithm>

namespace PackFetch {

ProgressTable::ProgressTable() {
    m_clock.start();
}

void ProgressTable::publish(PackId id, ByteCount downloaded, ByteCount total, TransferStatus status) {
    QWriteLocker locker(&m_lock);

    ProgressEntry& entry = m_entries[id];
    entry.id = id;
    entry.downloadedBytes = downloaded;
    entry.totalBytes = total;
    entry.status = status;
    entry.updatedAtMs = m_clock.elapsed();

    m_peakActive = std::max(m_peakActive, m_entries.size());
}

void ProgressTable::remove(PackId id) {
    QWriteLocker locker(&m_lock);
    m_entries.erase(id);
}

std::vector<ProgressEntry> ProgressTable::snapshot() const {
    QReadLocker locker(&m_lock);

    std::vector<ProgressEntry> result;
    result.reserve(m_entries.size());
    for (const auto& [id, entry] : m_entries) {
        result.push_back(entry);
    }
    return result;
}

size_t ProgressTable::activeCount() const {
    QReadLocker locker(&m_lock);
    return m_entries.size();
}

size_t ProgressTable::peakActiveCount() const {
    QReadLocker locker(&m_lock);
    return m_peakActive;
}

} // namespace PackFetch
