/**
 * @file ProgressTable.h
 * @brief Thread-safe table of in-flight transfers
 *
 * Workers publish their byte counters here; the ProgressAggregator reads
 * snapshots from its own thread. A single QReadWriteLock guards the
 * whole table.
 */

#pragma once

#include "packfetch/engine/Types.h"

#include <QReadWriteLock>
#include <QElapsedTimer>

#include <map>
#include <vector>

namespace PackFetch {

/**
 * @brief Live counters of one transfer
 */
struct ProgressEntry {
    PackId id = 0;
    ByteCount downloadedBytes = 0;      ///< Bytes on disk, including resumed prefix
    ByteCount totalBytes = -1;          ///< -1 until known
    TransferStatus status = TransferStatus::InProgress;
    qint64 updatedAtMs = 0;             ///< Monotonic timestamp of last publish

    bool isIndeterminate() const { return totalBytes <= 0; }

    double progressPercent() const {
        if (isIndeterminate()) return 0.0;
        return 100.0 * static_cast<double>(downloadedBytes) / static_cast<double>(totalBytes);
    }
};

/**
 * @class ProgressTable
 * @brief Map of identifier to ProgressEntry, present only while non-terminal
 */
class ProgressTable {
public:
    ProgressTable();

    ProgressTable(const ProgressTable&) = delete;
    ProgressTable& operator=(const ProgressTable&) = delete;

    /**
     * @brief Insert or overwrite the entry for @p id
     */
    void publish(PackId id, ByteCount downloaded, ByteCount total, TransferStatus status);

    /**
     * @brief Drop the entry for @p id (terminal transition)
     */
    void remove(PackId id);

    /**
     * @brief Copy of all entries, ordered by identifier
     */
    [[nodiscard]] std::vector<ProgressEntry> snapshot() const;

    [[nodiscard]] size_t activeCount() const;

    /**
     * @brief Highest number of simultaneous entries ever observed
     */
    [[nodiscard]] size_t peakActiveCount() const;

private:
    mutable QReadWriteLock m_lock;
    std::map<PackId, ProgressEntry> m_entries;
    size_t m_peakActive = 0;
    QElapsedTimer m_clock;
};

} // namespace PackFetch
