/**
 * @file StateStore.h
 * @brief Persistence interface for completed/failed sets and settings
 *
 * @copyright Copyright (c) 2024 PackFetch Project
 * @license GPL-3.0-or-later
 */

#pragma once

#include "packfetch/engine/Types.h"

#include <QString>

#include <set>

namespace PackFetch {

/**
 * @brief Everything that survives between runs
 */
struct PersistedState {
    QString downloadDir = QString::fromLatin1(Constants::DEFAULT_DOWNLOAD_DIR);
    int threads = Constants::DEFAULT_THREADS;
    ByteCount chunkSize = Constants::DEFAULT_CHUNK_SIZE;
    bool delay = true;

    std::set<PackId> completed;
    std::set<PackId> failed;

    /**
     * @brief Move @p id into the completed set
     */
    void markCompleted(PackId id) {
        completed.insert(id);
        failed.erase(id);
    }

    /**
     * @brief Record a failure unless the id already completed earlier
     */
    void markFailed(PackId id) {
        if (completed.count(id) == 0) {
            failed.insert(id);
        }
    }
};

/**
 * @class StateStore
 * @brief Abstract durable storage of PersistedState
 */
class StateStore {
public:
    virtual ~StateStore() = default;

    /**
     * @brief Read the stored state
     *
     * Never fails: a missing or unreadable source yields defaults.
     */
    [[nodiscard]] virtual PersistedState load() = 0;

    /**
     * @brief Replace the stored state
     * @return false if the write could not be committed
     */
    [[nodiscard]] virtual bool save(const PersistedState& state) = 0;
};

} // namespace PackFetch
