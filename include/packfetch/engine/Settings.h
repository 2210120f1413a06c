/**
 * @file Settings.h
 * @brief Typed configuration for a fetch run
 */

#pragma once

#include "packfetch/engine/Types.h"

#include <QString>

namespace PackFetch {

/**
 * @brief Every tunable that influences a batch run
 *
 * Filled from the persisted state file, then overridden by command-line
 * options. Passed by value into FetchContext; never mutated once a run
 * has started.
 */
struct FetchSettings {
    // ───────────────────────────────────────────────────────────────────────
    // Destination & scheduling
    // ───────────────────────────────────────────────────────────────────────

    QString downloadDir = QString::fromLatin1(Constants::DEFAULT_DOWNLOAD_DIR);
    int threads = Constants::DEFAULT_THREADS;
    bool forceRefresh = false;          ///< Re-fetch ids already marked completed
    bool checkpointEachItem = true;     ///< Save state after every terminal item

    // ───────────────────────────────────────────────────────────────────────
    // Transfer
    // ───────────────────────────────────────────────────────────────────────

    QString baseUrl = QString::fromLatin1(Constants::DEFAULT_BASE_URL);
    ByteCount chunkSize = Constants::DEFAULT_CHUNK_SIZE;
    bool resume = true;
    ByteCount bandwidthLimit = 0;       ///< Bytes/s per worker, 0 = unlimited

    // ───────────────────────────────────────────────────────────────────────
    // Retry & timeouts
    // ───────────────────────────────────────────────────────────────────────

    int retryBudget = Constants::MAX_RETRIES;
    Duration backoffBase = Constants::RETRY_BACKOFF_BASE;
    double backoffMultiplier = Constants::RETRY_BACKOFF_MULTIPLIER;
    Duration maxBackoff = Constants::MAX_RETRY_DELAY;
    Duration connectTimeout = Constants::CONNECT_TIMEOUT;
    Duration readTimeout = Constants::READ_TIMEOUT;

    // ───────────────────────────────────────────────────────────────────────
    // Politeness & display
    // ───────────────────────────────────────────────────────────────────────

    bool delay = true;                  ///< Random pause after each success
    Duration jitterMin = Constants::JITTER_MIN;
    Duration jitterMax = Constants::JITTER_MAX;
    Duration progressInterval = Constants::PROGRESS_UPDATE_INTERVAL;
    bool showProgress = true;

    /**
     * @brief Backoff before retry number @p attempt (0-based), capped
     */
    Duration backoffFor(int attempt) const;
};

} // namespace PackFetch
