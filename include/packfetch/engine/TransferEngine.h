/**
 * @file TransferEngine.h
 * @brief Resumable, retrying download of a single pack
 *
 * TransferEngine walks the candidate URLs of one identifier, probing each
 * with HEAD and streaming the body into "<final>.part" with a ranged GET.
 * Completed transfers are renamed into place atomically; anything else
 * leaves the partial file for a later resume.
 */

#pragma once

#include "packfetch/engine/Types.h"
#include "packfetch/engine/BandwidthThrottle.h"
#include "packfetch/engine/HttpTransport.h"
#include "packfetch/engine/UrlResolver.h"

#include <QString>

namespace PackFetch {

class FetchContext;

/**
 * @class TransferEngine
 * @brief Downloads one identifier at a time on the calling thread
 *
 * Failure policy per candidate:
 * - 404 moves on to the next candidate immediately
 * - transport errors and 429/5xx are retried with exponential backoff
 *   up to the retry budget, resuming from whatever was written
 * - other non-2xx statuses move on to the next candidate
 * - filesystem errors fail the identifier outright
 *
 * Thread Safety:
 * - One engine per worker; not shareable between threads
 * - The only shared state it touches is its own ProgressTable entry
 */
class TransferEngine {
public:
    /**
     * @param context Run-wide settings, progress table and interrupt flag
     * @param transport HTTP primitive owned by the same worker
     */
    TransferEngine(FetchContext& context, HttpTransport& transport);

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    /**
     * @brief Fetch @p id into the download directory
     * @return Completed or Failed; never an intermediate status
     */
    [[nodiscard]] TransferResult fetch(PackId id);

    [[nodiscard]] static QString partialPathFor(const QString& finalPath);

private:
    enum class Outcome {
        Completed,
        NotFound,       ///< 404, next candidate
        Retryable,      ///< Same candidate again after backoff
        Unusable,       ///< Non-retryable status, next candidate
        FileSystem,     ///< Local I/O failure, stop
        Interrupted     ///< Stop flag observed
    };

    struct Attempt {
        Outcome outcome = Outcome::Unusable;
        ErrorCategory category = ErrorCategory::None;
        QString reason;
    };

    Attempt tryCandidate(PackId id, const UrlCandidate& candidate, TransferResult& result);

    /**
     * @brief Sleep for @p delay in short slices
     * @return false if interrupted before the delay elapsed
     */
    bool sleepInterruptibly(Duration delay) const;

    TransferResult conclude(TransferResult result);

    FetchContext& m_context;
    HttpTransport& m_transport;
    BandwidthThrottle m_throttle;
};

} // namespace PackFetch
