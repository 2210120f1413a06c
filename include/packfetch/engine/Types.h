/**
 * @file Types.h
 * @brief Core type definitions and enumerations for the PackFetch engine
 *
 * Identifiers, byte counters, transfer states and the tunable defaults
 * shared by every engine component.
 */

#pragma once

#include <cstdint>
#include <chrono>
#include <QString>

namespace PackFetch {

// ═══════════════════════════════════════════════════════════════════════════════
// Type Aliases
// ═══════════════════════════════════════════════════════════════════════════════

using PackId = int;
using ByteOffset = int64_t;
using ByteCount = int64_t;
using Duration = std::chrono::milliseconds;
using SpeedBps = double;  // Bytes per second

// ═══════════════════════════════════════════════════════════════════════════════
// Transfer State Machine
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Lifecycle of a single pack transfer
 *
 * State transitions:
 *   Pending → InProgress ←→ Resuming
 *                ↓             ↓
 *            Completed       Failed
 *
 * Completed and Failed are terminal for the rest of the run.
 */
enum class TransferStatus : uint8_t {
    Pending,     ///< Queued, not yet picked up by a worker
    InProgress,  ///< Transferring from offset zero
    Resuming,    ///< Transferring from an existing partial file
    Completed,   ///< Final file is in place
    Failed       ///< Gave up on every candidate
};

/**
 * @brief Error categories for transfer failures
 */
enum class ErrorCategory : uint8_t {
    None,
    NotFound,          ///< HTTP 404, try next candidate
    Network,           ///< Connection issues
    ServerError,       ///< HTTP 429 and 5xx
    ClientError,       ///< Other HTTP 4xx
    FileSystem,        ///< Disk open/write/rename errors
    Cancelled,         ///< Interrupted by signal
    Timeout,           ///< Operation timed out
    SSLError,          ///< Certificate validation failed
    Unknown
};

// ═══════════════════════════════════════════════════════════════════════════════
// Constants
// ═══════════════════════════════════════════════════════════════════════════════

namespace Constants {
    // Transfer
    constexpr ByteCount DEFAULT_CHUNK_SIZE = 8192;                // 8 KB
    constexpr ByteCount MIN_CURL_BUFFER = 1024;                   // CURLOPT_BUFFERSIZE bounds
    constexpr ByteCount MAX_CURL_BUFFER = 512 * 1024;

    // Workers
    constexpr int DEFAULT_THREADS = 3;
    constexpr int MAX_THREADS = 32;
    constexpr int QUEUE_SLOTS_PER_WORKER = 2;

    // Timing intervals
    constexpr Duration PROGRESS_UPDATE_INTERVAL{1000};            // 1 second
    constexpr Duration JITTER_MIN{500};
    constexpr Duration JITTER_MAX{1500};

    // Retry configuration
    constexpr int MAX_RETRIES = 3;
    constexpr Duration RETRY_BACKOFF_BASE{1000};                  // 1 second
    constexpr double RETRY_BACKOFF_MULTIPLIER = 2.0;
    constexpr Duration MAX_RETRY_DELAY{30000};                    // 30 seconds

    // Network timeouts
    constexpr Duration CONNECT_TIMEOUT{30000};                    // 30 seconds
    constexpr Duration READ_TIMEOUT{30000};                       // 30 seconds
    constexpr int MAX_REDIRECTS = 10;

    // Status line
    constexpr int MAX_LISTED_TRANSFERS = 3;

    // Files
    inline constexpr char PARTIAL_SUFFIX[] = ".part";
    inline constexpr char DEFAULT_BASE_URL[] = "https://packs.ppy.sh";
    inline constexpr char DEFAULT_DOWNLOAD_DIR[] = "./osu_packs";
    inline constexpr char DEFAULT_STATE_FILE[] = "osu_downloader_config.json";
    inline constexpr char DEFAULT_LOG_FILE[] = "osu_downloader.log";
}

// ═══════════════════════════════════════════════════════════════════════════════
// Transfer Outcome
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Terminal result of fetching one pack
 */
struct TransferResult {
    PackId id = 0;
    TransferStatus status = TransferStatus::Pending;
    QString url;                        ///< Candidate that succeeded (empty on failure)
    QString finalPath;                  ///< Destination of the completed file
    QString reason;                     ///< Human-readable failure reason
    ErrorCategory category = ErrorCategory::None;
    ByteCount bytesWritten = 0;         ///< Bytes appended during this run

    bool succeeded() const { return status == TransferStatus::Completed; }
};

// ═══════════════════════════════════════════════════════════════════════════════
// Utility Functions
// ═══════════════════════════════════════════════════════════════════════════════

inline QString errorCategoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::None:        return QStringLiteral("None");
        case ErrorCategory::NotFound:    return QStringLiteral("NotFound");
        case ErrorCategory::Network:     return QStringLiteral("Network");
        case ErrorCategory::ServerError: return QStringLiteral("ServerError");
        case ErrorCategory::ClientError: return QStringLiteral("ClientError");
        case ErrorCategory::FileSystem:  return QStringLiteral("FileSystem");
        case ErrorCategory::Cancelled:   return QStringLiteral("Cancelled");
        case ErrorCategory::Timeout:     return QStringLiteral("Timeout");
        case ErrorCategory::SSLError:    return QStringLiteral("SSLError");
        default:                         return QStringLiteral("Unknown");
    }
}

/**
 * @brief Human-readable size: "512 B", "1.0 KB", "1.00 MB", "1.00 GB"
 */
inline QString formatByteSize(ByteCount bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    if (bytes < 0) return QStringLiteral("Unknown");
    if (bytes < KB) return QStringLiteral("%1 B").arg(bytes);
    if (bytes < MB) return QStringLiteral("%1 KB").arg(bytes / KB, 0, 'f', 1);
    if (bytes < GB) return QStringLiteral("%1 MB").arg(bytes / MB, 0, 'f', 2);
    return QStringLiteral("%1 GB").arg(bytes / GB, 0, 'f', 2);
}

/**
 * @brief Format speed in MB/s with one decimal, as shown on the status line
 */
inline QString formatSpeedMBps(SpeedBps speed) {
    return QStringLiteral("%1 MB/s").arg(speed / (1024.0 * 1024.0), 0, 'f', 1);
}

} // namespace PackFetch
