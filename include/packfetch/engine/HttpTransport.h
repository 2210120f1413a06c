/**
 * @file HttpTransport.h
 * @brief Abstract blocking HTTP primitive used by TransferEngine
 *
 * One transport instance belongs to one worker thread for its lifetime.
 * The production implementation is CurlTransport; tests substitute a
 * scripted transport.
 */

#pragma once

#include "packfetch/engine/Types.h"

#include <QString>

#include <functional>
#include <memory>

namespace PackFetch {

// ═══════════════════════════════════════════════════════════════════════════════
// Request / Result
// ═══════════════════════════════════════════════════════════════════════════════

struct HttpRequest {
    QString url;
    ByteOffset rangeStart = 0;      ///< Sends "Range: bytes=N-" when > 0
};

/**
 * @brief Outcome of one HEAD or GET
 *
 * error == None means the exchange completed and httpCode is meaningful.
 * Any other category is a transport-level failure (or an abort requested
 * by a callback, reported as Cancelled).
 */
struct HttpResult {
    ErrorCategory error = ErrorCategory::None;
    long httpCode = 0;
    ByteCount contentLength = -1;   ///< Body length of this response, -1 if absent
    QString errorMessage;

    [[nodiscard]] bool transportOk() const noexcept { return error == ErrorCategory::None; }

    [[nodiscard]] bool isSuccess() const noexcept {
        return transportOk() && httpCode >= 200 && httpCode < 300;
    }

    [[nodiscard]] static bool isRetryableStatus(long code) noexcept {
        return code == 429 || code == 500 || code == 502 || code == 503 || code == 504;
    }
};

// ═══════════════════════════════════════════════════════════════════════════════
// Callback Types
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Called once when the final response's headers are complete
 * @param httpCode Status of the final (post-redirect) response
 * @param contentLength Body length of that response, -1 if absent
 * @return true to receive the body, false to abort
 */
using ResponseCallback = std::function<bool(long httpCode, ByteCount contentLength)>;

/**
 * @brief Called for each received body chunk
 * @return true to continue, false to abort
 */
using BodyCallback = std::function<bool(const char* data, size_t size)>;

// ═══════════════════════════════════════════════════════════════════════════════
// HttpTransport
// ═══════════════════════════════════════════════════════════════════════════════

class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /**
     * @brief Issue a HEAD request (metadata only)
     */
    [[nodiscard]] virtual HttpResult head(const HttpRequest& request) = 0;

    /**
     * @brief Issue a GET, streaming the body through @p onBody
     *
     * @p onResponse fires before the first body byte. Returning false from
     * either callback aborts the transfer with ErrorCategory::Cancelled.
     */
    [[nodiscard]] virtual HttpResult get(const HttpRequest& request,
                                         const ResponseCallback& onResponse,
                                         const BodyCallback& onBody) = 0;
};

using TransportFactory = std::function<std::unique_ptr<HttpTransport>()>;

} // namespace PackFetch
