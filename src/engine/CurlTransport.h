/**
 * @file CurlTransport.h
 * @brief libcurl implementation of HttpTransport
 *
 * One CurlTransport owns one easy handle for the life of a worker, so
 * keep-alive connections are reused across packs. Requests carry the
 * browser headers the pack host expects, and CURLcode values are folded
 * into ErrorCategory for the retry policy.
 *
 * @copyright Copyright (c) 2024 PackFetch Project
 * @license GPL-3.0-or-later
 */

#ifndef PACKFETCH_CURLTRANSPORT_H
#define PACKFETCH_CURLTRANSPORT_H

#include <curl/curl.h>
#include <QByteArray>
#include <QString>
#include <QStringList>

#include <functional>

#include "packfetch/engine/HttpTransport.h"
#include "packfetch/engine/Settings.h"

namespace PackFetch {

class FetchContext;

// ═══════════════════════════════════════════════════════════════════════════════
// CurlGlobalInit
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Process-wide curl_global_init() guard
 *
 * Use via instance() to ensure single initialization. The function-local
 * static makes the first call thread-safe.
 */
class CurlGlobalInit {
public:
    static CurlGlobalInit& instance();

    ~CurlGlobalInit();

    CurlGlobalInit(const CurlGlobalInit&) = delete;
    CurlGlobalInit& operator=(const CurlGlobalInit&) = delete;

    [[nodiscard]] bool isValid() const noexcept { return m_valid; }
    [[nodiscard]] QString version() const;

private:
    CurlGlobalInit();
    bool m_valid = false;
};

// ═══════════════════════════════════════════════════════════════════════════════
// CurlEasyHandle
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Owns one CURL easy handle and its header list
 *
 * Each worker's CurlTransport owns exactly one handle, so consecutive
 * requests to the same host reuse the connection.
 */
class CurlEasyHandle {
public:
    CurlEasyHandle();
    ~CurlEasyHandle();

    CurlEasyHandle(const CurlEasyHandle&) = delete;
    CurlEasyHandle& operator=(const CurlEasyHandle&) = delete;

    [[nodiscard]] CURL* get() const noexcept { return m_handle; }

    // ───────────────────────────────────────────────────────────────────────
    // Configuration
    // ───────────────────────────────────────────────────────────────────────

    void setUrl(const QString& url);

    /**
     * @brief Request bytes from @p start to the end; 0 clears the range
     */
    void setRange(ByteOffset start);

    void setConnectTimeout(Duration timeout);
    void setLowSpeedLimit(int bytesPerSecond, Duration window);
    void setBufferSize(ByteCount bytes);
    void setUserAgent(const QString& userAgent);
    void setHeaders(const QStringList& headers);
    void setFollowRedirects(bool follow, int maxRedirects = Constants::MAX_REDIRECTS);

    /**
     * @brief Human-readable message for the last failed perform
     */
    [[nodiscard]] QString errorString(CURLcode code) const;
    void clearError() noexcept { m_errorBuffer[0] = '\0'; }

private:
    CURL* m_handle = nullptr;
    curl_slist* m_headerList = nullptr;
    char m_errorBuffer[CURL_ERROR_SIZE] = {0};
};

// ═══════════════════════════════════════════════════════════════════════════════
// ResponseHeaderParser
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Follows the header blocks libcurl reports for one request
 *
 * A single perform can produce several blocks: interim 1xx replies, one
 * block per redirect hop and, behind a proxy, the tunnel's CONNECT reply.
 * Only the first block that answers the request itself is final.
 */
class ResponseHeaderParser {
public:
    enum class Line {
        Header,         ///< Status or field line, block still open
        BlockSkipped,   ///< Blank line closing an interim, redirect or tunnel block
        FinalBlock      ///< Blank line closing the block that answers the request
    };

    Line feed(const QByteArray& rawLine);

    [[nodiscard]] long statusCode() const noexcept { return m_statusCode; }
    [[nodiscard]] ByteCount contentLength() const noexcept { return m_contentLength; }
    [[nodiscard]] bool finalSeen() const noexcept { return m_finalSeen; }

private:
    long m_statusCode = 0;
    ByteCount m_contentLength = -1;
    bool m_tunnelReply = false;
    bool m_finalSeen = false;
};

// ═══════════════════════════════════════════════════════════════════════════════
// CurlTransport
// ═══════════════════════════════════════════════════════════════════════════════

class CurlTransport : public HttpTransport {
public:
    /// Polled by libcurl while a request runs; true aborts it as Cancelled
    using CancelCheck = std::function<bool()>;

    explicit CurlTransport(const FetchSettings& settings, CancelCheck isCancelled = CancelCheck());
    ~CurlTransport() override = default;

    [[nodiscard]] HttpResult head(const HttpRequest& request) override;
    [[nodiscard]] HttpResult get(const HttpRequest& request,
                                 const ResponseCallback& onResponse,
                                 const BodyCallback& onBody) override;

    /**
     * @brief Headers sent with every request, mimicking a desktop browser
     */
    [[nodiscard]] static QStringList browserHeaders();
    [[nodiscard]] static QString browserUserAgent();

    /**
     * @brief Classify a libcurl failure code
     */
    [[nodiscard]] static ErrorCategory categorize(CURLcode code) noexcept;

    /**
     * @brief Factory producing one CurlTransport per worker
     *
     * Transports stop a running request once the context is interrupted.
     */
    [[nodiscard]] static TransportFactory factory(const FetchContext& context);

private:
    // Per-GET state shared with the static callbacks
    struct GetState {
        const ResponseCallback* onResponse = nullptr;
        const BodyCallback* onBody = nullptr;
        ResponseHeaderParser headers;
        bool rejectedStatus = false;    ///< Final status was not 2xx, body skipped
        bool abortedByCaller = false;
    };

    static size_t writeCallbackStatic(char* ptr, size_t size, size_t nmemb, void* userdata);
    static size_t headerCallbackStatic(char* buffer, size_t size, size_t nitems, void* userdata);
    static int progressCallbackStatic(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                                      curl_off_t ultotal, curl_off_t ulnow);

    void prepare(const HttpRequest& request);

    CurlEasyHandle m_handle;
    CancelCheck m_isCancelled;
};

} // namespace PackFetch

#endif // PACKFETCH_CURLTRANSPORT_H
