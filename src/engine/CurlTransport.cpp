/**
 * @file CurlTransport.cpp
 * @brief Implementation of the libcurl transport
 *
 * @copyright Copyright (c) 2024 PackFetch Project
 * @license GPL-3.0-or-later
 */

#include "CurlTransport.h"
#include "packfetch/engine/FetchContext.h"

#include <QDebug>

#include <algorithm>
#include <utility>

namespace PackFetch {

// ═══════════════════════════════════════════════════════════════════════════════
// CurlGlobalInit Implementation
// ═══════════════════════════════════════════════════════════════════════════════

CurlGlobalInit& CurlGlobalInit::instance()
{
    static CurlGlobalInit instance;
    return instance;
}

CurlGlobalInit::CurlGlobalInit()
{
    CURLcode result = curl_global_init(CURL_GLOBAL_ALL);
    m_valid = (result == CURLE_OK);

    if (!m_valid) {
        qCritical() << "CurlGlobalInit: Failed to initialize libcurl:" << curl_easy_strerror(result);
    } else {
        qDebug() << "CurlGlobalInit: libcurl initialized:" << version();
    }
}

CurlGlobalInit::~CurlGlobalInit()
{
    if (m_valid) {
        curl_global_cleanup();
    }
}

QString CurlGlobalInit::version() const
{
    return QString::fromUtf8(curl_version());
}

// ═══════════════════════════════════════════════════════════════════════════════
// CurlEasyHandle Implementation
// ═══════════════════════════════════════════════════════════════════════════════

CurlEasyHandle::CurlEasyHandle()
{
    CurlGlobalInit::instance();

    m_handle = curl_easy_init();
    if (!m_handle) {
        qCritical() << "CurlEasyHandle: Failed to create CURL easy handle";
        return;
    }

    curl_easy_setopt(m_handle, CURLOPT_ERRORBUFFER, m_errorBuffer);

    // Worker threads must not receive SIGALRM from the resolver
    curl_easy_setopt(m_handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(m_handle, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(m_handle, CURLOPT_TCP_KEEPIDLE, 60L);
    curl_easy_setopt(m_handle, CURLOPT_TCP_KEEPINTVL, 30L);

    curl_easy_setopt(m_handle, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(m_handle, CURLOPT_SSL_VERIFYHOST, 2L);

    // Proxy CONNECT replies never reach the header callback
    curl_easy_setopt(m_handle, CURLOPT_SUPPRESS_CONNECT_HEADERS, 1L);

    setFollowRedirects(true);
}

CurlEasyHandle::~CurlEasyHandle()
{
    if (m_headerList) {
        curl_slist_free_all(m_headerList);
        m_headerList = nullptr;
    }

    if (m_handle) {
        curl_easy_cleanup(m_handle);
        m_handle = nullptr;
    }
}

void CurlEasyHandle::setUrl(const QString& url)
{
    if (!m_handle) return;
    QByteArray urlBytes = url.toUtf8();
    curl_easy_setopt(m_handle, CURLOPT_URL, urlBytes.constData());
}

void CurlEasyHandle::setRange(ByteOffset start)
{
    if (!m_handle) return;

    if (start <= 0) {
        curl_easy_setopt(m_handle, CURLOPT_RANGE, nullptr);
        return;
    }

    QByteArray range = QByteArray::number(static_cast<qlonglong>(start)) + '-';
    curl_easy_setopt(m_handle, CURLOPT_RANGE, range.constData());
}

void CurlEasyHandle::setConnectTimeout(Duration timeout)
{
    if (!m_handle) return;
    curl_easy_setopt(m_handle, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout.count()));
}

void CurlEasyHandle::setLowSpeedLimit(int bytesPerSecond, Duration window)
{
    if (!m_handle) return;
    const long seconds = std::max<long>(1, static_cast<long>(window.count() / 1000));
    curl_easy_setopt(m_handle, CURLOPT_LOW_SPEED_LIMIT, static_cast<long>(bytesPerSecond));
    curl_easy_setopt(m_handle, CURLOPT_LOW_SPEED_TIME, seconds);
}

void CurlEasyHandle::setBufferSize(ByteCount bytes)
{
    if (!m_handle) return;
    const ByteCount clamped = std::clamp(bytes, Constants::MIN_CURL_BUFFER, Constants::MAX_CURL_BUFFER);
    curl_easy_setopt(m_handle, CURLOPT_BUFFERSIZE, static_cast<long>(clamped));
}

void CurlEasyHandle::setUserAgent(const QString& userAgent)
{
    if (!m_handle) return;
    QByteArray ua = userAgent.toUtf8();
    curl_easy_setopt(m_handle, CURLOPT_USERAGENT, ua.constData());
}

void CurlEasyHandle::setHeaders(const QStringList& headers)
{
    if (!m_handle) return;

    if (m_headerList) {
        curl_slist_free_all(m_headerList);
        m_headerList = nullptr;
    }

    for (const QString& header : headers) {
        QByteArray h = header.toUtf8();
        curl_slist* appended = curl_slist_append(m_headerList, h.constData());
        if (!appended) {
            qWarning() << "CurlEasyHandle: Failed to append header" << header;
            continue;
        }
        m_headerList = appended;
    }

    curl_easy_setopt(m_handle, CURLOPT_HTTPHEADER, m_headerList);
}

void CurlEasyHandle::setFollowRedirects(bool follow, int maxRedirects)
{
    if (!m_handle) return;
    curl_easy_setopt(m_handle, CURLOPT_FOLLOWLOCATION, follow ? 1L : 0L);
    curl_easy_setopt(m_handle, CURLOPT_MAXREDIRS, static_cast<long>(maxRedirects));
}

QString CurlEasyHandle::errorString(CURLcode code) const
{
    return QString::fromUtf8(m_errorBuffer[0] ? m_errorBuffer : curl_easy_strerror(code));
}

// ═══════════════════════════════════════════════════════════════════════════════
// ResponseHeaderParser
// ═══════════════════════════════════════════════════════════════════════════════

ResponseHeaderParser::Line ResponseHeaderParser::feed(const QByteArray& rawLine)
{
    const QByteArray line = rawLine.trimmed();

    if (m_finalSeen) {
        return line.isEmpty() ? Line::BlockSkipped : Line::Header;
    }

    // Status line opens a new block
    if (line.startsWith("HTTP/")) {
        const QList<QByteArray> parts = line.split(' ');
        m_statusCode = parts.size() > 1 ? parts.at(1).toLong() : 0;
        m_contentLength = -1;
        m_tunnelReply = line.toLower().contains("connection established");
        return Line::Header;
    }

    if (line.size() > 15 && line.left(15).toLower() == "content-length:") {
        bool ok = false;
        const qint64 length = line.mid(15).trimmed().toLongLong(&ok);
        if (ok) {
            m_contentLength = length;
        }
        return Line::Header;
    }

    if (!line.isEmpty()) {
        return Line::Header;
    }

    const bool interim = m_statusCode < 200 || (m_statusCode >= 300 && m_statusCode < 400);
    if (interim || m_tunnelReply) {
        return Line::BlockSkipped;
    }

    m_finalSeen = true;
    return Line::FinalBlock;
}

// ═══════════════════════════════════════════════════════════════════════════════
// CurlTransport
// ═══════════════════════════════════════════════════════════════════════════════

CurlTransport::CurlTransport(const FetchSettings& settings, CancelCheck isCancelled)
    : m_isCancelled(std::move(isCancelled))
{
    m_handle.setConnectTimeout(settings.connectTimeout);
    // Abort when the link stalls below 1 B/s for the read timeout
    m_handle.setLowSpeedLimit(1, settings.readTimeout);
    m_handle.setBufferSize(settings.chunkSize);
    m_handle.setUserAgent(browserUserAgent());
    m_handle.setHeaders(browserHeaders());

    if (m_isCancelled && m_handle.get()) {
        curl_easy_setopt(m_handle.get(), CURLOPT_XFERINFOFUNCTION, &CurlTransport::progressCallbackStatic);
        curl_easy_setopt(m_handle.get(), CURLOPT_XFERINFODATA, this);
        curl_easy_setopt(m_handle.get(), CURLOPT_NOPROGRESS, 0L);
    }
}

QString CurlTransport::browserUserAgent()
{
    return QStringLiteral("Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
                          "(KHTML, like Gecko) Chrome/91.0.4472.124 Safari/537.36");
}

QStringList CurlTransport::browserHeaders()
{
    return {
        QStringLiteral("Accept: text/html,application/xhtml+xml,application/xml;q=0.9,image/webp,*/*;q=0.8"),
        QStringLiteral("Accept-Language: en-US,en;q=0.5"),
        QStringLiteral("Connection: keep-alive"),
        QStringLiteral("Upgrade-Insecure-Requests: 1"),
        QStringLiteral("Cache-Control: max-age=0"),
    };
}

ErrorCategory CurlTransport::categorize(CURLcode code) noexcept
{
    switch (code) {
        case CURLE_OK:
            return ErrorCategory::None;

        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_PARTIAL_FILE:
        case CURLE_GOT_NOTHING:
            return ErrorCategory::Network;

        case CURLE_OPERATION_TIMEDOUT:
            return ErrorCategory::Timeout;

        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_PEER_FAILED_VERIFICATION:
            return ErrorCategory::SSLError;

        case CURLE_HTTP_RETURNED_ERROR:
            return ErrorCategory::ServerError;

        case CURLE_WRITE_ERROR:
        case CURLE_ABORTED_BY_CALLBACK:
            return ErrorCategory::Cancelled;

        default:
            return ErrorCategory::Unknown;
    }
}

TransportFactory CurlTransport::factory(const FetchContext& context)
{
    return [&context]() -> std::unique_ptr<HttpTransport> {
        return std::make_unique<CurlTransport>(context.settings(),
                                               [&context] { return context.isInterrupted(); });
    };
}

void CurlTransport::prepare(const HttpRequest& request)
{
    m_handle.clearError();
    m_handle.setUrl(request.url);
    m_handle.setRange(request.rangeStart);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Execution
// ═══════════════════════════════════════════════════════════════════════════════

HttpResult CurlTransport::head(const HttpRequest& request)
{
    HttpResult result;
    CURL* curl = m_handle.get();
    if (!curl) {
        result.error = ErrorCategory::Unknown;
        result.errorMessage = QStringLiteral("Handle not initialized");
        return result;
    }

    prepare(request);

    GetState state;
    curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, &CurlTransport::headerCallbackStatic);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &state);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &CurlTransport::writeCallbackStatic);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &state);

    CURLcode code = curl_easy_perform(curl);

    if (code == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &result.httpCode);
        result.contentLength = state.headers.contentLength();
    } else {
        result.error = categorize(code);
        result.errorMessage = m_handle.errorString(code);
    }

    // Back to GET for subsequent calls
    curl_easy_setopt(curl, CURLOPT_NOBODY, 0L);
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);

    return result;
}

HttpResult CurlTransport::get(const HttpRequest& request,
                              const ResponseCallback& onResponse,
                              const BodyCallback& onBody)
{
    HttpResult result;
    CURL* curl = m_handle.get();
    if (!curl) {
        result.error = ErrorCategory::Unknown;
        result.errorMessage = QStringLiteral("Handle not initialized");
        return result;
    }

    prepare(request);

    GetState state;
    state.onResponse = &onResponse;
    state.onBody = &onBody;

    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, &CurlTransport::headerCallbackStatic);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &state);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &CurlTransport::writeCallbackStatic);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &state);

    CURLcode code = curl_easy_perform(curl);

    result.httpCode = state.headers.finalSeen() ? state.headers.statusCode() : 0;
    if (result.httpCode == 0) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &result.httpCode);
    }
    result.contentLength = state.headers.contentLength();

    if (code == CURLE_OK || (code == CURLE_WRITE_ERROR && state.rejectedStatus)) {
        return result;
    }

    if (state.abortedByCaller) {
        result.error = ErrorCategory::Cancelled;
        result.errorMessage = QStringLiteral("Aborted");
    } else {
        result.error = categorize(code);
        result.errorMessage = m_handle.errorString(code);
    }
    return result;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Static Callbacks
// ═══════════════════════════════════════════════════════════════════════════════

size_t CurlTransport::writeCallbackStatic(char* ptr, size_t size, size_t nmemb, void* userdata)
{
    auto* state = static_cast<GetState*>(userdata);
    size_t totalSize = size * nmemb;

    // Bodies of interim, redirect or rejected responses are discarded
    if (!state->headers.finalSeen() || state->rejectedStatus || !state->onBody) {
        return totalSize;
    }

    if (!(*state->onBody)(ptr, totalSize)) {
        state->abortedByCaller = true;
        return 0;
    }
    return totalSize;
}

size_t CurlTransport::headerCallbackStatic(char* buffer, size_t size, size_t nitems, void* userdata)
{
    auto* state = static_cast<GetState*>(userdata);
    size_t totalSize = size * nitems;

    const QByteArray line(buffer, static_cast<qsizetype>(totalSize));
    if (state->headers.feed(line) != ResponseHeaderParser::Line::FinalBlock || !state->onResponse) {
        return totalSize;
    }

    const long status = state->headers.statusCode();
    if (status >= 400) {
        state->rejectedStatus = true;
        return 0;
    }

    if (!(*state->onResponse)(status, state->headers.contentLength())) {
        state->abortedByCaller = true;
        return 0;
    }
    return totalSize;
}

int CurlTransport::progressCallbackStatic(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t)
{
    const auto* self = static_cast<const CurlTransport*>(clientp);
    return self->m_isCancelled() ? 1 : 0;
}

} // namespace PackFetch
