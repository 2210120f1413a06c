/**
 * @file FakeTransport.h
 * @brief Scripted HttpTransport for engine and scheduler tests
 */

#pragma once

#include "packfetch/engine/HttpTransport.h"

#include <QByteArray>
#include <QHash>
#include <QList>
#include <QMutex>
#include <QMutexLocker>
#include <QString>

#include <algorithm>
#include <functional>
#include <memory>

namespace PackFetch {
namespace Testing {

/**
 * @brief How the fake server answers one URL
 */
struct FakeResource {
    long headStatus = 200;
    long getStatus = 200;
    QByteArray body;
    bool advertiseLength = true;    ///< Send Content-Length
    bool honorRange = true;         ///< Reply 206 to ranged GETs
    qint64 failAfterBytes = -1;     ///< Drop the connection after N body bytes per GET
    ErrorCategory headError = ErrorCategory::None;
    long rangedStatus = 0;          ///< Status for ranged GETs instead of 206/200
    int transientGetFailures = 0;   ///< The first N GETs answer transientStatus
    long transientStatus = 503;
    std::function<void(qint64)> afterChunk; ///< Called with the bytes delivered so far
};

struct RecordedRequest {
    QString method;
    QString url;
    ByteOffset rangeStart = 0;
};

/**
 * @brief Shared script and request log; safe to use from worker threads
 *
 * URLs without a script answer 404.
 */
class FakeServer {
public:
    void serve(const QString& url, const FakeResource& resource) {
        QMutexLocker locker(&m_mutex);
        m_resources.insert(url, resource);
    }

    FakeResource resourceFor(const QString& url) const {
        QMutexLocker locker(&m_mutex);
        auto it = m_resources.constFind(url);
        if (it == m_resources.constEnd()) {
            FakeResource missing;
            missing.headStatus = 404;
            missing.getStatus = 404;
            return missing;
        }
        return it.value();
    }

    void record(const QString& method, const HttpRequest& request) {
        QMutexLocker locker(&m_mutex);
        m_log.append(RecordedRequest{method, request.url, request.rangeStart});
    }

    QList<RecordedRequest> requests() const {
        QMutexLocker locker(&m_mutex);
        return m_log;
    }

    int countFor(const QString& method, const QString& url) const {
        QMutexLocker locker(&m_mutex);
        return static_cast<int>(std::count_if(m_log.cbegin(), m_log.cend(),
            [&](const RecordedRequest& r) { return r.method == method && r.url == url; }));
    }

    void noteTransportCreated() {
        QMutexLocker locker(&m_mutex);
        ++m_transportsCreated;
    }

    int transportsCreated() const {
        QMutexLocker locker(&m_mutex);
        return m_transportsCreated;
    }

private:
    mutable QMutex m_mutex;
    QHash<QString, FakeResource> m_resources;
    QList<RecordedRequest> m_log;
    int m_transportsCreated = 0;
};

/**
 * @brief HttpTransport answering from a FakeServer
 *
 * Mirrors CurlTransport: error statuses never reach the callbacks and a
 * callback returning false ends the exchange as Cancelled.
 */
class FakeTransport : public HttpTransport {
public:
    explicit FakeTransport(FakeServer& server)
        : m_server(server) {}

    HttpResult head(const HttpRequest& request) override {
        m_server.record(QStringLiteral("HEAD"), request);
        const FakeResource resource = m_server.resourceFor(request.url);

        HttpResult result;
        if (resource.headError != ErrorCategory::None) {
            result.error = resource.headError;
            result.errorMessage = QStringLiteral("scripted failure");
            return result;
        }
        result.httpCode = resource.headStatus;
        if (resource.headStatus < 300 && resource.advertiseLength) {
            result.contentLength = resource.body.size();
        }
        return result;
    }

    HttpResult get(const HttpRequest& request,
                   const ResponseCallback& onResponse,
                   const BodyCallback& onBody) override {
        m_server.record(QStringLiteral("GET"), request);
        const FakeResource resource = m_server.resourceFor(request.url);

        HttpResult result;
        if (m_server.countFor(QStringLiteral("GET"), request.url) <= resource.transientGetFailures) {
            result.httpCode = resource.transientStatus;
            return result;
        }
        if (request.rangeStart > 0 && resource.rangedStatus >= 400) {
            result.httpCode = resource.rangedStatus;
            return result;
        }
        if (resource.getStatus >= 400) {
            result.httpCode = resource.getStatus;
            return result;
        }

        const bool ranged = request.rangeStart > 0 && resource.honorRange
                            && request.rangeStart < resource.body.size();
        const QByteArray payload = ranged ? resource.body.mid(request.rangeStart) : resource.body;

        result.httpCode = ranged ? 206 : resource.getStatus;
        result.contentLength = resource.advertiseLength ? payload.size() : -1;

        if (!onResponse(result.httpCode, result.contentLength)) {
            result.error = ErrorCategory::Cancelled;
            return result;
        }

        const qint64 limit = resource.failAfterBytes >= 0
            ? std::min<qint64>(resource.failAfterBytes, payload.size())
            : payload.size();

        constexpr qint64 kChunk = 4096;
        for (qint64 pos = 0; pos < limit; pos += kChunk) {
            const qint64 n = std::min(kChunk, limit - pos);
            if (!onBody(payload.constData() + pos, static_cast<size_t>(n))) {
                result.error = ErrorCategory::Cancelled;
                return result;
            }
            if (resource.afterChunk) {
                resource.afterChunk(pos + n);
            }
        }

        if (limit < payload.size()) {
            result.error = ErrorCategory::Network;
            result.errorMessage = QStringLiteral("connection reset");
        }
        return result;
    }

private:
    FakeServer& m_server;
};

inline TransportFactory fakeFactory(FakeServer& server) {
    return [&server]() -> std::unique_ptr<HttpTransport> {
        server.noteTransportCreated();
        return std::make_unique<FakeTransport>(server);
    };
}

inline QByteArray patternBytes(qint64 size) {
    QByteArray bytes(static_cast<int>(size), Qt::Uninitialized);
    for (qint64 i = 0; i < size; ++i) {
        bytes[static_cast<int>(i)] = static_cast<char>('a' + (i % 26));
    }
    return bytes;
}

} // namespace Testing
} // namespace PackFetch
