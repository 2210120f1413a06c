/**
 * @file TransferEngine.cpp
 * @brief Implementation of TransferEngine - resumable single-pack download
 */

#include "packfetch/engine/TransferEngine.h"
#include "packfetch/engine/FetchContext.h"

#include <QDebug>
#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QThread>

#include <algorithm>

namespace PackFetch {

namespace {

constexpr qint64 kSleepSliceMs = 50;

// QFile::rename does not overwrite an existing target
bool commitPartial(const QString& partPath, const QString& finalPath) {
    if (QFileInfo::exists(finalPath) && !QFile::remove(finalPath)) {
        qWarning() << "TransferEngine: Cannot replace existing file" << finalPath;
        return false;
    }
    return QFile::rename(partPath, finalPath);
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Construction
// ═══════════════════════════════════════════════════════════════════════════════

TransferEngine::TransferEngine(FetchContext& context, HttpTransport& transport)
    : m_context(context)
    , m_transport(transport)
    , m_throttle(context.settings().bandwidthLimit)
{
}

QString TransferEngine::partialPathFor(const QString& finalPath) {
    return finalPath + QLatin1String(Constants::PARTIAL_SUFFIX);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Fetch
// ═══════════════════════════════════════════════════════════════════════════════

TransferResult TransferEngine::fetch(PackId id) {
    const FetchSettings& settings = m_context.settings();
    const QDir dir(settings.downloadDir);
    const std::vector<UrlCandidate> candidates = UrlResolver::candidates(id, settings.baseUrl);

    TransferResult result;
    result.id = id;

    // Any naming scheme already on disk counts as done, unless a refresh was asked for
    for (const UrlCandidate& candidate : candidates) {
        const QString finalPath = dir.filePath(candidate.fileName);
        if (!settings.forceRefresh && QFileInfo::exists(finalPath)) {
            qInfo() << "TransferEngine: Pack" << id << "already exists, skipping:" << finalPath;
            result.status = TransferStatus::Completed;
            result.finalPath = finalPath;
            return conclude(result);
        }
    }

    if (!dir.exists() && !QDir().mkpath(settings.downloadDir)) {
        qWarning() << "TransferEngine: Cannot create directory" << settings.downloadDir;
        result.status = TransferStatus::Failed;
        result.category = ErrorCategory::FileSystem;
        result.reason = QStringLiteral("cannot create directory %1").arg(settings.downloadDir);
        return conclude(result);
    }

    ErrorCategory lastCategory = ErrorCategory::NotFound;

    for (const UrlCandidate& candidate : candidates) {
        for (int attempt = 0; ; ++attempt) {
            if (m_context.isInterrupted()) {
                result.status = TransferStatus::Failed;
                result.category = ErrorCategory::Cancelled;
                result.reason = QStringLiteral("interrupted");
                return conclude(result);
            }

            qDebug() << "TransferEngine: Pack" << id << "trying" << candidate.url
                     << "attempt" << attempt + 1;

            const Attempt outcome = tryCandidate(id, candidate, result);

            switch (outcome.outcome) {
                case Outcome::Completed:
                    result.status = TransferStatus::Completed;
                    result.url = candidate.url;
                    result.finalPath = dir.filePath(candidate.fileName);
                    result.category = ErrorCategory::None;
                    result.reason.clear();
                    qInfo() << "TransferEngine: Pack" << id << "completed:" << result.finalPath;
                    return conclude(result);

                case Outcome::FileSystem:
                case Outcome::Interrupted:
                    result.status = TransferStatus::Failed;
                    result.category = outcome.category;
                    result.reason = outcome.reason;
                    return conclude(result);

                case Outcome::NotFound:
                case Outcome::Unusable:
                    qDebug() << "TransferEngine: Pack" << id << "skipping candidate:" << outcome.reason;
                    break;

                case Outcome::Retryable:
                    break;
            }

            lastCategory = outcome.category;

            if (outcome.outcome != Outcome::Retryable) {
                break;
            }

            if (attempt >= settings.retryBudget) {
                qWarning() << "TransferEngine: Pack" << id << "retries exhausted for"
                           << candidate.url << "-" << outcome.reason;
                break;
            }

            const Duration backoff = settings.backoffFor(attempt);
            qInfo() << "TransferEngine: Pack" << id << outcome.reason
                    << "- retrying in" << backoff.count() << "ms";

            if (!sleepInterruptibly(backoff)) {
                result.status = TransferStatus::Failed;
                result.category = ErrorCategory::Cancelled;
                result.reason = QStringLiteral("interrupted");
                return conclude(result);
            }
        }
    }

    qWarning() << "TransferEngine: Pack" << id << "failed: no candidate URL worked";
    result.status = TransferStatus::Failed;
    result.category = lastCategory;
    result.reason = QStringLiteral("no matching URL pattern");
    return conclude(result);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Single Attempt
// ═══════════════════════════════════════════════════════════════════════════════

TransferEngine::Attempt TransferEngine::tryCandidate(PackId id, const UrlCandidate& candidate,
                                                     TransferResult& result) {
    const FetchSettings& settings = m_context.settings();
    ProgressTable& progress = m_context.progress();

    const QString finalPath = QDir(settings.downloadDir).filePath(candidate.fileName);
    const QString partPath = partialPathFor(finalPath);

    ByteOffset offset = 0;
    if (settings.resume) {
        const QFileInfo partInfo(partPath);
        if (partInfo.exists()) {
            offset = partInfo.size();
        }
    }

    TransferStatus status = offset > 0 ? TransferStatus::Resuming : TransferStatus::InProgress;
    progress.publish(id, offset, -1, status);

    // ── Probe ───────────────────────────────────────────────────────────────

    const HttpResult probe = m_transport.head(HttpRequest{candidate.url, 0});

    if (m_context.isInterrupted()) {
        return {Outcome::Interrupted, ErrorCategory::Cancelled, QStringLiteral("interrupted")};
    }

    if (!probe.transportOk()) {
        return {Outcome::Retryable, probe.error,
                QStringLiteral("HEAD failed: %1").arg(probe.errorMessage)};
    }
    if (probe.httpCode == 404) {
        return {Outcome::NotFound, ErrorCategory::NotFound, QStringLiteral("HTTP 404")};
    }
    if (HttpResult::isRetryableStatus(probe.httpCode)) {
        return {Outcome::Retryable, ErrorCategory::ServerError,
                QStringLiteral("HTTP %1").arg(probe.httpCode)};
    }
    if (!probe.isSuccess()) {
        qWarning() << "TransferEngine: Pack" << id << "HEAD returned HTTP" << probe.httpCode;
        return {Outcome::Unusable, ErrorCategory::ClientError,
                QStringLiteral("HTTP %1").arg(probe.httpCode)};
    }

    const ByteCount declaredTotal = probe.contentLength > 0 ? probe.contentLength : -1;

    if (offset > 0 && declaredTotal > 0) {
        if (offset == declaredTotal) {
            qInfo() << "TransferEngine: Pack" << id << "partial file already complete";
            if (!commitPartial(partPath, finalPath)) {
                return {Outcome::FileSystem, ErrorCategory::FileSystem,
                        QStringLiteral("cannot rename %1").arg(partPath)};
            }
            return {Outcome::Completed, ErrorCategory::None, QString()};
        }
        if (offset > declaredTotal) {
            qWarning() << "TransferEngine: Pack" << id << "partial file larger than remote ("
                       << offset << ">" << declaredTotal << "), restarting";
            offset = 0;
            status = TransferStatus::InProgress;
        }
    }

    progress.publish(id, offset, declaredTotal, status);

    // ── Transfer ────────────────────────────────────────────────────────────

    QFile part(partPath);
    ByteCount written = offset;
    ByteCount total = declaredTotal;
    bool fileError = false;
    bool interrupted = false;
    QString fileErrorText;

    const ResponseCallback onResponse = [&](long httpCode, ByteCount contentLength) -> bool {
        QIODevice::OpenMode mode = QIODevice::WriteOnly;

        if (httpCode == 206 && offset > 0) {
            mode |= QIODevice::Append;
            if (contentLength > 0) {
                total = offset + contentLength;
            }
        } else {
            if (offset > 0) {
                qInfo() << "TransferEngine: Pack" << id
                        << "server ignored range request, restarting from zero";
            }
            offset = 0;
            written = 0;
            status = TransferStatus::InProgress;
            mode |= QIODevice::Truncate;
            if (contentLength > 0) {
                total = contentLength;
            }
        }

        if (!part.open(mode)) {
            fileError = true;
            fileErrorText = part.errorString();
            qWarning() << "TransferEngine: Failed to open partial file:" << partPath << fileErrorText;
            return false;
        }

        m_throttle.reset();
        progress.publish(id, written, total, status);
        return true;
    };

    const BodyCallback onBody = [&](const char* data, size_t size) -> bool {
        const qint64 n = part.write(data, static_cast<qint64>(size));
        if (n != static_cast<qint64>(size)) {
            fileError = true;
            fileErrorText = part.errorString();
            qWarning() << "TransferEngine: Write failed, expected:" << size << "written:" << n;
            return false;
        }

        written += n;
        result.bytesWritten += n;
        m_throttle.consume(n);
        progress.publish(id, written, total, status);

        if (m_context.isInterrupted()) {
            interrupted = true;
            return false;
        }
        return true;
    };

    const HttpResult response = m_transport.get(HttpRequest{candidate.url, offset}, onResponse, onBody);

    if (part.isOpen()) {
        if (!part.flush()) {
            fileError = true;
            fileErrorText = part.errorString();
        }
        part.close();
    }

    if (fileError) {
        return {Outcome::FileSystem, ErrorCategory::FileSystem,
                QStringLiteral("write failed: %1").arg(fileErrorText)};
    }
    if (interrupted || m_context.isInterrupted()) {
        return {Outcome::Interrupted, ErrorCategory::Cancelled, QStringLiteral("interrupted")};
    }
    if (!response.transportOk()) {
        return {Outcome::Retryable, response.error,
                QStringLiteral("transfer failed at %1: %2")
                    .arg(formatByteSize(written), response.errorMessage)};
    }
    if (response.httpCode == 404) {
        return {Outcome::NotFound, ErrorCategory::NotFound, QStringLiteral("HTTP 404")};
    }
    if (response.httpCode == 416) {
        qWarning() << "TransferEngine: Pack" << id << "range not satisfiable, discarding partial file";
        QFile::remove(partPath);
        return {Outcome::Retryable, ErrorCategory::ClientError, QStringLiteral("HTTP 416")};
    }
    if (HttpResult::isRetryableStatus(response.httpCode)) {
        return {Outcome::Retryable, ErrorCategory::ServerError,
                QStringLiteral("HTTP %1").arg(response.httpCode)};
    }
    if (!response.isSuccess()) {
        return {Outcome::Unusable, ErrorCategory::ClientError,
                QStringLiteral("HTTP %1").arg(response.httpCode)};
    }

    if (total > 0 && written < total) {
        return {Outcome::Retryable, ErrorCategory::Network,
                QStringLiteral("connection closed at %1 of %2")
                    .arg(formatByteSize(written), formatByteSize(total))};
    }
    if (total > 0 && written > total) {
        qWarning() << "TransferEngine: Pack" << id << "received more than declared, discarding";
        QFile::remove(partPath);
        return {Outcome::Retryable, ErrorCategory::Network,
                QStringLiteral("size mismatch (%1 > %2)").arg(written).arg(total)};
    }

    // Zero-length body: rename needs a source file
    if (!QFileInfo::exists(partPath)) {
        QFile empty(partPath);
        if (!empty.open(QIODevice::WriteOnly)) {
            return {Outcome::FileSystem, ErrorCategory::FileSystem,
                    QStringLiteral("cannot create %1").arg(partPath)};
        }
    }

    if (!commitPartial(partPath, finalPath)) {
        qWarning() << "TransferEngine: Failed to rename" << partPath << "to" << finalPath;
        return {Outcome::FileSystem, ErrorCategory::FileSystem,
                QStringLiteral("cannot rename %1").arg(partPath)};
    }

    return {Outcome::Completed, ErrorCategory::None, QString()};
}

// ═══════════════════════════════════════════════════════════════════════════════
// Helpers
// ═══════════════════════════════════════════════════════════════════════════════

bool TransferEngine::sleepInterruptibly(Duration delay) const {
    QElapsedTimer timer;
    timer.start();

    while (timer.elapsed() < delay.count()) {
        if (m_context.isInterrupted()) {
            return false;
        }
        const qint64 remaining = delay.count() - timer.elapsed();
        QThread::msleep(static_cast<unsigned long>(std::clamp<qint64>(remaining, 1, kSleepSliceMs)));
    }
    return !m_context.isInterrupted();
}

TransferResult TransferEngine::conclude(TransferResult result) {
    m_context.progress().remove(result.id);
    return result;
}

} // namespace PackFetch
