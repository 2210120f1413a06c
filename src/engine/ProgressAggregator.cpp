/**
 * @file ProgressAggregator.cpp
 * @brief Implementation of the status line render loop
 */

#include "packfetch/engine/ProgressAggregator.h"
#include "packfetch/engine/FetchContext.h"

#include <QDebug>
#include <QMutexLocker>
#include <QStringList>

#include <algorithm>
#include <cstdio>

namespace PackFetch {

namespace {

// Carriage return plus "erase to end of line"
const QByteArray kClearLine = QByteArrayLiteral("\r\033[K");

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Construction
// ═══════════════════════════════════════════════════════════════════════════════

ProgressAggregator::ProgressAggregator(FetchContext& context, QIODevice* output, QObject* parent)
    : QThread(parent)
    , m_context(context)
    , m_output(output)
{
    if (!m_output) {
        m_stdout = std::make_unique<QFile>();
        if (!m_stdout->open(stdout, QIODevice::WriteOnly | QIODevice::Unbuffered)) {
            qWarning() << "ProgressAggregator: Cannot open stdout:" << m_stdout->errorString();
        }
        m_output = m_stdout.get();
    }
    m_clock.start();
}

ProgressAggregator::~ProgressAggregator() {
    {
        QMutexLocker locker(&m_mutex);
        m_stopRequested = true;
        m_wake.wakeAll();
    }
    wait();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Render Loop
// ═══════════════════════════════════════════════════════════════════════════════

void ProgressAggregator::run() {
    const unsigned long intervalMs =
        static_cast<unsigned long>(std::max<qint64>(1, m_context.settings().progressInterval.count()));

    for (;;) {
        {
            QMutexLocker locker(&m_mutex);
            if (!m_stopRequested) {
                m_wake.wait(&m_mutex, intervalMs);
            }
            if (m_stopRequested) {
                break;
            }
        }
        renderOnce();
    }
}

void ProgressAggregator::stop() {
    {
        QMutexLocker locker(&m_mutex);
        m_stopRequested = true;
        m_wake.wakeAll();
    }

    if (isRunning()) {
        wait();
    }

    if (!m_finalRendered) {
        m_finalRendered = true;
        renderOnce();
        write(QByteArrayLiteral("\n"));
    }
}

void ProgressAggregator::renderOnce() {
    const std::vector<TransferView> active = sample();
    const RunSummary& summary = m_context.summary();

    const QString line = formatStatusLine(summary.completed(), summary.failed(),
                                          summary.requested(), active);
    write(kClearLine + line.toUtf8());
}

std::vector<TransferView> ProgressAggregator::sample() {
    const std::vector<ProgressEntry> entries = m_context.progress().snapshot();
    const qint64 now = m_clock.elapsed();

    std::vector<TransferView> views;
    views.reserve(entries.size());

    std::map<PackId, Sample> current;

    for (const ProgressEntry& entry : entries) {
        TransferView view;
        view.id = entry.id;
        view.downloadedBytes = entry.downloadedBytes;
        view.totalBytes = entry.totalBytes;

        auto previous = m_previous.find(entry.id);
        if (previous != m_previous.end()) {
            const qint64 elapsedMs = now - previous->second.atMs;
            const ByteCount delta = entry.downloadedBytes - previous->second.bytes;
            if (elapsedMs > 0 && delta > 0) {
                view.speed = static_cast<double>(delta) * 1000.0 / static_cast<double>(elapsedMs);
            }
        }

        current[entry.id] = Sample{entry.downloadedBytes, now};
        views.push_back(view);
    }

    m_previous = std::move(current);
    return views;
}

void ProgressAggregator::write(const QByteArray& bytes) {
    if (!m_output || !m_output->isOpen()) {
        return;
    }
    m_output->write(bytes);
    if (auto* file = qobject_cast<QFile*>(m_output)) {
        file->flush();
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Formatting
// ═══════════════════════════════════════════════════════════════════════════════

QString ProgressAggregator::formatStatusLine(int completed, int failed, int requested,
                                             const std::vector<TransferView>& active) {
    const int finished = completed + failed;
    const double overall = requested > 0
        ? std::min(100.0, 100.0 * finished / requested)
        : 100.0;

    QString line = QStringLiteral("Progress: %1/%2 complete, %3 failed (%4%)")
                       .arg(completed)
                       .arg(requested)
                       .arg(failed)
                       .arg(overall, 0, 'f', 1);

    if (active.empty()) {
        return line;
    }

    QStringList parts;
    const size_t shown = std::min(active.size(), static_cast<size_t>(Constants::MAX_LISTED_TRANSFERS));
    for (size_t i = 0; i < shown; ++i) {
        const TransferView& view = active[i];
        const QString amount = view.totalBytes > 0
            ? QStringLiteral("%1%").arg(100.0 * view.downloadedBytes / view.totalBytes, 0, 'f', 1)
            : formatByteSize(view.downloadedBytes);
        parts << QStringLiteral("Pack #%1: %2 at %3").arg(view.id).arg(amount, formatSpeedMBps(view.speed));
    }

    line += QStringLiteral(" | ") + parts.join(QStringLiteral(", "));

    if (active.size() > shown) {
        line += QStringLiteral(" (+ %1 more)").arg(active.size() - shown);
    }
    return line;
}

} // namespace PackFetch
