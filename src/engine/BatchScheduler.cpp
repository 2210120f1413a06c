/**
 * @file BatchScheduler.cpp
 * @brief Implementation of BatchScheduler and FetchWorker
 */

#include "packfetch/engine/BatchScheduler.h"
#include "packfetch/engine/FetchContext.h"
#include "packfetch/engine/ProgressAggregator.h"
#include "packfetch/engine/TransferEngine.h"

#include <QDebug>
#include <QDir>
#include <QElapsedTimer>
#include <QMutexLocker>
#include <QRandomGenerator>
#include <QSet>
#include <QThread>
#include <QThreadPool>

#include <algorithm>
#include <exception>

namespace PackFetch {

// ═══════════════════════════════════════════════════════════════════════════════
// FetchWorker
// ═══════════════════════════════════════════════════════════════════════════════

FetchWorker::FetchWorker(BatchScheduler& scheduler, WorkQueue<PackId>& queue)
    : m_scheduler(scheduler)
    , m_queue(queue)
{
    setAutoDelete(true);
}

void FetchWorker::run() {
    FetchContext& context = m_scheduler.context();

    std::unique_ptr<HttpTransport> transport = m_scheduler.createTransport();
    if (!transport) {
        qCritical() << "FetchWorker: No transport available, failing queued packs";
        while (std::optional<PackId> id = m_queue.pop()) {
            TransferResult result;
            result.id = *id;
            result.status = TransferStatus::Failed;
            result.category = ErrorCategory::Unknown;
            result.reason = QStringLiteral("no transport");
            m_scheduler.recordOutcome(result);
        }
        return;
    }

    TransferEngine engine(context, *transport);

    while (std::optional<PackId> id = m_queue.pop()) {
        if (context.isInterrupted()) {
            m_queue.abandon();
            break;
        }

        TransferResult result;
        try {
            result = engine.fetch(*id);
        } catch (const std::exception& e) {
            qCritical() << "FetchWorker: Pack" << *id << "raised:" << e.what();
            context.progress().remove(*id);
            result.id = *id;
            result.status = TransferStatus::Failed;
            result.category = ErrorCategory::Unknown;
            result.reason = QString::fromUtf8(e.what());
        }

        m_scheduler.recordOutcome(result);

        if (context.isInterrupted()) {
            m_queue.abandon();
            break;
        }

        if (result.succeeded() && context.settings().delay) {
            pauseBetweenItems();
        }
    }
}

void FetchWorker::pauseBetweenItems() const {
    const FetchSettings& settings = m_scheduler.context().settings();

    const qint64 low = settings.jitterMin.count();
    const qint64 high = std::max(low, static_cast<qint64>(settings.jitterMax.count()));
    const qint64 delayMs = low + static_cast<qint64>(QRandomGenerator::global()->bounded(high - low + 1));

    QElapsedTimer timer;
    timer.start();
    while (timer.elapsed() < delayMs && !m_scheduler.context().isInterrupted()) {
        QThread::msleep(static_cast<unsigned long>(std::min<qint64>(50, delayMs - timer.elapsed() + 1)));
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// BatchScheduler - Construction
// ═══════════════════════════════════════════════════════════════════════════════

BatchScheduler::BatchScheduler(FetchContext& context, StateStore& store, TransportFactory transportFactory)
    : m_context(context)
    , m_store(store)
    , m_transportFactory(std::move(transportFactory))
{
}

std::unique_ptr<HttpTransport> BatchScheduler::createTransport() const {
    if (!m_transportFactory) {
        return nullptr;
    }
    return m_transportFactory();
}

PersistedState BatchScheduler::persistedState() const {
    QMutexLocker locker(&m_stateMutex);
    return m_state;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Run
// ═══════════════════════════════════════════════════════════════════════════════

const RunSummary& BatchScheduler::run(const QList<PackId>& requested) {
    return run(requested, m_store.load());
}

QList<PackId> BatchScheduler::pendingFrom(const QList<PackId>& requested,
                                          const PersistedState& state) const {
    const bool force = m_context.settings().forceRefresh;

    QList<PackId> pending;
    QSet<PackId> seen;
    for (PackId id : requested) {
        if (id <= 0 || seen.contains(id)) {
            continue;
        }
        seen.insert(id);
        if (!force && state.completed.count(id) > 0) {
            continue;
        }
        pending.append(id);
    }
    return pending;
}

const RunSummary& BatchScheduler::run(const QList<PackId>& requested, PersistedState baseline) {
    const FetchSettings& settings = m_context.settings();
    RunSummary& summary = m_context.summary();

    const QList<PackId> pending = pendingFrom(requested, baseline);

    {
        QMutexLocker locker(&m_stateMutex);
        m_state = std::move(baseline);
    }

    QSet<PackId> unique;
    for (PackId id : requested) {
        if (id > 0) {
            unique.insert(id);
        }
    }
    const int skipped = static_cast<int>(unique.size()) - static_cast<int>(pending.size());
    if (skipped > 0) {
        qInfo() << "BatchScheduler: Skipping" << skipped << "already downloaded pack(s)";
    }

    summary.setRequested(static_cast<int>(pending.size()));

    if (pending.isEmpty()) {
        qInfo() << "BatchScheduler: Nothing to download";
        QMutexLocker locker(&m_stateMutex);
        if (!saveStateLocked()) {
            qWarning() << "BatchScheduler: State save failed";
        }
        return summary;
    }

    if (!QDir().mkpath(settings.downloadDir)) {
        qWarning() << "BatchScheduler: Cannot create download directory" << settings.downloadDir;
    }

    const int threads = std::clamp(settings.threads, 1, Constants::MAX_THREADS);
    const int workerCount = std::min(threads, static_cast<int>(pending.size()));

    qInfo() << "BatchScheduler: Downloading" << pending.size() << "pack(s) with"
            << workerCount << "worker(s) into" << settings.downloadDir;

    WorkQueue<PackId> queue(static_cast<size_t>(threads * Constants::QUEUE_SLOTS_PER_WORKER));

    QThreadPool pool;
    pool.setMaxThreadCount(workerCount);

    std::unique_ptr<ProgressAggregator> aggregator;
    if (settings.showProgress) {
        aggregator = std::make_unique<ProgressAggregator>(m_context, m_progressOutput);
        aggregator->start();
    }

    for (int i = 0; i < workerCount; ++i) {
        pool.start(new FetchWorker(*this, queue));
    }

    for (PackId id : pending) {
        if (m_context.isInterrupted() || !queue.push(id)) {
            break;
        }
    }
    queue.close();

    pool.waitForDone();

    if (aggregator) {
        aggregator->stop();
    }

    if (m_context.isInterrupted()) {
        qWarning() << "BatchScheduler: Interrupted,"
                    << (summary.requested() - summary.finished()) << "pack(s) not attempted";
    }

    {
        QMutexLocker locker(&m_stateMutex);
        if (!saveStateLocked()) {
            qWarning() << "BatchScheduler: Final state save failed";
        }
    }

    qInfo() << "BatchScheduler: Finished," << summary.completed() << "completed,"
            << summary.failed() << "failed";
    return summary;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Outcomes & Persistence
// ═══════════════════════════════════════════════════════════════════════════════

void BatchScheduler::recordOutcome(const TransferResult& result) {
    RunSummary& summary = m_context.summary();

    QMutexLocker locker(&m_stateMutex);

    if (result.succeeded()) {
        summary.recordCompleted(result.id);
        m_state.markCompleted(result.id);
    } else {
        qWarning() << "BatchScheduler: Pack" << result.id << "failed:" << result.reason
                   << "(" << errorCategoryToString(result.category) << ")";
        summary.recordFailed(result.id);
        m_state.markFailed(result.id);
    }

    if (m_context.settings().checkpointEachItem && !saveStateLocked()) {
        qWarning() << "BatchScheduler: Checkpoint save failed after pack" << result.id;
    }
}

void BatchScheduler::mergeSettings(PersistedState& state) const {
    const FetchSettings& settings = m_context.settings();
    state.downloadDir = settings.downloadDir;
    state.threads = settings.threads;
    state.chunkSize = settings.chunkSize;
    state.delay = settings.delay;
}

bool BatchScheduler::saveStateLocked() {
    mergeSettings(m_state);
    return m_store.save(m_state);
}

} // namespace PackFetch
