/**
 * @file BatchScheduler.h
 * @brief Fixed worker pool draining a bounded queue of pack identifiers
 *
 * BatchScheduler owns one batch run from filtering to the final save:
 * - Filters out identifiers already completed (unless forced)
 * - Feeds a bounded WorkQueue consumed by N FetchWorker runnables
 * - Drives the ProgressAggregator render thread
 * - Merges every outcome into PersistedState and checkpoints it
 */

#pragma once

#include "packfetch/engine/Types.h"
#include "packfetch/engine/HttpTransport.h"
#include "packfetch/engine/WorkQueue.h"
#include "packfetch/persistence/StateStore.h"

#include <QList>
#include <QMutex>
#include <QRunnable>

#include <memory>

class QIODevice;

namespace PackFetch {

class FetchContext;
class RunSummary;
class BatchScheduler;

// ═══════════════════════════════════════════════════════════════════════════════
// FetchWorker
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @class FetchWorker
 * @brief Pool runnable: pops identifiers and fetches them one at a time
 *
 * Lifecycle:
 * 1. Creates its own HttpTransport and TransferEngine
 * 2. Pops until the queue is closed and drained
 * 3. Reports each outcome through BatchScheduler::recordOutcome()
 * 4. Sleeps a random jitter after each success when delay is enabled
 *
 * Once the interrupt flag is set the worker abandons the queue, which
 * also releases a producer blocked on a full queue.
 */
class FetchWorker : public QRunnable {
public:
    FetchWorker(BatchScheduler& scheduler, WorkQueue<PackId>& queue);

    void run() override;

private:
    void pauseBetweenItems() const;

    BatchScheduler& m_scheduler;
    WorkQueue<PackId>& m_queue;
};

// ═══════════════════════════════════════════════════════════════════════════════
// BatchScheduler
// ═══════════════════════════════════════════════════════════════════════════════

class BatchScheduler {
public:
    /**
     * @param context Run-wide settings, progress table, summary and stop flag
     * @param store Destination of checkpoint and final saves
     * @param transportFactory Produces one transport per worker
     */
    BatchScheduler(FetchContext& context, StateStore& store, TransportFactory transportFactory);

    BatchScheduler(const BatchScheduler&) = delete;
    BatchScheduler& operator=(const BatchScheduler&) = delete;

    /**
     * @brief Run a batch, loading the baseline state from the store
     */
    const RunSummary& run(const QList<PackId>& requested);

    /**
     * @brief Run a batch against an already loaded baseline
     *
     * Blocks until every queued identifier is terminal (or the run was
     * interrupted), then writes the merged state once more.
     */
    const RunSummary& run(const QList<PackId>& requested, PersistedState baseline);

    /**
     * @brief Thread-safe sink for worker outcomes
     */
    void recordOutcome(const TransferResult& result);

    /**
     * @brief Identifiers that will actually be queued for @p requested
     *
     * Deduplicated, positive, in first-seen order, minus completed ones
     * unless force refresh is on.
     */
    [[nodiscard]] QList<PackId> pendingFrom(const QList<PackId>& requested,
                                            const PersistedState& state) const;

    /**
     * @brief Draw the status line here instead of stdout
     */
    void setProgressOutput(QIODevice* output) { m_progressOutput = output; }

    [[nodiscard]] PersistedState persistedState() const;

    [[nodiscard]] FetchContext& context() noexcept { return m_context; }
    [[nodiscard]] std::unique_ptr<HttpTransport> createTransport() const;

private:
    void mergeSettings(PersistedState& state) const;
    bool saveStateLocked();   ///< Caller holds m_stateMutex

    FetchContext& m_context;
    StateStore& m_store;
    TransportFactory m_transportFactory;
    QIODevice* m_progressOutput = nullptr;

    mutable QMutex m_stateMutex;
    PersistedState m_state;
};

} // namespace PackFetch
