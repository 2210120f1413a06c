/**
 * @file ProgressAggregator.h
 * @brief Background thread rendering the single-line status display
 */

#pragma once

#include "packfetch/engine/Types.h"

#include <QElapsedTimer>
#include <QFile>
#include <QMutex>
#include <QThread>
#include <QWaitCondition>

#include <map>
#include <memory>
#include <vector>

class QIODevice;

namespace PackFetch {

class FetchContext;
struct ProgressEntry;

/**
 * @brief Display view of one active transfer
 */
struct TransferView {
    PackId id = 0;
    ByteCount downloadedBytes = 0;
    ByteCount totalBytes = -1;
    SpeedBps speed = 0.0;
};

/**
 * @class ProgressAggregator
 * @brief Polls the ProgressTable at a fixed interval and redraws one line
 *
 * Runs on its own thread and only reads shared state. Speeds are derived
 * from the byte delta between consecutive polls, so entries that appear
 * or vanish between polls are simply shown or dropped.
 */
class ProgressAggregator : public QThread {
    Q_OBJECT

public:
    /**
     * @param context Source of the progress table and run summary
     * @param output Device to draw on; stdout when null
     */
    explicit ProgressAggregator(FetchContext& context, QIODevice* output = nullptr,
                                QObject* parent = nullptr);
    ~ProgressAggregator() override;

    /**
     * @brief Wake the loop, render a final line and terminate it with '\n'
     *
     * Blocks until the thread has exited. Safe to call more than once.
     */
    void stop();

    /**
     * @brief Take one sample and redraw; also used by tests
     */
    void renderOnce();

    /**
     * @brief Build the status line text (no control sequences)
     */
    [[nodiscard]] static QString formatStatusLine(int completed, int failed, int requested,
                                                  const std::vector<TransferView>& active);

protected:
    void run() override;

private:
    std::vector<TransferView> sample();
    void write(const QByteArray& bytes);

    FetchContext& m_context;
    QIODevice* m_output;
    std::unique_ptr<QFile> m_stdout;

    QMutex m_mutex;
    QWaitCondition m_wake;
    bool m_stopRequested = false;
    bool m_finalRendered = false;

    // Previous poll, per identifier: bytes and poll time
    struct Sample {
        ByteCount bytes = 0;
        qint64 atMs = 0;
    };
    std::map<PackId, Sample> m_previous;
    QElapsedTimer m_clock;
};

} // namespace PackFetch
