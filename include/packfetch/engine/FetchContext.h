/**
 * @file FetchContext.h
 * @brief Shared state of one batch run
 *
 * One FetchContext is created per run and passed by reference to the
 * scheduler, every transfer engine and the progress aggregator. It owns
 * the settings snapshot, the progress table, the run summary and the
 * interrupt flag; nothing in the engine reaches for globals instead.
 */

#pragma once

#include "packfetch/engine/Settings.h"
#include "packfetch/engine/ProgressTable.h"
#include "packfetch/engine/RunSummary.h"

#include <atomic>

namespace PackFetch {

class FetchContext {
public:
    explicit FetchContext(FetchSettings settings)
        : m_settings(std::move(settings)) {}

    FetchContext(const FetchContext&) = delete;
    FetchContext& operator=(const FetchContext&) = delete;

    [[nodiscard]] const FetchSettings& settings() const noexcept { return m_settings; }
    [[nodiscard]] ProgressTable& progress() noexcept { return m_progress; }
    [[nodiscard]] const ProgressTable& progress() const noexcept { return m_progress; }
    [[nodiscard]] RunSummary& summary() noexcept { return m_summary; }
    [[nodiscard]] const RunSummary& summary() const noexcept { return m_summary; }

    /**
     * @brief Ask every worker to stop after its current chunk
     *
     * Async-signal-safe: only stores to a lock-free atomic.
     */
    void requestInterrupt() noexcept { m_interrupted.store(true, std::memory_order_release); }

    [[nodiscard]] bool isInterrupted() const noexcept {
        return m_interrupted.load(std::memory_order_acquire);
    }

private:
    const FetchSettings m_settings;
    ProgressTable m_progress;
    RunSummary m_summary;
    std::atomic<bool> m_interrupted{false};
};

} // namespace PackFetch
