/**
 * @file BandwidthThrottle.h
 * @brief Per-worker transfer rate limiter
 */

#pragma once

#include "packfetch/engine/Types.h"

#include <QElapsedTimer>

namespace PackFetch {

/**
 * @class BandwidthThrottle
 * @brief Sleeps the calling thread so chunks arrive no faster than the cap
 *
 * After each chunk the ideal duration (bytes / rate) is compared with the
 * wall time since the previous chunk boundary and the shortfall is slept.
 * The cap is per instance; with N workers the aggregate rate is N × cap.
 * A rate of zero or less disables throttling entirely.
 */
class BandwidthThrottle {
public:
    explicit BandwidthThrottle(ByteCount bytesPerSecond = 0);

    [[nodiscard]] bool isEnabled() const noexcept { return m_rate > 0; }
    [[nodiscard]] ByteCount rate() const noexcept { return m_rate; }

    /**
     * @brief Mark the start of a transfer
     */
    void reset();

    /**
     * @brief Account for @p bytes just written; may block
     * @return Time spent sleeping
     */
    Duration consume(ByteCount bytes);

private:
    ByteCount m_rate;
    QElapsedTimer m_boundary;
};

} // namespace PackFetch
