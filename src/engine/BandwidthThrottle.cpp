/**
 * @file BandwidthThrottle.cpp
 * @brief Implementation of BandwidthThrottle
 */

#include "packfetch/engine/BandwidthThrottle.h"

#include <QThread>

namespace PackFetch {

BandwidthThrottle::BandwidthThrottle(ByteCount bytesPerSecond)
    : m_rate(bytesPerSecond)
{
    m_boundary.start();
}

void BandwidthThrottle::reset() {
    m_boundary.restart();
}

Duration BandwidthThrottle::consume(ByteCount bytes) {
    if (!isEnabled() || bytes <= 0) {
        return Duration{0};
    }

    if (!m_boundary.isValid()) {
        m_boundary.start();
    }

    const qint64 idealNs = bytes * 1'000'000'000LL / m_rate;
    const qint64 elapsedNs = m_boundary.nsecsElapsed();

    Duration slept{0};
    if (elapsedNs < idealNs) {
        const qint64 sleepUs = (idealNs - elapsedNs) / 1000;
        QThread::usleep(static_cast<unsigned long>(sleepUs));
        slept = Duration(sleepUs / 1000);
    }

    m_boundary.restart();
    return slept;
}

} // namespace PackFetch
