/**
 * @file Settings.cpp
 * @brief FetchSettings helpers
 */

#include "packfetch/engine/Settings.h"

#include <algorithm>
#include <cmath>

namespace PackFetch {

Duration FetchSettings::backoffFor(int attempt) const {
    const double factor = std::pow(backoffMultiplier, std::max(attempt, 0));
    const double delayMs = static_cast<double>(backoffBase.count()) * factor;
    const double capped = std::min(delayMs, static_cast<double>(maxBackoff.count()));
    return Duration(static_cast<Duration::rep>(capped));
}

} // namespace PackFetch
