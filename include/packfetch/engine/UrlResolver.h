/**
 * @file UrlResolver.h
 * @brief Maps a pack identifier to its ordered candidate URLs
 */

#pragma once

#include "packfetch/engine/Types.h"

#include <QString>

#include <vector>

namespace PackFetch {

/**
 * @brief One guess at where a pack lives and the file it produces
 */
struct UrlCandidate {
    QString url;        ///< Fully encoded, ready for libcurl
    QString fileName;   ///< Local file name (decoded)
};

/**
 * @class UrlResolver
 * @brief Pure candidate generator; performs no I/O
 *
 * The host has published packs under three naming schemes over time.
 * Candidates are returned newest scheme first and are tried in order.
 */
class UrlResolver {
public:
    [[nodiscard]] static std::vector<UrlCandidate> candidates(
        PackId id,
        const QString& baseUrl = QString::fromLatin1(Constants::DEFAULT_BASE_URL));
};

} // namespace PackFetch
