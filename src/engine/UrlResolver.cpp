/**
 * @file UrlResolver.cpp
 * @brief Implementation of UrlResolver
 */

#include "packfetch/engine/UrlResolver.h"

#include <QUrl>

#include <iterator>

namespace PackFetch {

namespace {

struct NamingScheme {
    const char* title;      ///< Name with "%1" for the identifier
    const char* extension;
};

constexpr NamingScheme kSchemes[] = {
    {"osu! Beatmap Pack #%1", ".zip"},
    {"Beatmap Pack #%1", ".zip"},
    {"Beatmap Pack #%1", ".7z"},
};

} // namespace

std::vector<UrlCandidate> UrlResolver::candidates(PackId id, const QString& baseUrl) {
    QString base = baseUrl;
    while (base.endsWith(QLatin1Char('/'))) {
        base.chop(1);
    }

    std::vector<UrlCandidate> result;
    result.reserve(std::size(kSchemes));

    for (const NamingScheme& scheme : kSchemes) {
        const QString fileName = QString::fromLatin1(scheme.title).arg(id)
                                 + QString::fromLatin1(scheme.extension);

        // Remote objects are prefixed "S<id> - "; percent-encode everything
        // outside the unreserved set so '!' and '#' survive as %21 / %23.
        const QString remoteName = QStringLiteral("S%1 - ").arg(id) + fileName;
        const QByteArray encoded = QUrl::toPercentEncoding(remoteName);

        result.push_back(UrlCandidate{
            base + QLatin1Char('/') + QString::fromLatin1(encoded),
            fileName
        });
    }

    return result;
}

} // namespace PackFetch
