/**
 * @file CommandLine.cpp
 * @brief Implementation of CommandLine
 *
 * @copyright Copyright (c) 2024 PackFetch Project
 * @license GPL-3.0-or-later
 */

#include "packfetch/app/CommandLine.h"

#include <QSet>

#include <algorithm>
#include <cmath>

namespace PackFetch {

// ═══════════════════════════════════════════════════════════════════════════════
// Construction
// ═══════════════════════════════════════════════════════════════════════════════

CommandLine::CommandLine()
    : m_startOption(QStringLiteral("start"),
                    QStringLiteral("First pack number of an inclusive range."),
                    QStringLiteral("n"))
    , m_endOption(QStringLiteral("end"),
                  QStringLiteral("Last pack number of an inclusive range."),
                  QStringLiteral("n"))
    , m_packsOption(QStringLiteral("packs"),
                    QStringLiteral("Comma-separated list of specific pack numbers."),
                    QStringLiteral("list"))
    , m_retryFailedOption(QStringLiteral("retry-failed"),
                          QStringLiteral("Also request packs that failed in earlier runs."))
    , m_forceOption(QStringLiteral("force"),
                    QStringLiteral("Download packs even if already marked completed."))
    , m_dirOption(QStringLiteral("dir"),
                  QStringLiteral("Directory to save the packs."),
                  QStringLiteral("path"))
    , m_threadsOption(QStringLiteral("threads"),
                      QStringLiteral("Number of concurrent downloads (1-%1).").arg(Constants::MAX_THREADS),
                      QStringLiteral("n"))
    , m_chunkSizeOption(QStringLiteral("chunk-size"),
                        QStringLiteral("Download chunk size in bytes."),
                        QStringLiteral("bytes"))
    , m_noDelayOption(QStringLiteral("no-delay"),
                      QStringLiteral("Disable the random pause between downloads."))
    , m_noResumeOption(QStringLiteral("no-resume"),
                       QStringLiteral("Ignore partial files and start over."))
    , m_bandwidthOption(QStringLiteral("bandwidth-limit"),
                        QStringLiteral("Limit bandwidth in MB/s per thread."),
                        QStringLiteral("mbps"))
    , m_retriesOption(QStringLiteral("retries"),
                      QStringLiteral("Retries per candidate URL (default %1).").arg(Constants::MAX_RETRIES),
                      QStringLiteral("n"))
    , m_backoffOption(QStringLiteral("backoff"),
                      QStringLiteral("Base retry backoff in milliseconds (default %1).")
                          .arg(Constants::RETRY_BACKOFF_BASE.count()),
                      QStringLiteral("ms"))
    , m_timeoutOption(QStringLiteral("timeout"),
                      QStringLiteral("Connect and stall timeout in seconds (default %1).")
                          .arg(Constants::CONNECT_TIMEOUT.count() / 1000),
                      QStringLiteral("seconds"))
    , m_baseUrlOption(QStringLiteral("base-url"),
                      QStringLiteral("Host serving the packs."),
                      QStringLiteral("url"),
                      QString::fromLatin1(Constants::DEFAULT_BASE_URL))
    , m_configOption(QStringLiteral("config"),
                     QStringLiteral("State file path."),
                     QStringLiteral("path"),
                     QString::fromLatin1(Constants::DEFAULT_STATE_FILE))
    , m_logLevelOption(QStringLiteral("log-level"),
                       QStringLiteral("DEBUG, INFO, WARNING or ERROR."),
                       QStringLiteral("level"),
                       QStringLiteral("INFO"))
    , m_logFileOption(QStringLiteral("log-file"),
                      QStringLiteral("Log file path."),
                      QStringLiteral("path"),
                      QString::fromLatin1(Constants::DEFAULT_LOG_FILE))
    , m_quietOption(QStringLiteral("quiet"),
                    QStringLiteral("Do not draw the progress line."))
    , m_helpOption(m_parser.addHelpOption())
    , m_versionOption(m_parser.addVersionOption())
{
    m_parser.setApplicationDescription(QStringLiteral("Concurrent osu! beatmap pack downloader"));

    m_parser.addOptions({
        m_startOption, m_endOption, m_packsOption, m_retryFailedOption, m_forceOption,
        m_dirOption, m_threadsOption, m_chunkSizeOption, m_noDelayOption, m_noResumeOption,
        m_bandwidthOption, m_retriesOption, m_backoffOption, m_timeoutOption, m_baseUrlOption,
        m_configOption, m_logLevelOption, m_logFileOption, m_quietOption,
    });
}

// ═══════════════════════════════════════════════════════════════════════════════
// Parsing
// ═══════════════════════════════════════════════════════════════════════════════

bool CommandLine::fail(const QString& message) {
    m_error = message;
    return false;
}

bool CommandLine::readNonNegativeInt(const QCommandLineOption& option, std::optional<int>& target) {
    if (!m_parser.isSet(option)) {
        return true;
    }

    bool ok = false;
    const int value = m_parser.value(option).trimmed().toInt(&ok);
    if (!ok || value < 0) {
        return fail(QStringLiteral("--%1 expects a non-negative integer, got '%2'")
                        .arg(option.names().constFirst(), m_parser.value(option)));
    }
    target = value;
    return true;
}

bool CommandLine::parse(const QStringList& arguments) {
    m_options = CommandLineOptions{};
    m_error.clear();

    if (!m_parser.parse(arguments)) {
        return fail(m_parser.errorText());
    }

    m_helpRequested = m_parser.isSet(m_helpOption);
    m_versionRequested = m_parser.isSet(m_versionOption);
    if (m_helpRequested || m_versionRequested) {
        return true;
    }

    if (!m_parser.positionalArguments().isEmpty()) {
        return fail(QStringLiteral("Unexpected argument: %1")
                        .arg(m_parser.positionalArguments().constFirst()));
    }

    // ── Pack selection ──────────────────────────────────────────────────────

    std::optional<int> start;
    std::optional<int> end;
    if (!readNonNegativeInt(m_startOption, start) || !readNonNegativeInt(m_endOption, end)) {
        return false;
    }
    if (start.has_value() != end.has_value()) {
        return fail(QStringLiteral("--start and --end must be given together"));
    }
    if (start && (*start <= 0 || *end <= 0)) {
        return fail(QStringLiteral("Pack numbers must be positive"));
    }
    if (start && *start > *end) {
        return fail(QStringLiteral("Start number must be less than or equal to end number"));
    }
    m_options.start = start;
    m_options.end = end;

    if (m_parser.isSet(m_packsOption)) {
        const QStringList tokens = m_parser.value(m_packsOption).split(QLatin1Char(','));
        for (const QString& token : tokens) {
            const QString trimmed = token.trimmed();
            if (trimmed.isEmpty()) {
                continue;
            }
            bool ok = false;
            const int id = trimmed.toInt(&ok);
            if (!ok) {
                return fail(QStringLiteral("Pack numbers must be integers, got '%1'").arg(trimmed));
            }
            if (id <= 0) {
                return fail(QStringLiteral("Pack numbers must be positive, got %1").arg(id));
            }
            m_options.packs.append(id);
        }
    }

    m_options.retryFailed = m_parser.isSet(m_retryFailedOption);
    m_options.force = m_parser.isSet(m_forceOption);

    // ── Transfer settings ───────────────────────────────────────────────────

    if (m_parser.isSet(m_dirOption)) {
        const QString dir = m_parser.value(m_dirOption);
        if (dir.isEmpty()) {
            return fail(QStringLiteral("--dir must not be empty"));
        }
        m_options.downloadDir = dir;
    }

    std::optional<int> threads;
    if (!readNonNegativeInt(m_threadsOption, threads)) {
        return false;
    }
    if (threads && (*threads < 1 || *threads > Constants::MAX_THREADS)) {
        return fail(QStringLiteral("--threads must be between 1 and %1").arg(Constants::MAX_THREADS));
    }
    m_options.threads = threads;

    if (m_parser.isSet(m_chunkSizeOption)) {
        bool ok = false;
        const qlonglong chunk = m_parser.value(m_chunkSizeOption).toLongLong(&ok);
        if (!ok || chunk <= 0) {
            return fail(QStringLiteral("--chunk-size must be a positive integer"));
        }
        m_options.chunkSize = chunk;
    }

    m_options.noDelay = m_parser.isSet(m_noDelayOption);
    m_options.noResume = m_parser.isSet(m_noResumeOption);

    if (m_parser.isSet(m_bandwidthOption)) {
        bool ok = false;
        const double mbps = m_parser.value(m_bandwidthOption).toDouble(&ok);
        if (!ok || mbps < 0.0 || !std::isfinite(mbps)) {
            return fail(QStringLiteral("--bandwidth-limit must be a non-negative number"));
        }
        m_options.bandwidthLimitMBps = mbps;
    }

    if (!readNonNegativeInt(m_retriesOption, m_options.retries)
        || !readNonNegativeInt(m_backoffOption, m_options.backoffMs)
        || !readNonNegativeInt(m_timeoutOption, m_options.timeoutSeconds)) {
        return false;
    }
    if (m_options.timeoutSeconds && *m_options.timeoutSeconds == 0) {
        return fail(QStringLiteral("--timeout must be at least 1 second"));
    }

    m_options.baseUrl = m_parser.value(m_baseUrlOption);
    if (!m_options.baseUrl.startsWith(QLatin1String("http://"))
        && !m_options.baseUrl.startsWith(QLatin1String("https://"))) {
        return fail(QStringLiteral("--base-url must be an http(s) URL"));
    }

    // ── Application ─────────────────────────────────────────────────────────

    m_options.configPath = m_parser.value(m_configOption);
    m_options.logFile = m_parser.value(m_logFileOption);
    m_options.quiet = m_parser.isSet(m_quietOption);

    const std::optional<Logging::Level> level = Logging::levelFromString(m_parser.value(m_logLevelOption));
    if (!level) {
        return fail(QStringLiteral("--log-level must be one of DEBUG, INFO, WARNING, ERROR"));
    }
    m_options.logLevel = *level;

    return true;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Merging
// ═══════════════════════════════════════════════════════════════════════════════

FetchSettings CommandLine::settings(const PersistedState& persisted) const {
    FetchSettings settings;

    settings.downloadDir = m_options.downloadDir.value_or(persisted.downloadDir);
    settings.threads = std::clamp(m_options.threads.value_or(persisted.threads), 1, Constants::MAX_THREADS);
    settings.chunkSize = m_options.chunkSize.value_or(persisted.chunkSize);
    settings.delay = m_options.noDelay ? false : persisted.delay;
    settings.resume = !m_options.noResume;
    settings.forceRefresh = m_options.force;
    settings.baseUrl = m_options.baseUrl;
    settings.showProgress = !m_options.quiet;

    if (m_options.bandwidthLimitMBps > 0.0) {
        settings.bandwidthLimit = static_cast<ByteCount>(std::llround(m_options.bandwidthLimitMBps * 1024.0 * 1024.0));
    }
    if (m_options.retries) {
        settings.retryBudget = *m_options.retries;
    }
    if (m_options.backoffMs) {
        settings.backoffBase = Duration(*m_options.backoffMs);
    }
    if (m_options.timeoutSeconds) {
        settings.connectTimeout = Duration(static_cast<Duration::rep>(*m_options.timeoutSeconds) * 1000);
        settings.readTimeout = settings.connectTimeout;
    }

    return settings;
}

QList<PackId> CommandLine::requestedPacks(const PersistedState& persisted) const {
    QSet<PackId> ids;

    if (m_options.start && m_options.end) {
        for (qint64 id = *m_options.start; id <= *m_options.end; ++id) {
            ids.insert(static_cast<PackId>(id));
        }
    }

    for (PackId id : m_options.packs) {
        ids.insert(id);
    }

    if (m_options.retryFailed) {
        for (PackId id : persisted.failed) {
            ids.insert(id);
        }
    }

    QList<PackId> result(ids.begin(), ids.end());
    std::sort(result.begin(), result.end());
    return result;
}

} // namespace PackFetch
