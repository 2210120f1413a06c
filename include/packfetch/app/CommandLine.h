/**
 * @file CommandLine.h
 * @brief Command-line parsing and merging with persisted settings
 *
 * @copyright Copyright (c) 2024 PackFetch Project
 * @license GPL-3.0-or-later
 */

#pragma once

#include "packfetch/app/Logging.h"
#include "packfetch/engine/Settings.h"
#include "packfetch/persistence/StateStore.h"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QList>
#include <QString>
#include <QStringList>

#include <optional>

namespace PackFetch {

/**
 * @brief Parsed values; unset optionals fall back to the state file
 */
struct CommandLineOptions {
    std::optional<PackId> start;
    std::optional<PackId> end;
    QList<PackId> packs;
    bool retryFailed = false;
    bool force = false;

    std::optional<QString> downloadDir;
    std::optional<int> threads;
    std::optional<ByteCount> chunkSize;
    bool noDelay = false;
    bool noResume = false;
    double bandwidthLimitMBps = 0.0;    ///< Per worker, 0 = unlimited

    std::optional<int> retries;
    std::optional<int> backoffMs;
    std::optional<int> timeoutSeconds;
    QString baseUrl = QString::fromLatin1(Constants::DEFAULT_BASE_URL);

    QString configPath = QString::fromLatin1(Constants::DEFAULT_STATE_FILE);
    QString logFile = QString::fromLatin1(Constants::DEFAULT_LOG_FILE);
    Logging::Level logLevel = Logging::Level::Info;
    bool quiet = false;
};

/**
 * @class CommandLine
 * @brief QCommandLineParser front end for the packfetch executable
 */
class CommandLine {
public:
    CommandLine();

    CommandLine(const CommandLine&) = delete;
    CommandLine& operator=(const CommandLine&) = delete;

    /**
     * @brief Parse and validate @p arguments (argv[0] included)
     * @return false on a usage error; see errorText()
     */
    bool parse(const QStringList& arguments);

    [[nodiscard]] const QString& errorText() const noexcept { return m_error; }
    [[nodiscard]] bool helpRequested() const noexcept { return m_helpRequested; }
    [[nodiscard]] bool versionRequested() const noexcept { return m_versionRequested; }
    [[nodiscard]] QString helpText() const { return m_parser.helpText(); }
    [[nodiscard]] const CommandLineOptions& options() const noexcept { return m_options; }

    /**
     * @brief Effective settings: command line over persisted over defaults
     */
    [[nodiscard]] FetchSettings settings(const PersistedState& persisted) const;

    /**
     * @brief Sorted, deduplicated union of range, --packs and --retry-failed
     */
    [[nodiscard]] QList<PackId> requestedPacks(const PersistedState& persisted) const;

private:
    bool fail(const QString& message);
    bool readNonNegativeInt(const QCommandLineOption& option, std::optional<int>& target);

    QCommandLineParser m_parser;
    CommandLineOptions m_options;
    QString m_error;
    bool m_helpRequested = false;
    bool m_versionRequested = false;

    QCommandLineOption m_startOption;
    QCommandLineOption m_endOption;
    QCommandLineOption m_packsOption;
    QCommandLineOption m_retryFailedOption;
    QCommandLineOption m_forceOption;
    QCommandLineOption m_dirOption;
    QCommandLineOption m_threadsOption;
    QCommandLineOption m_chunkSizeOption;
    QCommandLineOption m_noDelayOption;
    QCommandLineOption m_noResumeOption;
    QCommandLineOption m_bandwidthOption;
    QCommandLineOption m_retriesOption;
    QCommandLineOption m_backoffOption;
    QCommandLineOption m_timeoutOption;
    QCommandLineOption m_baseUrlOption;
    QCommandLineOption m_configOption;
    QCommandLineOption m_logLevelOption;
    QCommandLineOption m_logFileOption;
    QCommandLineOption m_quietOption;
    QCommandLineOption m_helpOption;
    QCommandLineOption m_versionOption;
};

} // namespace PackFetch
