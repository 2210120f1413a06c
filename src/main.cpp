/**
 * @file main.cpp
 * @brief PackFetch command-line entry point
 *
 * Parses options, merges them over the state file, runs one batch and
 * prints the final summary.
 */

#include <QCoreApplication>
#include <QDebug>
#include <QStringList>

#include "packfetch/app/CommandLine.h"
#include "packfetch/app/Logging.h"
#include "packfetch/engine/BatchScheduler.h"
#include "packfetch/engine/FetchContext.h"
#include "packfetch/persistence/JsonStateStore.h"
#include "engine/CurlTransport.h"

#include <atomic>
#include <csignal>
#include <cstdio>

namespace {

constexpr int EXIT_USAGE = 2;
constexpr int EXIT_INTERRUPTED = 130;

std::atomic<PackFetch::FetchContext*> g_activeContext{nullptr};

void handleStopSignal(int /*signal*/)
{
    if (PackFetch::FetchContext* context = g_activeContext.load()) {
        context->requestInterrupt();
    }
}

void printLine(const QString& text, FILE* stream = stdout)
{
    std::fprintf(stream, "%s\n", qPrintable(text));
    std::fflush(stream);
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("packfetch"));
    app.setApplicationVersion(QStringLiteral("1.0.0"));

    using namespace PackFetch;

    CommandLine commandLine;
    if (!commandLine.parse(app.arguments())) {
        printLine(QStringLiteral("packfetch: %1").arg(commandLine.errorText()), stderr);
        printLine(commandLine.helpText(), stderr);
        return EXIT_USAGE;
    }
    if (commandLine.helpRequested()) {
        printLine(commandLine.helpText());
        return 0;
    }
    if (commandLine.versionRequested()) {
        printLine(QStringLiteral("%1 %2").arg(app.applicationName(), app.applicationVersion()));
        return 0;
    }

    const CommandLineOptions& options = commandLine.options();
    Logging::install(options.logFile, options.logLevel);

    JsonStateStore store(options.configPath);
    const PersistedState persisted = store.load();

    const QList<PackId> requested = commandLine.requestedPacks(persisted);
    if (requested.isEmpty()) {
        printLine(QStringLiteral("packfetch: No packs specified to download. "
                                 "Use --start/--end, --packs, or --retry-failed"), stderr);
        Logging::uninstall();
        return EXIT_USAGE;
    }

    if (!CurlGlobalInit::instance().isValid()) {
        qCritical() << "main: libcurl is unavailable";
        Logging::uninstall();
        return 1;
    }

    FetchContext context(commandLine.settings(persisted));
    g_activeContext.store(&context);
    std::signal(SIGINT, handleStopSignal);
    std::signal(SIGTERM, handleStopSignal);

    qInfo() << "main: Requested" << requested.size() << "pack(s), state file" << store.path();

    BatchScheduler scheduler(context, store, CurlTransport::factory(context));
    const RunSummary& summary = scheduler.run(requested, persisted);

    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    g_activeContext.store(nullptr);

    printLine(QStringLiteral("Download complete: %1/%2 successful, %3 failed")
                  .arg(summary.completed())
                  .arg(summary.requested())
                  .arg(summary.failed()));

    const QList<PackId> failed = summary.failedIds();
    if (!failed.isEmpty()) {
        QStringList ids;
        for (PackId id : failed) {
            ids << QString::number(id);
        }
        printLine(QStringLiteral("Failed packs: %1").arg(ids.join(QStringLiteral(", "))));
    }

    const bool interrupted = context.isInterrupted();
    Logging::uninstall();

    if (interrupted) {
        return EXIT_INTERRUPTED;
    }
    return failed.isEmpty() ? 0 : 1;
}
