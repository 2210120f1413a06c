/**
 * @file Logging.cpp
 * @brief Implementation of the log file message handler
 *
 * @copyright Copyright (c) 2024 PackFetch Project
 * @license GPL-3.0-or-later
 */

#include "packfetch/app/Logging.h"

#include <QDateTime>
#include <QFile>
#include <QMutex>
#include <QMutexLocker>

#include <cstdio>
#include <memory>

namespace PackFetch {
namespace Logging {

namespace {

struct Sink {
    QMutex mutex;
    std::unique_ptr<QFile> file;
    Level threshold = Level::Info;
    QtMessageHandler previous = nullptr;
    bool installed = false;
};

Sink& sink() {
    static Sink instance;
    return instance;
}

const char* levelName(QtMsgType type) {
    switch (type) {
        case QtDebugMsg:    return "DEBUG";
        case QtInfoMsg:     return "INFO";
        case QtWarningMsg:  return "WARNING";
        case QtCriticalMsg: return "ERROR";
        case QtFatalMsg:    return "FATAL";
    }
    return "UNKNOWN";
}

void messageHandler(QtMsgType type, const QMessageLogContext& /*context*/, const QString& message) {
    Sink& s = sink();
    const QByteArray record = formatRecord(type, message).toUtf8();

    QMutexLocker locker(&s.mutex);

    if (static_cast<int>(levelOf(type)) < static_cast<int>(s.threshold) && type != QtFatalMsg) {
        return;
    }

    if (s.file && s.file->isOpen()) {
        s.file->write(record);
        s.file->write("\n", 1);
        s.file->flush();
    }

    // Warnings and above also reach the terminal, on a fresh line
    if (type == QtWarningMsg || type == QtCriticalMsg || type == QtFatalMsg || !s.file) {
        std::fprintf(stderr, "\r\033[K%s\n", record.constData());
        std::fflush(stderr);
    }
}

} // namespace

std::optional<Level> levelFromString(const QString& text) {
    const QString upper = text.trimmed().toUpper();
    if (upper == QLatin1String("DEBUG"))   return Level::Debug;
    if (upper == QLatin1String("INFO"))    return Level::Info;
    if (upper == QLatin1String("WARNING")) return Level::Warning;
    if (upper == QLatin1String("ERROR"))   return Level::Error;
    return std::nullopt;
}

Level levelOf(QtMsgType type) {
    switch (type) {
        case QtDebugMsg:   return Level::Debug;
        case QtInfoMsg:    return Level::Info;
        case QtWarningMsg: return Level::Warning;
        default:           return Level::Error;
    }
}

QString formatRecord(QtMsgType type, const QString& message) {
    return QStringLiteral("[%1] [%2] %3")
        .arg(QDateTime::currentDateTime().toString(QStringLiteral("yyyy-MM-dd hh:mm:ss.zzz")),
             QString::fromLatin1(levelName(type)),
             message);
}

bool install(const QString& path, Level threshold) {
    Sink& s = sink();
    bool opened = false;

    {
        QMutexLocker locker(&s.mutex);
        s.threshold = threshold;

        auto file = std::make_unique<QFile>(path);
        if (file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            s.file = std::move(file);
            opened = true;
        } else {
            std::fprintf(stderr, "Cannot open log file %s: %s\n",
                         qPrintable(path), qPrintable(file->errorString()));
            s.file.reset();
        }

        if (!s.installed) {
            s.previous = qInstallMessageHandler(messageHandler);
            s.installed = true;
        }
    }

    return opened;
}

void uninstall() {
    Sink& s = sink();
    QMutexLocker locker(&s.mutex);

    if (s.installed) {
        qInstallMessageHandler(s.previous);
        s.previous = nullptr;
        s.installed = false;
    }

    if (s.file) {
        s.file->close();
        s.file.reset();
    }
}

} // namespace Logging
} // namespace PackFetch
