/**
 * @file JsonStateStore.cpp
 * @brief Implementation of the JSON state file
 *
 * @copyright Copyright (c) 2024 PackFetch Project
 * @license GPL-3.0-or-later
 */

#include "packfetch/persistence/JsonStateStore.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QMutexLocker>
#include <QSaveFile>

#include <algorithm>
#include <cmath>
#include <limits>

namespace PackFetch {

namespace {

const QString kDownloadDir = QStringLiteral("download_dir");
const QString kThreads = QStringLiteral("threads");
const QString kChunkSize = QStringLiteral("chunk_size");
const QString kDelay = QStringLiteral("delay");
const QString kCompleted = QStringLiteral("completed_packs");
const QString kFailed = QStringLiteral("failed_packs");

std::set<PackId> readIdList(const QJsonObject& object, const QString& key) {
    std::set<PackId> ids;
    const QJsonValue value = object.value(key);
    if (value.isUndefined()) {
        return ids;
    }
    if (!value.isArray()) {
        qWarning() << "JsonStateStore:" << key << "is not an array, ignoring";
        return ids;
    }

    for (const QJsonValue& entry : value.toArray()) {
        const double number = entry.toDouble(-1.0);
        if (!entry.isDouble() || number < 1.0 || std::floor(number) != number
            || number > static_cast<double>(std::numeric_limits<PackId>::max())) {
            qWarning() << "JsonStateStore: Skipping invalid identifier in" << key << ":" << entry;
            continue;
        }
        ids.insert(static_cast<PackId>(number));
    }
    return ids;
}

QJsonArray writeIdList(const std::set<PackId>& ids) {
    QJsonArray array;
    for (PackId id : ids) {  // std::set iterates ascending
        array.append(id);
    }
    return array;
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Construction
// ═══════════════════════════════════════════════════════════════════════════════

JsonStateStore::JsonStateStore(QString path)
    : m_path(std::move(path))
{
}

// ═══════════════════════════════════════════════════════════════════════════════
// Serialization
// ═══════════════════════════════════════════════════════════════════════════════

QJsonObject JsonStateStore::toJson(const PersistedState& state) {
    QJsonObject object;
    object.insert(kDownloadDir, state.downloadDir);
    object.insert(kThreads, state.threads);
    object.insert(kChunkSize, static_cast<qint64>(state.chunkSize));
    object.insert(kDelay, state.delay);
    object.insert(kCompleted, writeIdList(state.completed));
    object.insert(kFailed, writeIdList(state.failed));
    return object;
}

PersistedState JsonStateStore::fromJson(const QJsonObject& object) {
    PersistedState state;

    const QJsonValue dir = object.value(kDownloadDir);
    if (dir.isString() && !dir.toString().isEmpty()) {
        state.downloadDir = dir.toString();
    }

    const QJsonValue threads = object.value(kThreads);
    if (threads.isDouble() && threads.toInt() >= 1) {
        state.threads = std::min(threads.toInt(), Constants::MAX_THREADS);
    }

    const QJsonValue chunk = object.value(kChunkSize);
    if (chunk.isDouble() && chunk.toInteger() > 0) {
        state.chunkSize = chunk.toInteger();
    }

    const QJsonValue delay = object.value(kDelay);
    if (delay.isBool()) {
        state.delay = delay.toBool();
    }

    state.completed = readIdList(object, kCompleted);
    state.failed = readIdList(object, kFailed);

    // A pack cannot be both
    for (PackId id : state.completed) {
        state.failed.erase(id);
    }

    return state;
}

// ═══════════════════════════════════════════════════════════════════════════════
// StateStore Interface
// ═══════════════════════════════════════════════════════════════════════════════

PersistedState JsonStateStore::load() {
    QMutexLocker locker(&m_mutex);

    QFile file(m_path);
    if (!file.exists()) {
        qInfo() << "JsonStateStore: No state file at" << m_path << "- using defaults";
        return PersistedState{};
    }

    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "JsonStateStore: Cannot read" << m_path << file.errorString()
                   << "- using defaults";
        return PersistedState{};
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);

    if (parseError.error != QJsonParseError::NoError) {
        qWarning() << "JsonStateStore: Malformed state file" << m_path << ":"
                   << parseError.errorString() << "- using defaults";
        return PersistedState{};
    }

    if (!doc.isObject()) {
        qWarning() << "JsonStateStore: State file" << m_path << "is not an object - using defaults";
        return PersistedState{};
    }

    PersistedState state = fromJson(doc.object());
    qDebug() << "JsonStateStore: Loaded" << state.completed.size() << "completed,"
             << state.failed.size() << "failed from" << m_path;
    return state;
}

bool JsonStateStore::save(const PersistedState& state) {
    QMutexLocker locker(&m_mutex);

    const QString dir = QFileInfo(m_path).absolutePath();
    if (!QDir().mkpath(dir)) {
        qWarning() << "JsonStateStore: Cannot create directory" << dir;
        return false;
    }

    QSaveFile file(m_path);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "JsonStateStore: Cannot open" << m_path << "for writing:" << file.errorString();
        return false;
    }

    const QByteArray bytes = QJsonDocument(toJson(state)).toJson(QJsonDocument::Indented);
    if (file.write(bytes) != bytes.size()) {
        qWarning() << "JsonStateStore: Short write to" << m_path << ":" << file.errorString();
        file.cancelWriting();
        return false;
    }

    if (!file.commit()) {
        qWarning() << "JsonStateStore: Failed to commit" << m_path << ":" << file.errorString();
        return false;
    }

    return true;
}

} // namespace PackFetch
