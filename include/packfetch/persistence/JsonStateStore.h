/**
 * @file JsonStateStore.h
 * @brief StateStore backed by a JSON file
 *
 * File layout:
 * @code
 * {
 *     "download_dir": "./osu_packs",
 *     "threads": 3,
 *     "chunk_size": 8192,
 *     "delay": true,
 *     "completed_packs": [1, 2],
 *     "failed_packs": [3]
 * }
 * @endcode
 *
 * Writes go through QSaveFile so a crash mid-save leaves the previous
 * file intact.
 *
 * @copyright Copyright (c) 2024 PackFetch Project
 * @license GPL-3.0-or-later
 */

#pragma once

#include "packfetch/persistence/StateStore.h"

#include <QJsonObject>
#include <QMutex>
#include <QString>

namespace PackFetch {

class JsonStateStore : public StateStore {
public:
    explicit JsonStateStore(QString path = QString::fromLatin1(Constants::DEFAULT_STATE_FILE));

    [[nodiscard]] PersistedState load() override;
    [[nodiscard]] bool save(const PersistedState& state) override;

    [[nodiscard]] const QString& path() const noexcept { return m_path; }

    [[nodiscard]] static QJsonObject toJson(const PersistedState& state);
    [[nodiscard]] static PersistedState fromJson(const QJsonObject& object);

private:
    QString m_path;
    QMutex m_mutex;
};

} // namespace PackFetch
