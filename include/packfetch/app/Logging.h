/**
 * @file Logging.h
 * @brief Qt message handler writing to a log file
 *
 * All components log through qDebug()/qInfo()/qWarning()/qCritical()
 * with a "ClassName:" prefix. install() routes those messages to a file
 * and echoes warnings and above to stderr.
 *
 * @copyright Copyright (c) 2024 PackFetch Project
 * @license GPL-3.0-or-later
 */

#pragma once

#include <QString>
#include <QtGlobal>

#include <optional>

namespace PackFetch {
namespace Logging {

enum class Level : int {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3
};

/**
 * @brief Parse DEBUG/INFO/WARNING/ERROR (case-insensitive)
 */
[[nodiscard]] std::optional<Level> levelFromString(const QString& text);

[[nodiscard]] Level levelOf(QtMsgType type);

/**
 * @brief Install the file handler
 * @param path Log file, opened in append mode
 * @param threshold Messages below this level are dropped
 * @return false if the file could not be opened (stderr only then)
 */
bool install(const QString& path, Level threshold);

/**
 * @brief Restore the previous handler and close the file
 */
void uninstall();

/**
 * @brief Format one record as written to the file
 */
[[nodiscard]] QString formatRecord(QtMsgType type, const QString& message);

} // namespace Logging
} // namespace PackFetch
