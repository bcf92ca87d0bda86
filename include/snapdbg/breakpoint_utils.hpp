#pragma once

#include <QJsonObject>
#include <QString>

namespace snapdbg {

constexpr qint64 kMaxLineNumber = 2147483647;

QString locationErrorMessage();

// "file:line" -> {"path": file, "line": line}; empty object when invalid.
QJsonObject parseAndValidateLocation(const QString& fileLine);

// {"path", "line"} -> "file:line"; null string when either field is missing.
QString transformLocationToFileLine(const QJsonObject& location);

QString convertUnixMsecToRfc3339(qint64 unixMsec);

// Fills in the fields the display code relies on. Returns an empty object when
// the breakpoint lacks an id or a complete location.
QJsonObject normalizeBreakpoint(const QJsonObject& breakpoint, const QString& id = {});

QString snapshotState(const QJsonObject& breakpoint);
QString logpointState(const QJsonObject& breakpoint);

enum class LogLevel {
    Info,
    Warning,
    Error,
};

// Accepts the lowercase names used on the command line.
bool parseLogLevel(const QString& text, LogLevel* level);
QString logLevelName(LogLevel level);

}  // namespace snapdbg
