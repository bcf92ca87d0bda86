#include "snapdbg/breakpoint_utils.hpp"

#include <QDateTime>
#include <QJsonArray>
#include <QRegularExpression>
#include <QStringList>

#include "snapdbg/log_template.hpp"
#include "snapdbg/status_message.hpp"

namespace snapdbg {

namespace {

void setConvertedTimestamps(QJsonObject& breakpoint) {
    const QStringList pairs[] = {
        {"createTime", "createTimeUnixMsec"},
        {"finalTime", "finalTimeUnixMsec"},
    };
    for (const QStringList& pair : pairs) {
        if (!breakpoint.contains(pair[0]) && breakpoint.contains(pair[1])) {
            const qint64 msec = static_cast<qint64>(breakpoint.value(pair[1]).toDouble(0));
            breakpoint.insert(pair[0], convertUnixMsecToRfc3339(msec));
        }
    }
}

}  // namespace

QString locationErrorMessage() {
    return QString("Location must be in the format file:line, with the maximum line "
                   "number being %1").arg(kMaxLineNumber);
}

QJsonObject parseAndValidateLocation(const QString& fileLine) {
    static const QRegularExpression pattern("^[^:]+:[1-9][0-9]*$");
    if (!pattern.match(fileLine).hasMatch()) {
        return {};
    }

    const int colon = fileLine.indexOf(':');
    bool ok = false;
    const qint64 line = fileLine.mid(colon + 1).toLongLong(&ok);
    if (!ok || line > kMaxLineNumber) {
        return {};
    }

    return {
        {"path", fileLine.left(colon)},
        {"line", static_cast<double>(line)},
    };
}

QString transformLocationToFileLine(const QJsonObject& location) {
    if (!location.contains("path") || !location.contains("line")) {
        return {};
    }
    const QJsonValue line = location.value("line");
    const QString lineText = line.isDouble()
        ? QString::number(static_cast<qint64>(line.toDouble()))
        : line.toString();
    return QString("%1:%2").arg(location.value("path").toString(), lineText);
}

QString convertUnixMsecToRfc3339(qint64 unixMsec) {
    QDateTime dt = QDateTime::fromMSecsSinceEpoch(unixMsec, Qt::UTC);
    if (!dt.isValid() || dt.date().year() > 9999) {
        dt = QDateTime::fromMSecsSinceEpoch(0, Qt::UTC);
    }
    return dt.toString("yyyy-MM-dd'T'HH:mm:ss.zzz'000Z'");
}

QJsonObject normalizeBreakpoint(const QJsonObject& breakpoint, const QString& id) {
    QJsonObject bp = breakpoint;
    if (!bp.contains("id") && !id.isEmpty()) {
        bp.insert("id", id);
    }

    if (!bp.contains("id") || !bp.value("location").isObject()) {
        return {};
    }
    const QJsonObject location = bp.value("location").toObject();
    if (!location.contains("path") || !location.contains("line")) {
        return {};
    }

    if (!bp.contains("action")) {
        bp.insert("action", "CAPTURE");
    }
    if (!bp.contains("isFinalState")) {
        bp.insert("isFinalState", false);
    }
    if (!bp.contains("createTimeUnixMsec")) {
        // Zero marks the time as unknown.
        bp.insert("createTimeUnixMsec", 0);
    }
    if (!bp.contains("finalTimeUnixMsec") && bp.value("isFinalState").toBool()) {
        bp.insert("finalTimeUnixMsec", 0);
    }
    if (!bp.contains("userEmail")) {
        bp.insert("userEmail", "unknown");
    }
    setConvertedTimestamps(bp);

    if (bp.value("action").toString() == "LOG") {
        QStringList expressions;
        for (const QJsonValue& expression : bp.value("expressions").toArray()) {
            expressions.append(expression.toString());
        }
        bp.insert("logMessageFormatString",
            mergeLogTemplate(bp.value("logMessageFormat").toString(), expressions));
        if (!bp.contains("logLevel")) {
            bp.insert("logLevel", logLevelName(LogLevel::Info));
        }
    }
    return bp;
}

QString snapshotState(const QJsonObject& breakpoint) {
    if (!breakpoint.value("isFinalState").toBool()) {
        return "ACTIVE";
    }
    const StatusMessage status(breakpoint);
    if (!status.isError()) {
        return "COMPLETED";
    }
    return status.refersTo() == "BREAKPOINT_AGE" ? "EXPIRED" : "FAILED";
}

QString logpointState(const QJsonObject& breakpoint) {
    if (!breakpoint.value("isFinalState").toBool()) {
        return "ACTIVE";
    }
    const StatusMessage status(breakpoint);
    if (status.isError() && status.refersTo() != "BREAKPOINT_AGE") {
        return "FAILED";
    }
    return "EXPIRED";
}

bool parseLogLevel(const QString& text, LogLevel* level) {
    if (text == "info") {
        *level = LogLevel::Info;
    } else if (text == "warning") {
        *level = LogLevel::Warning;
    } else if (text == "error") {
        *level = LogLevel::Error;
    } else {
        return false;
    }
    return true;
}

QString logLevelName(LogLevel level) {
    switch (level) {
    case LogLevel::Warning:
        return "WARNING";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Info:
        break;
    }
    return "INFO";
}

}  // namespace snapdbg
