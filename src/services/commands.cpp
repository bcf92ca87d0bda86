#include "snapdbg/commands.hpp"

#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

#include <cstdio>

#include "snapdbg/breakpoint_utils.hpp"
#include "snapdbg/log_template.hpp"
#include "snapdbg/snapshot_parser.hpp"
#include "snapdbg/telemetry.hpp"

namespace snapdbg {

namespace {

int fail(CommandContext& context, const QString& message, int code = kExitFailure) {
    Telemetry::instance().recordEvent("command_failed", {{"error", message}});
    context.err << message << Qt::endl;
    return code;
}

QJsonObject loadBreakpoint(const QString& path, const QString& action, QString* error) {
    const QJsonObject loaded = readBreakpointFile(path);
    if (!loaded.value("success").toBool()) {
        *error = loaded.value("error").toString();
        return {};
    }

    const QString fallbackId = path == "-" ? QString() : QFileInfo(path).completeBaseName();
    const QJsonObject bp = normalizeBreakpoint(loaded.value("breakpoint").toObject(), fallbackId);
    if (bp.isEmpty() || bp.value("action").toString() != action) {
        const QString kind = action == "LOG" ? "logpoint" : "snapshot";
        *error = QString("No valid %1 found in %2").arg(kind, path);
        return {};
    }
    return bp;
}

void printJson(const QJsonObject& document, OutputFormat format, const DataFormatter& formatter,
    CommandContext& context) {
    context.out << formatter.toJsonString(document, format == OutputFormat::PrettyJson) << Qt::endl;
}

QString joinedExpressions(const QJsonObject& bp) {
    QStringList expressions;
    for (const QJsonValue& expression : bp.value("expressions").toArray()) {
        expressions.append(expression.toString());
    }
    return expressions.join(", ");
}

}  // namespace

QJsonObject readBreakpointFile(const QString& path) {
    QFile file;
    bool opened = false;
    if (path == "-") {
        opened = file.open(stdin, QIODevice::ReadOnly);
    } else {
        file.setFileName(path);
        opened = file.open(QIODevice::ReadOnly);
    }
    if (!opened) {
        return {{"success", false}, {"error", QString("Failed to open %1.").arg(path)}};
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();
    if (parseError.error != QJsonParseError::NoError) {
        return {
            {"success", false},
            {"error", QString("Failed to parse %1: %2").arg(path, parseError.errorString())},
        };
    }
    if (!doc.isObject()) {
        return {{"success", false}, {"error", QString("%1 must contain a JSON object.").arg(path)}};
    }
    return {{"success", true}, {"breakpoint", doc.object()}};
}

void GetSnapshotCommand::displayHeader(const QString& title, CommandContext& context) const {
    const QString rule(80, '-');
    context.out << Qt::endl << rule << Qt::endl;
    context.out << "| " << title << Qt::endl;
    context.out << rule << Qt::endl << Qt::endl;
}

void GetSnapshotCommand::displaySummary(
    const QJsonObject& snapshot,
    const StatusMessage& statusMessage,
    CommandContext& context) const {
    QString condition = snapshot.value("condition").toString();
    if (condition.isEmpty()) {
        condition = "No condition set";
    }
    QString expressions = joinedExpressions(snapshot);
    if (expressions.isEmpty()) {
        expressions = "No expressions set";
    }

    QString status = snapshot.value("isFinalState").toBool() ? "Complete" : "Active";
    if (statusMessage.hasMessage()) {
        if (statusMessage.isError() && statusMessage.refersTo() != "BREAKPOINT_AGE") {
            status = QString("ERROR: %1 (refers to: %2)")
                         .arg(statusMessage.parsedMessage(), statusMessage.refersTo());
        } else {
            status = statusMessage.parsedMessage();
        }
    }

    displayHeader("Summary", context);
    context.out << "Location:    "
                << transformLocationToFileLine(snapshot.value("location").toObject()) << Qt::endl;
    context.out << "Condition:   " << condition << Qt::endl;
    context.out << "Expressions: " << expressions << Qt::endl;
    context.out << "Status:      " << status << Qt::endl;
    context.out << "Create Time: " << snapshot.value("createTime").toString() << Qt::endl;
    context.out << "Final Time:  " << snapshot.value("finalTime").toString() << Qt::endl;
}

int GetSnapshotCommand::run(const CliOptions& options, CommandContext& context) const {
    QString error;
    const QJsonObject snapshot = loadBreakpoint(options.arguments.value(0), "CAPTURE", &error);
    if (snapshot.isEmpty()) {
        return fail(context, error);
    }

    if (options.format != OutputFormat::Default) {
        printJson(snapshot, options.format, formatter_, context);
        return kExitSuccess;
    }

    const SnapshotParser parser(snapshot, options.maxLevel);

    // A specific frame request only shows that frame's locals.
    if (options.frameIndex == 0) {
        displaySummary(snapshot, parser.statusMessage(), context);
    }

    if (!snapshot.value("isFinalState").toBool() || parser.statusMessage().isError()) {
        return kExitSuccess;
    }

    const int frameCount = parser.stackFrames().size();
    if (options.frameIndex > 0 && options.frameIndex >= frameCount) {
        return fail(context,
            QString("Stack frame index %1 too big, there are only %2 stack frames.")
                .arg(options.frameIndex)
                .arg(frameCount));
    }

    if (options.frameIndex == 0) {
        const DisplayList expressions = parser.parseExpressions();
        displayHeader("Evaluated Expressions", context);
        context.out << (expressions.empty() ? QString("There were no expressions specified.")
                                            : formatter_.toJsonString(expressions, true))
                    << Qt::endl;
    }

    const DisplayList locals = parser.parseLocals(options.frameIndex);
    displayHeader(
        QString("Local Variables For Stack Frame Index %1:").arg(options.frameIndex), context);
    context.out << (locals.empty() ? QString("There are no local variables.")
                                   : formatter_.toJsonString(locals, true))
                << Qt::endl;

    if (options.frameIndex == 0) {
        displayHeader("CallStack:", context);
        context.out << formatter_.buildTable({"Function", "Location"}, parser.parseCallStack());
    }
    context.out.flush();
    return kExitSuccess;
}

int GetLogpointCommand::run(const CliOptions& options, CommandContext& context) const {
    QString error;
    const QJsonObject logpoint = loadBreakpoint(options.arguments.value(0), "LOG", &error);
    if (logpoint.isEmpty()) {
        return fail(context, error);
    }

    if (options.format != OutputFormat::Default) {
        printJson(logpoint, options.format, formatter_, context);
        return kExitSuccess;
    }

    QString condition = logpoint.value("condition").toString();
    if (condition.isEmpty()) {
        condition = "No condition set";
    }

    context.out << "Logpoint ID:        " << logpoint.value("id").toString() << Qt::endl;
    context.out << "Log Message Format: " << logpoint.value("logMessageFormatString").toString()
                << Qt::endl;
    context.out << "Location:           "
                << transformLocationToFileLine(logpoint.value("location").toObject()) << Qt::endl;
    context.out << "Condition:          " << condition << Qt::endl;
    context.out << "Log Level:          " << logpoint.value("logLevel").toString() << Qt::endl;
    context.out << "Status:             " << logpointState(logpoint) << Qt::endl;
    context.out << "Create Time:        " << logpoint.value("createTime").toString() << Qt::endl;
    context.out << "Final Time:         " << logpoint.value("finalTime").toString() << Qt::endl;
    context.out << "User Email:         " << logpoint.value("userEmail").toString() << Qt::endl;
    return kExitSuccess;
}

QJsonObject SetLogpointCommand::buildLogpoint(
    const QString& location,
    const QString& logFormatString,
    const CliOptions& options,
    const QString& userEmail,
    QString* error) {
    const QJsonObject parsedLocation = parseAndValidateLocation(location);
    if (parsedLocation.isEmpty()) {
        *error = locationErrorMessage();
        return {};
    }

    const LogTemplateSplit split = splitLogTemplate(logFormatString);
    if (!split.success()) {
        *error = split.error;
        return {};
    }

    QJsonObject logpoint;
    logpoint.insert("action", "LOG");
    logpoint.insert("logMessageFormat", split.format);
    logpoint.insert("location", parsedLocation);
    logpoint.insert("logLevel", logLevelName(options.logLevel));
    logpoint.insert("userEmail", userEmail);
    if (!split.expressions.isEmpty()) {
        logpoint.insert("expressions", QJsonArray::fromStringList(split.expressions));
    }
    // Server value, replaced with the write time by the database.
    logpoint.insert("createTimeUnixMsec", QJsonObject{{".sv", "timestamp"}});
    if (!options.condition.isEmpty()) {
        logpoint.insert("condition", options.condition);
    }
    return logpoint;
}

int SetLogpointCommand::run(const CliOptions& options, CommandContext& context) const {
    QString error;
    const QString userEmail = !options.userEmail.isEmpty() ? options.userEmail
        : context.accountProvider ? context.accountProvider()
                                  : QString("unknown");
    const QJsonObject logpoint = buildLogpoint(
        options.arguments.value(0), options.arguments.value(1), options, userEmail, &error);
    if (logpoint.isEmpty()) {
        return fail(context, error, kExitUsage);
    }

    printJson(logpoint, options.format == OutputFormat::Json ? OutputFormat::Json
                                                             : OutputFormat::PrettyJson,
        formatter_, context);
    return kExitSuccess;
}

int runCommand(const CliOptions& options, CommandContext& context) {
    Telemetry::instance().incrementCounter("cli." + options.command);
    if (options.command == "get_snapshot") {
        return GetSnapshotCommand().run(options, context);
    }
    if (options.command == "get_logpoint") {
        return GetLogpointCommand().run(options, context);
    }
    if (options.command == "set_logpoint") {
        return SetLogpointCommand().run(options, context);
    }
    return fail(context, QString("Unknown command: %1").arg(options.command), kExitUsage);
}

}  // namespace snapdbg
