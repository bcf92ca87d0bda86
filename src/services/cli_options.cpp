#include "snapdbg/cli_options.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>

namespace snapdbg {

namespace {

struct CommandSpec {
    const char* name;
    int positionalCount;
    const char* usage;
};

const CommandSpec kCommands[] = {
    {"get_snapshot", 1, "get_snapshot FILE"},
    {"get_logpoint", 1, "get_logpoint FILE"},
    {"set_logpoint", 2, "set_logpoint LOCATION LOG_FORMAT_STRING"},
};

bool parseNonNegative(const QString& text, int* value) {
    bool ok = false;
    const int parsed = text.toInt(&ok);
    if (!ok || parsed < 0) {
        return false;
    }
    *value = parsed;
    return true;
}

}  // namespace

QStringList supportedCommands() {
    QStringList names;
    for (const CommandSpec& spec : kCommands) {
        names.append(spec.name);
    }
    return names;
}

CliParseResult parseCommandLine(const QStringList& argv) {
    CliParseResult result;

    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Inspect debug snapshots and compile logpoint messages from breakpoint documents.");
    parser.setSingleDashWordOptionMode(QCommandLineParser::ParseAsLongOptions);
    const QCommandLineOption helpOption = parser.addHelpOption();
    const QCommandLineOption versionOption = parser.addVersionOption();

    const QCommandLineOption frameIndexOption(
        "frame-index",
        "Stack frame to display local variables from, 0 is the top of the stack.",
        "N", "0");
    const QCommandLineOption maxLevelOption(
        "max-level",
        QString("Maximum variable expansion level, default %1.")
            .arg(VariableResolver::kDefaultMaxLevel),
        "N", QString::number(VariableResolver::kDefaultMaxLevel));
    const QCommandLineOption formatOption(
        "format", "Output format: default, json or pretty-json.", "FORMAT", "default");
    const QCommandLineOption logLevelOption(
        "log-level", "Logpoint level: info, warning or error.", "LEVEL", "info");
    const QCommandLineOption conditionOption(
        "condition", "Only emit the logpoint when the condition is true.", "CONDITION");
    const QCommandLineOption userEmailOption(
        "user-email", "Owner recorded in the logpoint, defaults to the gcloud account.", "EMAIL");
    const QCommandLineOption telemetryOption(
        "telemetry-out", "Write run telemetry as JSON to PATH on exit.", "PATH");
    parser.addOptions({frameIndexOption, maxLevelOption, formatOption, logLevelOption,
        conditionOption, userEmailOption, telemetryOption});
    parser.addPositionalArgument("command", supportedCommands().join(", "));
    parser.addPositionalArgument("args", "Command arguments.", "[args...]");

    if (!parser.parse(argv)) {
        result.error = parser.errorText();
        return result;
    }
    if (parser.isSet(helpOption)) {
        result.helpRequested = true;
        result.helpText = parser.helpText();
        return result;
    }
    if (parser.isSet(versionOption)) {
        result.versionRequested = true;
        return result;
    }

    CliOptions& options = result.options;
    QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        result.error = "No command given. Expected one of: " + supportedCommands().join(", ");
        return result;
    }
    options.command = positional.takeFirst();
    options.arguments = positional;

    const CommandSpec* command = nullptr;
    for (const CommandSpec& spec : kCommands) {
        if (options.command == spec.name) {
            command = &spec;
        }
    }
    if (command == nullptr) {
        result.error = QString("Unknown command: %1").arg(options.command);
        return result;
    }
    if (options.arguments.size() != command->positionalCount) {
        result.error = QString("Usage: %1").arg(command->usage);
        return result;
    }

    if (!parseNonNegative(parser.value(frameIndexOption), &options.frameIndex)) {
        result.error = "--frame-index must be a non-negative integer.";
        return result;
    }
    if (!parseNonNegative(parser.value(maxLevelOption), &options.maxLevel)) {
        result.error = "--max-level must be a non-negative integer.";
        return result;
    }

    const QString format = parser.value(formatOption);
    if (format == "default") {
        options.format = OutputFormat::Default;
    } else if (format == "json") {
        options.format = OutputFormat::Json;
    } else if (format == "pretty-json") {
        options.format = OutputFormat::PrettyJson;
    } else {
        result.error = QString("Invalid format argument provided: %1").arg(format);
        return result;
    }

    if (!parseLogLevel(parser.value(logLevelOption), &options.logLevel)) {
        result.error =
            QString("Invalid log-level argument provided: %1").arg(parser.value(logLevelOption));
        return result;
    }

    options.condition = parser.value(conditionOption);
    options.userEmail = parser.value(userEmailOption);
    options.telemetryOut = parser.value(telemetryOption);
    return result;
}

}  // namespace snapdbg
