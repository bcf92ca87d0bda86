#pragma once

#include <QString>
#include <QStringList>

#include "snapdbg/breakpoint_utils.hpp"
#include "snapdbg/variable_resolver.hpp"

namespace snapdbg {

enum class OutputFormat {
    Default,
    Json,
    PrettyJson,
};

struct CliOptions {
    QString command;
    QStringList arguments;
    int frameIndex = 0;
    int maxLevel = VariableResolver::kDefaultMaxLevel;
    OutputFormat format = OutputFormat::Default;
    LogLevel logLevel = LogLevel::Info;
    QString condition;
    QString userEmail;
    QString telemetryOut;
};

struct CliParseResult {
    CliOptions options;
    QString error;
    QString helpText;
    bool helpRequested = false;
    bool versionRequested = false;

    [[nodiscard]] bool success() const { return error.isEmpty(); }
};

QStringList supportedCommands();

// Parses argv (program name first) without exiting the process.
CliParseResult parseCommandLine(const QStringList& argv);

}  // namespace snapdbg
