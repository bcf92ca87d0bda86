#pragma once

#include <QJsonObject>
#include <QString>
#include <QTextStream>

#include <functional>

#include "snapdbg/cli_options.hpp"
#include "snapdbg/data_formatter.hpp"
#include "snapdbg/status_message.hpp"

namespace snapdbg {

enum ExitCode {
    kExitSuccess = 0,
    kExitFailure = 1,
    kExitUsage = 2,
};

struct CommandContext {
    QTextStream& out;
    QTextStream& err;
    // Account recorded as the logpoint owner when --user-email is not given.
    std::function<QString()> accountProvider;
};

// Reads a breakpoint document from PATH, or standard input for "-".
// Returns {"success", "error"} on failure and {"success", "breakpoint"} otherwise.
QJsonObject readBreakpointFile(const QString& path);

class GetSnapshotCommand {
public:
    int run(const CliOptions& options, CommandContext& context) const;

private:
    void displayHeader(const QString& title, CommandContext& context) const;
    void displaySummary(
        const QJsonObject& snapshot,
        const StatusMessage& statusMessage,
        CommandContext& context) const;

    DataFormatter formatter_;
};

class GetLogpointCommand {
public:
    int run(const CliOptions& options, CommandContext& context) const;

private:
    DataFormatter formatter_;
};

class SetLogpointCommand {
public:
    int run(const CliOptions& options, CommandContext& context) const;

    // Document a debug agent consumes for a new logpoint. Empty when either the
    // location or the message is invalid, with the reason in *error.
    static QJsonObject buildLogpoint(
        const QString& location,
        const QString& logFormatString,
        const CliOptions& options,
        const QString& userEmail,
        QString* error);

private:
    DataFormatter formatter_;
};

int runCommand(const CliOptions& options, CommandContext& context);

}  // namespace snapdbg
