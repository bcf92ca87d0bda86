#include "snapdbg/command_runner.hpp"

#include <QElapsedTimer>
#include <QJsonObject>
#include <QProcess>

#include "snapdbg/telemetry.hpp"

namespace snapdbg {

CommandResult CommandRunner::run(
    const QString& program,
    const QStringList& args,
    int timeoutMs) {
    QProcess process;
    QElapsedTimer elapsed;
    elapsed.start();
    process.start(program, args);

    CommandResult result;
    if (!process.waitForStarted(timeoutMs)) {
        result.failedToStart = true;
        result.stderrText = QString("Failed to start %1.").arg(program);
        Telemetry::instance().incrementCounter("commands.start_failures");
        Telemetry::instance().recordEvent("command_start_failed", {{"program", program}});
        return result;
    }

    if (!process.waitForFinished(timeoutMs)) {
        process.kill();
        process.waitForFinished(500);
        result.timedOut = true;
        result.stderrText = "Command timed out.";
        Telemetry::instance().incrementCounter("commands.timeouts");
        Telemetry::instance().recordEvent("command_timeout", {{"program", program}});
        Telemetry::instance().recordDurationMs("commands.duration_ms", elapsed.elapsed());
        return result;
    }

    result.exitCode = process.exitCode();
    result.stdoutText = QString::fromUtf8(process.readAllStandardOutput());
    result.stderrText = QString::fromUtf8(process.readAllStandardError());
    Telemetry::instance().incrementCounter("commands.count");
    if (result.exitCode != 0) {
        Telemetry::instance().incrementCounter("commands.non_zero_exit");
    }
    Telemetry::instance().recordDurationMs("commands.duration_ms", elapsed.elapsed());
    return result;
}

QString gcloudAccount(int timeoutMs) {
    const CommandResult result =
        CommandRunner::run("gcloud", {"config", "get-value", "account"}, timeoutMs);
    if (!result.success()) {
        return "unknown";
    }
    const QString account = result.stdoutText.trimmed();
    return account.isEmpty() ? QString("unknown") : account;
}

}  // namespace snapdbg
