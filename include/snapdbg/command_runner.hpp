#pragma once

#include <QString>
#include <QStringList>

namespace snapdbg {

struct CommandResult {
    int exitCode = -1;
    QString stdoutText;
    QString stderrText;
    bool timedOut = false;
    bool failedToStart = false;

    [[nodiscard]] bool success() const { return !timedOut && !failedToStart && exitCode == 0; }
};

class CommandRunner {
public:
    static CommandResult run(
        const QString& program,
        const QStringList& args = {},
        int timeoutMs = 10000);
};

// Account configured in the local gcloud installation, or "unknown" when gcloud
// is missing or reports nothing.
QString gcloudAccount(int timeoutMs = 10000);

}  // namespace snapdbg
