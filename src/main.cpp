#include <QCoreApplication>
#include <QTextStream>

#include <cstdio>

#include "snapdbg/cli_options.hpp"
#include "snapdbg/command_runner.hpp"
#include "snapdbg/commands.hpp"
#include "snapdbg/telemetry.hpp"

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("snapdbg");
    app.setApplicationVersion("0.3.0");

    QTextStream out(stdout);
    QTextStream err(stderr);

    const snapdbg::CliParseResult parsed = snapdbg::parseCommandLine(QCoreApplication::arguments());
    if (parsed.helpRequested) {
        out << parsed.helpText;
        return snapdbg::kExitSuccess;
    }
    if (parsed.versionRequested) {
        out << app.applicationName() << ' ' << app.applicationVersion() << Qt::endl;
        return snapdbg::kExitSuccess;
    }
    if (!parsed.success()) {
        err << parsed.error << Qt::endl;
        return snapdbg::kExitUsage;
    }

    snapdbg::CommandContext context{out, err, []() { return snapdbg::gcloudAccount(); }};
    const int exitCode = snapdbg::runCommand(parsed.options, context);
    out.flush();

    if (!parsed.options.telemetryOut.isEmpty()) {
        const QJsonObject exported =
            snapdbg::Telemetry::instance().exportToFile(parsed.options.telemetryOut);
        if (!exported.value("success").toBool()) {
            err << exported.value("error").toString() << Qt::endl;
        }
    }
    return exitCode;
}
