#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTextStream>

#include <chrono>
#include <cstdio>
#include <optional>

#include "execguard/config.hpp"
#include "execguard/errors.hpp"
#include "execguard/path_validator.hpp"
#include "execguard/process_executor.hpp"
#include "execguard/telemetry.hpp"

namespace {

constexpr int kExitTimedOut = 124;

// Exports telemetry if configured. A failed export is reported but does not
// change the exit code.
int finish(const execguard::ExecguardConfig& config, int code) {
    if (!config.telemetryExportPath.isEmpty()) {
        const QJsonObject exported =
            execguard::Telemetry::instance().exportToFile(config.telemetryExportPath);
        if (!exported.value("success").toBool()) {
            QTextStream(stderr) << "Telemetry export to " << config.telemetryExportPath
                                << " failed: " << exported.value("error").toString() << Qt::endl;
        }
    }
    return code;
}

}  // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("execguard");

    QCommandLineParser parser;
    parser.setApplicationDescription("Validate arguments and run a command without a shell.");
    parser.addHelpOption();
    const QCommandLineOption configOption("config", "JSON configuration file.", "file");
    const QCommandLineOption timeoutOption("timeout", "Kill the command after <ms> milliseconds.", "ms");
    const QCommandLineOption userOption("user", "Run the command as <name>.", "name");
    const QCommandLineOption fileOption("check-file", "Require <path> to be a readable file.", "path");
    const QCommandLineOption dirOption("check-dir", "Require <path> to be a readable directory.", "path");
    const QCommandLineOption jsonOption("json", "Print the outcome as JSON.");
    parser.addOptions({configOption, timeoutOption, userOption, fileOption, dirOption, jsonOption});
    parser.addPositionalArgument("command", "Program and arguments to run.", "-- program [args...]");
    parser.process(app);

    QTextStream out(stdout);
    QTextStream err(stderr);

    execguard::ExecguardConfig config;
    if (parser.isSet(configOption)) {
        const execguard::ConfigLoadResult loaded = execguard::loadConfig(parser.value(configOption));
        if (!loaded.ok()) {
            err << loaded.status.message << Qt::endl;
            return execguard::exitCodeFor(loaded.status.kind);
        }
        config = loaded.config;
    }
    execguard::applyLoggingRules(config);

    for (const QString& path : parser.values(fileOption)) {
        const execguard::PathValidationResult checked = execguard::sanitizePath(
            path, "UTF-8", execguard::PathConstraints().requireFile().requireReadable().allowWritable().allowExecutable());
        if (!checked.ok()) {
            err << checked.status.message << Qt::endl;
            return finish(config, execguard::exitCodeFor(checked.status.kind));
        }
    }
    for (const QString& path : parser.values(dirOption)) {
        const execguard::PathValidationResult checked = execguard::sanitizePath(
            path, "UTF-8",
            execguard::PathConstraints().requireDirectory().requireReadable().allowWritable().allowExecutable());
        if (!checked.ok()) {
            err << checked.status.message << Qt::endl;
            return finish(config, execguard::exitCodeFor(checked.status.kind));
        }
    }

    const QStringList arguments = parser.positionalArguments();
    if (arguments.isEmpty()) {
        return finish(config, execguard::kExitOk);
    }

    execguard::CommandSpec command;
    command.arguments = arguments;
    if (parser.isSet(timeoutOption)) {
        bool valid = false;
        const qint64 ms = parser.value(timeoutOption).toLongLong(&valid);
        if (!valid || ms < 0) {
            err << "Invalid --timeout value: " << parser.value(timeoutOption) << Qt::endl;
            return finish(config, execguard::kExitUsage);
        }
        command.timeout = std::chrono::milliseconds(ms);
    }
    if (parser.isSet(userOption)) {
        command.runAsUser = parser.value(userOption);
    }

    try {
        const execguard::ProcessExecutor executor(config);
        const execguard::ExecutionOutcome outcome = executor.run(command);
        if (parser.isSet(jsonOption)) {
            out << QJsonDocument(execguard::outcomeToJson(outcome)).toJson(QJsonDocument::Indented);
        }

        if (const auto* success = std::get_if<execguard::ProcessSuccess>(&outcome)) {
            if (!parser.isSet(jsonOption)) {
                out << success->stdoutText;
                err << success->stderrText;
            }
            return finish(config, success->exitCode);
        }
        if (const auto* failed = std::get_if<execguard::ProcessFailed>(&outcome)) {
            if (!parser.isSet(jsonOption)) {
                out << failed->stdoutText;
                err << failed->stderrText;
            }
            return finish(config, failed->crashed ? execguard::kExitSoftware : failed->exitCode);
        }
        err << "Command timed out." << Qt::endl;
        return finish(config, kExitTimedOut);
    } catch (const execguard::ExecutionError& error) {
        err << error.what() << Qt::endl;
        return finish(config, execguard::exitCodeFor(error.kind()));
    }
}
