#include "execguard/process_executor.hpp"

#include <QElapsedTimer>
#include <QJsonArray>
#include <QProcess>

#include <algorithm>
#include <climits>
#include <utility>

#include "execguard/encoding.hpp"
#include "execguard/errors.hpp"
#include "execguard/logging.hpp"
#include "execguard/process_group.hpp"
#include "execguard/telemetry.hpp"

namespace execguard {

namespace {

QString describe(const QStringList& arguments) {
    return "[\"" + arguments.join("\", \"") + "\"]";
}

}  // namespace

QJsonObject outcomeToJson(const ExecutionOutcome& outcome) {
    QJsonObject out;
    if (const auto* success = std::get_if<ProcessSuccess>(&outcome)) {
        out.insert("outcome", "success");
        out.insert("exit_code", success->exitCode);
        out.insert("stdout", success->stdoutText);
        out.insert("stderr", success->stderrText);
    } else if (const auto* timedOut = std::get_if<ProcessTimedOut>(&outcome)) {
        out.insert("outcome", "timed_out");
        out.insert("command", QJsonArray::fromStringList(timedOut->command));
        out.insert("timeout_ms", static_cast<double>(timedOut->timeout.count()));
        out.insert("elapsed_ms", static_cast<double>(timedOut->elapsed.count()));
        out.insert("partial_stdout", timedOut->partialStdout);
        out.insert("partial_stderr", timedOut->partialStderr);
    } else if (const auto* failed = std::get_if<ProcessFailed>(&outcome)) {
        out.insert("outcome", "failed");
        out.insert("exit_code", failed->exitCode);
        out.insert("crashed", failed->crashed);
        out.insert("stdout", failed->stdoutText);
        out.insert("stderr", failed->stderrText);
    }
    return out;
}

ProcessExecutor::ProcessExecutor(
    ExecguardConfig config,
    std::shared_ptr<const PrivilegeSwitcher> switcher,
    const EncodingResolver& resolver)
    : config_(std::move(config)),
      switcher_(std::move(switcher)),
      pipeEncoding_(resolver.resolve(std::nullopt, config_.fallbackEncoding)) {
    if (!isEncodingSupported(pipeEncoding_)) {
        qCWarning(lcEncoding) << "Pipe encoding" << pipeEncoding_ << "is not supported, using UTF-8.";
        pipeEncoding_ = "UTF-8";
    }
    if (!switcher_) {
        switcher_ = PrivilegeSwitcher::platformDefault();
    }
}

ExecutionOutcome ProcessExecutor::run(const CommandSpec& command) const {
    const QStringList& arguments = command.arguments;
    if (arguments.isEmpty() || arguments.first().isEmpty()) {
        throw ExecutionError(ErrorKind::BadParametrization, "Command must name a program to run.");
    }

    std::optional<std::chrono::milliseconds> timeout = command.timeout;
    if (timeout && timeout->count() < 0) {
        throw ExecutionError(
            ErrorKind::BadParametrization,
            QString("Negative timeout for command %1.").arg(describe(arguments)));
    }
    if (!timeout && config_.defaultTimeoutMs > 0) {
        timeout = std::chrono::milliseconds(config_.defaultTimeoutMs);
    }

    if (arguments.contains("-")) {
        qCWarning(lcProcess).noquote()
            << "Command" << describe(arguments) << "has a \"-\" argument, which usually means"
            << "\"read from standard input\". Piping input into the child is not supported;"
            << "it receives no data.";
    }
    if (!timeout && config_.warnOnMissingTimeout) {
        qCWarning(lcProcess).noquote()
            << "No timeout set for command" << describe(arguments)
            << "- a hung child process cannot be detected.";
    }

    QProcess process;
    process.setProgram(arguments.first());
    process.setArguments(arguments.mid(1));
    isolateProcessGroup(process);
    if (command.runAsUser) {
        switcher_->configure(process, *command.runAsUser);
    }

    Telemetry& telemetry = Telemetry::instance();
    QElapsedTimer elapsed;
    elapsed.start();
    telemetry.incrementCounter("commands.count");

    process.start();
    if (!process.waitForStarted(-1)) {
        telemetry.incrementCounter("commands.start_failures");
        telemetry.recordDurationMs("commands.duration_ms", elapsed.elapsed());
        throw ExecutionError(
            ErrorKind::SystemError,
            QString("Failed to start command %1: %2").arg(describe(arguments), process.errorString()));
    }

    const int waitMs = timeout
        ? static_cast<int>(std::min<qint64>(timeout->count(), INT_MAX))
        : -1;
    const bool finished = process.waitForFinished(waitMs);

    if (!finished && process.state() != QProcess::NotRunning) {
        killProcessGroup(process);
        ProcessTimedOut timedOut;
        timedOut.command = arguments;
        timedOut.timeout = *timeout;
        timedOut.elapsed = std::chrono::milliseconds(elapsed.elapsed());
        timedOut.partialStdout = decodeLossy(process.readAllStandardOutput(), pipeEncoding_);
        timedOut.partialStderr = decodeLossy(process.readAllStandardError(), pipeEncoding_);
        telemetry.incrementCounter("commands.timeouts");
        telemetry.recordDurationMs("commands.duration_ms", elapsed.elapsed());
        qCWarning(lcProcess).noquote()
            << "Command" << describe(arguments) << "timed out after" << timeout->count() << "ms.";
        return timedOut;
    }

    const QString stdoutText = decodeLossy(process.readAllStandardOutput(), pipeEncoding_);
    const QString stderrText = decodeLossy(process.readAllStandardError(), pipeEncoding_);
    telemetry.recordDurationMs("commands.duration_ms", elapsed.elapsed());

    if (process.exitStatus() == QProcess::CrashExit) {
        telemetry.incrementCounter("commands.non_zero_exit");
        qCInfo(lcProcess).noquote() << "Command" << describe(arguments) << "was terminated by a signal.";
        return ProcessFailed{-1, true, stdoutText, stderrText};
    }

    const int exitCode = process.exitCode();
    if (exitCode != 0) {
        telemetry.incrementCounter("commands.non_zero_exit");
        qCInfo(lcProcess).noquote() << "Command" << describe(arguments) << "exited with" << exitCode;
        return ProcessFailed{exitCode, false, stdoutText, stderrText};
    }
    return ProcessSuccess{exitCode, stdoutText, stderrText};
}

ExecutionOutcome runCommand(
    const QStringList& arguments,
    std::optional<std::chrono::milliseconds> timeout,
    const std::optional<QString>& runAsUser) {
    const ProcessExecutor executor;
    return executor.run(CommandSpec{arguments, timeout, runAsUser});
}

}  // namespace execguard
