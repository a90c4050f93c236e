#pragma once

#include <QJsonObject>
#include <QString>
#include <QStringList>

#include <chrono>
#include <memory>
#include <optional>
#include <variant>

#include "execguard/config.hpp"
#include "execguard/encoding_resolver.hpp"
#include "execguard/privilege_switcher.hpp"

namespace execguard {

// An argument vector, never a shell string: arguments[0] is the program.
struct CommandSpec {
    QStringList arguments;
    std::optional<std::chrono::milliseconds> timeout;
    std::optional<QString> runAsUser;
};

struct ProcessSuccess {
    int exitCode = 0;
    QString stdoutText;
    QString stderrText;
};

struct ProcessTimedOut {
    QStringList command;
    std::chrono::milliseconds timeout{0};
    std::chrono::milliseconds elapsed{0};
    QString partialStdout;
    QString partialStderr;
};

struct ProcessFailed {
    int exitCode = -1;
    // Terminated by a signal rather than by exit(); exitCode is -1 then.
    bool crashed = false;
    QString stdoutText;
    QString stderrText;
};

using ExecutionOutcome = std::variant<ProcessSuccess, ProcessTimedOut, ProcessFailed>;

QJsonObject outcomeToJson(const ExecutionOutcome& outcome);

// Runs one command without a shell. Timeouts and non-zero exits are outcomes;
// bad arguments, unknown users and start failures throw ExecutionError.
class ProcessExecutor {
public:
    explicit ProcessExecutor(
        ExecguardConfig config = {},
        std::shared_ptr<const PrivilegeSwitcher> switcher = PrivilegeSwitcher::platformDefault(),
        const EncodingResolver& resolver = EncodingResolver());

    [[nodiscard]] const QString& pipeEncoding() const { return pipeEncoding_; }

    [[nodiscard]] ExecutionOutcome run(const CommandSpec& command) const;

private:
    ExecguardConfig config_;
    std::shared_ptr<const PrivilegeSwitcher> switcher_;
    QString pipeEncoding_;
};

ExecutionOutcome runCommand(
    const QStringList& arguments,
    std::optional<std::chrono::milliseconds> timeout = std::nullopt,
    const std::optional<QString>& runAsUser = std::nullopt);

}  // namespace execguard
