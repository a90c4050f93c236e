#pragma once

#include <QString>

#include <stdexcept>

namespace execguard {

enum class ErrorKind {
    None,
    BadParametrization,
    EncodingError,
    ForbiddenCharacter,
    DisallowedCharacter,
    NotFound,
    WrongType,
    PermissionMismatch,
    UnsupportedPlatform,
    SystemError,
};

// sysexits.h values; not every platform ships the header.
constexpr int kExitOk = 0;
constexpr int kExitUsage = 64;
constexpr int kExitSoftware = 70;

QString errorKindName(ErrorKind kind);
int exitCodeFor(ErrorKind kind);

struct ValidationResult {
    ErrorKind kind = ErrorKind::None;
    QString message;

    [[nodiscard]] bool ok() const { return kind == ErrorKind::None; }

    static ValidationResult success() { return {}; }
    static ValidationResult failure(ErrorKind kind, const QString& message) {
        return {kind, message};
    }
};

struct PathValidationResult {
    QString path;
    ValidationResult status;

    [[nodiscard]] bool ok() const { return status.ok(); }
};

// Thrown by the process executor for conditions that are not one of the
// three expected outcomes.
class ExecutionError : public std::runtime_error {
public:
    ExecutionError(ErrorKind kind, const QString& message);

    [[nodiscard]] ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

}  // namespace execguard
