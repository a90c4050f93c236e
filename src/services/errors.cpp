#include "execguard/errors.hpp"

namespace execguard {

QString errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:
        return "none";
    case ErrorKind::BadParametrization:
        return "bad_parametrization";
    case ErrorKind::EncodingError:
        return "encoding_error";
    case ErrorKind::ForbiddenCharacter:
        return "forbidden_character";
    case ErrorKind::DisallowedCharacter:
        return "disallowed_character";
    case ErrorKind::NotFound:
        return "not_found";
    case ErrorKind::WrongType:
        return "wrong_type";
    case ErrorKind::PermissionMismatch:
        return "permission_mismatch";
    case ErrorKind::UnsupportedPlatform:
        return "unsupported_platform";
    case ErrorKind::SystemError:
        return "system_error";
    }
    return "unknown";
}

int exitCodeFor(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:
        return kExitOk;
    case ErrorKind::UnsupportedPlatform:
    case ErrorKind::SystemError:
        return kExitSoftware;
    default:
        return kExitUsage;
    }
}

ExecutionError::ExecutionError(ErrorKind kind, const QString& message)
    : std::runtime_error(message.toStdString()),
      kind_(kind) {}

}  // namespace execguard
