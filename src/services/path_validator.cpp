#include "execguard/path_validator.hpp"

#include <QDir>
#include <QFileInfo>
#include <QRegularExpression>

#include "execguard/input_sanitizer.hpp"
#include "execguard/logging.hpp"
#include "execguard/telemetry.hpp"

namespace execguard {

namespace {

const char* kCategoryConflict =
    "Wrong parametrization of function. "
    "The item identified by a path can only be enforced to be one single category at a time "
    "out of the following three categories: symlink or directory or file.";

CharacterSet pathWhitelist() {
    // Word characters, name punctuation (including plain space but no other
    // whitespace), both separators, home shorthand and drive colons.
    QString body = R"(\w\. \-_/\\~:)";
    body += QRegularExpression::escape(QString(QDir::separator()));
    return CharacterSet(body);
}

CharacterSet pathBlacklist() {
    // Command separators, quotes, comment and variable sigils, line breaks.
    return CharacterSet(R"(;&'"#!\$%\r\n)");
}

PathValidationResult reject(ErrorKind kind, const QString& message) {
    PathValidationResult result;
    result.status = ValidationResult::failure(kind, message);
    qCInfo(lcPath).noquote() << "Rejected path:" << message;
    Telemetry::instance().recordRejection("path", result.status);
    return result;
}

// sanitizeInput() itself stays free of side effects; its verdict on a path
// is reported here under the input category.
PathValidationResult rejectCharacters(const ValidationResult& status) {
    PathValidationResult result;
    result.status = status;
    qCInfo(lcInput).noquote() << "Rejected input:" << status.message;
    Telemetry::instance().recordRejection("input", status);
    return result;
}

PathValidationResult reject(const ValidationResult& status) {
    return reject(status.kind, status.message);
}

bool isDriveLetter(QChar c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

}  // namespace

ValidationResult PathConstraints::normalize() {
    const int categories = int(mustBeFile) + int(mustBeDirectory) + int(mustBeSymlink);
    if (categories > 1) {
        return ValidationResult::failure(ErrorKind::BadParametrization, kCategoryConflict);
    }

    mayBeFile = mayBeFile || mustBeFile;
    mayBeDirectory = mayBeDirectory || mustBeDirectory;
    mayBeSymlink = mayBeSymlink || mustBeSymlink;
    mayBeReadable = mayBeReadable || mustBeReadable;
    mayBeWritable = mayBeWritable || mustBeWritable;
    mayBeExecutable = mayBeExecutable || mustBeExecutable;

    if (!mayBeFile && !mayBeDirectory && !mayBeSymlink) {
        return ValidationResult::failure(
            ErrorKind::BadParametrization,
            "Wrong parametrization of function. Path must be allowed to be at least one "
            "category out of symlinks, directories or files.");
    }
    return ValidationResult::success();
}

QString appendDriveRootSeparator(const QString& path, bool mustBeDirectory) {
    if (mustBeDirectory && path.size() == 2 && path.at(1) == ':' && isDriveLetter(path.at(0))) {
        return path + QDir::separator();
    }
    return path;
}

PathValidationResult sanitizePath(
    const QString& path,
    const QString& encoding,
    const PathConstraints& constraints) {
    PathConstraints c = constraints;
    const ValidationResult parametrization = c.normalize();
    if (!parametrization.ok()) {
        return reject(parametrization);
    }

    const ValidationResult characters =
        sanitizeInput(path, encoding, pathWhitelist(), pathBlacklist());
    if (!characters.ok()) {
        return rejectCharacters(characters);
    }

    const QString invalidArgument =
        " => your argument in the following line is invalid:\n" + path;

    // stat() may fail on an existing path when an intermediate directory
    // denies search permission; that is reported as not found as well.
    if (path.isEmpty() || !QFileInfo::exists(path)) {
        return reject(
            ErrorKind::NotFound,
            "Path doesn't exist or is not readable or doesn't grant permissions for stat()."
                + invalidArgument);
    }

    // The path as the caller named it: parents resolved, last component kept.
    // The directory part goes to realpath() uncleaned, because ".." after a
    // symlinked directory leaves the link target, not the link's parent.
    const QFileInfo named(path);
    QString linkView;
    const QString lastComponent = named.fileName();
    if (lastComponent.isEmpty() || lastComponent == "." || lastComponent == "..") {
        linkView = named.canonicalFilePath();
    } else {
        const QString parent = QFileInfo(named.path()).canonicalFilePath();
        if (parent.isEmpty()) {
            return reject(
                ErrorKind::NotFound,
                "Parent directories of path could not be resolved." + invalidArgument);
        }
        linkView = QDir(parent).filePath(lastComponent);
    }

    QString resolved;
    if (c.mustBeSymlink) {
        resolved = linkView;
    } else {
        resolved = named.canonicalFilePath();
        if (resolved.isEmpty()) {
            return reject(
                ErrorKind::NotFound,
                "Path doesn't exist or contains a symlink loop or other comparable problems."
                    + invalidArgument);
        }
    }

    const QString rooted = appendDriveRootSeparator(resolved, c.mustBeDirectory);
    if (rooted != resolved) {
        qCWarning(lcPath).noquote()
            << "Path" << resolved << "is a bare drive letter. Some command line interpreters"
            << "resolve it to the last working directory on that drive, so the root"
            << "directory" << rooted << "is used instead.";
        resolved = rooted;
    }

    // A symlink is a symlink, a directory and/or a file at once. Symlink
    // policy is settled first; a required symlink is not judged by the type
    // of its target.
    const bool isSymlink = QFileInfo(linkView).isSymLink();
    if (c.mustBeSymlink && !isSymlink) {
        return reject(ErrorKind::WrongType, "Path must be symlink." + invalidArgument);
    }
    if (!c.mayBeSymlink && isSymlink) {
        return reject(ErrorKind::WrongType, "Path may NOT be symlink." + invalidArgument);
    }

    const QFileInfo target(resolved);
    if (c.mustBeDirectory && !target.isDir()) {
        return reject(ErrorKind::WrongType, "Path must be directory." + invalidArgument);
    }
    if (!c.mustBeSymlink && !c.mayBeDirectory && target.isDir()) {
        return reject(ErrorKind::WrongType, "Path may NOT be directory." + invalidArgument);
    }
    if (c.mustBeFile && !target.isFile()) {
        return reject(ErrorKind::WrongType, "Path must be file." + invalidArgument);
    }
    if (!c.mustBeSymlink && !c.mayBeFile && target.isFile()) {
        return reject(ErrorKind::WrongType, "Path may NOT be file." + invalidArgument);
    }

    struct PermissionRule {
        bool must;
        bool may;
        bool granted;
        const char* name;
    };
    const PermissionRule rules[] = {
        {c.mustBeReadable, c.mayBeReadable, target.isReadable(), "readable"},
        {c.mustBeWritable, c.mayBeWritable, target.isWritable(), "writable"},
        {c.mustBeExecutable, c.mayBeExecutable, target.isExecutable(), "executable"},
    };
    for (const PermissionRule& rule : rules) {
        if (rule.must && !rule.granted) {
            return reject(
                ErrorKind::PermissionMismatch,
                QString("Path must be %1.").arg(rule.name) + invalidArgument);
        }
        if (!rule.may && rule.granted) {
            return reject(
                ErrorKind::PermissionMismatch,
                QString("Path may NOT be %1.").arg(rule.name) + invalidArgument);
        }
    }

    PathValidationResult result;
    result.path = resolved;
    return result;
}

PathValidationResult stripFileExtension(const QString& fileBaseName) {
    QString name = fileBaseName;
    if (name.startsWith("./") || name.startsWith(QString(".") + QDir::separator())) {
        name = name.mid(2);
    }
    if (name.contains('/') || name.contains(QDir::separator())) {
        PathValidationResult result;
        result.status = ValidationResult::failure(
            ErrorKind::BadParametrization,
            QString("The given file base name \"%1\" is invalid because it seems to contain some "
                    "path fragments. It contains the directory separator symbol \"%2\".")
                .arg(name, QString(QDir::separator())));
        return result;
    }

    // Leading dots belong to the name (".bashrc" has no extension).
    int firstNonDot = 0;
    while (firstNonDot < name.size() && name.at(firstNonDot) == '.') {
        ++firstNonDot;
    }
    const int dot = name.lastIndexOf('.');
    PathValidationResult result;
    result.path = dot > firstNonDot ? name.left(dot) : name;
    return result;
}

}  // namespace execguard
