#pragma once

#include <QString>

#include "execguard/errors.hpp"

namespace execguard {

// A must-flag implies its may-flag; normalize() derives those and rejects contradictions.
struct PathConstraints {
    bool mustBeFile = false;
    bool mayBeFile = false;
    bool mustBeDirectory = false;
    bool mayBeDirectory = false;
    bool mustBeSymlink = false;
    bool mayBeSymlink = false;
    bool mustBeReadable = false;
    bool mayBeReadable = false;
    bool mustBeWritable = false;
    bool mayBeWritable = false;
    bool mustBeExecutable = false;
    bool mayBeExecutable = false;

    PathConstraints& requireFile() { mustBeFile = true; return allowFile(); }
    PathConstraints& allowFile() { mayBeFile = true; return *this; }
    PathConstraints& requireDirectory() { mustBeDirectory = true; return allowDirectory(); }
    PathConstraints& allowDirectory() { mayBeDirectory = true; return *this; }
    PathConstraints& requireSymlink() { mustBeSymlink = true; return allowSymlink(); }
    PathConstraints& allowSymlink() { mayBeSymlink = true; return *this; }
    PathConstraints& requireReadable() { mustBeReadable = true; return allowReadable(); }
    PathConstraints& allowReadable() { mayBeReadable = true; return *this; }
    PathConstraints& requireWritable() { mustBeWritable = true; return allowWritable(); }
    PathConstraints& allowWritable() { mayBeWritable = true; return *this; }
    PathConstraints& requireExecutable() { mustBeExecutable = true; return allowExecutable(); }
    PathConstraints& allowExecutable() { mayBeExecutable = true; return *this; }

    ValidationResult normalize();
};

// Returns the canonical absolute path, or the link itself with mustBeSymlink.
PathValidationResult sanitizePath(
    const QString& path,
    const QString& encoding,
    const PathConstraints& constraints);

// Turns a bare drive letter ("C:") into its root ("C:/" or "C:\") when a
// directory is required. Any other path is returned unchanged.
QString appendDriveRootSeparator(const QString& path, bool mustBeDirectory);

// "./report.tar.gz" -> "report.tar"; directory components are rejected.
PathValidationResult stripFileExtension(const QString& fileBaseName);

}  // namespace execguard
