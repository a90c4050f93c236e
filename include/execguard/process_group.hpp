#pragma once

#include <QProcess>

namespace execguard {

// Starts the child in its own session with default signal dispositions so
// that everything it spawns can be killed together.
void isolateProcessGroup(QProcess& process);

// Kills the child's whole process group and reaps the child.
void killProcessGroup(QProcess& process);

}  // namespace execguard
