#include "execguard/process_group.hpp"

#ifdef Q_OS_UNIX
#include <cerrno>
#include <csignal>
#include <cstring>
#include <sys/types.h>
#endif

#include "execguard/logging.hpp"

namespace execguard {

void isolateProcessGroup(QProcess& process) {
#ifdef Q_OS_UNIX
    process.setUnixProcessParameters(
        QProcess::UnixProcessFlags(QProcess::UnixProcessFlag::CreateNewSession)
        | QProcess::UnixProcessFlag::ResetSignalHandlers);
#else
    Q_UNUSED(process);
#endif
}

void killProcessGroup(QProcess& process) {
#ifdef Q_OS_UNIX
    const qint64 pid = process.processId();
    if (pid > 0) {
        // The child is its own session leader, so its pid is the group id.
        if (::kill(-static_cast<pid_t>(pid), SIGKILL) != 0 && errno != ESRCH) {
            qCWarning(lcProcess) << "Killing process group" << pid << "failed:" << std::strerror(errno);
        }
    }
#endif
    process.kill();
    process.waitForFinished(-1);
}

}  // namespace execguard
