#include "execguard/privilege_switcher.hpp"

#include <QDir>
#include <QFile>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <vector>

#ifdef Q_OS_UNIX
#include <grp.h>
#include <pwd.h>
#include <sys/types.h>
#include <unistd.h>
#endif

#include "execguard/errors.hpp"
#include "execguard/logging.hpp"

namespace execguard {

QProcessEnvironment buildChildEnvironment(
    const QProcessEnvironment& base,
    const UserIdentity& user,
    const QString& workingDirectory) {
    QProcessEnvironment env = base;
    env.insert("HOME", user.home);
    env.insert("LOGNAME", user.name);
    env.insert("USER", user.name);
    env.insert("PWD", workingDirectory);
    return env;
}

std::shared_ptr<const PrivilegeSwitcher> PrivilegeSwitcher::platformDefault() {
#ifdef Q_OS_UNIX
    return std::make_shared<PosixPrivilegeSwitcher>();
#else
    return std::make_shared<UnsupportedPrivilegeSwitcher>();
#endif
}

void UnsupportedPrivilegeSwitcher::configure(QProcess&, const QString& userName) const {
    throw ExecutionError(
        ErrorKind::UnsupportedPlatform,
        QString("Running commands as user \"%1\" requires POSIX user switching, "
                "which this platform does not support.")
            .arg(userName));
}

#ifdef Q_OS_UNIX

std::optional<UserIdentity> PosixPrivilegeSwitcher::lookupUser(const QString& userName) {
    const QByteArray name = userName.toLocal8Bit();
    long hint = ::sysconf(_SC_GETPW_R_SIZE_MAX);
    std::vector<char> buffer(hint > 0 ? static_cast<size_t>(hint) : 16384);

    struct passwd pwd;
    struct passwd* found = nullptr;
    int rc = 0;
    while ((rc = ::getpwnam_r(name.constData(), &pwd, buffer.data(), buffer.size(), &found)) == ERANGE) {
        buffer.resize(buffer.size() * 2);
    }
    if (rc != 0) {
        throw ExecutionError(
            ErrorKind::SystemError,
            QString("User database lookup for \"%1\" failed: %2")
                .arg(userName, QString::fromLocal8Bit(std::strerror(rc))));
    }
    if (found == nullptr) {
        return std::nullopt;
    }

    UserIdentity user;
    user.name = QString::fromLocal8Bit(pwd.pw_name);
    user.uid = pwd.pw_uid;
    user.gid = pwd.pw_gid;
    user.home = QFile::decodeName(pwd.pw_dir);

    int count = 32;
    std::vector<gid_t> groups(static_cast<size_t>(count));
    while (::getgrouplist(pwd.pw_name, pwd.pw_gid, groups.data(), &count) < 0) {
        groups.resize(std::max(static_cast<size_t>(count), groups.size() * 2));
        count = static_cast<int>(groups.size());
    }
    for (int i = 0; i < count; ++i) {
        user.groups.append(groups[static_cast<size_t>(i)]);
    }
    return user;
}

void PosixPrivilegeSwitcher::configure(QProcess& process, const QString& userName) const {
    const std::optional<UserIdentity> user = lookupUser(userName);
    if (!user) {
        throw ExecutionError(
            ErrorKind::NotFound,
            QString("Cannot run command as unknown user \"%1\".").arg(userName));
    }

    QProcessEnvironment base = process.processEnvironment();
    if (base.isEmpty()) {
        base = QProcessEnvironment::systemEnvironment();
    }
    process.setProcessEnvironment(buildChildEnvironment(base, *user, QDir::currentPath()));

    const auto uid = static_cast<uid_t>(user->uid);
    const auto gid = static_cast<gid_t>(user->gid);
    std::vector<gid_t> groups;
    for (const quint32 group : user->groups) {
        groups.push_back(static_cast<gid_t>(group));
    }
    // Only root may replace the supplementary groups.
    const bool replaceGroups = ::geteuid() == 0;

    qCInfo(lcProcess) << "Child will run as" << user->name << "uid" << user->uid << "gid" << user->gid;

    // Runs in the forked child with stdio already redirected and nothing
    // else executed yet. The group must change while we still may change it.
    process.setChildProcessModifier([uid, gid, groups, replaceGroups]() {
        if (replaceGroups && ::setgroups(groups.size(), groups.data()) != 0) {
            QProcess::failChildProcessModifier("setgroups", errno);
        }
        if (::setgid(gid) != 0) {
            QProcess::failChildProcessModifier("setgid", errno);
        }
        if (::setuid(uid) != 0) {
            QProcess::failChildProcessModifier("setuid", errno);
        }
    });
}

#endif

}  // namespace execguard
