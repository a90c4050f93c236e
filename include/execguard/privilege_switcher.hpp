#pragma once

#include <QList>
#include <QProcess>
#include <QProcessEnvironment>
#include <QString>

#include <memory>
#include <optional>

namespace execguard {

struct UserIdentity {
    QString name;
    quint32 uid = 0;
    quint32 gid = 0;
    QString home;
    QList<quint32> groups;
};

// HOME, LOGNAME and USER rewritten for user, PWD set to workingDirectory.
QProcessEnvironment buildChildEnvironment(
    const QProcessEnvironment& base,
    const UserIdentity& user,
    const QString& workingDirectory);

// Runs a child process as another OS user. Implementations throw
// ExecutionError; the executor never checks which platform it is on.
class PrivilegeSwitcher {
public:
    virtual ~PrivilegeSwitcher() = default;

    // Arranges for process to take on userName's identity after fork and
    // before exec. Must be called before QProcess::start().
    virtual void configure(QProcess& process, const QString& userName) const = 0;

    static std::shared_ptr<const PrivilegeSwitcher> platformDefault();
};

class UnsupportedPrivilegeSwitcher final : public PrivilegeSwitcher {
public:
    void configure(QProcess& process, const QString& userName) const override;
};

#ifdef Q_OS_UNIX
class PosixPrivilegeSwitcher final : public PrivilegeSwitcher {
public:
    void configure(QProcess& process, const QString& userName) const override;

    // Reads the user database; std::nullopt if there is no such user.
    static std::optional<UserIdentity> lookupUser(const QString& userName);
};
#endif

}  // namespace execguard
