#pragma once

#include <QtCore/QHash>
#include <QtCore/QMutex>
#include <memory>

#include "Sandbox.hpp"

namespace AudioGate {

class LinuxCgroup;

/**
 * @brief Filesystem jail fallback for hosts without a container runtime.
 *
 * Each open() builds <base>/<id> holding the configured programs under /bin,
 * the configured shared libraries at their original paths and an empty
 * /work directory. The launched child joins the cgroup v2 leaf when the
 * hierarchy is delegated to us, chroots, drops to nobody with no
 * supplementary groups and runs with RLIMIT_AS. Requires root.
 */
class ChrootSandbox : public Sandbox {
public:
    ChrootSandbox(QString basePath, QStringList libraries, QStringList programs);
    ~ChrootSandbox() override;

    SandboxKind kind() const override { return SandboxKind::Chroot; }
    QString name() const override { return "chroot"; }
    bool isAvailable() override;

    Expected<SandboxHandle, SandboxError> open(const SandboxLimits& limits) override;
    Expected<LaunchSpec, SandboxError> wrapCommand(const SandboxHandle& handle,
                                                   const QString& program,
                                                   const QStringList& arguments) override;
    Expected<void, SandboxError> close(const SandboxHandle& handle) override;

    QString sandboxPath(const SandboxHandle& handle, const QString& hostPath) const override;

    // Clears supplementary groups, then sets gid and uid; async-signal-safe
    static bool dropPrivileges(int uid, int gid);

    static constexpr int kNobodyId = 65534;

private:
    bool populate(const QString& root) const;
    static bool copyInto(const QString& source, const QString& target);

    QString basePath_;
    QStringList libraries_;
    QStringList programs_;

    QMutex mutex_;
    QHash<QString, std::shared_ptr<LinuxCgroup>> cgroups_;
};

} // namespace AudioGate
