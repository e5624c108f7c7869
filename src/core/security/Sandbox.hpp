#pragma once

#include <QtCore/QJsonObject>
#include <QtCore/QList>
#include <QtCore/QProcessEnvironment>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <functional>

#include "core/common/Expected.hpp"

namespace AudioGate {

enum class SandboxError {
    Unavailable,
    CreationFailed,
    LaunchFailed,
    UnknownHandle,
    TeardownFailed,
    StagingFailed
};

enum class SandboxKind {
    Container,
    Chroot,
    Custom
};

QString toString(SandboxError error);
QString toString(SandboxKind kind);

struct SandboxLimits {
    int memoryMb = 2048;
    int cpuPercent = 80;
    int maxProcesses = 64;
    int lifetimeSeconds = 3600;   // upper bound on how long the context may exist
};

struct SandboxHandle {
    QString id;
    SandboxKind kind = SandboxKind::Custom;
    QString location;   // container id or chroot root
    QString workDir;    // host directory shared with the sandboxed process
    QString cgroupPath; // host cgroup v2 directory holding every sandboxed process, if known
    SandboxLimits limits;

    bool isValid() const { return !id.isEmpty(); }
    QJsonObject toJson() const;
};

// How to start one command so that it runs inside a given sandbox
struct LaunchSpec {
    QString program;
    QStringList arguments;
    QString workingDirectory;
    QProcessEnvironment environment;
    // Runs in the forked child before exec; must only call async-signal-safe functions
    std::function<void()> childSetup;
};

/**
 * @brief One isolation strategy.
 *
 * SandboxManager picks the first available strategy in preference order and
 * routes every open, launch and close through it. Implementations never
 * keep a handle alive after close() returned, whatever its result.
 */
class Sandbox {
public:
    virtual ~Sandbox() = default;

    virtual SandboxKind kind() const = 0;
    virtual QString name() const = 0;
    virtual bool isAvailable() = 0;

    virtual Expected<SandboxHandle, SandboxError> open(const SandboxLimits& limits) = 0;
    virtual Expected<LaunchSpec, SandboxError> wrapCommand(const SandboxHandle& handle,
                                                           const QString& program,
                                                           const QStringList& arguments) = 0;
    virtual Expected<void, SandboxError> close(const SandboxHandle& handle) = 0;

    // Host pids running the workload launched as launcherPid: the members of
    // handle.cgroupPath when set, otherwise the launcher's own process tree
    virtual QList<qint64> workloadProcesses(const SandboxHandle& handle, qint64 launcherPid) const;

    // True once the sandbox killed part of the workload for exceeding its memory limit
    virtual bool memoryLimitHit(const SandboxHandle& handle) const;

    // Path under which the sandboxed process sees a file below handle.workDir
    virtual QString sandboxPath(const SandboxHandle& handle, const QString& hostPath) const {
        Q_UNUSED(handle)
        return hostPath;
    }
};

} // namespace AudioGate
