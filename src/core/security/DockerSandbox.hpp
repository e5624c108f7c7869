#pragma once

#include <QtCore/QMutex>

#include "Sandbox.hpp"

namespace AudioGate {

/**
 * @brief Container isolation through the docker CLI.
 *
 * The configured image is resolved once to its local image id and every
 * container runs from that id, so re-tagging cannot change what runs.
 * open() starts a long-lived idle container with networking disabled, all
 * capabilities dropped and memory, CPU and pid limits applied; commands run
 * through docker exec. The work directory is bind-mounted at the same path
 * so host and container paths coincide. The workload is everything in the
 * container's cgroup, or what docker top reports when that cgroup is not
 * visible from the host.
 */
class DockerSandbox : public Sandbox {
public:
    explicit DockerSandbox(QString image, int graceSeconds = 5, QString dockerBinary = "docker");

    SandboxKind kind() const override { return SandboxKind::Container; }
    QString name() const override { return "docker"; }
    bool isAvailable() override;

    Expected<SandboxHandle, SandboxError> open(const SandboxLimits& limits) override;
    Expected<LaunchSpec, SandboxError> wrapCommand(const SandboxHandle& handle,
                                                   const QString& program,
                                                   const QStringList& arguments) override;
    Expected<void, SandboxError> close(const SandboxHandle& handle) override;

    QList<qint64> workloadProcesses(const SandboxHandle& handle, qint64 launcherPid) const override;
    // Kernel oom_kill in the container cgroup, or State.OOMKilled
    bool memoryLimitHit(const SandboxHandle& handle) const override;

    // Host pids from "docker top <id> -eo pid" output
    static QList<qint64> parseTopPids(const QByteArray& output);
    // "sha256:<64 hex>" from docker image inspect, empty when malformed
    static QString parseImageId(const QByteArray& output);

    // Image id every container runs from, empty until resolved
    QString pinnedImage() const;

    // Arguments of the docker run call that creates the container
    QStringList runArguments(const QString& containerName, const QString& workDir,
                             const SandboxLimits& limits) const;

private:
    struct CliResult {
        bool ok = false;
        QByteArray output;
        QByteArray error;
    };

    CliResult runCli(const QStringList& arguments, int timeoutMs) const;
    QString resolveCgroup(const QString& containerId) const;
    QString pinImage();

    QString image_;
    int graceSeconds_;
    QString dockerBinary_;

    mutable QMutex mutex_;
    QString pinnedImage_;
};

} // namespace AudioGate
