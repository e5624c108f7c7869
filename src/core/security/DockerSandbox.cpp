#include "DockerSandbox.hpp"
#include "core/common/Logger.hpp"
#include "platform/linux/ProcFs.hpp"

#include <QtCore/QDir>
#include <QtCore/QMutexLocker>
#include <QtCore/QProcess>
#include <QtCore/QRegularExpression>
#include <QtCore/QUuid>

namespace AudioGate {

namespace {
constexpr int kCliTimeoutMs = 30000;
constexpr int kProbeTimeoutMs = 10000;
}

DockerSandbox::DockerSandbox(QString image, int graceSeconds, QString dockerBinary)
    : image_(std::move(image))
    , graceSeconds_(graceSeconds)
    , dockerBinary_(std::move(dockerBinary))
{
}

bool DockerSandbox::isAvailable() {
    const CliResult result = runCli({"version", "--format", "{{.Server.Version}}"}, kProbeTimeoutMs);
    if (!result.ok) {
        AUDIOGATE_DEBUG("DockerSandbox: daemon not reachable: {}", result.error.trimmed().toStdString());
        return false;
    }
    return !pinImage().isEmpty();
}

QString DockerSandbox::parseImageId(const QByteArray& output) {
    static const QRegularExpression imageId(QStringLiteral("^sha256:[0-9a-f]{64}$"));
    const QString id = QString::fromUtf8(output.trimmed());
    return imageId.match(id).hasMatch() ? id : QString();
}

QString DockerSandbox::pinImage() {
    QMutexLocker locker(&mutex_);
    if (!pinnedImage_.isEmpty()) {
        return pinnedImage_;
    }
    // Only images already on the host; the gateway never pulls
    const CliResult inspected = runCli({"image", "inspect", "--format", "{{.Id}}", image_}, kProbeTimeoutMs);
    pinnedImage_ = inspected.ok ? parseImageId(inspected.output) : QString();
    if (pinnedImage_.isEmpty()) {
        AUDIOGATE_ERROR("DockerSandbox: image {} is not present locally", image_.toStdString());
    } else {
        AUDIOGATE_INFO("DockerSandbox: {} pinned to {}", image_.toStdString(), pinnedImage_.toStdString());
    }
    return pinnedImage_;
}

QString DockerSandbox::pinnedImage() const {
    QMutexLocker locker(&mutex_);
    return pinnedImage_;
}

QStringList DockerSandbox::runArguments(const QString& containerName, const QString& workDir,
                                        const SandboxLimits& limits) const {
    const QString image = pinnedImage();
    const QString memory = QString::number(limits.memoryMb) + "m";
    return {
        "run", "-d",
        "--name", containerName,
        "--network", "none",
        "--memory", memory,
        "--memory-swap", memory,
        "--cpus", QString::number(limits.cpuPercent / 100.0, 'f', 2),
        "--pids-limit", QString::number(limits.maxProcesses),
        "--security-opt", "no-new-privileges",
        "--cap-drop", "ALL",
        "--tmpfs", "/tmp",
        "-v", workDir + ":" + workDir,
        "-w", workDir,
        "--pull", "never",
        image.isEmpty() ? image_ : image,
        "sleep", QString::number(limits.lifetimeSeconds)
    };
}

Expected<SandboxHandle, SandboxError> DockerSandbox::open(const SandboxLimits& limits) {
    if (pinImage().isEmpty()) {
        return makeUnexpected(SandboxError::CreationFailed);
    }

    SandboxHandle handle;
    handle.id = "audiogate_" + QUuid::createUuid().toString(QUuid::Id128).left(12);
    handle.kind = SandboxKind::Container;
    handle.limits = limits;
    handle.workDir = QDir::tempPath() + "/audiogate/" + handle.id;

    QDir workDir;
    if (!workDir.mkpath(handle.workDir)) {
        AUDIOGATE_ERROR("DockerSandbox: cannot create work directory {}", handle.workDir.toStdString());
        return makeUnexpected(SandboxError::CreationFailed);
    }

    const CliResult result = runCli(runArguments(handle.id, handle.workDir, limits), kCliTimeoutMs);
    if (!result.ok) {
        AUDIOGATE_ERROR("DockerSandbox: container start failed: {}", result.error.trimmed().toStdString());
        QDir(handle.workDir).removeRecursively();
        // A half-created container would otherwise keep the name reserved
        const CliResult cleanup = runCli({"rm", "-f", handle.id}, kCliTimeoutMs);
        if (!cleanup.ok) {
            AUDIOGATE_DEBUG("DockerSandbox: no container {} to remove", handle.id.toStdString());
        }
        return makeUnexpected(SandboxError::CreationFailed);
    }

    handle.location = QString::fromUtf8(result.output.trimmed());
    handle.cgroupPath = resolveCgroup(handle.id);
    if (handle.cgroupPath.isEmpty()) {
        AUDIOGATE_INFO("DockerSandbox: cgroup of {} not visible, sampling through docker top",
                       handle.id.toStdString());
    }
    AUDIOGATE_DEBUG("DockerSandbox: container {} running ({})", handle.id.toStdString(),
                    handle.location.left(12).toStdString());
    return handle;
}

Expected<LaunchSpec, SandboxError> DockerSandbox::wrapCommand(const SandboxHandle& handle,
                                                              const QString& program,
                                                              const QStringList& arguments) {
    if (!handle.isValid()) {
        return makeUnexpected(SandboxError::UnknownHandle);
    }

    LaunchSpec spec;
    spec.program = dockerBinary_;
    spec.arguments = QStringList{"exec", "-w", handle.workDir, handle.id, program} + arguments;
    spec.environment = QProcessEnvironment::systemEnvironment();
    return spec;
}

QString DockerSandbox::resolveCgroup(const QString& containerId) const {
    const CliResult inspected = runCli({"inspect", "-f", "{{.State.Pid}}", containerId}, kProbeTimeoutMs);
    bool ok = false;
    const qint64 initPid = inspected.output.trimmed().toLongLong(&ok);
    if (!inspected.ok || !ok || initPid <= 0) {
        return QString();
    }
    return ProcFs::cgroupDirectory(initPid);
}

QList<qint64> DockerSandbox::parseTopPids(const QByteArray& output) {
    QList<qint64> pids;
    for (const QByteArray& line : output.split('\n')) {
        bool ok = false;
        const qint64 pid = line.trimmed().toLongLong(&ok);
        if (ok && pid > 0) {
            pids.append(pid);
        }
    }
    return pids;
}

QList<qint64> DockerSandbox::workloadProcesses(const SandboxHandle& handle, qint64 launcherPid) const {
    if (!handle.cgroupPath.isEmpty()) {
        return Sandbox::workloadProcesses(handle, launcherPid);
    }
    // Exec'd processes descend from the container runtime, not from the docker client
    const CliResult top = runCli({"top", handle.id, "-eo", "pid"}, kProbeTimeoutMs);
    return top.ok ? parseTopPids(top.output) : QList<qint64>();
}

bool DockerSandbox::memoryLimitHit(const SandboxHandle& handle) const {
    if (Sandbox::memoryLimitHit(handle)) {
        return true;
    }
    const CliResult inspected = runCli({"inspect", "-f", "{{.State.OOMKilled}}", handle.id}, kProbeTimeoutMs);
    return inspected.ok && inspected.output.trimmed() == "true";
}

Expected<void, SandboxError> DockerSandbox::close(const SandboxHandle& handle) {
    const CliResult stopped = runCli({"stop", "-t", QString::number(graceSeconds_), handle.id},
                                     (graceSeconds_ * 1000) + kCliTimeoutMs);
    if (!stopped.ok) {
        AUDIOGATE_WARN("DockerSandbox: stop of {} failed, forcing removal", handle.id.toStdString());
    }

    const CliResult removed = runCli({"rm", "-f", handle.id}, kCliTimeoutMs);
    if (!handle.workDir.isEmpty()) {
        QDir(handle.workDir).removeRecursively();
    }

    if (!removed.ok) {
        AUDIOGATE_ERROR("DockerSandbox: removal of {} failed: {}", handle.id.toStdString(),
                        removed.error.trimmed().toStdString());
        return makeUnexpected(SandboxError::TeardownFailed);
    }
    return {};
}

DockerSandbox::CliResult DockerSandbox::runCli(const QStringList& arguments, int timeoutMs) const {
    CliResult result;
    QProcess process;
    process.start(dockerBinary_, arguments);
    if (!process.waitForStarted(kProbeTimeoutMs)) {
        result.error = process.errorString().toUtf8();
        return result;
    }
    if (!process.waitForFinished(timeoutMs)) {
        process.kill();
        process.waitForFinished(kProbeTimeoutMs);
        result.error = "docker " + arguments.value(0).toUtf8() + " timed out";
        return result;
    }
    result.output = process.readAllStandardOutput();
    result.error = process.readAllStandardError();
    result.ok = process.exitStatus() == QProcess::NormalExit && process.exitCode() == 0;
    return result;
}

} // namespace AudioGate
