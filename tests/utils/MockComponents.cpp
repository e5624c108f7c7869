#include "MockComponents.hpp"
#include "platform/linux/ProcFs.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QMutexLocker>
#include <QtCore/QUuid>

#include <signal.h>

namespace AudioGate {
namespace Test {

namespace {
// Starts "$0" "$@" outside the launcher's tree and waits until it is gone
const char* kDetachedLauncher =
    "( setsid \"$0\" \"$@\" & echo $! > .workload_pid ); "
    "pid=$(cat .workload_pid); "
    "while [ -e /proc/$pid ] && ! grep -q ') Z ' /proc/$pid/stat; do sleep 0.1; done";
}

MockSandbox::MockSandbox(std::shared_ptr<SandboxProbe> probe, QString baseDir, SandboxKind kind)
    : probe_(std::move(probe))
    , baseDir_(std::move(baseDir))
    , kind_(kind)
{
}

Expected<SandboxHandle, SandboxError> MockSandbox::open(const SandboxLimits& limits) {
    if (probe_->failOpen.load()) {
        return makeUnexpected(SandboxError::CreationFailed);
    }

    SandboxHandle handle;
    handle.id = "mock_" + QUuid::createUuid().toString(QUuid::Id128).left(12);
    handle.kind = kind_;
    handle.workDir = baseDir_ + "/" + handle.id;
    handle.location = handle.workDir;
    handle.limits = limits;

    if (!QDir().mkpath(handle.workDir)) {
        return makeUnexpected(SandboxError::CreationFailed);
    }
    ++probe_->opened;
    const int nowOpen = probe_->stillOpen();
    int peak = probe_->peakOpen.load();
    while (nowOpen > peak && !probe_->peakOpen.compare_exchange_weak(peak, nowOpen)) {
    }
    return handle;
}

Expected<LaunchSpec, SandboxError> MockSandbox::wrapCommand(const SandboxHandle& handle,
                                                            const QString& program,
                                                            const QStringList& arguments) {
    LaunchSpec spec;
    spec.workingDirectory = handle.workDir;
    if (kind_ == SandboxKind::Container) {
        spec.program = "sh";
        spec.arguments = QStringList{"-c", kDetachedLauncher, program} + arguments;
    } else {
        spec.program = program;
        spec.arguments = arguments;
    }
    return spec;
}

qint64 MockSandbox::readWorkloadPid(const SandboxHandle& handle) const {
    QFile file(handle.workDir + "/" + kWorkloadPidFile);
    if (!file.open(QIODevice::ReadOnly)) {
        return 0;
    }
    return file.readAll().trimmed().toLongLong();
}

QList<qint64> MockSandbox::workloadProcesses(const SandboxHandle& handle, qint64 launcherPid) const {
    if (kind_ != SandboxKind::Container) {
        return Sandbox::workloadProcesses(handle, launcherPid);
    }
    ++probe_->workloadQueries;
    QList<qint64> pids;
    const qint64 workload = readWorkloadPid(handle);
    if (workload <= 0) {
        return pids;
    }
    probe_->workloadPid = workload;
    for (const ProcStat& stat : ProcFs::processTree(workload)) {
        pids.append(stat.pid);
    }
    return pids;
}

bool MockSandbox::memoryLimitHit(const SandboxHandle& handle) const {
    Q_UNUSED(handle)
    return probe_->memoryLimitHit.load();
}

Expected<void, SandboxError> MockSandbox::close(const SandboxHandle& handle) {
    if (kind_ == SandboxKind::Container) {
        const qint64 workload = readWorkloadPid(handle);
        if (workload > 0) {
            ProcFs::signalProcessGroup(workload, SIGKILL);
        }
    }
    ++probe_->closed;
    QDir(handle.workDir).removeRecursively();
    if (probe_->failClose.load()) {
        return makeUnexpected(SandboxError::TeardownFailed);
    }
    return {};
}

MockTransport::MockTransport(std::shared_ptr<TransportProbe> probe)
    : probe_(std::move(probe))
{
}

Expected<qint64, TransferError> MockTransport::download(const TransferRequest& request, QIODevice& sink) {
    ++probe_->calls;

    QFile source(probe_->sourceFile);
    if (!source.open(QIODevice::ReadOnly)) {
        return makeUnexpected(TransferError::RemoteNotFound);
    }
    QByteArray data = source.readAll();
    if (request.maxBytes > 0 && data.size() > request.maxBytes) {
        return makeUnexpected(TransferError::TooLarge);
    }
    if (probe_->corrupt.load() && !data.isEmpty()) {
        data[data.size() - 1] = static_cast<char>(data.at(data.size() - 1) ^ 0x5A);
    }
    if (sink.write(data) != data.size()) {
        return makeUnexpected(TransferError::WriteFailed);
    }
    return static_cast<qint64>(data.size());
}

MockAnalysisClient::MockAnalysisClient(QString reply)
    : reply_(std::move(reply))
{
}

MockAnalysisClient::MockAnalysisClient(AnalysisError error)
    : fails_(true)
    , error_(error)
{
}

Expected<QString, AnalysisError> MockAnalysisClient::analyze(const QString& prompt) {
    {
        QMutexLocker locker(&mutex_);
        lastPrompt_ = prompt;
        ++calls_;
    }
    if (fails_) {
        return makeUnexpected(error_);
    }
    return reply_;
}

QString MockAnalysisClient::lastPrompt() const {
    QMutexLocker locker(&mutex_);
    return lastPrompt_;
}

int MockAnalysisClient::callCount() const {
    QMutexLocker locker(&mutex_);
    return calls_;
}

} // namespace Test
} // namespace AudioGate
