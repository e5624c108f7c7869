#include "SandboxManager.hpp"
#include "ChrootSandbox.hpp"
#include "DockerSandbox.hpp"
#include "core/common/Logger.hpp"
#include "platform/linux/ProcFs.hpp"

#include <QtCore/QElapsedTimer>
#include <QtCore/QFile>
#include <QtCore/QMutex>
#include <QtCore/QMutexLocker>
#include <QtCore/QProcess>
#include <QtCore/QThread>
#include <unordered_map>

#ifdef Q_OS_LINUX
#include <signal.h>
#include <unistd.h>
#endif

namespace AudioGate {

namespace {
constexpr int kStartTimeoutMs = 5000;
constexpr int kPollIntervalMs = 100;
constexpr const char* kStdoutCapture = ".audiogate_stdout";
constexpr const char* kStderrCapture = ".audiogate_stderr";

// At most limit bytes from the start of the file, or from its end with fromEnd
QByteArray readCapture(const QString& path, qint64 limit, bool fromEnd, bool* truncated) {
    *truncated = false;
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return QByteArray();
    }
    const qint64 size = file.size();
    if (size > limit) {
        *truncated = true;
        if (fromEnd && !file.seek(size - limit)) {
            return QByteArray();
        }
    }
    return file.read(limit);
}
}

QString toString(SandboxError error) {
    switch (error) {
        case SandboxError::Unavailable: return "no sandbox strategy available";
        case SandboxError::CreationFailed: return "sandbox creation failed";
        case SandboxError::LaunchFailed: return "command could not be started in sandbox";
        case SandboxError::UnknownHandle: return "unknown sandbox handle";
        case SandboxError::TeardownFailed: return "sandbox teardown failed";
        case SandboxError::StagingFailed: return "input could not be staged into sandbox";
    }
    return "unknown sandbox error";
}

QString toString(SandboxKind kind) {
    switch (kind) {
        case SandboxKind::Container: return "container";
        case SandboxKind::Chroot: return "chroot";
        case SandboxKind::Custom: return "custom";
    }
    return "unknown";
}

QString toString(TerminationReason reason) {
    switch (reason) {
        case TerminationReason::None: return "none";
        case TerminationReason::Deadline: return "deadline";
        case TerminationReason::Aborted: return "aborted";
    }
    return "unknown";
}

QJsonObject SandboxHandle::toJson() const {
    QJsonObject json;
    json["id"] = id;
    json["kind"] = toString(kind);
    json["location"] = location;
    json["memory_mb"] = limits.memoryMb;
    json["cpu_percent"] = limits.cpuPercent;
    json["max_processes"] = limits.maxProcesses;
    return json;
}

QList<qint64> Sandbox::workloadProcesses(const SandboxHandle& handle, qint64 launcherPid) const {
    if (!handle.cgroupPath.isEmpty()) {
        return ProcFs::cgroupMembers(handle.cgroupPath);
    }
    QList<qint64> pids;
    for (const ProcStat& stat : ProcFs::processTree(launcherPid)) {
        pids.append(stat.pid);
    }
    return pids;
}

bool Sandbox::memoryLimitHit(const SandboxHandle& handle) const {
    return ProcFs::cgroupOomKills(handle.cgroupPath) > 0;
}

class SandboxManager::SandboxManagerPrivate {
public:
    std::shared_ptr<const SecurityConfig> config;
    std::vector<std::unique_ptr<Sandbox>> strategies;

    struct OpenEntry {
        Sandbox* strategy = nullptr;
        SandboxHandle handle;
    };

    mutable QMutex mutex;
    Sandbox* selected = nullptr;
    std::unordered_map<QString, OpenEntry> openHandles;

    Sandbox* owner(const QString& id) const {
        QMutexLocker locker(&mutex);
        auto it = openHandles.find(id);
        return it == openHandles.end() ? nullptr : it->second.strategy;
    }
};

SandboxManager::SandboxManager(std::shared_ptr<const SecurityConfig> config, QObject* parent)
    : SandboxManager(config, createDefaultStrategies(*config), parent)
{
}

SandboxManager::SandboxManager(std::shared_ptr<const SecurityConfig> config,
                               std::vector<std::unique_ptr<Sandbox>> strategies,
                               QObject* parent)
    : QObject(parent)
    , d(std::make_unique<SandboxManagerPrivate>())
{
    d->config = std::move(config);
    d->strategies = std::move(strategies);
}

SandboxManager::~SandboxManager() {
    QList<SandboxHandle> leftovers;
    {
        QMutexLocker locker(&d->mutex);
        for (const auto& [id, entry] : d->openHandles) {
            leftovers.append(entry.handle);
        }
    }
    for (const SandboxHandle& handle : leftovers) {
        AUDIOGATE_WARN("SandboxManager: closing sandbox {} left open at shutdown", handle.id.toStdString());
        auto result = close(handle);
        if (!result) {
            AUDIOGATE_ERROR("SandboxManager: teardown of {} failed: {}",
                            handle.id.toStdString(), toString(result.error()).toStdString());
        }
    }
}

std::vector<std::unique_ptr<Sandbox>> SandboxManager::createDefaultStrategies(const SecurityConfig& config) {
    std::vector<std::unique_ptr<Sandbox>> strategies;
    if (config.useDockerSandbox) {
        strategies.push_back(std::make_unique<DockerSandbox>(config.dockerImage, config.terminationGraceSeconds));
    }
    if (config.useChroot) {
        const QString program = QProcess::splitCommand(config.pipelineCommand).value(0);
        strategies.push_back(std::make_unique<ChrootSandbox>(config.chrootPath, config.chrootLibraries,
                                                             QStringList{program}));
    }
    return strategies;
}

Sandbox* SandboxManager::selectedStrategy() {
    QMutexLocker locker(&d->mutex);
    if (d->selected) {
        return d->selected;
    }
    for (const auto& strategy : d->strategies) {
        if (strategy->isAvailable()) {
            d->selected = strategy.get();
            AUDIOGATE_INFO("SandboxManager: using {} isolation", strategy->name().toStdString());
            break;
        }
        AUDIOGATE_WARN("SandboxManager: {} isolation unavailable", strategy->name().toStdString());
    }
    return d->selected;
}

bool SandboxManager::isAvailable() {
    return selectedStrategy() != nullptr;
}

Expected<SandboxHandle, SandboxError> SandboxManager::open(const SandboxLimits& limits) {
    Sandbox* strategy = selectedStrategy();
    if (!strategy) {
        AUDIOGATE_ERROR("SandboxManager: no isolation strategy available, refusing to run unsandboxed");
        return makeUnexpected(SandboxError::Unavailable);
    }

    auto handle = strategy->open(limits);
    if (!handle) {
        AUDIOGATE_ERROR("SandboxManager: {} open failed: {}",
                        strategy->name().toStdString(), toString(handle.error()).toStdString());
        return makeUnexpected(handle.error());
    }

    {
        QMutexLocker locker(&d->mutex);
        d->openHandles[handle->id] = {strategy, handle.value()};
    }
    AUDIOGATE_INFO("SandboxManager: opened {} sandbox {}", toString(handle->kind).toStdString(),
                   handle->id.toStdString());
    emit sandboxOpened(handle->id);
    return handle;
}

Expected<CommandResult, SandboxError> SandboxManager::runIn(const SandboxHandle& handle,
                                                            const QString& program,
                                                            const QStringList& arguments,
                                                            std::chrono::milliseconds timeout,
                                                            const RunHooks& hooks) {
    Sandbox* strategy = d->owner(handle.id);
    if (!strategy) {
        return makeUnexpected(SandboxError::UnknownHandle);
    }
    if (handle.workDir.isEmpty()) {
        return makeUnexpected(SandboxError::LaunchFailed);
    }

    auto spec = strategy->wrapCommand(handle, program, arguments);
    if (!spec) {
        return makeUnexpected(spec.error());
    }

    const QString stdoutPath = handle.workDir + "/" + kStdoutCapture;
    const QString stderrPath = handle.workDir + "/" + kStderrCapture;

    QProcess process;
    process.setProgram(spec->program);
    process.setArguments(spec->arguments);
    if (!spec->workingDirectory.isEmpty()) {
        process.setWorkingDirectory(spec->workingDirectory);
    }
    if (!spec->environment.isEmpty()) {
        process.setProcessEnvironment(spec->environment);
    }
    process.setStandardInputFile(QProcess::nullDevice());
    process.setStandardOutputFile(stdoutPath);
    process.setStandardErrorFile(stderrPath);
#ifdef Q_OS_LINUX
    std::function<void()> childSetup = spec->childSetup;
    process.setChildProcessModifier([childSetup]() {
        ::setsid();
        if (childSetup) {
            childSetup();
        }
    });
#endif

    AUDIOGATE_DEBUG("SandboxManager: [{}] {} {}", handle.id.toStdString(), spec->program.toStdString(),
                    spec->arguments.join(' ').toStdString());

    QElapsedTimer timer;
    timer.start();
    process.start();
    if (!process.waitForStarted(kStartTimeoutMs)) {
        AUDIOGATE_ERROR("SandboxManager: failed to start {}: {}", spec->program.toStdString(),
                        process.errorString().toStdString());
        QFile::remove(stdoutPath);
        QFile::remove(stderrPath);
        return makeUnexpected(SandboxError::LaunchFailed);
    }

    CommandResult result;
    result.pid = process.processId();

    try {
        if (hooks.onStarted) {
            hooks.onStarted(result.pid);
        }

        while (!process.waitForFinished(kPollIntervalMs)) {
            if (process.state() == QProcess::NotRunning) {
                break;
            }
            if (timeout.count() > 0 && timer.elapsed() >= timeout.count()) {
                result.termination = TerminationReason::Deadline;
                break;
            }
            if (hooks.shouldAbort && hooks.shouldAbort()) {
                result.termination = TerminationReason::Aborted;
                break;
            }
        }
    } catch (...) {
        AUDIOGATE_ERROR("SandboxManager: [{}] supervision of pid {} threw, killing its group",
                        handle.id.toStdString(), result.pid);
#ifdef Q_OS_LINUX
        ProcFs::signalProcessGroup(result.pid, SIGKILL);
#endif
        process.kill();
        process.waitForFinished(kStartTimeoutMs);
        throw;
    }

    if (result.termination != TerminationReason::None) {
        AUDIOGATE_WARN("SandboxManager: [{}] terminating pid {} ({})", handle.id.toStdString(),
                       result.pid, toString(result.termination).toStdString());
        const auto grace = std::chrono::seconds(d->config->terminationGraceSeconds);
        terminateGroup(result.pid, grace);
        if (!process.waitForFinished(static_cast<int>(
                std::chrono::duration_cast<std::chrono::milliseconds>(grace).count()) + kStartTimeoutMs)) {
            process.kill();
            process.waitForFinished(kStartTimeoutMs);
        }
    }

    result.elapsedMs = timer.elapsed();
    result.standardOutput = readCapture(stdoutPath, kMaxCapturedOutputBytes, false, &result.outputTruncated);
    bool errorTruncated = false;
    result.standardError = readCapture(stderrPath, kMaxCapturedErrorBytes, true, &errorTruncated);
    QFile::remove(stdoutPath);
    QFile::remove(stderrPath);
    result.crashed = process.exitStatus() == QProcess::CrashExit;
    result.exitCode = process.exitCode();

    if (result.outputTruncated) {
        AUDIOGATE_WARN("SandboxManager: [{}] stdout of pid {} exceeded {} bytes, truncated",
                       handle.id.toStdString(), result.pid, kMaxCapturedOutputBytes);
    }
    AUDIOGATE_DEBUG("SandboxManager: [{}] pid {} finished in {} ms (exit {}, crashed {})",
                    handle.id.toStdString(), result.pid, result.elapsedMs, result.exitCode, result.crashed);
    return result;
}

Expected<void, SandboxError> SandboxManager::close(const SandboxHandle& handle) {
    SandboxManagerPrivate::OpenEntry entry;
    {
        QMutexLocker locker(&d->mutex);
        auto it = d->openHandles.find(handle.id);
        if (it == d->openHandles.end()) {
            AUDIOGATE_DEBUG("SandboxManager: sandbox {} already closed", handle.id.toStdString());
            return {};
        }
        entry = it->second;
        d->openHandles.erase(it);
    }

    auto result = entry.strategy->close(entry.handle);
    if (!result) {
        AUDIOGATE_ERROR("SandboxManager: teardown of {} reported {}", handle.id.toStdString(),
                        toString(result.error()).toStdString());
    } else {
        AUDIOGATE_INFO("SandboxManager: closed sandbox {}", handle.id.toStdString());
    }
    emit sandboxClosed(handle.id);
    return result;
}

QString SandboxManager::sandboxPath(const SandboxHandle& handle, const QString& hostPath) const {
    Sandbox* strategy = d->owner(handle.id);
    return strategy ? strategy->sandboxPath(handle, hostPath) : hostPath;
}

QList<qint64> SandboxManager::workloadProcesses(const SandboxHandle& handle, qint64 launcherPid) const {
    Sandbox* strategy = d->owner(handle.id);
    return strategy ? strategy->workloadProcesses(handle, launcherPid) : QList<qint64>();
}

bool SandboxManager::memoryLimitHit(const SandboxHandle& handle) const {
    Sandbox* strategy = d->owner(handle.id);
    return strategy && strategy->memoryLimitHit(handle);
}

int SandboxManager::openCount() const {
    QMutexLocker locker(&d->mutex);
    return static_cast<int>(d->openHandles.size());
}

void SandboxManager::terminateGroup(qint64 pgid, std::chrono::milliseconds grace) {
    if (pgid <= 0) {
        return;
    }
#ifdef Q_OS_LINUX
    ProcFs::signalProcessGroup(pgid, SIGTERM);

    QElapsedTimer timer;
    timer.start();
    while (timer.elapsed() < grace.count()) {
        if (ProcFs::processGroupMembers(pgid).isEmpty()) {
            return;
        }
        QThread::msleep(kPollIntervalMs);
    }
    AUDIOGATE_WARN("SandboxManager: process group {} ignored SIGTERM, sending SIGKILL", pgid);
    ProcFs::signalProcessGroup(pgid, SIGKILL);
#else
    Q_UNUSED(grace)
#endif
}

SandboxGuard::SandboxGuard(SandboxManager& manager, SandboxHandle handle)
    : manager_(manager)
    , handle_(std::move(handle))
{
}

SandboxGuard::~SandboxGuard() {
    if (released_) {
        return;
    }
    auto result = release();
    if (!result) {
        AUDIOGATE_ERROR("SandboxGuard: teardown of {} failed: {}", handle_.id.toStdString(),
                        toString(result.error()).toStdString());
    }
}

Expected<void, SandboxError> SandboxGuard::release() {
    if (released_) {
        return {};
    }
    released_ = true;
    return manager_.close(handle_);
}

} // namespace AudioGate
