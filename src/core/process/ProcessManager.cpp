#include "ProcessManager.hpp"
#include "ProcessRegistry.hpp"
#include "core/common/Logger.hpp"
#include "core/security/SandboxManager.hpp"
#include "platform/linux/ProcFs.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QProcess>
#include <QtCore/QUuid>
#include <optional>

#ifdef Q_OS_LINUX
#include <signal.h>
#endif

namespace AudioGate {

namespace {
constexpr int kStderrTailBytes = 4096;
// Extra container lifetime beyond the run deadline for staging and teardown
constexpr int kLifetimeMarginSeconds = 120;
}

QString toString(ProcessError error) {
    switch (error) {
        case ProcessError::SandboxUnavailable: return "sandbox unavailable";
        case ProcessError::SandboxFailed: return "sandbox could not be created";
        case ProcessError::StagingFailed: return "input could not be staged";
        case ProcessError::LaunchFailed: return "pipeline could not be started";
    }
    return "unknown process error";
}

QString toString(OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::Completed: return "completed";
        case OutcomeKind::TimedOut: return "timed_out";
        case OutcomeKind::ResourceExceeded: return "resource_exceeded";
        case OutcomeKind::Crashed: return "crashed";
    }
    return "unknown";
}

ExecutionLimits ExecutionLimits::fromConfig(const SecurityConfig& config) {
    ExecutionLimits limits;
    limits.memoryMb = config.maxMemoryMb;
    limits.cpuPercent = config.maxCpuPercent;
    limits.deadline = std::chrono::seconds(config.maxTranscriptionTimeSeconds);
    return limits;
}

QJsonObject ProcessingOutcome::toJson() const {
    QJsonObject json;
    json["kind"] = toString(kind);
    json["exit_code"] = exitCode;
    json["elapsed_ms"] = elapsedMs;
    json["sandbox_id"] = sandboxId;
    json["sandbox_kind"] = toString(sandboxKind);
    json["resource_usage"] = usage.toJson();
    return json;
}

ProcessManager::ProcessManager(std::shared_ptr<const SecurityConfig> config,
                               SandboxManager& sandboxManager,
                               ProcessRegistry& registry,
                               ResourceMonitor& monitor,
                               Housekeeper* housekeeper,
                               QObject* parent)
    : QObject(parent)
    , config_(std::move(config))
    , sandboxManager_(sandboxManager)
    , registry_(registry)
    , monitor_(monitor)
    , housekeeper_(housekeeper)
{
    if (!housekeeper_) {
        ownedHousekeeper_ = std::make_unique<Housekeeper>(registry_, config_->monitorIntervalMs,
                                                          config_->terminationGraceSeconds);
        housekeeper_ = ownedHousekeeper_.get();
    }
}

ProcessManager::~ProcessManager() = default;

QStringList ProcessManager::expandCommand(const QString& commandTemplate, const QString& input,
                                          const QString& outputDir) {
    // Substitution happens per token so file names never get re-split
    QStringList tokens = QProcess::splitCommand(commandTemplate);
    for (QString& token : tokens) {
        token.replace("{input}", input);
        token.replace("{output_dir}", outputDir);
    }
    return tokens;
}

Expected<ProcessingOutcome, ProcessError> ProcessManager::execute(const QString& filePath,
                                                                  const ExecutionLimits& limits) {
    SandboxLimits sandboxLimits;
    sandboxLimits.memoryMb = limits.memoryMb;
    sandboxLimits.cpuPercent = limits.cpuPercent;
    sandboxLimits.maxProcesses = limits.maxProcesses;
    sandboxLimits.lifetimeSeconds = static_cast<int>(limits.deadline.count()) +
                                    config_->terminationGraceSeconds + kLifetimeMarginSeconds;

    auto opened = sandboxManager_.open(sandboxLimits);
    if (!opened) {
        return makeUnexpected(opened.error() == SandboxError::Unavailable ? ProcessError::SandboxUnavailable
                                                                          : ProcessError::SandboxFailed);
    }
    SandboxGuard guard(sandboxManager_, opened.value());
    const SandboxHandle& handle = guard.handle();

    // Stage
    const QFileInfo source(filePath);
    const QString stagedPath = handle.workDir + "/" + source.fileName();
    if (!QFile::copy(source.absoluteFilePath(), stagedPath) ||
        !QFile::setPermissions(stagedPath, QFileDevice::ReadOwner | QFileDevice::WriteOwner |
                                           QFileDevice::ReadGroup | QFileDevice::ReadOther)) {
        AUDIOGATE_ERROR("ProcessManager: cannot stage {} into {}", filePath.toStdString(),
                        handle.workDir.toStdString());
        return makeUnexpected(ProcessError::StagingFailed);
    }

    const QStringList command = expandCommand(config_->pipelineCommand,
                                              sandboxManager_.sandboxPath(handle, stagedPath),
                                              sandboxManager_.sandboxPath(handle, handle.workDir));
    if (command.isEmpty()) {
        return makeUnexpected(ProcessError::LaunchFailed);
    }

    const QString runId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    std::optional<ProcessRegistry::Registration> registration;
    MonitorHandle monitorHandle;

    RunHooks hooks;
    hooks.onStarted = [&](qint64 pid) {
        ActiveProcessRecord record;
        record.runId = runId;
        record.pid = pid;
        record.sandboxId = handle.id;
        record.cpuLimitPercent = limits.cpuPercent;
        record.memoryLimitMb = limits.memoryMb;
        record.startTime = std::chrono::steady_clock::now();
        record.deadline = record.startTime + limits.deadline;
        registration.emplace(registry_.registerProcess(record));
        // The launcher may only be a client of the sandbox, sample what the sandbox reports
        const SandboxHandle sandbox = handle;
        monitorHandle = monitor_.start(record, [this, sandbox, pid]() {
            return sandboxManager_.workloadProcesses(sandbox, pid);
        });
        emit runStarted(runId, pid);
    };
    hooks.shouldAbort = [&monitorHandle]() { return monitorHandle.killRequested(); };

    AUDIOGATE_INFO("ProcessManager: run {} for {} in {}", runId.toStdString(),
                   source.fileName().toStdString(), handle.id.toStdString());

    auto run = sandboxManager_.runIn(handle, command.first(), command.mid(1),
                                     std::chrono::duration_cast<std::chrono::milliseconds>(limits.deadline),
                                     hooks);

    ProcessingOutcome outcome;
    outcome.usage = monitor_.stop(monitorHandle);
    outcome.sandboxId = handle.id;
    outcome.sandboxKind = handle.kind;

    if (!run) {
        return makeUnexpected(ProcessError::LaunchFailed);
    }

    const CommandResult& result = run.value();
#ifdef Q_OS_LINUX
    // Stragglers that outlived the leader; the housekeeper retries the rest
    ProcFs::signalProcessGroup(result.pid, SIGKILL);
#endif
    if (registration) {
        registration->release();
    }

    outcome.elapsedMs = result.elapsedMs;
    outcome.exitCode = result.crashed ? -1 : result.exitCode;
    outcome.errorOutput = QString::fromUtf8(result.standardError.right(kStderrTailBytes));

    if (result.termination == TerminationReason::Deadline) {
        outcome.kind = OutcomeKind::TimedOut;
    } else if (result.termination == TerminationReason::Aborted) {
        outcome.kind = OutcomeKind::ResourceExceeded;
    } else if (sandboxManager_.memoryLimitHit(handle)) {
        AUDIOGATE_WARN("ProcessManager: run {} was killed by the sandbox memory limit", runId.toStdString());
        outcome.kind = OutcomeKind::ResourceExceeded;
        outcome.usage.breach = ResourceBreach::Memory;
    } else if (result.outputTruncated) {
        outcome.kind = OutcomeKind::ResourceExceeded;
        outcome.usage.breach = ResourceBreach::Output;
    } else if (result.crashed || result.exitCode != 0) {
        outcome.kind = OutcomeKind::Crashed;
    } else {
        outcome.kind = OutcomeKind::Completed;
        QFile transcript(handle.workDir + "/" + source.completeBaseName() + ".txt");
        if (transcript.exists() && transcript.open(QIODevice::ReadOnly)) {
            outcome.output = QString::fromUtf8(transcript.readAll());
        } else {
            outcome.output = QString::fromUtf8(result.standardOutput);
        }
    }

    AUDIOGATE_INFO("ProcessManager: run {} {} after {} ms (exit {})", runId.toStdString(),
                   toString(outcome.kind).toStdString(), outcome.elapsedMs, outcome.exitCode);
    emit runFinished(runId, outcome.kind);

    auto closed = guard.release();
    if (!closed) {
        AUDIOGATE_ERROR("ProcessManager: sandbox {} teardown failed: {}", handle.id.toStdString(),
                        toString(closed.error()).toStdString());
    }
    return outcome;
}

HousekeepingReport ProcessManager::cleanupZombieProcesses() {
    return housekeeper_->runOnce();
}

} // namespace AudioGate
