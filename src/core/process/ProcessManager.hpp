#pragma once

#include <QtCore/QJsonObject>
#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <chrono>
#include <memory>

#include "Housekeeper.hpp"
#include "ResourceMonitor.hpp"
#include "core/common/Expected.hpp"
#include "core/common/SecurityConfig.hpp"
#include "core/security/Sandbox.hpp"

namespace AudioGate {

class SandboxManager;
class ProcessRegistry;

enum class ProcessError {
    SandboxUnavailable,
    SandboxFailed,
    StagingFailed,
    LaunchFailed
};

QString toString(ProcessError error);

enum class OutcomeKind {
    Completed,
    TimedOut,
    ResourceExceeded,
    Crashed
};

QString toString(OutcomeKind kind);

struct ExecutionLimits {
    int memoryMb = 2048;
    int cpuPercent = 80;
    int maxProcesses = 64;
    std::chrono::seconds deadline{3600};

    static ExecutionLimits fromConfig(const SecurityConfig& config);
};

struct ProcessingOutcome {
    OutcomeKind kind = OutcomeKind::Crashed;
    QString output;             // transcript, only for Completed
    int exitCode = -1;
    QString errorOutput;        // tail of the pipeline's stderr
    ResourceUsageSummary usage;
    qint64 elapsedMs = 0;
    QString sandboxId;
    SandboxKind sandboxKind = SandboxKind::Custom;

    bool isCompleted() const { return kind == OutcomeKind::Completed; }
    QJsonObject toJson() const;
};

/**
 * @brief Runs the transcription pipeline for one file inside a sandbox.
 *
 * The sandbox is opened and closed around the run whatever happens in
 * between. While the pipeline runs it is registered with the process
 * registry and sampled by the resource monitor; a breach or the deadline
 * terminates its process group.
 */
class ProcessManager : public QObject {
    Q_OBJECT

public:
    ProcessManager(std::shared_ptr<const SecurityConfig> config,
                   SandboxManager& sandboxManager,
                   ProcessRegistry& registry,
                   ResourceMonitor& monitor,
                   Housekeeper* housekeeper = nullptr,
                   QObject* parent = nullptr);
    ~ProcessManager() override;

    Expected<ProcessingOutcome, ProcessError> execute(const QString& filePath, const ExecutionLimits& limits);

    // One reaper pass over overdue runs and orphaned process groups
    HousekeepingReport cleanupZombieProcesses();

    // Splits the command template and substitutes {input} and {output_dir}
    static QStringList expandCommand(const QString& commandTemplate, const QString& input,
                                     const QString& outputDir);

signals:
    void runStarted(const QString& runId, qint64 pid);
    void runFinished(const QString& runId, OutcomeKind kind);

private:
    std::shared_ptr<const SecurityConfig> config_;
    SandboxManager& sandboxManager_;
    ProcessRegistry& registry_;
    ResourceMonitor& monitor_;
    Housekeeper* housekeeper_;
    std::unique_ptr<Housekeeper> ownedHousekeeper_;
};

} // namespace AudioGate
