#include "SecurityProcessor.hpp"
#include "core/common/Logger.hpp"
#include "core/process/AdmissionController.hpp"
#include "core/process/ProcessManager.hpp"
#include "core/process/ProcessRegistry.hpp"
#include "core/security/PromptInjectionDetector.hpp"
#include "core/security/SandboxManager.hpp"

#include <QtConcurrent/QtConcurrent>
#include <QtCore/QDateTime>
#include <QtCore/QDir>
#include <QtCore/QElapsedTimer>
#include <QtCore/QFileInfo>
#include <QtCore/QFuture>
#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QSet>
#include <QtCore/QThreadPool>
#include <QtCore/QUuid>
#include <atomic>

namespace AudioGate {

QString toString(ProcessingState state) {
    switch (state) {
        case ProcessingState::Received: return "received";
        case ProcessingState::Validated: return "validated";
        case ProcessingState::Admitted: return "admitted";
        case ProcessingState::Sandboxed: return "sandboxed";
        case ProcessingState::Scanned: return "scanned";
        case ProcessingState::Persisted: return "persisted";
        case ProcessingState::Succeeded: return "succeeded";
        case ProcessingState::Rejected: return "rejected";
        case ProcessingState::Failed: return "failed";
    }
    return "unknown";
}

QString toString(ProcessingStatus status) {
    switch (status) {
        case ProcessingStatus::Success: return "success";
        case ProcessingStatus::Rejected: return "rejected";
        case ProcessingStatus::Failed: return "failed";
    }
    return "unknown";
}

QJsonObject SecurityMetadata::toJson() const {
    QJsonObject json;
    json["request_id"] = requestId;
    json["source_file"] = sourceFile;
    json["checksum"] = checksum;
    json["detected_format"] = detectedFormat;
    json["size_bytes"] = sizeBytes;
    json["duration_seconds"] = durationSeconds;
    json["sandbox_kind"] = sandboxKind;
    json["sandbox_id"] = sandboxId;
    json["suspicious_patterns_found"] = QJsonArray::fromStringList(suspiciousPatterns);
    json["injection_score"] = injectionScore;
    json["resource_usage"] = resourceUsage.toJson();
    json["processing_time_seconds"] = processingTimeSeconds;
    json["outcome"] = outcome;
    json["analysis_status"] = analysisStatus;
    json["analysis_response_valid"] = analysisStatus == "valid";
    json["integrity_alert"] = integrityAlert;
    json["created_at"] = createdAt;
    return json;
}

QJsonObject ProcessingResult::toJson() const {
    QJsonObject json;
    json["success"] = success;
    json["message"] = message;
    json["status"] = toString(status);
    if (error) {
        json["error"] = toString(*error);
    }
    if (!detail.isEmpty()) {
        json["detail"] = detail;
    }
    json["warnings"] = QJsonArray::fromStringList(warnings);
    QJsonArray stateList;
    for (ProcessingState state : states) {
        stateList.append(toString(state));
    }
    json["states"] = stateList;
    json["security_issue"] = securityIssue;
    json["processing_time_seconds"] = processingTimeSeconds;
    json["metadata"] = metadata.toJson();
    return json;
}

QJsonObject BatchReport::toJson() const {
    QJsonObject json;
    json["total_files"] = totalFiles;
    json["successful"] = successful;
    json["failed"] = failed;
    json["security_issues"] = securityIssues;
    QJsonArray times;
    for (double seconds : processingTimes) {
        times.append(seconds);
    }
    json["processing_times"] = times;
    json["errors"] = QJsonArray::fromStringList(errors);
    return json;
}

namespace {

GatewayError gatewayErrorFor(ProcessError error) {
    switch (error) {
        case ProcessError::SandboxUnavailable:
        case ProcessError::SandboxFailed:
            return GatewayError::SandboxUnavailable;
        case ProcessError::StagingFailed:
        case ProcessError::LaunchFailed:
            return GatewayError::ProcessCrashed;
    }
    return GatewayError::ProcessCrashed;
}

GatewayError gatewayErrorFor(OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::TimedOut: return GatewayError::TimedOut;
        case OutcomeKind::ResourceExceeded: return GatewayError::ResourceExceeded;
        case OutcomeKind::Crashed:
        case OutcomeKind::Completed:
            break;
    }
    return GatewayError::ProcessCrashed;
}

GatewayError gatewayErrorFor(FetchError error) {
    switch (error) {
        case FetchError::InvalidTarget:
            return GatewayError::ValidationError;
        case FetchError::HostNotAllowed:
        case FetchError::InsecureProtocol:
        case FetchError::AnonymousNotAllowed:
        case FetchError::ChecksumMissing:
        case FetchError::ChecksumMismatch:
            return GatewayError::NetworkPolicyViolation;
        case FetchError::TransferFailed:
        case FetchError::IOError:
            return GatewayError::TransferFailed;
    }
    return GatewayError::TransferFailed;
}

QString outcomeMessage(OutcomeKind kind, const ProcessingOutcome& outcome) {
    switch (kind) {
        case OutcomeKind::TimedOut:
            return QString("Transcription timed out after %1 s").arg(outcome.elapsedMs / 1000.0, 0, 'f', 1);
        case OutcomeKind::ResourceExceeded:
            return QString("Resource limit exceeded (%1)").arg(toString(outcome.usage.breach));
        case OutcomeKind::Crashed:
            return QString("Transcription pipeline failed with exit code %1").arg(outcome.exitCode);
        case OutcomeKind::Completed:
            break;
    }
    return "Transcription completed";
}

} // namespace

class SecurityProcessor::SecurityProcessorPrivate {
public:
    std::shared_ptr<const SecurityConfig> config;

    ProcessRegistry registry;
    std::unique_ptr<ResourceMonitor> monitor;
    std::unique_ptr<SandboxManager> sandboxManager;
    std::unique_ptr<Housekeeper> housekeeper;
    std::unique_ptr<ProcessManager> processManager;
    std::unique_ptr<AdmissionController> admission;

    std::unique_ptr<FileValidator> validator;
    std::unique_ptr<PromptInjectionDetector> detector;
    std::unique_ptr<SecureFTPClient> ftpClient;
    std::unique_ptr<AnalysisClient> analysisClient;
    ResultWriter writer;

    std::atomic<bool> shutDown{false};
};

SecurityProcessor::SecurityProcessor(std::shared_ptr<const SecurityConfig> config,
                                     Dependencies dependencies,
                                     QObject* parent)
    : QObject(parent)
    , d(std::make_unique<SecurityProcessorPrivate>())
{
    d->config = std::move(config);
    const SecurityConfig& cfg = *d->config;

    MonitorLimits limits;
    limits.maxMemoryMb = cfg.maxMemoryMb;
    limits.maxCpuPercent = cfg.maxCpuPercent;
    limits.cpuBreachSamples = cfg.cpuBreachSamples;
    limits.intervalMs = cfg.monitorIntervalMs;
    d->monitor = std::make_unique<ResourceMonitor>(d->registry, limits, cfg.enableResourceMonitoring);

    if (dependencies.sandboxStrategies.empty()) {
        d->sandboxManager = std::make_unique<SandboxManager>(d->config);
    } else {
        d->sandboxManager = std::make_unique<SandboxManager>(d->config, std::move(dependencies.sandboxStrategies));
    }

    d->housekeeper = std::make_unique<Housekeeper>(d->registry, cfg.monitorIntervalMs, cfg.terminationGraceSeconds);
    d->processManager = std::make_unique<ProcessManager>(d->config, *d->sandboxManager, d->registry,
                                                         *d->monitor, d->housekeeper.get());
    d->admission = std::make_unique<AdmissionController>(cfg.maxConcurrentProcesses, cfg.maxQueueDepth);

    d->validator = dependencies.durationProbe
        ? std::make_unique<FileValidator>(d->config, dependencies.durationProbe)
        : std::make_unique<FileValidator>(d->config);
    d->detector = std::make_unique<PromptInjectionDetector>(d->config);
    d->ftpClient = dependencies.fetchTransport
        ? std::make_unique<SecureFTPClient>(d->config, std::move(dependencies.fetchTransport))
        : std::make_unique<SecureFTPClient>(d->config);
    d->analysisClient = std::move(dependencies.analysisClient);

    d->housekeeper->start();
    AUDIOGATE_INFO("SecurityProcessor: ready (concurrency {}, queue depth {}, analysis {})",
                   cfg.maxConcurrentProcesses, cfg.maxQueueDepth,
                   d->analysisClient ? d->analysisClient->name().toStdString() : std::string("disabled"));
}

SecurityProcessor::~SecurityProcessor() {
    shutdown();
}

ProcessingResult SecurityProcessor::processFile(const QString& filePath, const QString& outputBase) {
    return processRequest(filePath, outputBase, QString());
}

ProcessingResult SecurityProcessor::processRequest(const QString& filePath, const QString& outputBase,
                                                   const QString& expectedChecksum) {
    QElapsedTimer timer;
    timer.start();

    ProcessingResult result;
    SecurityMetadata& metadata = result.metadata;
    metadata.requestId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    metadata.sourceFile = QFileInfo(filePath).fileName();
    const std::string tag = metadata.requestId.left(8).toStdString();

    auto enter = [&](ProcessingState state) {
        result.states.append(state);
        AUDIOGATE_DEBUG("[{}] {}", tag, toString(state).toStdString());
        emit stateChanged(metadata.requestId, toString(state));
    };

    auto finish = [&](ProcessingStatus status, std::optional<GatewayError> error, const QString& message,
                      const QJsonObject& detail = QJsonObject()) -> ProcessingResult {
        result.status = status;
        result.success = status == ProcessingStatus::Success;
        result.error = error;
        result.message = message;
        result.detail = detail;
        result.processingTimeSeconds = timer.elapsed() / 1000.0;
        metadata.outcome = toString(status);
        enter(status == ProcessingStatus::Success ? ProcessingState::Succeeded
              : status == ProcessingStatus::Rejected ? ProcessingState::Rejected
                                                     : ProcessingState::Failed);
        if (result.success) {
            AUDIOGATE_INFO("[{}] {} processed in {:.2f} s", tag, metadata.sourceFile.toStdString(),
                           result.processingTimeSeconds);
        } else {
            AUDIOGATE_WARN("[{}] {} {}: {} ({})", tag, metadata.sourceFile.toStdString(),
                           toString(status).toStdString(), message.toStdString(),
                           error ? toString(*error).toStdString() : std::string());
        }
        return result;
    };

    enter(ProcessingState::Received);
    if (d->shutDown) {
        return finish(ProcessingStatus::Rejected, GatewayError::AdmissionRejected, "Processor is shutting down");
    }

    // Validation runs on the host, before any slot or sandbox is taken
    const ValidationResult validation = d->validator->validate(filePath);
    if (!validation.isValid) {
        result.securityIssue = true;
        return finish(ProcessingStatus::Rejected, GatewayError::ValidationError, validation.reason,
                      validation.toJson());
    }
    metadata.checksum = validation.checksum;
    if (!expectedChecksum.isEmpty() && validation.checksum.compare(expectedChecksum, Qt::CaseInsensitive) != 0) {
        // File changed between transfer and validation
        result.securityIssue = true;
        QJsonObject detail;
        detail["expected_checksum"] = expectedChecksum;
        detail["actual_checksum"] = validation.checksum;
        return finish(ProcessingStatus::Rejected, GatewayError::NetworkPolicyViolation,
                      "Checksum changed after transfer", detail);
    }
    metadata.detectedFormat = validation.detectedFormat;
    metadata.sizeBytes = validation.sizeBytes;
    metadata.durationSeconds = validation.durationSeconds;
    enter(ProcessingState::Validated);

    auto slot = d->admission->acquire();
    if (!slot) {
        QJsonObject detail;
        detail["capacity"] = d->admission->capacity();
        detail["max_queue_depth"] = d->admission->maxQueueDepth();
        detail["reason"] = slot.error() == AdmissionError::QueueFull ? "queue_full" : "shutting_down";
        return finish(ProcessingStatus::Rejected, GatewayError::AdmissionRejected,
                      "Admission rejected: no processing slot available", detail);
    }
    enter(ProcessingState::Admitted);

    auto execution = d->processManager->execute(filePath, ExecutionLimits::fromConfig(*d->config));
    if (!execution) {
        QJsonObject detail;
        detail["cause"] = toString(execution.error());
        return finish(ProcessingStatus::Failed, gatewayErrorFor(execution.error()),
                      "Sandboxed execution unavailable: " + toString(execution.error()), detail);
    }
    const ProcessingOutcome& outcome = execution.value();
    metadata.sandboxKind = toString(outcome.sandboxKind);
    metadata.sandboxId = outcome.sandboxId;
    metadata.resourceUsage = outcome.usage;
    enter(ProcessingState::Sandboxed);

    if (!outcome.isCompleted()) {
        // Partial output is discarded with the sandbox
        QJsonObject detail = outcome.toJson();
        if (!outcome.errorOutput.isEmpty()) {
            detail["stderr_tail"] = outcome.errorOutput.right(512);
        }
        return finish(ProcessingStatus::Failed, gatewayErrorFor(outcome.kind),
                      outcomeMessage(outcome.kind, outcome), detail);
    }

    InjectionFinding finding;
    finding.sanitizedText = outcome.output;
    if (d->detector->isEnabled()) {
        finding = d->detector->scan(outcome.output);
    }
    metadata.suspiciousPatterns = finding.matchedPatterns;
    metadata.injectionScore = finding.score;
    if (finding.isSuspicious) {
        result.securityIssue = true;
        result.warnings.append("Prompt injection signatures detected: " + finding.matchedPatterns.join(", "));
    }
    if (d->detector->isEnabled() && d->detector->exceedsThreshold(finding)) {
        QJsonObject detail;
        detail["matched_patterns"] = QJsonArray::fromStringList(finding.matchedPatterns);
        detail["score"] = finding.score;
        detail["threshold"] = d->config->maxSuspiciousPatterns;
        detail["counting_policy"] = toString(d->config->injectionCountingPolicy);
        return finish(ProcessingStatus::Rejected, GatewayError::InjectionThresholdExceeded,
                      QString("Prompt injection threshold exceeded (%1 of %2)")
                          .arg(finding.score).arg(d->config->maxSuspiciousPatterns),
                      detail);
    }
    enter(ProcessingState::Scanned);

    QString analysisArtifact;
    if (!d->analysisClient) {
        QJsonObject skipped;
        skipped["skipped"] = true;
        skipped["reason"] = "no analysis endpoint configured";
        analysisArtifact = QString::fromUtf8(QJsonDocument(skipped).toJson(QJsonDocument::Indented));
        metadata.analysisStatus = "skipped";
    } else {
        auto reply = d->analysisClient->analyze(d->detector->buildAnalysisPrompt(finding.sanitizedText));
        if (!reply) {
            QJsonObject unavailable;
            unavailable["available"] = false;
            unavailable["error"] = toString(reply.error());
            analysisArtifact = QString::fromUtf8(QJsonDocument(unavailable).toJson(QJsonDocument::Indented));
            metadata.analysisStatus = "unavailable";
            result.warnings.append("Analysis unavailable: " + toString(reply.error()));
        } else {
            const ResponseValidation check = d->detector->inspectResponse(reply.value());
            if (check.isValid) {
                analysisArtifact = QString::fromUtf8(QJsonDocument(check.payload).toJson(QJsonDocument::Indented));
                metadata.analysisStatus = "valid";
                metadata.integrityAlert = check.integrityAlert;
                if (check.integrityAlert) {
                    result.securityIssue = true;
                    result.warnings.append("Analysis raised an integrity alert");
                }
            } else {
                QJsonObject invalid;
                invalid["valid"] = false;
                invalid["reason"] = check.reason;
                invalid["raw_response"] = reply.value();
                analysisArtifact = QString::fromUtf8(QJsonDocument(invalid).toJson(QJsonDocument::Indented));
                metadata.analysisStatus = "invalid";
                result.securityIssue = true;
                result.warnings.append("Analysis response rejected: " + check.reason);
            }
        }
    }
    slot->release();

    if (!outputBase.isEmpty()) {
        metadata.processingTimeSeconds = timer.elapsed() / 1000.0;
        metadata.outcome = toString(ProcessingStatus::Success);
        metadata.createdAt = QDateTime::currentDateTimeUtc().toString(Qt::ISODate);
        auto written = d->writer.write(outputBase, finding.sanitizedText, analysisArtifact, metadata.toJson());
        if (!written) {
            QJsonObject detail;
            detail["output_base"] = outputBase;
            detail["cause"] = toString(written.error());
            return finish(ProcessingStatus::Failed, GatewayError::PersistenceFailed,
                          "Results could not be persisted: " + toString(written.error()), detail);
        }
        result.artifacts = written.value();
        enter(ProcessingState::Persisted);
    }

    return finish(ProcessingStatus::Success, std::nullopt, "Processing completed successfully");
}

BatchReport SecurityProcessor::processBatch(const QStringList& filePaths, const QString& outputDir) {
    BatchReport report;
    report.totalFiles = static_cast<int>(filePaths.size());

    QThreadPool pool;
    pool.setMaxThreadCount(d->config->maxConcurrentProcesses);

    QList<QFuture<ProcessingResult>> futures;
    futures.reserve(filePaths.size());
    const QStringList bases = batchOutputBases(filePaths, outputDir);
    for (int i = 0; i < filePaths.size(); ++i) {
        const QString path = filePaths[i];
        const QString base = bases[i];
        futures.append(QtConcurrent::run(&pool, [this, path, base]() { return processFile(path, base); }));
    }

    for (int i = 0; i < futures.size(); ++i) {
        const ProcessingResult result = futures[i].result();
        const QString name = QFileInfo(filePaths[i]).fileName();
        if (result.success) {
            ++report.successful;
            report.processingTimes.append(result.processingTimeSeconds);
        } else {
            ++report.failed;
            report.errors.append(name + ": " + result.message);
        }
        if (result.securityIssue) {
            ++report.securityIssues;
        }
    }

    const HousekeepingReport reaped = cleanupZombieProcesses();
    if (reaped.lingeringGroupsKilled > 0) {
        AUDIOGATE_INFO("SecurityProcessor: reaped {} leftover process groups", reaped.lingeringGroupsKilled);
    }
    AUDIOGATE_INFO("SecurityProcessor: batch finished, {}/{} succeeded, {} with security issues",
                   report.successful, report.totalFiles, report.securityIssues);
    return report;
}

ProcessingResult SecurityProcessor::fetchAndProcess(const FetchTarget& target, const QString& localDir,
                                                    const QString& outputBase) {
    const QString fileName = QFileInfo(target.url.path()).fileName();
    const QString destination = QDir(localDir).filePath(fileName);

    auto fetched = d->ftpClient->fetch(target, destination);
    if (!fetched) {
        ProcessingResult result;
        result.metadata.requestId = QUuid::createUuid().toString(QUuid::WithoutBraces);
        result.metadata.sourceFile = fileName;
        result.metadata.outcome = toString(ProcessingStatus::Rejected);
        result.states = {ProcessingState::Received, ProcessingState::Rejected};
        result.status = ProcessingStatus::Rejected;
        result.error = gatewayErrorFor(fetched.error());
        result.message = "Fetch refused: " + toString(fetched.error());
        result.detail["host"] = target.url.host();
        result.detail["cause"] = toString(fetched.error());
        result.securityIssue = result.error == GatewayError::NetworkPolicyViolation;
        AUDIOGATE_WARN("SecurityProcessor: {}", result.message.toStdString());
        return result;
    }

    ProcessingResult result = processRequest(fetched->localPath, outputBase, fetched->checksum);
    result.detail["fetch"] = fetched->toJson();
    return result;
}

HousekeepingReport SecurityProcessor::cleanupZombieProcesses() {
    return d->processManager->cleanupZombieProcesses();
}

void SecurityProcessor::shutdown() {
    if (d->shutDown.exchange(true)) {
        return;
    }
    d->admission->shutdown();
    d->housekeeper->stop();
    const HousekeepingReport reaped = d->processManager->cleanupZombieProcesses();
    AUDIOGATE_INFO("SecurityProcessor: shut down ({} overdue runs killed, {} groups reaped)",
                   reaped.overdueRunsKilled, reaped.lingeringGroupsKilled);
}

const SecurityConfig& SecurityProcessor::config() const {
    return *d->config;
}

AdmissionController& SecurityProcessor::admission() {
    return *d->admission;
}

SandboxManager& SecurityProcessor::sandboxManager() {
    return *d->sandboxManager;
}

ProcessRegistry& SecurityProcessor::registry() {
    return d->registry;
}

QString SecurityProcessor::outputBaseFor(const QString& filePath, const QString& outputDir) {
    return QDir(outputDir).filePath(QFileInfo(filePath).completeBaseName());
}

QStringList SecurityProcessor::batchOutputBases(const QStringList& filePaths, const QString& outputDir) {
    QStringList natural;
    QSet<QString> taken;
    for (const QString& path : filePaths) {
        natural.append(outputDir.isEmpty() ? QString() : outputBaseFor(path, outputDir));
        taken.insert(natural.last());
    }

    QStringList bases;
    QSet<QString> assigned;
    for (const QString& base : natural) {
        if (base.isEmpty()) {
            bases.append(base);
            continue;
        }
        QString unique = base;
        int suffix = 1;
        while (assigned.contains(unique) || (unique != base && taken.contains(unique))) {
            unique = QString("%1_%2").arg(base).arg(++suffix);
        }
        assigned.insert(unique);
        bases.append(unique);
    }
    return bases;
}

} // namespace AudioGate
