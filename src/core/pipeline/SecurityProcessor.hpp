#pragma once

#include <QtCore/QJsonObject>
#include <QtCore/QList>
#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <memory>
#include <optional>
#include <vector>

#include "AnalysisClient.hpp"
#include "ResultWriter.hpp"
#include "core/common/GatewayError.hpp"
#include "core/common/SecurityConfig.hpp"
#include "core/process/Housekeeper.hpp"
#include "core/process/ResourceMonitor.hpp"
#include "core/security/FileValidator.hpp"
#include "core/security/Sandbox.hpp"
#include "core/security/SecureFTPClient.hpp"

namespace AudioGate {

class AdmissionController;
class ProcessRegistry;
class SandboxManager;

enum class ProcessingState {
    Received,
    Validated,
    Admitted,
    Sandboxed,
    Scanned,
    Persisted,
    Succeeded,
    Rejected,
    Failed
};

QString toString(ProcessingState state);

enum class ProcessingStatus {
    Success,
    Rejected,
    Failed
};

QString toString(ProcessingStatus status);

struct SecurityMetadata {
    QString requestId;
    QString sourceFile;
    QString checksum;
    QString detectedFormat;
    qint64 sizeBytes = 0;
    double durationSeconds = 0.0;
    QString sandboxKind;
    QString sandboxId;
    QStringList suspiciousPatterns;
    int injectionScore = 0;
    ResourceUsageSummary resourceUsage;
    double processingTimeSeconds = 0.0;
    QString outcome;
    QString analysisStatus;       // valid | invalid | unavailable | skipped
    bool integrityAlert = false;
    QString createdAt;

    QJsonObject toJson() const;
};

struct ProcessingResult {
    bool success = false;
    QString message;
    ProcessingStatus status = ProcessingStatus::Failed;
    std::optional<GatewayError> error;
    QJsonObject detail;
    QStringList warnings;
    QList<ProcessingState> states;
    SecurityMetadata metadata;
    ResultArtifacts artifacts;     // empty unless persisted
    bool securityIssue = false;    // rejected input, injection signatures or untrusted analysis reply
    double processingTimeSeconds = 0.0;

    QJsonObject toJson() const;
};

struct BatchReport {
    int totalFiles = 0;
    int successful = 0;
    int failed = 0;
    int securityIssues = 0;
    QList<double> processingTimes;
    QStringList errors;

    QJsonObject toJson() const;
};

/**
 * @brief Drives one audio file through the whole gateway.
 *
 * Received -> Validated -> Admitted -> Sandboxed -> Scanned -> Persisted ->
 * Succeeded, with Rejected or Failed reachable from every step. Artifacts
 * are written only on success. Collaborators left empty in Dependencies are
 * built from the configuration.
 */
class SecurityProcessor : public QObject {
    Q_OBJECT

public:
    struct Dependencies {
        std::vector<std::unique_ptr<Sandbox>> sandboxStrategies;
        std::unique_ptr<AnalysisClient> analysisClient;
        std::unique_ptr<FetchTransport> fetchTransport;
        DurationProbe durationProbe;
    };

    explicit SecurityProcessor(std::shared_ptr<const SecurityConfig> config,
                               Dependencies dependencies = {},
                               QObject* parent = nullptr);
    ~SecurityProcessor() override;

    ProcessingResult processFile(const QString& filePath, const QString& outputBase = QString());
    BatchReport processBatch(const QStringList& filePaths, const QString& outputDir = QString());
    ProcessingResult fetchAndProcess(const FetchTarget& target, const QString& localDir,
                                     const QString& outputBase = QString());

    HousekeepingReport cleanupZombieProcesses();
    void shutdown();

    const SecurityConfig& config() const;
    AdmissionController& admission();
    SandboxManager& sandboxManager();
    ProcessRegistry& registry();

    // <outputDir>/<file name without its last suffix>
    static QString outputBaseFor(const QString& filePath, const QString& outputDir);
    // One base per file; repeated names get _2, _3, ... without taking another file's base
    static QStringList batchOutputBases(const QStringList& filePaths, const QString& outputDir);

signals:
    void stateChanged(const QString& requestId, const QString& state);

private:
    ProcessingResult processRequest(const QString& filePath, const QString& outputBase,
                                    const QString& expectedChecksum);

    class SecurityProcessorPrivate;
    std::unique_ptr<SecurityProcessorPrivate> d;
};

} // namespace AudioGate
