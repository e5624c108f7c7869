#pragma once

#include <QtCore/QJsonObject>
#include <QtCore/QString>
#include <QtCore/QStringList>

#include "Expected.hpp"

class QSettings;

namespace AudioGate {

enum class InjectionCountingPolicy {
    AllDistinct,        // every distinct matched signature counts once
    SeverityWeighted    // distinct signatures weighted by severity (low 1, medium 2, high 3)
};

enum class ConfigError {
    InvalidFileSizeLimit,
    InvalidDurationLimit,
    InvalidConcurrency,
    InvalidTimeout,
    InvalidThreshold,
    InvalidResourceLimit,
    EmptyPipelineCommand,
    EmptyFormatList,
    InvalidDockerImage
};

QString toString(ConfigError error);
QString toString(InjectionCountingPolicy policy);
InjectionCountingPolicy countingPolicyFromString(const QString& name);

/**
 * @brief Immutable snapshot of every gateway limit and toggle.
 *
 * Built once and shared as std::shared_ptr<const SecurityConfig>. A changed
 * configuration means a new snapshot; running requests keep the one they
 * started with.
 */
struct SecurityConfig {
    // File validation
    qint64 maxFileSizeMb = 200;
    double maxAudioDurationHours = 2.0;
    QStringList allowedAudioFormats = {".mp3", ".wav", ".flac", ".m4a", ".aac"};

    // Admission
    int maxConcurrentProcesses = 4;
    int maxQueueDepth = 16; // 0 = unbounded

    // Deadlines
    int maxTranscriptionTimeSeconds = 3600;
    int maxAnalysisTimeSeconds = 300;
    int terminationGraceSeconds = 5;

    // Isolation
    bool useDockerSandbox = true;
    // A tag is resolved to the local image id once and every run uses that id
    QString dockerImage = "python:3.10-slim";
    bool useChroot = false;
    QString chrootPath = "/tmp/audio_sandbox";
    QStringList chrootLibraries = {
        "/lib/x86_64-linux-gnu/libc.so.6",
        "/lib/x86_64-linux-gnu/libm.so.6",
        "/lib64/ld-linux-x86-64.so.2"
    };
    QString pipelineCommand =
        "whisper {input} --model large-v3 --output_format txt --output_dir {output_dir}";

    // Remote retrieval
    QStringList allowedFtpHosts = {"localhost", "127.0.0.1"};
    bool allowPlainFtp = false;
    QString sftpKnownHosts;
    bool requireFileChecksum = true;
    int ftpConnectTimeoutSeconds = 30;
    int ftpTransferTimeoutSeconds = 600;

    // Prompt injection
    bool enablePromptInjectionDetection = true;
    int maxSuspiciousPatterns = 3;
    InjectionCountingPolicy injectionCountingPolicy = InjectionCountingPolicy::AllDistinct;

    // Resource monitoring
    bool enableResourceMonitoring = true;
    int maxMemoryMb = 2048;
    int maxCpuPercent = 80;
    int monitorIntervalMs = 500;
    int cpuBreachSamples = 3;

    qint64 maxFileSizeBytes() const { return maxFileSizeMb * 1024 * 1024; }
    double maxAudioDurationSeconds() const { return maxAudioDurationHours * 3600.0; }

    Expected<void, ConfigError> validate() const;

    // Reads keys from the "security" group, falling back to the defaults above
    static SecurityConfig fromSettings(QSettings& settings);

    // name@sha256:<64 hex digits>
    static bool isDigestPinned(const QString& image);
    // A plain name[:tag] or a digest-pinned reference
    static bool isValidImageReference(const QString& image);
    void writeTo(QSettings& settings) const;

    QJsonObject toJson() const;
};

} // namespace AudioGate
