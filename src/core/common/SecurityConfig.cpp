#include "SecurityConfig.hpp"
#include "Logger.hpp"

#include <QtCore/QJsonArray>
#include <QtCore/QRegularExpression>
#include <QtCore/QSettings>

namespace AudioGate {

namespace {

QStringList readList(QSettings& settings, const QString& key, const QStringList& fallback) {
    if (!settings.contains(key)) {
        return fallback;
    }
    // INI files deliver "a, b" as a list and "a" as a plain string
    QStringList values = settings.value(key).toStringList();
    QStringList trimmed;
    for (const QString& value : values) {
        const QString item = value.trimmed();
        if (!item.isEmpty()) {
            trimmed << item;
        }
    }
    return trimmed;
}

QStringList normalizeExtensions(const QStringList& formats) {
    QStringList normalized;
    for (QString format : formats) {
        format = format.trimmed().toLower();
        if (format.isEmpty()) {
            continue;
        }
        if (!format.startsWith('.')) {
            format.prepend('.');
        }
        normalized << format;
    }
    return normalized;
}

} // namespace

QString toString(ConfigError error) {
    switch (error) {
        case ConfigError::InvalidFileSizeLimit: return QStringLiteral("max_file_size_mb must be positive");
        case ConfigError::InvalidDurationLimit: return QStringLiteral("max_audio_duration_hours must be positive");
        case ConfigError::InvalidConcurrency: return QStringLiteral("max_concurrent_processes must be at least 1 and max_queue_depth not negative");
        case ConfigError::InvalidTimeout: return QStringLiteral("timeouts must be positive");
        case ConfigError::InvalidThreshold: return QStringLiteral("max_suspicious_patterns must be at least 1");
        case ConfigError::InvalidResourceLimit: return QStringLiteral("resource limits must be positive");
        case ConfigError::EmptyPipelineCommand: return QStringLiteral("pipeline_command must not be empty");
        case ConfigError::EmptyFormatList: return QStringLiteral("allowed_audio_formats must not be empty");
        case ConfigError::InvalidDockerImage: return QStringLiteral("docker_image must be name[:tag] or name@sha256:<digest>");
    }
    return QStringLiteral("unknown configuration error");
}

QString toString(InjectionCountingPolicy policy) {
    return policy == InjectionCountingPolicy::SeverityWeighted ? QStringLiteral("severity")
                                                               : QStringLiteral("all");
}

InjectionCountingPolicy countingPolicyFromString(const QString& name) {
    const QString lowered = name.trimmed().toLower();
    if (lowered == "severity" || lowered == "weighted") {
        return InjectionCountingPolicy::SeverityWeighted;
    }
    if (lowered != "all") {
        AUDIOGATE_WARN("Unknown injection counting policy '{}', using 'all'", name.toStdString());
    }
    return InjectionCountingPolicy::AllDistinct;
}

Expected<void, ConfigError> SecurityConfig::validate() const {
    if (maxFileSizeMb <= 0) {
        return makeUnexpected(ConfigError::InvalidFileSizeLimit);
    }
    if (maxAudioDurationHours <= 0.0) {
        return makeUnexpected(ConfigError::InvalidDurationLimit);
    }
    if (maxConcurrentProcesses < 1 || maxQueueDepth < 0) {
        return makeUnexpected(ConfigError::InvalidConcurrency);
    }
    if (maxTranscriptionTimeSeconds <= 0 || maxAnalysisTimeSeconds <= 0 ||
        terminationGraceSeconds < 0 || ftpConnectTimeoutSeconds <= 0 ||
        ftpTransferTimeoutSeconds <= 0) {
        return makeUnexpected(ConfigError::InvalidTimeout);
    }
    if (maxSuspiciousPatterns < 1) {
        return makeUnexpected(ConfigError::InvalidThreshold);
    }
    if (maxMemoryMb <= 0 || maxCpuPercent <= 0 || monitorIntervalMs <= 0 || cpuBreachSamples < 1) {
        return makeUnexpected(ConfigError::InvalidResourceLimit);
    }
    if (pipelineCommand.trimmed().isEmpty()) {
        return makeUnexpected(ConfigError::EmptyPipelineCommand);
    }
    if (allowedAudioFormats.isEmpty()) {
        return makeUnexpected(ConfigError::EmptyFormatList);
    }
    if (useDockerSandbox && !isValidImageReference(dockerImage)) {
        return makeUnexpected(ConfigError::InvalidDockerImage);
    }
    return {};
}

bool SecurityConfig::isDigestPinned(const QString& image) {
    static const QRegularExpression pinned(QStringLiteral("^[a-z0-9][a-z0-9._/:-]*@sha256:[0-9a-f]{64}$"));
    return pinned.match(image).hasMatch();
}

bool SecurityConfig::isValidImageReference(const QString& image) {
    if (image.contains('@')) {
        return isDigestPinned(image);
    }
    static const QRegularExpression tagged(QStringLiteral("^([a-z0-9.-]+(:[0-9]+)?/)?[a-z0-9][a-z0-9._/-]*(:[A-Za-z0-9_][A-Za-z0-9._-]{0,127})?$"));
    return tagged.match(image).hasMatch();
}

SecurityConfig SecurityConfig::fromSettings(QSettings& settings) {
    SecurityConfig config;

    settings.beginGroup("security");
    config.maxFileSizeMb = settings.value("max_file_size_mb", config.maxFileSizeMb).toLongLong();
    config.maxAudioDurationHours = settings.value("max_audio_duration_hours", config.maxAudioDurationHours).toDouble();
    config.allowedAudioFormats = normalizeExtensions(
        readList(settings, "allowed_audio_formats", config.allowedAudioFormats));

    config.maxConcurrentProcesses = settings.value("max_concurrent_processes", config.maxConcurrentProcesses).toInt();
    config.maxQueueDepth = settings.value("max_queue_depth", config.maxQueueDepth).toInt();

    config.maxTranscriptionTimeSeconds = settings.value("max_transcription_time_seconds", config.maxTranscriptionTimeSeconds).toInt();
    config.maxAnalysisTimeSeconds = settings.value("max_analysis_time_seconds", config.maxAnalysisTimeSeconds).toInt();
    config.terminationGraceSeconds = settings.value("termination_grace_seconds", config.terminationGraceSeconds).toInt();

    config.useDockerSandbox = settings.value("use_docker_sandbox", config.useDockerSandbox).toBool();
    config.dockerImage = settings.value("docker_image", config.dockerImage).toString();
    config.useChroot = settings.value("use_chroot", config.useChroot).toBool();
    config.chrootPath = settings.value("chroot_path", config.chrootPath).toString();
    config.chrootLibraries = readList(settings, "chroot_libraries", config.chrootLibraries);
    config.pipelineCommand = settings.value("pipeline_command", config.pipelineCommand).toString();

    config.allowedFtpHosts = readList(settings, "allowed_ftp_hosts", config.allowedFtpHosts);
    config.allowPlainFtp = settings.value("allow_plain_ftp", config.allowPlainFtp).toBool();
    config.sftpKnownHosts = settings.value("sftp_known_hosts", config.sftpKnownHosts).toString();
    config.requireFileChecksum = settings.value("require_file_checksum", config.requireFileChecksum).toBool();
    config.ftpConnectTimeoutSeconds = settings.value("ftp_connect_timeout_seconds", config.ftpConnectTimeoutSeconds).toInt();
    config.ftpTransferTimeoutSeconds = settings.value("ftp_transfer_timeout_seconds", config.ftpTransferTimeoutSeconds).toInt();

    config.enablePromptInjectionDetection = settings.value("enable_prompt_injection_detection", config.enablePromptInjectionDetection).toBool();
    config.maxSuspiciousPatterns = settings.value("max_suspicious_patterns", config.maxSuspiciousPatterns).toInt();
    config.injectionCountingPolicy = countingPolicyFromString(
        settings.value("injection_counting_policy", toString(config.injectionCountingPolicy)).toString());

    config.enableResourceMonitoring = settings.value("enable_resource_monitoring", config.enableResourceMonitoring).toBool();
    config.maxMemoryMb = settings.value("max_memory_mb", config.maxMemoryMb).toInt();
    config.maxCpuPercent = settings.value("max_cpu_percent", config.maxCpuPercent).toInt();
    config.monitorIntervalMs = settings.value("monitor_interval_ms", config.monitorIntervalMs).toInt();
    config.cpuBreachSamples = settings.value("cpu_breach_samples", config.cpuBreachSamples).toInt();
    settings.endGroup();

    return config;
}

void SecurityConfig::writeTo(QSettings& settings) const {
    settings.beginGroup("security");
    settings.setValue("max_file_size_mb", maxFileSizeMb);
    settings.setValue("max_audio_duration_hours", maxAudioDurationHours);
    settings.setValue("allowed_audio_formats", allowedAudioFormats);
    settings.setValue("max_concurrent_processes", maxConcurrentProcesses);
    settings.setValue("max_queue_depth", maxQueueDepth);
    settings.setValue("max_transcription_time_seconds", maxTranscriptionTimeSeconds);
    settings.setValue("max_analysis_time_seconds", maxAnalysisTimeSeconds);
    settings.setValue("termination_grace_seconds", terminationGraceSeconds);
    settings.setValue("use_docker_sandbox", useDockerSandbox);
    settings.setValue("docker_image", dockerImage);
    settings.setValue("use_chroot", useChroot);
    settings.setValue("chroot_path", chrootPath);
    settings.setValue("chroot_libraries", chrootLibraries);
    settings.setValue("pipeline_command", pipelineCommand);
    settings.setValue("allowed_ftp_hosts", allowedFtpHosts);
    settings.setValue("allow_plain_ftp", allowPlainFtp);
    settings.setValue("sftp_known_hosts", sftpKnownHosts);
    settings.setValue("require_file_checksum", requireFileChecksum);
    settings.setValue("ftp_connect_timeout_seconds", ftpConnectTimeoutSeconds);
    settings.setValue("ftp_transfer_timeout_seconds", ftpTransferTimeoutSeconds);
    settings.setValue("enable_prompt_injection_detection", enablePromptInjectionDetection);
    settings.setValue("max_suspicious_patterns", maxSuspiciousPatterns);
    settings.setValue("injection_counting_policy", toString(injectionCountingPolicy));
    settings.setValue("enable_resource_monitoring", enableResourceMonitoring);
    settings.setValue("max_memory_mb", maxMemoryMb);
    settings.setValue("max_cpu_percent", maxCpuPercent);
    settings.setValue("monitor_interval_ms", monitorIntervalMs);
    settings.setValue("cpu_breach_samples", cpuBreachSamples);
    settings.endGroup();
}

QJsonObject SecurityConfig::toJson() const {
    QJsonObject json;
    json["max_file_size_mb"] = maxFileSizeMb;
    json["max_audio_duration_hours"] = maxAudioDurationHours;
    json["allowed_audio_formats"] = QJsonArray::fromStringList(allowedAudioFormats);
    json["max_concurrent_processes"] = maxConcurrentProcesses;
    json["max_queue_depth"] = maxQueueDepth;
    json["max_transcription_time_seconds"] = maxTranscriptionTimeSeconds;
    json["max_analysis_time_seconds"] = maxAnalysisTimeSeconds;
    json["use_docker_sandbox"] = useDockerSandbox;
    json["docker_image"] = dockerImage;
    json["use_chroot"] = useChroot;
    json["allowed_ftp_hosts"] = QJsonArray::fromStringList(allowedFtpHosts);
    json["allow_plain_ftp"] = allowPlainFtp;
    json["require_file_checksum"] = requireFileChecksum;
    json["enable_prompt_injection_detection"] = enablePromptInjectionDetection;
    json["max_suspicious_patterns"] = maxSuspiciousPatterns;
    json["injection_counting_policy"] = toString(injectionCountingPolicy);
    json["enable_resource_monitoring"] = enableResourceMonitoring;
    json["max_memory_mb"] = maxMemoryMb;
    json["max_cpu_percent"] = maxCpuPercent;
    return json;
}

} // namespace AudioGate
