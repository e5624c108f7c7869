#pragma once

#include <QtCore/QJsonObject>
#include <QtCore/QString>
#include <functional>
#include <memory>

#include "core/common/Expected.hpp"
#include "core/common/SecurityConfig.hpp"
#include "core/media/AudioProbe.hpp"

namespace AudioGate {

enum class ValidationFailure {
    None,
    FileNotFound,
    UnsupportedFormat,
    ContentMismatch,
    TooLarge,
    TooLong,
    ProbeFailed,
    Unreadable
};

struct ValidationResult {
    bool isValid = false;
    ValidationFailure failure = ValidationFailure::None;
    QString reason;
    QString checksum;        // lowercase hex SHA-256, empty unless valid
    QString detectedFormat;  // sniffed container, e.g. "wav"
    double durationSeconds = 0.0;
    qint64 sizeBytes = 0;

    QJsonObject toJson() const;
};

using DurationProbe = std::function<Expected<double, ProbeError>(const QString&)>;

/**
 * @brief Static admission checks on a candidate audio file.
 *
 * Runs on the host, before any sandbox exists. Checks short-circuit in
 * order: extension and sniffed content, size, probed duration, checksum.
 */
class FileValidator {
public:
    explicit FileValidator(std::shared_ptr<const SecurityConfig> config,
                           DurationProbe durationProbe = &AudioProbe::durationSeconds);

    ValidationResult validate(const QString& filePath) const;

    static Expected<QString, ValidationFailure> calculateChecksum(const QString& filePath);
    static Expected<bool, ValidationFailure> verifyChecksum(const QString& filePath,
                                                            const QString& expectedChecksum);

    // Format name from magic bytes, empty when nothing known matches
    static QString sniffFormat(const QByteArray& header);

private:
    static bool contentMatchesExtension(const QString& sniffed, const QString& extension);
    static ValidationResult reject(ValidationFailure failure, const QString& reason);

    std::shared_ptr<const SecurityConfig> config_;
    DurationProbe durationProbe_;
};

} // namespace AudioGate
