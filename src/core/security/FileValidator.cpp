#include "FileValidator.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QCryptographicHash>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>

namespace AudioGate {

namespace {

constexpr int kSniffBytes = 64;

// Sniffed format -> extensions it may legitimately carry. An ID3 tag can
// prefix both MPEG audio and ADTS streams.
bool formatAllowsExtension(const QString& format, const QString& extension) {
    if (format == "wav") return extension == ".wav";
    if (format == "flac") return extension == ".flac";
    if (format == "mp3") return extension == ".mp3";
    if (format == "aac") return extension == ".aac";
    if (format == "id3") return extension == ".mp3" || extension == ".aac";
    if (format == "m4a") return extension == ".m4a" || extension == ".mp4";
    if (format == "ogg") return extension == ".ogg" || extension == ".opus";
    return false;
}

} // namespace

QJsonObject ValidationResult::toJson() const {
    QJsonObject json;
    json["is_valid"] = isValid;
    if (!reason.isEmpty()) {
        json["reason"] = reason;
    }
    json["checksum"] = checksum;
    json["detected_format"] = detectedFormat;
    json["duration_seconds"] = durationSeconds;
    json["size_bytes"] = sizeBytes;
    return json;
}

FileValidator::FileValidator(std::shared_ptr<const SecurityConfig> config, DurationProbe durationProbe)
    : config_(std::move(config))
    , durationProbe_(std::move(durationProbe))
{
}

ValidationResult FileValidator::validate(const QString& filePath) const {
    QFileInfo info(filePath);
    if (!info.exists() || !info.isFile()) {
        return reject(ValidationFailure::FileNotFound, QString("File not found: %1").arg(filePath));
    }

    // (a) extension and sniffed content
    const QString extension = "." + info.suffix().toLower();
    if (!config_->allowedAudioFormats.contains(extension)) {
        return reject(ValidationFailure::UnsupportedFormat,
                      QString("Unsupported file format: %1").arg(extension));
    }

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        return reject(ValidationFailure::Unreadable,
                      QString("File cannot be read: %1").arg(file.errorString()));
    }
    const QByteArray header = file.read(kSniffBytes);
    file.close();

    const QString sniffed = sniffFormat(header);
    if (!contentMatchesExtension(sniffed, extension)) {
        return reject(ValidationFailure::ContentMismatch,
                      QString("File content does not match extension %1 (detected: %2)")
                          .arg(extension, sniffed.isEmpty() ? QStringLiteral("unknown") : sniffed));
    }

    // (b) size
    const qint64 sizeBytes = info.size();
    if (sizeBytes > config_->maxFileSizeBytes()) {
        return reject(ValidationFailure::TooLarge,
                      QString("File too large: %1 MB (limit %2 MB)")
                          .arg(sizeBytes / (1024.0 * 1024.0), 0, 'f', 1)
                          .arg(config_->maxFileSizeMb));
    }

    // (c) duration from container metadata
    auto duration = durationProbe_(filePath);
    if (duration.hasError()) {
        return reject(ValidationFailure::ProbeFailed,
                      QString("Unable to determine audio duration: %1").arg(toString(duration.error())));
    }
    if (duration.value() > config_->maxAudioDurationSeconds()) {
        return reject(ValidationFailure::TooLong,
                      QString("Audio too long: %1 h (limit %2 h)")
                          .arg(duration.value() / 3600.0, 0, 'f', 2)
                          .arg(config_->maxAudioDurationHours, 0, 'f', 2));
    }

    // (d) checksum over the full byte stream
    auto checksum = calculateChecksum(filePath);
    if (checksum.hasError()) {
        return reject(checksum.error(), QStringLiteral("Unable to compute file checksum"));
    }

    ValidationResult result;
    result.isValid = true;
    result.checksum = checksum.value();
    result.detectedFormat = sniffed == "id3" ? extension.mid(1) : sniffed;
    result.durationSeconds = duration.value();
    result.sizeBytes = sizeBytes;

    AUDIOGATE_DEBUG("FileValidator: {} passed ({} bytes, {:.1f}s, sha256 {})",
                    filePath.toStdString(), sizeBytes, result.durationSeconds,
                    result.checksum.left(16).toStdString());
    return result;
}

Expected<QString, ValidationFailure> FileValidator::calculateChecksum(const QString& filePath) {
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        return makeUnexpected(ValidationFailure::Unreadable);
    }

    QCryptographicHash hash(QCryptographicHash::Sha256);
    if (!hash.addData(&file)) {
        return makeUnexpected(ValidationFailure::Unreadable);
    }

    return QString::fromLatin1(hash.result().toHex());
}

Expected<bool, ValidationFailure> FileValidator::verifyChecksum(const QString& filePath,
                                                                const QString& expectedChecksum) {
    auto checksum = calculateChecksum(filePath);
    if (checksum.hasError()) {
        return makeUnexpected(checksum.error());
    }
    return checksum.value().compare(expectedChecksum.trimmed(), Qt::CaseInsensitive) == 0;
}

QString FileValidator::sniffFormat(const QByteArray& header) {
    if (header.size() >= 12 && header.startsWith("RIFF") && header.mid(8, 4) == "WAVE") {
        return QStringLiteral("wav");
    }
    if (header.startsWith("fLaC")) {
        return QStringLiteral("flac");
    }
    if (header.startsWith("OggS")) {
        return QStringLiteral("ogg");
    }
    if (header.startsWith("ID3")) {
        return QStringLiteral("id3");
    }
    if (header.size() >= 8 && header.mid(4, 4) == "ftyp") {
        return QStringLiteral("m4a");
    }
    if (header.size() >= 2) {
        const auto b0 = static_cast<unsigned char>(header[0]);
        const auto b1 = static_cast<unsigned char>(header[1]);
        if (b0 == 0xFF && (b1 & 0xF0) == 0xF0 && (b1 & 0x06) == 0x00) {
            return QStringLiteral("aac"); // ADTS: layer bits are always zero
        }
        if (b0 == 0xFF && (b1 & 0xE0) == 0xE0 && (b1 & 0x06) != 0x00) {
            return QStringLiteral("mp3");
        }
    }
    return QString();
}

bool FileValidator::contentMatchesExtension(const QString& sniffed, const QString& extension) {
    return !sniffed.isEmpty() && formatAllowsExtension(sniffed, extension);
}

ValidationResult FileValidator::reject(ValidationFailure failure, const QString& reason) {
    AUDIOGATE_WARN("FileValidator: rejected: {}", reason.toStdString());
    ValidationResult result;
    result.isValid = false;
    result.failure = failure;
    result.reason = reason;
    return result;
}

} // namespace AudioGate
