#pragma once

#include <QtCore/QString>

#include "core/common/Expected.hpp"

extern "C" {
    struct AVFormatContext;
}

namespace AudioGate {

enum class ProbeError {
    InvalidFile,
    UnsupportedFormat,
    NoAudioStream,
    UnknownDuration,
    IOError
};

QString toString(ProbeError error);

struct AudioStreamInfo {
    QString containerFormat;
    QString codec;
    double durationSeconds = 0.0;
    int sampleRate = 0;
    int channels = 0;
    qint64 bitrate = 0;
};

/**
 * @brief Reads container and stream headers through libavformat.
 *
 * Only demuxer metadata is inspected; no packet is decoded, so probing a
 * hostile file never runs a codec on the host.
 */
class AudioProbe {
public:
    static Expected<AudioStreamInfo, ProbeError> probe(const QString& filePath);
    static Expected<double, ProbeError> durationSeconds(const QString& filePath);

private:
    static Expected<AVFormatContext*, ProbeError> openInputFile(const QString& filePath);
    static QString avErrorString(int errorCode);
};

} // namespace AudioGate
