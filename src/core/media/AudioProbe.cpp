#include "AudioProbe.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QFileInfo>
#include <memory>

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/avutil.h>
#include <libavutil/error.h>
}

namespace AudioGate {

namespace {

// Bounds header inspection for formats without a global duration field
constexpr int64_t kProbeSize = 5 * 1024 * 1024;
constexpr int64_t kAnalyzeDurationUs = 5 * AV_TIME_BASE;

struct FormatContextCloser {
    void operator()(AVFormatContext* context) const {
        if (context) {
            avformat_close_input(&context);
        }
    }
};

} // namespace

QString toString(ProbeError error) {
    switch (error) {
        case ProbeError::InvalidFile: return QStringLiteral("file cannot be opened as media");
        case ProbeError::UnsupportedFormat: return QStringLiteral("container format not recognised");
        case ProbeError::NoAudioStream: return QStringLiteral("no audio stream present");
        case ProbeError::UnknownDuration: return QStringLiteral("duration not available in metadata");
        case ProbeError::IOError: return QStringLiteral("I/O error while probing");
    }
    return QStringLiteral("unknown probe error");
}

Expected<AVFormatContext*, ProbeError> AudioProbe::openInputFile(const QString& filePath) {
    AVFormatContext* formatContext = nullptr;
    AVDictionary* options = nullptr;
    av_dict_set_int(&options, "probesize", kProbeSize, 0);
    av_dict_set_int(&options, "analyzeduration", kAnalyzeDurationUs, 0);

    int ret = avformat_open_input(&formatContext, filePath.toUtf8().constData(), nullptr, &options);
    av_dict_free(&options);
    if (ret < 0) {
        AUDIOGATE_WARN("AudioProbe: failed to open {} ({})",
                       filePath.toStdString(), avErrorString(ret).toStdString());
        return makeUnexpected(ret == AVERROR_INVALIDDATA ? ProbeError::UnsupportedFormat
                                                         : ProbeError::InvalidFile);
    }

    ret = avformat_find_stream_info(formatContext, nullptr);
    if (ret < 0) {
        avformat_close_input(&formatContext);
        AUDIOGATE_WARN("AudioProbe: failed to read stream info: {}", avErrorString(ret).toStdString());
        return makeUnexpected(ProbeError::IOError);
    }

    return formatContext;
}

Expected<AudioStreamInfo, ProbeError> AudioProbe::probe(const QString& filePath) {
    if (!QFileInfo(filePath).isFile()) {
        return makeUnexpected(ProbeError::InvalidFile);
    }

    auto openResult = openInputFile(filePath);
    if (openResult.hasError()) {
        return makeUnexpected(openResult.error());
    }
    std::unique_ptr<AVFormatContext, FormatContextCloser> formatContext(openResult.value());

    AudioStreamInfo info;
    info.containerFormat = QString::fromUtf8(formatContext->iformat->name);
    info.bitrate = formatContext->bit_rate;

    const AVStream* audioStream = nullptr;
    for (unsigned int i = 0; i < formatContext->nb_streams; ++i) {
        const AVStream* stream = formatContext->streams[i];
        if (stream->codecpar->codec_type == AVMEDIA_TYPE_AUDIO) {
            audioStream = stream;
            break;
        }
    }
    if (!audioStream) {
        return makeUnexpected(ProbeError::NoAudioStream);
    }

    const AVCodecParameters* codecParams = audioStream->codecpar;
    info.codec = QString::fromUtf8(avcodec_get_name(codecParams->codec_id));
    info.sampleRate = codecParams->sample_rate;
    info.channels = codecParams->ch_layout.nb_channels;

    if (formatContext->duration != AV_NOPTS_VALUE && formatContext->duration > 0) {
        info.durationSeconds = static_cast<double>(formatContext->duration) / AV_TIME_BASE;
    } else if (audioStream->duration != AV_NOPTS_VALUE && audioStream->duration > 0) {
        info.durationSeconds = audioStream->duration * av_q2d(audioStream->time_base);
    } else {
        return makeUnexpected(ProbeError::UnknownDuration);
    }

    return info;
}

Expected<double, ProbeError> AudioProbe::durationSeconds(const QString& filePath) {
    auto result = probe(filePath);
    if (result.hasError()) {
        return makeUnexpected(result.error());
    }
    return result.value().durationSeconds;
}

QString AudioProbe::avErrorString(int errorCode) {
    char buffer[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(errorCode, buffer, sizeof(buffer));
    return QString::fromUtf8(buffer);
}

} // namespace AudioGate
