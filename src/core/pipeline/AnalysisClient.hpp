#pragma once

#include <QtCore/QString>

#include "core/common/Expected.hpp"

namespace AudioGate {

enum class AnalysisError {
    NotConfigured,
    ConnectionFailed,
    Timeout,
    HttpError,
    MalformedReply
};

QString toString(AnalysisError error);

/**
 * @brief External model that analyses a sanitized transcript.
 *
 * Receives the complete safe prompt and returns the raw model text; the
 * caller validates it. Implementations must be callable from worker threads.
 */
class AnalysisClient {
public:
    virtual ~AnalysisClient() = default;

    virtual QString name() const = 0;
    virtual Expected<QString, AnalysisError> analyze(const QString& prompt) = 0;
};

} // namespace AudioGate
