#pragma once

#include <QtCore/QJsonObject>
#include <QtCore/QString>

namespace AudioGate {

/**
 * @brief Caller-facing failure taxonomy of the gateway.
 *
 * Component level error enums are mapped onto these values before a result
 * leaves SecurityProcessor. Every value is terminal for the request.
 */
enum class GatewayError {
    ValidationError,
    AdmissionRejected,
    SandboxUnavailable,
    ResourceExceeded,
    TimedOut,
    InjectionThresholdExceeded,
    NetworkPolicyViolation,
    ProcessCrashed,
    TransferFailed,
    PersistenceFailed
};

QString toString(GatewayError error);

struct ErrorDetail {
    GatewayError code = GatewayError::ValidationError;
    QString message;
    QJsonObject detail;

    QJsonObject toJson() const;
};

} // namespace AudioGate
