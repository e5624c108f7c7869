#include "GatewayError.hpp"

namespace AudioGate {

QString toString(GatewayError error) {
    switch (error) {
        case GatewayError::ValidationError: return QStringLiteral("ValidationError");
        case GatewayError::AdmissionRejected: return QStringLiteral("AdmissionRejected");
        case GatewayError::SandboxUnavailable: return QStringLiteral("SandboxUnavailable");
        case GatewayError::ResourceExceeded: return QStringLiteral("ResourceExceeded");
        case GatewayError::TimedOut: return QStringLiteral("TimedOut");
        case GatewayError::InjectionThresholdExceeded: return QStringLiteral("InjectionThresholdExceeded");
        case GatewayError::NetworkPolicyViolation: return QStringLiteral("NetworkPolicyViolation");
        case GatewayError::ProcessCrashed: return QStringLiteral("ProcessCrashed");
        case GatewayError::TransferFailed: return QStringLiteral("TransferFailed");
        case GatewayError::PersistenceFailed: return QStringLiteral("PersistenceFailed");
    }
    return QStringLiteral("Unknown");
}

QJsonObject ErrorDetail::toJson() const {
    QJsonObject json;
    json["error"] = toString(code);
    json["message"] = message;
    if (!detail.isEmpty()) {
        json["detail"] = detail;
    }
    return json;
}

} // namespace AudioGate
