#pragma once

#include <QtCore/QUrl>

#include "AnalysisClient.hpp"

namespace AudioGate {

// Non-streaming JSON-mode completion against an Ollama /api/generate endpoint
class OllamaAnalysisClient : public AnalysisClient {
public:
    OllamaAnalysisClient(QUrl baseUrl, QString model, int timeoutSeconds);

    QString name() const override { return "ollama"; }
    Expected<QString, AnalysisError> analyze(const QString& prompt) override;

    QUrl endpoint() const;

private:
    QUrl baseUrl_;
    QString model_;
    int timeoutSeconds_;
};

} // namespace AudioGate
