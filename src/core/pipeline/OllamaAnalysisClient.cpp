#include "OllamaAnalysisClient.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QEventLoop>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>
#include <QtCore/QTimer>
#include <QtNetwork/QNetworkAccessManager>
#include <QtNetwork/QNetworkReply>
#include <QtNetwork/QNetworkRequest>
#include <memory>

namespace AudioGate {

QString toString(AnalysisError error) {
    switch (error) {
        case AnalysisError::NotConfigured: return "analysis endpoint not configured";
        case AnalysisError::ConnectionFailed: return "analysis endpoint unreachable";
        case AnalysisError::Timeout: return "analysis timed out";
        case AnalysisError::HttpError: return "analysis endpoint returned an error";
        case AnalysisError::MalformedReply: return "analysis reply malformed";
    }
    return "unknown analysis error";
}

OllamaAnalysisClient::OllamaAnalysisClient(QUrl baseUrl, QString model, int timeoutSeconds)
    : baseUrl_(std::move(baseUrl))
    , model_(std::move(model))
    , timeoutSeconds_(timeoutSeconds)
{
}

QUrl OllamaAnalysisClient::endpoint() const {
    QUrl url = baseUrl_;
    QString path = url.path();
    if (path.endsWith('/')) {
        path.chop(1);
    }
    url.setPath(path + "/api/generate");
    return url;
}

Expected<QString, AnalysisError> OllamaAnalysisClient::analyze(const QString& prompt) {
    if (!baseUrl_.isValid() || baseUrl_.host().isEmpty()) {
        return makeUnexpected(AnalysisError::NotConfigured);
    }

    QJsonObject body;
    body["model"] = model_;
    body["prompt"] = prompt;
    body["stream"] = false;
    body["format"] = "json";

    QNetworkRequest request(endpoint());
    request.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::NoLessSafeRedirectPolicy);
    request.setRawHeader("User-Agent", "AudioGate/1.0");

    // One manager per call: callers run on pool threads without a shared event loop
    QNetworkAccessManager manager;
    std::unique_ptr<QNetworkReply> reply(manager.post(request, QJsonDocument(body).toJson(QJsonDocument::Compact)));

    QEventLoop loop;
    QObject::connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);

    QTimer timeoutTimer;
    timeoutTimer.setSingleShot(true);
    QObject::connect(&timeoutTimer, &QTimer::timeout, &loop, &QEventLoop::quit);
    timeoutTimer.start(timeoutSeconds_ * 1000);

    loop.exec();

    if (!reply->isFinished()) {
        reply->abort();
        AUDIOGATE_ERROR("OllamaAnalysisClient: no reply within {} s", timeoutSeconds_);
        return makeUnexpected(AnalysisError::Timeout);
    }

    if (reply->error() != QNetworkReply::NoError) {
        const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        AUDIOGATE_ERROR("OllamaAnalysisClient: request failed (HTTP {}): {}", status,
                        reply->errorString().toStdString());
        return makeUnexpected(status > 0 ? AnalysisError::HttpError : AnalysisError::ConnectionFailed);
    }

    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(reply->readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !document.isObject() ||
        !document.object().value("response").isString()) {
        AUDIOGATE_ERROR("OllamaAnalysisClient: reply without a response field");
        return makeUnexpected(AnalysisError::MalformedReply);
    }

    const QString response = document.object().value("response").toString();
    AUDIOGATE_DEBUG("OllamaAnalysisClient: {} characters from {}", response.size(), model_.toStdString());
    return response;
}

} // namespace AudioGate
