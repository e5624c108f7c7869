#pragma once

#include <QtCore/QJsonObject>
#include <QtCore/QList>
#include <QtCore/QRegularExpression>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <memory>

#include "core/common/SecurityConfig.hpp"

namespace AudioGate {

enum class PatternSeverity {
    Low = 1,
    Medium = 2,
    High = 3
};

struct InjectionSignature {
    QString id;
    QString pattern;
    PatternSeverity severity = PatternSeverity::Medium;
};

struct InjectionFinding {
    bool isSuspicious = false;
    QStringList matchedPatterns;  // signature ids, in first-match order, no duplicates
    QString sanitizedText;
    int score = 0;                // as computed by the configured counting policy
};

struct ResponseValidation {
    bool isValid = false;
    bool integrityAlert = false;
    QString reason;
    QJsonObject payload;
};

/**
 * @brief Pattern based detection of instruction smuggling in transcripts.
 *
 * Matching is case-insensitive and Unicode aware. The default signature set
 * covers Polish and English phrasings of instruction overrides, command
 * execution requests, role reassignment and disclosure of hidden prompts.
 */
class PromptInjectionDetector {
public:
    explicit PromptInjectionDetector(std::shared_ptr<const SecurityConfig> config,
                                     QList<InjectionSignature> signatures = defaultSignatures());

    static QList<InjectionSignature> defaultSignatures();
    static const QString& replacementMarker();

    InjectionFinding scan(const QString& text) const;
    QString sanitize(const QString& text, const InjectionFinding& finding) const;

    // Wraps sanitized text in the fixed analysis preamble
    QString buildAnalysisPrompt(const QString& sanitizedText) const;

    // True when the finding reaches max_suspicious_patterns under the counting policy
    bool exceedsThreshold(const InjectionFinding& finding) const;

    bool validateResponse(const QString& response) const;
    ResponseValidation inspectResponse(const QString& response) const;

    bool isEnabled() const;
    int signatureCount() const;

private:
    struct CompiledSignature {
        InjectionSignature signature;
        QRegularExpression expression;
    };

    int scoreFor(const QStringList& matchedIds) const;

    std::shared_ptr<const SecurityConfig> config_;
    QList<CompiledSignature> signatures_;
    QRegularExpression codeExecutionPattern_;
};

} // namespace AudioGate
