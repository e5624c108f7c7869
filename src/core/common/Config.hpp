#pragma once

#include <QtCore/QSettings>
#include <QtCore/QStandardPaths>
#include <QtCore/QString>
#include <QtCore/QVariant>
#include <memory>

#include "SecurityConfig.hpp"

namespace AudioGate {

class Config {
public:
    static Config& instance();

    // Native per-user settings store
    void initialize(const QString& organizationName = "AudioGate",
                    const QString& applicationName = "audiogate");
    // Explicit INI file, as passed with --config
    void initializeFromFile(const QString& iniPath);
    bool isInitialized() const;

    QVariant getValue(const QString& key, const QVariant& defaultValue = QVariant()) const;
    void setValue(const QString& key, const QVariant& value);

    QString getString(const QString& key, const QString& defaultValue = QString()) const;
    int getInt(const QString& key, int defaultValue = 0) const;
    bool getBool(const QString& key, bool defaultValue = false) const;

    struct LoggingSettings {
        QString logFile = "audiogate.log";
        QString level = "info";
        bool console = true;
    };

    struct AnalysisSettings {
        QString url;                  // empty disables remote analysis
        QString model = "llama3";
        int timeoutSeconds = 300;
    };

    LoggingSettings getLoggingSettings() const;
    AnalysisSettings getAnalysisSettings() const;

    // Snapshot of the security group; a fresh object on every call
    std::shared_ptr<const SecurityConfig> getSecurityConfig() const;
    void setSecurityConfig(const SecurityConfig& config);

    QString getTempPath() const;
    QString settingsLocation() const;

    void sync();

private:
    Config() = default;
    std::unique_ptr<QSettings> settings_;
};

} // namespace AudioGate
