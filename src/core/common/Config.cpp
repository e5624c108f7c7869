#include "Config.hpp"
#include "Logger.hpp"

#include <QtCore/QDir>
#include <QtCore/QFileInfo>

namespace AudioGate {

Config& Config::instance() {
    static Config instance;
    return instance;
}

void Config::initialize(const QString& organizationName, const QString& applicationName) {
    settings_ = std::make_unique<QSettings>(organizationName, applicationName);
    AUDIOGATE_INFO("Config initialized for {}/{}",
                   organizationName.toStdString(), applicationName.toStdString());
}

void Config::initializeFromFile(const QString& iniPath) {
    if (!QFileInfo::exists(iniPath)) {
        AUDIOGATE_WARN("Config file {} does not exist, defaults apply", iniPath.toStdString());
    }
    settings_ = std::make_unique<QSettings>(iniPath, QSettings::IniFormat);
    if (settings_->status() != QSettings::NoError) {
        AUDIOGATE_ERROR("Config file {} could not be parsed", iniPath.toStdString());
    }
    AUDIOGATE_INFO("Config loaded from {}", iniPath.toStdString());
}

bool Config::isInitialized() const {
    return settings_ != nullptr;
}

QVariant Config::getValue(const QString& key, const QVariant& defaultValue) const {
    if (!settings_) return defaultValue;
    return settings_->value(key, defaultValue);
}

void Config::setValue(const QString& key, const QVariant& value) {
    if (settings_) {
        settings_->setValue(key, value);
    }
}

QString Config::getString(const QString& key, const QString& defaultValue) const {
    return getValue(key, defaultValue).toString();
}

int Config::getInt(const QString& key, int defaultValue) const {
    return getValue(key, defaultValue).toInt();
}

bool Config::getBool(const QString& key, bool defaultValue) const {
    return getValue(key, defaultValue).toBool();
}

Config::LoggingSettings Config::getLoggingSettings() const {
    LoggingSettings settings;
    settings.logFile = getString("logging/file", settings.logFile);
    settings.level = getString("logging/level", settings.level);
    settings.console = getBool("logging/console", settings.console);
    return settings;
}

Config::AnalysisSettings Config::getAnalysisSettings() const {
    AnalysisSettings settings;
    settings.url = getString("analysis/url");
    settings.model = getString("analysis/model", settings.model);
    settings.timeoutSeconds = getInt("security/max_analysis_time_seconds", settings.timeoutSeconds);
    return settings;
}

std::shared_ptr<const SecurityConfig> Config::getSecurityConfig() const {
    if (!settings_) {
        return std::make_shared<const SecurityConfig>();
    }
    return std::make_shared<const SecurityConfig>(SecurityConfig::fromSettings(*settings_));
}

void Config::setSecurityConfig(const SecurityConfig& config) {
    if (settings_) {
        config.writeTo(*settings_);
    }
}

QString Config::getTempPath() const {
    const QString path = QStandardPaths::writableLocation(QStandardPaths::TempLocation) + "/audiogate";
    if (!QDir().mkpath(path)) {
        AUDIOGATE_WARN("Failed to create directory: {}", path.toStdString());
    }
    return path;
}

QString Config::settingsLocation() const {
    return settings_ ? settings_->fileName() : QString();
}

void Config::sync() {
    if (settings_) {
        settings_->sync();
    }
}

} // namespace AudioGate
