#include <QtCore/QCommandLineParser>
#include <QtCore/QCoreApplication>
#include <QtCore/QDir>
#include <QtCore/QFileInfo>
#include <QtCore/QJsonDocument>
#include <QtCore/QTextStream>
#include <QtCore/QUrl>
#include <curl/curl.h>

#include "core/common/Config.hpp"
#include "core/common/Logger.hpp"
#include "core/pipeline/EnvironmentCheck.hpp"
#include "core/pipeline/OllamaAnalysisClient.hpp"
#include "core/pipeline/SecurityProcessor.hpp"

namespace {

void printJson(const QJsonObject& json) {
    QTextStream out(stdout);
    out << QJsonDocument(json).toJson(QJsonDocument::Indented);
    out.flush();
}

int runGateway(QCommandLineParser& parser) {
    using namespace AudioGate;

    Config& config = Config::instance();
    if (parser.isSet("config")) {
        config.initializeFromFile(parser.value("config"));
    } else {
        config.initialize();
    }

    const Config::LoggingSettings logging = config.getLoggingSettings();
    Logger::instance().initialize(logging.logFile.toStdString(),
                                  Logger::levelFromString(logging.level.toStdString()),
                                  logging.console);
    AUDIOGATE_INFO("AudioGate {} starting, settings from {}",
                   QCoreApplication::applicationVersion().toStdString(),
                   config.settingsLocation().toStdString());

    if (parser.isSet("check-env")) {
        const EnvironmentReport report = EnvironmentCheck::run();
        printJson(report.toJson());
        return report.isReady() ? 0 : 1;
    }

    const std::shared_ptr<const SecurityConfig> security = config.getSecurityConfig();
    auto valid = security->validate();
    if (!valid) {
        AUDIOGATE_CRITICAL("Invalid security configuration: {}", toString(valid.error()).toStdString());
        return 1;
    }

    const QStringList files = parser.positionalArguments();
    if (files.isEmpty() && !parser.isSet("fetch")) {
        AUDIOGATE_ERROR("Nothing to do: pass audio files or --fetch");
        return 1;
    }

    SecurityProcessor::Dependencies dependencies;
    const Config::AnalysisSettings analysis = config.getAnalysisSettings();
    if (!analysis.url.isEmpty()) {
        dependencies.analysisClient = std::make_unique<OllamaAnalysisClient>(
            QUrl(analysis.url), analysis.model, analysis.timeoutSeconds);
    }
    SecurityProcessor processor(security, std::move(dependencies));

    const QString outputDir = parser.value("output-dir");
    bool allSucceeded = true;

    if (parser.isSet("fetch")) {
        FetchTarget target;
        target.url = QUrl(parser.value("fetch"));
        target.username = parser.value("ftp-user");
        target.password = qEnvironmentVariable("AUDIOGATE_FTP_PASSWORD");
        target.expectedSha256 = parser.value("expected-sha256");

        const QString localDir = QDir(config.getTempPath()).filePath("incoming");
        const QString base = outputDir.isEmpty()
            ? QString()
            : SecurityProcessor::outputBaseFor(target.url.path(), outputDir);
        const ProcessingResult result = processor.fetchAndProcess(target, localDir, base);
        printJson(result.toJson());
        allSucceeded = result.success;
    }

    if (files.size() == 1) {
        const QString base = outputDir.isEmpty() ? QString() : SecurityProcessor::outputBaseFor(files.first(), outputDir);
        const ProcessingResult result = processor.processFile(files.first(), base);
        printJson(result.toJson());
        allSucceeded = allSucceeded && result.success;
    } else if (files.size() > 1) {
        const BatchReport report = processor.processBatch(files, outputDir);
        printJson(report.toJson());
        allSucceeded = allSucceeded && report.failed == 0;
    }

    processor.shutdown();
    return allSucceeded ? 0 : 1;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("audiogate");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("AudioGate");

    QCommandLineParser parser;
    parser.setApplicationDescription("Validate, sandbox and transcribe untrusted audio files");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addOptions({
        {"config", "INI file with [security], [analysis] and [logging] groups.", "file"},
        {"output-dir", "Directory for transcript, analysis and security artifacts.", "dir"},
        {"check-env", "Check required tools and scratch space, then exit."},
        {"fetch", "Fetch an sftp:// or ftp:// URL before processing it.", "url"},
        {"expected-sha256", "Expected SHA-256 of the fetched file.", "hex"},
        {"ftp-user", "User name for --fetch; the password is read from AUDIOGATE_FTP_PASSWORD.", "user"}
    });
    parser.addPositionalArgument("files", "Audio files to process.", "[files...]");
    parser.process(app);

    // Before any worker thread exists
    curl_global_init(CURL_GLOBAL_ALL);

    int exitCode = 1;
    try {
        exitCode = runGateway(parser);
    } catch (const std::exception& e) {
        AUDIOGATE_CRITICAL("Fatal error: {}", e.what());
        exitCode = 1;
    }

    curl_global_cleanup();
    AudioGate::Logger::instance().shutdown();
    return exitCode;
}
