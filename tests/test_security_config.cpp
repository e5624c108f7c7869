#include <QtTest/QtTest>
#include <QtCore/QSettings>

#include "utils/TestUtils.hpp"
#include "core/common/Config.hpp"
#include "core/common/SecurityConfig.hpp"

using namespace AudioGate;
using namespace AudioGate::Test;

class TestSecurityConfig : public QObject {
    Q_OBJECT

private slots:
    void testDefaultsAreValid();
    void testRejectsBrokenLimits();
    void testReadsIniGroup();
    void testExtensionsAreNormalized();
    void testUnknownCountingPolicyFallsBack();
    void testConfigFileSnapshot();
    void testDockerImageReferences();
};

void TestSecurityConfig::testDefaultsAreValid() {
    SecurityConfig config;
    QVERIFY(config.validate().hasValue());
    QCOMPARE(config.maxFileSizeBytes(), qint64(200) * 1024 * 1024);
    QCOMPARE(config.maxAudioDurationSeconds(), 7200.0);
    QVERIFY(config.allowedAudioFormats.contains(".wav"));
    QVERIFY(config.useDockerSandbox);
    QVERIFY(!config.allowPlainFtp);
    QVERIFY(config.requireFileChecksum);
}

void TestSecurityConfig::testRejectsBrokenLimits() {
    SecurityConfig config;
    config.maxConcurrentProcesses = 0;
    ASSERT_EXPECTED_ERROR(config.validate(), ConfigError::InvalidConcurrency);

    config = SecurityConfig();
    config.maxSuspiciousPatterns = 0;
    ASSERT_EXPECTED_ERROR(config.validate(), ConfigError::InvalidThreshold);

    config = SecurityConfig();
    config.pipelineCommand = "   ";
    ASSERT_EXPECTED_ERROR(config.validate(), ConfigError::EmptyPipelineCommand);

    config = SecurityConfig();
    config.maxFileSizeMb = -1;
    ASSERT_EXPECTED_ERROR(config.validate(), ConfigError::InvalidFileSizeLimit);

    config = SecurityConfig();
    config.allowedAudioFormats.clear();
    ASSERT_EXPECTED_ERROR(config.validate(), ConfigError::EmptyFormatList);
}

void TestSecurityConfig::testDockerImageReferences() {
    const QString digest = "sha256:" + QString(64, 'c');

    QVERIFY(SecurityConfig::isDigestPinned("python:3.10-slim@" + digest));
    QVERIFY(SecurityConfig::isDigestPinned("registry.example.com:5000/audio/whisper@" + digest));
    QVERIFY(!SecurityConfig::isDigestPinned("python:3.10-slim"));
    QVERIFY(!SecurityConfig::isDigestPinned("python@sha256:abc"));

    QVERIFY(SecurityConfig::isValidImageReference("python:3.10-slim"));
    QVERIFY(SecurityConfig::isValidImageReference("registry.example.com:5000/audio/whisper:v1"));
    QVERIFY(SecurityConfig::isValidImageReference("python@" + digest));
    QVERIFY(!SecurityConfig::isValidImageReference(""));
    QVERIFY(!SecurityConfig::isValidImageReference("python@sha256:abc"));
    QVERIFY(!SecurityConfig::isValidImageReference("Python:3.10"));
    QVERIFY(!SecurityConfig::isValidImageReference("python; rm -rf /"));

    SecurityConfig config;
    config.dockerImage = "python@sha256:abc";
    ASSERT_EXPECTED_ERROR(config.validate(), ConfigError::InvalidDockerImage);
    config.dockerImage.clear();
    ASSERT_EXPECTED_ERROR(config.validate(), ConfigError::InvalidDockerImage);

    // Only checked when containers are in use
    config.useDockerSandbox = false;
    QVERIFY(config.validate().hasValue());
}

void TestSecurityConfig::testReadsIniGroup() {
    TEST_SCOPE("readsIniGroup");
    const QString iniPath = TestUtils::createTestTextFile(_testScope.getTempDirectory(),
        "[security]\n"
        "max_file_size_mb=50\n"
        "max_concurrent_processes=2\n"
        "use_docker_sandbox=false\n"
        "allowed_ftp_hosts=files.example.org, backup.example.org\n"
        "max_suspicious_patterns=5\n"
        "injection_counting_policy=severity\n",
        "gateway.ini");

    QSettings settings(iniPath, QSettings::IniFormat);
    const SecurityConfig config = SecurityConfig::fromSettings(settings);

    QCOMPARE(config.maxFileSizeMb, qint64(50));
    QCOMPARE(config.maxConcurrentProcesses, 2);
    QVERIFY(!config.useDockerSandbox);
    QCOMPARE(config.allowedFtpHosts, QStringList({"files.example.org", "backup.example.org"}));
    QCOMPARE(config.maxSuspiciousPatterns, 5);
    QCOMPARE(config.injectionCountingPolicy, InjectionCountingPolicy::SeverityWeighted);
    // Untouched keys keep their defaults
    QCOMPARE(config.maxAudioDurationHours, 2.0);
}

void TestSecurityConfig::testExtensionsAreNormalized() {
    TEST_SCOPE("extensionsAreNormalized");
    const QString iniPath = TestUtils::createTestTextFile(_testScope.getTempDirectory(),
        "[security]\nallowed_audio_formats=WAV, .Flac, mp3\n", "formats.ini");

    QSettings settings(iniPath, QSettings::IniFormat);
    const SecurityConfig config = SecurityConfig::fromSettings(settings);
    QCOMPARE(config.allowedAudioFormats, QStringList({".wav", ".flac", ".mp3"}));
}

void TestSecurityConfig::testUnknownCountingPolicyFallsBack() {
    QCOMPARE(countingPolicyFromString("severity"), InjectionCountingPolicy::SeverityWeighted);
    QCOMPARE(countingPolicyFromString(" ALL "), InjectionCountingPolicy::AllDistinct);
    QCOMPARE(countingPolicyFromString("loudest"), InjectionCountingPolicy::AllDistinct);
}

void TestSecurityConfig::testConfigFileSnapshot() {
    TEST_SCOPE("configFileSnapshot");
    const QString iniPath = TestUtils::createTestTextFile(_testScope.getTempDirectory(),
        "[security]\nmax_queue_depth=3\n[analysis]\nurl=http://127.0.0.1:11434\nmodel=llama3\n",
        "audiogate.ini");

    Config& config = Config::instance();
    config.initializeFromFile(iniPath);
    QVERIFY(config.isInitialized());

    auto first = config.getSecurityConfig();
    QCOMPARE(first->maxQueueDepth, 3);

    SecurityConfig changed = *first;
    changed.maxQueueDepth = 9;
    config.setSecurityConfig(changed);

    // Earlier snapshots are immutable
    QCOMPARE(first->maxQueueDepth, 3);
    QCOMPARE(config.getSecurityConfig()->maxQueueDepth, 9);

    const Config::AnalysisSettings analysis = config.getAnalysisSettings();
    QCOMPARE(analysis.url, QString("http://127.0.0.1:11434"));
    QCOMPARE(analysis.model, QString("llama3"));
}

int runTestSecurityConfig(int argc, char** argv) {
    TestSecurityConfig test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_security_config.moc"
