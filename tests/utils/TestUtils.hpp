#pragma once

#include <QtTest/QtTest>
#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QTemporaryDir>
#include <functional>
#include <memory>

#include "core/common/Expected.hpp"
#include "core/common/SecurityConfig.hpp"

namespace AudioGate {
namespace Test {

/**
 * @brief Test utilities for the AudioGate gateway
 *
 * Provides temporary directories, generated audio files and configuration
 * presets that run the pipeline without docker, ffprobe or whisper.
 */
class TestUtils : public QObject {
    Q_OBJECT

public:
    explicit TestUtils(QObject* parent = nullptr);
    ~TestUtils() override;

    // Test environment setup
    static void initializeTestEnvironment();
    static void cleanupTestEnvironment();

    // Temporary directory management
    static QString createTempDirectory(const QString& prefix = "audiogate_test");
    static void cleanupTempDirectory(const QString& path);
    static QString getTempPath();

    // Test file creation
    static QString createSilentWavFile(const QString& directory, const QString& fileName = "speech.wav",
                                       int durationSeconds = 1);
    // Valid WAV header followed by a hole up to sizeBytes
    static QString createSparseWavFile(const QString& directory, const QString& fileName, qint64 sizeBytes);
    static QString createTestTextFile(const QString& directory, const QString& content,
                                      const QString& filename = "test.txt");
    static QByteArray wavHeader(int sampleRate, int channels, int bitsPerSample, quint32 dataBytes);

    // Configuration with docker and chroot off and a host-side pipeline
    static std::shared_ptr<SecurityConfig> makeTestConfig(const QString& pipelineCommand = "cat {input}");

    static bool waitForCondition(std::function<bool()> condition, int timeoutMs = 5000, int checkIntervalMs = 50);

    // Test assertions with better error messages
    template<typename T, typename E>
    static void assertExpectedValue(const Expected<T, E>& result, const QString& context = QString());

    template<typename T, typename E>
    static void assertExpectedError(const Expected<T, E>& result, E expectedError, const QString& context = QString());

    static void assertFileExists(const QString& filePath, const QString& context = QString());
    static void assertFileNotExists(const QString& filePath, const QString& context = QString());

    static void logMessage(const QString& message);
    static QStringList getTestLogs();

private:
    static QTemporaryDir* tempDir_;
    static QStringList testLogs_;
};

/**
 * @brief RAII helper for test scope management
 */
class TestScope {
public:
    explicit TestScope(const QString& testName);
    ~TestScope();

    QString getTempDirectory() const;

private:
    QString testName_;
    QString tempDirectory_;
};

template<typename T, typename E>
void TestUtils::assertExpectedValue(const Expected<T, E>& result, const QString& context) {
    if (result.hasError()) {
        QString message = QString("Expected value but got error");
        if (!context.isEmpty()) {
            message += QString(" in %1").arg(context);
        }
        message += QString(": error code %1").arg(static_cast<int>(result.error()));
        QFAIL(qPrintable(message));
    }
}

template<typename T, typename E>
void TestUtils::assertExpectedError(const Expected<T, E>& result, E expectedError, const QString& context) {
    if (result.hasValue()) {
        QString message = QString("Expected error but got value");
        if (!context.isEmpty()) {
            message += QString(" in %1").arg(context);
        }
        QFAIL(qPrintable(message));
    }

    if (result.error() != expectedError) {
        QString message = QString("Expected error %1 but got error %2")
                         .arg(static_cast<int>(expectedError))
                         .arg(static_cast<int>(result.error()));
        if (!context.isEmpty()) {
            message += QString(" in %1").arg(context);
        }
        QFAIL(qPrintable(message));
    }
}

// Convenience macros for testing
#define ASSERT_EXPECTED_VALUE(result) TestUtils::assertExpectedValue(result, QString("%1:%2").arg(__FILE__).arg(__LINE__))
#define ASSERT_EXPECTED_ERROR(result, error) TestUtils::assertExpectedError(result, error, QString("%1:%2").arg(__FILE__).arg(__LINE__))
#define ASSERT_FILE_EXISTS(path) TestUtils::assertFileExists(path, QString("%1:%2").arg(__FILE__).arg(__LINE__))
#define ASSERT_FILE_NOT_EXISTS(path) TestUtils::assertFileNotExists(path, QString("%1:%2").arg(__FILE__).arg(__LINE__))

#define TEST_SCOPE(name) TestScope _testScope(name)

} // namespace Test
} // namespace AudioGate
