#include "TestUtils.hpp"
#include <QtCore/QCoreApplication>
#include <QtCore/QDateTime>
#include <QtCore/QDir>
#include <QtCore/QElapsedTimer>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QRandomGenerator>
#include <QtCore/QThread>
#include <QtCore/QtEndian>

namespace AudioGate {
namespace Test {

// Static member initialization
QTemporaryDir* TestUtils::tempDir_ = nullptr;
QStringList TestUtils::testLogs_;

TestUtils::TestUtils(QObject* parent) : QObject(parent) {
}

TestUtils::~TestUtils() = default;

void TestUtils::initializeTestEnvironment() {
    if (!tempDir_) {
        tempDir_ = new QTemporaryDir();
        if (!tempDir_->isValid()) {
            qFatal("Failed to create temporary directory for tests");
        }
    }

    qputenv("AUDIOGATE_TEST_MODE", "1");
    logMessage("Test environment initialized");
}

void TestUtils::cleanupTestEnvironment() {
    if (tempDir_) {
        delete tempDir_;
        tempDir_ = nullptr;
    }
    testLogs_.clear();
}

QString TestUtils::createTempDirectory(const QString& prefix) {
    if (!tempDir_) {
        initializeTestEnvironment();
    }

    QString dirName = QString("%1_%2_%3")
                     .arg(prefix)
                     .arg(QDateTime::currentMSecsSinceEpoch())
                     .arg(QRandomGenerator::global()->generate());

    QString fullPath = tempDir_->path() + "/" + dirName;
    if (!QDir().mkpath(fullPath)) {
        return QString();
    }
    return fullPath;
}

void TestUtils::cleanupTempDirectory(const QString& path) {
    QDir dir(path);
    if (dir.exists()) {
        dir.removeRecursively();
    }
}

QString TestUtils::getTempPath() {
    if (!tempDir_) {
        initializeTestEnvironment();
    }
    return tempDir_->path();
}

QByteArray TestUtils::wavHeader(int sampleRate, int channels, int bitsPerSample, quint32 dataBytes) {
    const quint16 blockAlign = static_cast<quint16>(channels * bitsPerSample / 8);
    const quint32 byteRate = static_cast<quint32>(sampleRate) * blockAlign;

    QByteArray header;
    auto put32 = [&header](quint32 value) {
        char bytes[4];
        qToLittleEndian(value, bytes);
        header.append(bytes, 4);
    };
    auto put16 = [&header](quint16 value) {
        char bytes[2];
        qToLittleEndian(value, bytes);
        header.append(bytes, 2);
    };

    header.append("RIFF");
    put32(36 + dataBytes);
    header.append("WAVE");
    header.append("fmt ");
    put32(16);
    put16(1); // PCM
    put16(static_cast<quint16>(channels));
    put32(static_cast<quint32>(sampleRate));
    put32(byteRate);
    put16(blockAlign);
    put16(static_cast<quint16>(bitsPerSample));
    header.append("data");
    put32(dataBytes);
    return header;
}

QString TestUtils::createSilentWavFile(const QString& directory, const QString& fileName, int durationSeconds) {
    const int sampleRate = 16000;
    const quint32 dataBytes = static_cast<quint32>(sampleRate * 2 * durationSeconds);

    if (!QDir().mkpath(directory)) {
        return QString();
    }
    QString filePath = directory + "/" + fileName;
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        return QString();
    }
    file.write(wavHeader(sampleRate, 1, 16, dataBytes));
    file.write(QByteArray(static_cast<int>(dataBytes), '\0'));
    file.close();

    logMessage(QString("Created silent wav: %1").arg(filePath));
    return filePath;
}

QString TestUtils::createSparseWavFile(const QString& directory, const QString& fileName, qint64 sizeBytes) {
    QString filePath = directory + "/" + fileName;
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        return QString();
    }
    const QByteArray header = wavHeader(16000, 1, 16, static_cast<quint32>(sizeBytes - 44));
    file.write(header);
    if (!file.resize(sizeBytes)) {
        return QString();
    }
    file.close();
    return filePath;
}

QString TestUtils::createTestTextFile(const QString& directory, const QString& content, const QString& filename) {
    QString filePath = directory + "/" + filename;
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        return QString();
    }
    file.write(content.toUtf8());
    return filePath;
}

std::shared_ptr<SecurityConfig> TestUtils::makeTestConfig(const QString& pipelineCommand) {
    auto config = std::make_shared<SecurityConfig>();
    config->useDockerSandbox = false;
    config->useChroot = false;
    config->pipelineCommand = pipelineCommand;
    config->maxConcurrentProcesses = 2;
    config->maxQueueDepth = 8;
    config->terminationGraceSeconds = 1;
    config->monitorIntervalMs = 100;
    config->maxTranscriptionTimeSeconds = 30;
    return config;
}

bool TestUtils::waitForCondition(std::function<bool()> condition, int timeoutMs, int checkIntervalMs) {
    QElapsedTimer timer;
    timer.start();
    while (timer.elapsed() < timeoutMs) {
        if (condition()) {
            return true;
        }
        QCoreApplication::processEvents();
        QThread::msleep(checkIntervalMs);
    }
    return condition();
}

void TestUtils::assertFileExists(const QString& filePath, const QString& context) {
    QFileInfo fileInfo(filePath);
    if (!fileInfo.exists()) {
        QString message = QString("File does not exist: %1").arg(filePath);
        if (!context.isEmpty()) {
            message += QString(" (context: %1)").arg(context);
        }
        QFAIL(qPrintable(message));
    }
}

void TestUtils::assertFileNotExists(const QString& filePath, const QString& context) {
    QFileInfo fileInfo(filePath);
    if (fileInfo.exists()) {
        QString message = QString("File unexpectedly exists: %1").arg(filePath);
        if (!context.isEmpty()) {
            message += QString(" (context: %1)").arg(context);
        }
        QFAIL(qPrintable(message));
    }
}

void TestUtils::logMessage(const QString& message) {
    QString timestamp = QDateTime::currentDateTime().toString(Qt::ISODate);
    testLogs_.append(QString("[%1] %2").arg(timestamp, message));
}

QStringList TestUtils::getTestLogs() {
    return testLogs_;
}

TestScope::TestScope(const QString& testName)
    : testName_(testName) {
    tempDirectory_ = TestUtils::createTempDirectory("test_" + testName);
    TestUtils::logMessage(QString("Starting test scope: %1").arg(testName));
}

TestScope::~TestScope() {
    if (!tempDirectory_.isEmpty()) {
        TestUtils::cleanupTempDirectory(tempDirectory_);
    }
    TestUtils::logMessage(QString("Finished test scope: %1").arg(testName_));
}

QString TestScope::getTempDirectory() const {
    return tempDirectory_;
}

} // namespace Test
} // namespace AudioGate
