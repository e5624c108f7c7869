#include <QtTest/QtTest>
#include <QtCore/QCryptographicHash>
#include <QtCore/QFile>

#include "utils/TestUtils.hpp"
#include "core/security/FileValidator.hpp"

using namespace AudioGate;
using namespace AudioGate::Test;

/**
 * @brief Admission checks on candidate audio files
 *
 * The duration probe is replaced so the checks run without libavformat
 * reading real media.
 */
class TestFileValidator : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();
    void init();
    void cleanup();

    void testAcceptsWellFormedWav();
    void testRejectsMissingFile();
    void testRejectsUnknownExtension();
    void testRejectsDisguisedContent();
    void testRejectsOversizedFile();
    void testRejectsOverlongAudio();
    void testRejectsWhenDurationUnknown();
    void testChecksumIsLowercaseSha256();
    void testVerifyChecksumIgnoresCase();
    void testSniffFormats();

private:
    FileValidator validatorWithDuration(double seconds);

    std::shared_ptr<SecurityConfig> config_;
    QString dir_;
    int probeCalls_ = 0;
};

void TestFileValidator::initTestCase() {
    TestUtils::initializeTestEnvironment();
}

void TestFileValidator::init() {
    config_ = TestUtils::makeTestConfig();
    dir_ = TestUtils::createTempDirectory("file_validator");
    QVERIFY(!dir_.isEmpty());
    probeCalls_ = 0;
}

void TestFileValidator::cleanup() {
    TestUtils::cleanupTempDirectory(dir_);
}

FileValidator TestFileValidator::validatorWithDuration(double seconds) {
    int* calls = &probeCalls_;
    return FileValidator(config_, [seconds, calls](const QString&) -> Expected<double, ProbeError> {
        ++*calls;
        return seconds;
    });
}

void TestFileValidator::testAcceptsWellFormedWav() {
    const QString path = TestUtils::createSilentWavFile(dir_);
    const ValidationResult result = validatorWithDuration(1.0).validate(path);

    QVERIFY2(result.isValid, qPrintable(result.reason));
    QCOMPARE(result.failure, ValidationFailure::None);
    QCOMPARE(result.detectedFormat, QString("wav"));
    QCOMPARE(result.durationSeconds, 1.0);
    QCOMPARE(result.sizeBytes, QFileInfo(path).size());
    QCOMPARE(result.checksum.size(), 64);
}

void TestFileValidator::testRejectsMissingFile() {
    const ValidationResult result = validatorWithDuration(1.0).validate(dir_ + "/absent.wav");
    QVERIFY(!result.isValid);
    QCOMPARE(result.failure, ValidationFailure::FileNotFound);
}

void TestFileValidator::testRejectsUnknownExtension() {
    const QString path = TestUtils::createTestTextFile(dir_, "#!/bin/sh\necho hi\n", "payload.sh");
    const ValidationResult result = validatorWithDuration(1.0).validate(path);

    QVERIFY(!result.isValid);
    QCOMPARE(result.failure, ValidationFailure::UnsupportedFormat);
    QVERIFY(result.reason.contains(".sh"));
    QCOMPARE(probeCalls_, 0);
}

void TestFileValidator::testRejectsDisguisedContent() {
    const QString path = TestUtils::createTestTextFile(dir_, "#!/bin/sh\nrm -rf /\n", "song.mp3");
    const ValidationResult result = validatorWithDuration(1.0).validate(path);

    QVERIFY(!result.isValid);
    QCOMPARE(result.failure, ValidationFailure::ContentMismatch);
    QCOMPARE(probeCalls_, 0);
}

void TestFileValidator::testRejectsOversizedFile() {
    // 250 MB against the 200 MB default, without writing the bytes
    const QString path = TestUtils::createSparseWavFile(dir_, "huge.wav", qint64(250) * 1024 * 1024);
    QVERIFY(!path.isEmpty());

    const ValidationResult result = validatorWithDuration(60.0).validate(path);
    QVERIFY(!result.isValid);
    QCOMPARE(result.failure, ValidationFailure::TooLarge);
    QVERIFY(result.reason.contains("too large"));
    // Size is checked before the duration probe runs
    QCOMPARE(probeCalls_, 0);
}

void TestFileValidator::testRejectsOverlongAudio() {
    const QString path = TestUtils::createSilentWavFile(dir_);
    const ValidationResult result = validatorWithDuration(3.0 * 3600.0).validate(path);

    QVERIFY(!result.isValid);
    QCOMPARE(result.failure, ValidationFailure::TooLong);
    QVERIFY(result.checksum.isEmpty());
    QCOMPARE(probeCalls_, 1);
}

void TestFileValidator::testRejectsWhenDurationUnknown() {
    const QString path = TestUtils::createSilentWavFile(dir_);
    FileValidator validator(config_, [](const QString&) -> Expected<double, ProbeError> {
        return makeUnexpected(ProbeError::UnknownDuration);
    });

    const ValidationResult result = validator.validate(path);
    QVERIFY(!result.isValid);
    QCOMPARE(result.failure, ValidationFailure::ProbeFailed);
}

void TestFileValidator::testChecksumIsLowercaseSha256() {
    const QString path = TestUtils::createTestTextFile(dir_, "abc", "abc.txt");
    auto checksum = FileValidator::calculateChecksum(path);
    ASSERT_EXPECTED_VALUE(checksum);
    QCOMPARE(checksum.value(), QString("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"));

    ASSERT_EXPECTED_ERROR(FileValidator::calculateChecksum(dir_ + "/missing"), ValidationFailure::Unreadable);
}

void TestFileValidator::testVerifyChecksumIgnoresCase() {
    const QString path = TestUtils::createTestTextFile(dir_, "abc", "abc.txt");
    auto matches = FileValidator::verifyChecksum(
        path, "BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD");
    ASSERT_EXPECTED_VALUE(matches);
    QVERIFY(matches.value());

    auto differs = FileValidator::verifyChecksum(path, QString(64, '0'));
    ASSERT_EXPECTED_VALUE(differs);
    QVERIFY(!differs.value());
}

void TestFileValidator::testSniffFormats() {
    QCOMPARE(FileValidator::sniffFormat(TestUtils::wavHeader(16000, 1, 16, 0)), QString("wav"));
    QCOMPARE(FileValidator::sniffFormat(QByteArray("fLaC\0\0\0\x22", 8)), QString("flac"));
    QCOMPARE(FileValidator::sniffFormat(QByteArray("ID3\x04\0\0\0\0", 8)), QString("id3"));
    QCOMPARE(FileValidator::sniffFormat(QByteArray("\0\0\0\x20" "ftypM4A ", 12)), QString("m4a"));
    QCOMPARE(FileValidator::sniffFormat(QByteArray("\xFF\xFB\x90\x64", 4)), QString("mp3"));
    QCOMPARE(FileValidator::sniffFormat(QByteArray("\xFF\xF1\x50\x80", 4)), QString("aac"));
    QCOMPARE(FileValidator::sniffFormat(QByteArray("MZ\x90\0", 4)), QString());
}

int runTestFileValidator(int argc, char** argv) {
    TestFileValidator test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_file_validator.moc"
