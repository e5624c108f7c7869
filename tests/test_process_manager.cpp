#include <QtTest/QtTest>
#include <QtTest/QSignalSpy>

#include "utils/MockComponents.hpp"
#include "utils/TestUtils.hpp"
#include "core/process/ProcessManager.hpp"
#include "core/process/ProcessRegistry.hpp"
#include "core/security/SandboxManager.hpp"
#include "platform/linux/ProcFs.hpp"

using namespace AudioGate;
using namespace AudioGate::Test;

/**
 * @brief Sandboxed pipeline runs and their outcomes
 *
 * The pipeline command is a small shell snippet so each outcome kind can be
 * produced on demand.
 */
class TestProcessManager : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();
    void init();
    void cleanup();

    void testExpandCommandKeepsTokens();
    void testTranscriptFromStdout();
    void testTranscriptFromOutputFile();
    void testDeadlineGivesTimedOut();
    void testNonZeroExitGivesCrashed();
    void testMemoryBreachGivesResourceExceeded();
    void testUnavailableSandboxRunsNothing();
    void testContainerWorkloadIsMonitored();
    void testSandboxMemoryKillGivesResourceExceeded();
    void testFloodedStdoutGivesResourceExceeded();

private:
    Expected<ProcessingOutcome, ProcessError> run(const QString& pipelineCommand,
                                                  const ExecutionLimits& limits = ExecutionLimits());

    std::shared_ptr<SandboxProbe> probe_;
    SandboxKind kind_ = SandboxKind::Custom;
    QString dir_;
    QString input_;
    int activeAfterRun_ = -1;
    int startedSignals_ = 0;
    int finishedSignals_ = 0;
};

void TestProcessManager::initTestCase() {
    TestUtils::initializeTestEnvironment();
}

void TestProcessManager::init() {
    probe_ = std::make_shared<SandboxProbe>();
    kind_ = SandboxKind::Custom;
    dir_ = TestUtils::createTempDirectory("process_manager");
    QVERIFY(!dir_.isEmpty());
    input_ = TestUtils::createSilentWavFile(dir_, "speech.wav");
    QVERIFY(!input_.isEmpty());
    activeAfterRun_ = -1;
    startedSignals_ = 0;
    finishedSignals_ = 0;
}

void TestProcessManager::cleanup() {
    TestUtils::cleanupTempDirectory(dir_);
}

Expected<ProcessingOutcome, ProcessError> TestProcessManager::run(const QString& pipelineCommand,
                                                                  const ExecutionLimits& limits) {
    auto config = TestUtils::makeTestConfig(pipelineCommand);
    MonitorLimits monitorLimits;
    monitorLimits.intervalMs = 50;

    std::vector<std::unique_ptr<Sandbox>> strategies;
    strategies.push_back(std::make_unique<MockSandbox>(probe_, dir_ + "/sandboxes", kind_));
    SandboxManager sandboxManager(config, std::move(strategies));
    ProcessRegistry registry;
    ResourceMonitor monitor(registry, monitorLimits);
    ProcessManager manager(config, sandboxManager, registry, monitor);

    QSignalSpy startedSpy(&manager, &ProcessManager::runStarted);
    QSignalSpy finishedSpy(&manager, &ProcessManager::runFinished);

    auto outcome = manager.execute(input_, limits);

    activeAfterRun_ = registry.activeCount();
    startedSignals_ = startedSpy.count();
    finishedSignals_ = finishedSpy.count();
    manager.cleanupZombieProcesses();
    return outcome;
}

void TestProcessManager::testExpandCommandKeepsTokens() {
    const QStringList command = ProcessManager::expandCommand(
        "whisper {input} --model large-v3 --output_format txt --output_dir {output_dir}",
        "/work/my talk.wav", "/work");
    QCOMPARE(command, QStringList({"whisper", "/work/my talk.wav", "--model", "large-v3",
                                   "--output_format", "txt", "--output_dir", "/work"}));

    // A hostile file name stays one argument
    const QStringList hostile = ProcessManager::expandCommand("tool {input}", "/w/a.wav; rm -rf ~", "/w");
    QCOMPARE(hostile, QStringList({"tool", "/w/a.wav; rm -rf ~"}));
}

void TestProcessManager::testTranscriptFromStdout() {
    auto outcome = run("sh -c \"printf 'budget review'\"");
    ASSERT_EXPECTED_VALUE(outcome);

    QCOMPARE(outcome->kind, OutcomeKind::Completed);
    QVERIFY(outcome->isCompleted());
    QCOMPARE(outcome->output, QString("budget review"));
    QCOMPARE(outcome->exitCode, 0);
    QVERIFY(outcome->sandboxId.startsWith("mock_"));
    QCOMPARE(outcome->sandboxKind, SandboxKind::Custom);

    QCOMPARE(probe_->opened.load(), 1);
    QCOMPARE(probe_->stillOpen(), 0);
    QCOMPARE(activeAfterRun_, 0);
    QCOMPARE(startedSignals_, 1);
    QCOMPARE(finishedSignals_, 1);
}

void TestProcessManager::testTranscriptFromOutputFile() {
    // The staged input is visible to the pipeline and the transcript lands beside it
    auto outcome = run("sh -c \"test -s $0 && printf 'from file' > $1/speech.txt\" {input} {output_dir}");
    ASSERT_EXPECTED_VALUE(outcome);

    QCOMPARE(outcome->kind, OutcomeKind::Completed);
    QCOMPARE(outcome->output, QString("from file"));
    QCOMPARE(probe_->stillOpen(), 0);
}

void TestProcessManager::testDeadlineGivesTimedOut() {
    ExecutionLimits limits;
    limits.deadline = std::chrono::seconds(1);

    QElapsedTimer timer;
    timer.start();
    auto outcome = run("sleep 30", limits);
    ASSERT_EXPECTED_VALUE(outcome);

    QCOMPARE(outcome->kind, OutcomeKind::TimedOut);
    QVERIFY(outcome->output.isEmpty());
    QVERIFY(timer.elapsed() < 15000);
    QCOMPARE(probe_->stillOpen(), 0);
    QCOMPARE(activeAfterRun_, 0);
}

void TestProcessManager::testNonZeroExitGivesCrashed() {
    auto outcome = run("sh -c \"echo failing >&2; exit 3\"");
    ASSERT_EXPECTED_VALUE(outcome);

    QCOMPARE(outcome->kind, OutcomeKind::Crashed);
    QCOMPARE(outcome->exitCode, 3);
    QVERIFY(outcome->errorOutput.contains("failing"));
    QVERIFY(outcome->output.isEmpty());
    QCOMPARE(outcome->toJson().value("kind").toString(), QString("crashed"));
}

void TestProcessManager::testMemoryBreachGivesResourceExceeded() {
    ExecutionLimits limits;
    limits.memoryMb = 1;
    limits.deadline = std::chrono::seconds(20);

    auto outcome = run("sh -c \"sleep 30 & sleep 30 & sleep 30 & wait\"", limits);
    ASSERT_EXPECTED_VALUE(outcome);

    QCOMPARE(outcome->kind, OutcomeKind::ResourceExceeded);
    QCOMPARE(outcome->usage.breach, ResourceBreach::Memory);
    QVERIFY(outcome->usage.samples >= 1);
    QVERIFY(outcome->elapsedMs < 15000);
    QCOMPARE(probe_->stillOpen(), 0);
}

void TestProcessManager::testUnavailableSandboxRunsNothing() {
    probe_->available = false;
    const QString marker = dir_ + "/ran";

    auto outcome = run(QString("touch %1").arg(marker));
    ASSERT_EXPECTED_ERROR(outcome, ProcessError::SandboxUnavailable);
    QVERIFY(!QFile::exists(marker));
    QCOMPARE(probe_->opened.load(), 0);
    QCOMPARE(startedSignals_, 0);
}

void TestProcessManager::testContainerWorkloadIsMonitored() {
    // The launcher stays small; the memory is held by a process outside its tree
    kind_ = SandboxKind::Container;
    const QString hog = TestUtils::createTestTextFile(
        dir_, "x=$(head -c 64000000 /dev/zero | tr '\\0' a)\nsleep 30\n", "hog.sh");
    QVERIFY(!hog.isEmpty());

    ExecutionLimits limits;
    limits.memoryMb = 32;
    limits.deadline = std::chrono::seconds(20);

    auto outcome = run(QString("sh %1").arg(hog), limits);
    ASSERT_EXPECTED_VALUE(outcome);

    QCOMPARE(outcome->kind, OutcomeKind::ResourceExceeded);
    QCOMPARE(outcome->usage.breach, ResourceBreach::Memory);
    QVERIFY(outcome->usage.peakMemoryMb > 32.0);
    QVERIFY(outcome->elapsedMs < 15000);
    QCOMPARE(outcome->sandboxKind, SandboxKind::Container);
    QVERIFY(probe_->workloadQueries.load() > 0);

    const qint64 workload = probe_->workloadPid.load();
    QVERIFY(workload > 0);
    QVERIFY(TestUtils::waitForCondition([workload]() { return !ProcFs::isAlive(workload); }, 5000));
    QCOMPARE(probe_->stillOpen(), 0);
}

void TestProcessManager::testSandboxMemoryKillGivesResourceExceeded() {
    // What an OOM-killed container looks like from outside: exit 137
    probe_->memoryLimitHit = true;

    auto outcome = run("sh -c \"exit 137\"");
    ASSERT_EXPECTED_VALUE(outcome);

    QCOMPARE(outcome->kind, OutcomeKind::ResourceExceeded);
    QCOMPARE(outcome->usage.breach, ResourceBreach::Memory);
    QCOMPARE(outcome->exitCode, 137);
    QVERIFY(outcome->output.isEmpty());
    QCOMPARE(probe_->stillOpen(), 0);
}

void TestProcessManager::testFloodedStdoutGivesResourceExceeded() {
    auto outcome = run("head -c 20000000 /dev/zero");
    ASSERT_EXPECTED_VALUE(outcome);

    QCOMPARE(outcome->kind, OutcomeKind::ResourceExceeded);
    QCOMPARE(outcome->usage.breach, ResourceBreach::Output);
    QVERIFY(outcome->output.isEmpty());
    QCOMPARE(probe_->stillOpen(), 0);
}

int runTestProcessManager(int argc, char** argv) {
    TestProcessManager test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_process_manager.moc"
