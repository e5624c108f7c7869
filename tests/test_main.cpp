#include <QtTest/QtTest>
#include <QtCore/QCoreApplication>
#include <QtCore/QDebug>

#include "utils/TestUtils.hpp"
#include "core/common/Logger.hpp"

// Test suites live in separate compilation units
extern int runTestExpected(int argc, char** argv);
extern int runTestSecurityConfig(int argc, char** argv);
extern int runTestFileValidator(int argc, char** argv);
extern int runTestPromptInjectionDetector(int argc, char** argv);
extern int runTestAdmissionController(int argc, char** argv);
extern int runTestSandboxManager(int argc, char** argv);
extern int runTestResourceMonitor(int argc, char** argv);
extern int runTestProcessManager(int argc, char** argv);
extern int runTestSecureFTPClient(int argc, char** argv);
extern int runTestResultWriter(int argc, char** argv);
extern int runTestSecurityProcessor(int argc, char** argv);

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);

    AudioGate::Logger::instance().initialize("audiogate-tests.log", AudioGate::Logger::Level::Trace, false);
    AudioGate::Test::TestUtils::initializeTestEnvironment();

    int totalResult = 0;
    int testCount = 0;
    int passedTests = 0;

    struct TestInfo {
        const char* name;
        int (*function)(int, char**);
    };

    TestInfo tests[] = {
        {"Expected", runTestExpected},
        {"SecurityConfig", runTestSecurityConfig},
        {"FileValidator", runTestFileValidator},
        {"PromptInjectionDetector", runTestPromptInjectionDetector},
        {"AdmissionController", runTestAdmissionController},
        {"SandboxManager", runTestSandboxManager},
        {"ResourceMonitor", runTestResourceMonitor},
        {"ProcessManager", runTestProcessManager},
        {"SecureFTPClient", runTestSecureFTPClient},
        {"ResultWriter", runTestResultWriter},
        {"SecurityProcessor", runTestSecurityProcessor}
    };

    for (const auto& test : tests) {
        qDebug() << "\n========================================";
        qDebug() << "Running test suite:" << test.name;
        qDebug() << "========================================";

        testCount++;
        int result = test.function(argc, argv);

        if (result == 0) {
            qDebug() << "Test suite" << test.name << "PASSED";
            passedTests++;
        } else {
            qDebug() << "Test suite" << test.name << "FAILED with code" << result;
            totalResult |= result;
        }
    }

    AudioGate::Test::TestUtils::cleanupTestEnvironment();
    AudioGate::Logger::instance().shutdown();

    // Summary
    qDebug() << "\n========================================";
    qDebug() << "TEST SUMMARY";
    qDebug() << "========================================";
    qDebug() << "Total test suites:" << testCount;
    qDebug() << "Passed:" << passedTests;
    qDebug() << "Failed:" << (testCount - passedTests);
    qDebug() << "Overall result:" << (totalResult == 0 ? "PASS" : "FAIL");

    return totalResult;
}
