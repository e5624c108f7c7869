#pragma once

#include <QtCore/QMutex>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <atomic>
#include <memory>

#include "core/common/Expected.hpp"
#include "core/pipeline/AnalysisClient.hpp"
#include "core/security/Sandbox.hpp"
#include "core/security/SecureFTPClient.hpp"

namespace AudioGate {
namespace Test {

/**
 * @brief Shared view of what a MockSandbox did, kept alive after the
 * sandbox itself was handed to a SandboxManager.
 */
struct SandboxProbe {
    std::atomic<int> opened{0};
    std::atomic<int> closed{0};
    std::atomic<int> peakOpen{0};
    std::atomic<int> workloadQueries{0};
    std::atomic<qint64> workloadPid{0};
    std::atomic<bool> available{true};
    std::atomic<bool> failOpen{false};
    std::atomic<bool> failClose{false};
    std::atomic<bool> memoryLimitHit{false};

    int stillOpen() const { return opened.load() - closed.load(); }
};

/**
 * @brief Sandbox double that runs commands directly on the host.
 *
 * Every open gets its own work directory below baseDir, removed again on
 * close. Used wherever tests need the pipeline without docker or root.
 *
 * With SandboxKind::Container the command behaves like docker exec: a
 * launcher starts the workload in a new session it does not parent, waits
 * for it and exits. Its exit status is not relayed. The workload pid is
 * published in the work directory and close() kills its group.
 */
class MockSandbox : public Sandbox {
public:
    MockSandbox(std::shared_ptr<SandboxProbe> probe, QString baseDir,
                SandboxKind kind = SandboxKind::Custom);

    SandboxKind kind() const override { return kind_; }
    QString name() const override { return "mock"; }
    bool isAvailable() override { return probe_->available.load(); }

    Expected<SandboxHandle, SandboxError> open(const SandboxLimits& limits) override;
    Expected<LaunchSpec, SandboxError> wrapCommand(const SandboxHandle& handle,
                                                   const QString& program,
                                                   const QStringList& arguments) override;
    Expected<void, SandboxError> close(const SandboxHandle& handle) override;

    QList<qint64> workloadProcesses(const SandboxHandle& handle, qint64 launcherPid) const override;
    bool memoryLimitHit(const SandboxHandle& handle) const override;

    static constexpr const char* kWorkloadPidFile = ".workload_pid";

private:
    qint64 readWorkloadPid(const SandboxHandle& handle) const;

    std::shared_ptr<SandboxProbe> probe_;
    QString baseDir_;
    SandboxKind kind_;
};

struct TransportProbe {
    std::atomic<int> calls{0};
    std::atomic<bool> corrupt{false};
    QString sourceFile;
};

/**
 * @brief Transport double that copies a local file instead of dialing out.
 */
class MockTransport : public FetchTransport {
public:
    explicit MockTransport(std::shared_ptr<TransportProbe> probe);

    Expected<qint64, TransferError> download(const TransferRequest& request, QIODevice& sink) override;

private:
    std::shared_ptr<TransportProbe> probe_;
};

/**
 * @brief Analysis client returning a canned reply.
 */
class MockAnalysisClient : public AnalysisClient {
public:
    explicit MockAnalysisClient(QString reply);
    explicit MockAnalysisClient(AnalysisError error);

    QString name() const override { return "mock"; }
    Expected<QString, AnalysisError> analyze(const QString& prompt) override;

    QString lastPrompt() const;
    int callCount() const;

private:
    QString reply_;
    bool fails_ = false;
    AnalysisError error_ = AnalysisError::NotConfigured;

    mutable QMutex mutex_;
    QString lastPrompt_;
    int calls_ = 0;
};

} // namespace Test
} // namespace AudioGate
