#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <chrono>
#include <functional>
#include <memory>
#include <vector>

#include "Sandbox.hpp"
#include "core/common/Expected.hpp"
#include "core/common/SecurityConfig.hpp"

namespace AudioGate {

enum class TerminationReason {
    None,
    Deadline,
    Aborted
};

QString toString(TerminationReason reason);

struct CommandResult {
    QByteArray standardOutput;
    QByteArray standardError;
    int exitCode = -1;
    bool crashed = false;
    qint64 pid = 0;
    qint64 elapsedMs = 0;
    TerminationReason termination = TerminationReason::None;
    bool outputTruncated = false;   // stdout went past the capture limit

    bool succeeded() const { return !crashed && exitCode == 0 && termination == TerminationReason::None; }
};

struct RunHooks {
    std::function<void(qint64 pid)> onStarted;
    // Polled while the command runs; true terminates it
    std::function<bool()> shouldAbort;
};

/**
 * @brief Opens, runs commands in and tears down isolated execution contexts.
 *
 * Every command runs as leader of its own session, so a deadline or abort
 * reaches the whole process group: SIGTERM, the grace period, then SIGKILL.
 * close() is idempotent; the strategy sees exactly one close per handle.
 * Output goes to files in the work directory, never into gateway memory;
 * runIn() reads back the first kMaxCapturedOutputBytes of stdout and the
 * last kMaxCapturedErrorBytes of stderr.
 */
class SandboxManager : public QObject {
    Q_OBJECT

public:
    static constexpr qint64 kMaxCapturedOutputBytes = 16 * 1024 * 1024;
    static constexpr qint64 kMaxCapturedErrorBytes = 64 * 1024;

    // Docker and chroot strategies as enabled in the configuration
    explicit SandboxManager(std::shared_ptr<const SecurityConfig> config, QObject* parent = nullptr);
    // Explicit strategies in preference order
    SandboxManager(std::shared_ptr<const SecurityConfig> config,
                   std::vector<std::unique_ptr<Sandbox>> strategies,
                   QObject* parent = nullptr);
    ~SandboxManager() override;

    static std::vector<std::unique_ptr<Sandbox>> createDefaultStrategies(const SecurityConfig& config);

    Expected<SandboxHandle, SandboxError> open(const SandboxLimits& limits);
    Expected<CommandResult, SandboxError> runIn(const SandboxHandle& handle,
                                                const QString& program,
                                                const QStringList& arguments,
                                                std::chrono::milliseconds timeout,
                                                const RunHooks& hooks = {});
    Expected<void, SandboxError> close(const SandboxHandle& handle);

    QString sandboxPath(const SandboxHandle& handle, const QString& hostPath) const;
    QList<qint64> workloadProcesses(const SandboxHandle& handle, qint64 launcherPid) const;
    bool memoryLimitHit(const SandboxHandle& handle) const;

    // Strategy open() would use, or null when every candidate is unavailable
    Sandbox* selectedStrategy();
    bool isAvailable();
    int openCount() const;

    // SIGTERM to the group, wait up to grace, then SIGKILL
    static void terminateGroup(qint64 pgid, std::chrono::milliseconds grace);

signals:
    void sandboxOpened(const QString& sandboxId);
    void sandboxClosed(const QString& sandboxId);

private:
    class SandboxManagerPrivate;
    std::unique_ptr<SandboxManagerPrivate> d;
};

/**
 * @brief Closes its handle when it goes out of scope.
 */
class SandboxGuard {
public:
    SandboxGuard(SandboxManager& manager, SandboxHandle handle);
    ~SandboxGuard();

    SandboxGuard(const SandboxGuard&) = delete;
    SandboxGuard& operator=(const SandboxGuard&) = delete;

    const SandboxHandle& handle() const { return handle_; }

    // Explicit close with the result; the destructor then does nothing
    Expected<void, SandboxError> release();

private:
    SandboxManager& manager_;
    SandboxHandle handle_;
    bool released_ = false;
};

} // namespace AudioGate
