#pragma once

#include <QtCore/QMutex>
#include <QtCore/QObject>
#include <QtCore/QThread>
#include <QtCore/QWaitCondition>
#include <memory>

namespace AudioGate {

class ProcessRegistry;

struct HousekeepingReport {
    int overdueRunsKilled = 0;
    int lingeringGroupsKilled = 0;
    int lingeringGroupsCleared = 0;
};

/**
 * @brief Process-wide reaper running on its own thread.
 *
 * Started once at processor init and stopped at shutdown. Each pass
 * SIGKILLs runs that outlived their deadline by more than the grace period
 * and process groups whose leader already finished.
 */
class Housekeeper : public QObject {
    Q_OBJECT

public:
    Housekeeper(ProcessRegistry& registry, int intervalMs, int graceSeconds, QObject* parent = nullptr);
    ~Housekeeper() override;

    void start();
    void stop();
    bool isRunning() const;

    // One synchronous pass; also what the background loop runs
    HousekeepingReport runOnce();

signals:
    void overdueRunKilled(const QString& runId, qint64 pid);

private:
    void loop();

    ProcessRegistry& registry_;
    int intervalMs_;
    int graceSeconds_;

    mutable QMutex mutex_;
    QWaitCondition wake_;
    bool stopRequested_ = false;
    std::unique_ptr<QThread> thread_;
};

} // namespace AudioGate
