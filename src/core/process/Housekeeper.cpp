#include "Housekeeper.hpp"
#include "ProcessRegistry.hpp"
#include "core/common/Logger.hpp"
#include "platform/linux/ProcFs.hpp"

#include <QtCore/QMutexLocker>
#include <chrono>

#ifdef Q_OS_LINUX
#include <signal.h>
#endif

namespace AudioGate {

Housekeeper::Housekeeper(ProcessRegistry& registry, int intervalMs, int graceSeconds, QObject* parent)
    : QObject(parent)
    , registry_(registry)
    , intervalMs_(intervalMs)
    , graceSeconds_(graceSeconds)
{
}

Housekeeper::~Housekeeper() {
    stop();
}

void Housekeeper::start() {
    QMutexLocker locker(&mutex_);
    if (thread_) {
        return;
    }
    stopRequested_ = false;
    thread_.reset(QThread::create([this]() { loop(); }));
    thread_->setObjectName("audiogate-housekeeper");
    thread_->start(QThread::LowPriority);
    AUDIOGATE_INFO("Housekeeper started (interval {} ms)", intervalMs_);
}

void Housekeeper::stop() {
    std::unique_ptr<QThread> thread;
    {
        QMutexLocker locker(&mutex_);
        if (!thread_) {
            return;
        }
        stopRequested_ = true;
        wake_.wakeAll();
        thread = std::move(thread_);
    }
    thread->wait();
    AUDIOGATE_INFO("Housekeeper stopped");
}

bool Housekeeper::isRunning() const {
    QMutexLocker locker(&mutex_);
    return thread_ != nullptr;
}

void Housekeeper::loop() {
    QMutexLocker locker(&mutex_);
    while (!stopRequested_) {
        wake_.wait(&mutex_, static_cast<unsigned long>(intervalMs_));
        if (stopRequested_) {
            break;
        }
        locker.unlock();
        runOnce();
        locker.relock();
    }
}

HousekeepingReport Housekeeper::runOnce() {
    HousekeepingReport report;
    const auto now = std::chrono::steady_clock::now();
    const auto grace = std::chrono::seconds(graceSeconds_);

    for (const ActiveProcessRecord& record : registry_.activeRecords()) {
        if (record.deadline.time_since_epoch().count() == 0 || now < record.deadline + grace) {
            continue;
        }
        if (ProcFs::signalProcessGroup(record.pid, SIGKILL)) {
            ++report.overdueRunsKilled;
            AUDIOGATE_WARN("Housekeeper: run {} (pid {}) outlived its deadline, killed",
                           record.runId.toStdString(), record.pid);
            emit overdueRunKilled(record.runId, record.pid);
        }
    }

    for (qint64 pgid : registry_.lingeringGroups()) {
        if (ProcFs::processGroupMembers(pgid).isEmpty()) {
            registry_.forgetGroup(pgid);
            ++report.lingeringGroupsCleared;
            continue;
        }
        if (ProcFs::signalProcessGroup(pgid, SIGKILL)) {
            ++report.lingeringGroupsKilled;
            AUDIOGATE_WARN("Housekeeper: killed orphaned process group {}", pgid);
        }
    }

    return report;
}

} // namespace AudioGate
