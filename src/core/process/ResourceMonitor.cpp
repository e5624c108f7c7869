#include "ResourceMonitor.hpp"
#include "core/common/Logger.hpp"
#include "platform/linux/ProcFs.hpp"

#include <QtCore/QDateTime>
#include <QtCore/QElapsedTimer>
#include <QtCore/QMutex>
#include <QtCore/QMutexLocker>
#include <QtCore/QThread>
#include <QtCore/QWaitCondition>
#include <algorithm>
#include <atomic>

namespace AudioGate {

QString toString(ResourceBreach breach) {
    switch (breach) {
        case ResourceBreach::None: return "none";
        case ResourceBreach::Memory: return "memory";
        case ResourceBreach::Cpu: return "cpu";
        case ResourceBreach::Output: return "output";
    }
    return "unknown";
}

QJsonObject ResourceUsageSummary::toJson() const {
    QJsonObject json;
    json["samples"] = samples;
    json["peak_memory_mb"] = peakMemoryMb;
    json["peak_cpu_percent"] = peakCpuPercent;
    json["average_cpu_percent"] = averageCpuPercent;
    json["peak_process_count"] = peakProcessCount;
    json["breach"] = toString(breach);
    return json;
}

struct MonitorHandle::State {
    ProcessRegistry* registry = nullptr;
    QString runId;
    qint64 rootPid = 0;
    WorkloadSource source;
    MonitorLimits limits;

    QMutex mutex;
    QWaitCondition wake;
    bool stopRequested = false;
    std::unique_ptr<QThread> thread;

    std::atomic<bool> killRequested{false};
    std::atomic<int> breach{static_cast<int>(ResourceBreach::None)};

    // Guarded by mutex
    ResourceUsageSummary summary;
    double cpuTotal = 0.0;

    void run();
    void shutdown();
    ResourceSample sample(quint64& ticks) const;
};

ResourceSample MonitorHandle::State::sample(quint64& ticks) const {
    return source ? ResourceMonitor::samplePids(source(), ticks) : ResourceMonitor::sampleTree(rootPid, ticks);
}

void MonitorHandle::State::run() {
    const long ticksPerSecond = ProcFs::clockTicksPerSecond();
    const int cpuCount = ProcFs::onlineCpuCount();
    quint64 lastTicks = 0;
    sample(lastTicks);

    QElapsedTimer timer;
    timer.start();
    qint64 lastMs = 0;
    int consecutiveCpu = 0;

    QMutexLocker locker(&mutex);
    while (!stopRequested) {
        wake.wait(&mutex, static_cast<unsigned long>(limits.intervalMs));
        if (stopRequested) {
            break;
        }
        locker.unlock();

        quint64 ticks = 0;
        ResourceSample current = sample(ticks);
        const qint64 nowMs = timer.elapsed();
        current.cpuPercent = ResourceMonitor::cpuPercent(lastTicks, ticks, nowMs - lastMs, ticksPerSecond, cpuCount);
        current.timestampMs = QDateTime::currentMSecsSinceEpoch();
        lastTicks = ticks;
        lastMs = nowMs;

        ResourceBreach detected = ResourceBreach::None;
        if (current.processCount > 0) {
            registry->appendSample(runId, current);
            detected = ResourceMonitor::evaluate(current, limits, consecutiveCpu);
        }

        locker.relock();
        if (current.processCount == 0) {
            continue;
        }

        ++summary.samples;
        summary.peakMemoryMb = std::max(summary.peakMemoryMb, current.memoryMb);
        summary.peakCpuPercent = std::max(summary.peakCpuPercent, current.cpuPercent);
        summary.peakProcessCount = std::max(summary.peakProcessCount, current.processCount);
        cpuTotal += current.cpuPercent;
        summary.averageCpuPercent = cpuTotal / summary.samples;

        if (detected != ResourceBreach::None && !killRequested.load()) {
            breach.store(static_cast<int>(detected));
            killRequested.store(true);
            AUDIOGATE_WARN("ResourceMonitor: run {} breached {} limit (memory {:.1f} MB, cpu {:.1f}%)",
                           runId.toStdString(), toString(detected).toStdString(),
                           current.memoryMb, current.cpuPercent);
        }
    }
}

void MonitorHandle::State::shutdown() {
    std::unique_ptr<QThread> worker;
    {
        QMutexLocker locker(&mutex);
        stopRequested = true;
        wake.wakeAll();
        worker = std::move(thread);
    }
    if (worker) {
        worker->wait();
    }
}

MonitorHandle::~MonitorHandle() {
    if (state_) {
        state_->shutdown();
    }
}

MonitorHandle& MonitorHandle::operator=(MonitorHandle&& other) noexcept {
    if (this != &other) {
        if (state_) {
            state_->shutdown();
        }
        state_ = std::move(other.state_);
    }
    return *this;
}

bool MonitorHandle::isActive() const {
    return state_ != nullptr;
}

bool MonitorHandle::killRequested() const {
    return state_ && state_->killRequested.load();
}

ResourceBreach MonitorHandle::breach() const {
    if (!state_) {
        return ResourceBreach::None;
    }
    return static_cast<ResourceBreach>(state_->breach.load());
}

ResourceMonitor::ResourceMonitor(ProcessRegistry& registry, MonitorLimits defaults, bool enabled)
    : registry_(registry)
    , defaults_(defaults)
    , enabled_(enabled)
{
}

MonitorHandle ResourceMonitor::start(const ActiveProcessRecord& record, WorkloadSource source) {
    MonitorHandle handle;
    if (!enabled_ || record.pid <= 0) {
        return handle;
    }

    auto state = std::make_shared<MonitorHandle::State>();
    state->registry = &registry_;
    state->runId = record.runId;
    state->rootPid = record.pid;
    state->source = std::move(source);
    state->limits = defaults_;
    if (record.memoryLimitMb > 0) {
        state->limits.maxMemoryMb = record.memoryLimitMb;
    }
    if (record.cpuLimitPercent > 0) {
        state->limits.maxCpuPercent = record.cpuLimitPercent;
    }

    MonitorHandle::State* raw = state.get();
    state->thread.reset(QThread::create([raw]() { raw->run(); }));
    state->thread->setObjectName("audiogate-monitor");
    state->thread->start();

    AUDIOGATE_DEBUG("ResourceMonitor: watching run {} (pid {}, memory {} MB, cpu {}%)",
                    record.runId.toStdString(), record.pid,
                    state->limits.maxMemoryMb, state->limits.maxCpuPercent);
    handle.state_ = std::move(state);
    return handle;
}

ResourceUsageSummary ResourceMonitor::stop(MonitorHandle& handle) {
    if (!handle.state_) {
        return {};
    }

    auto state = std::move(handle.state_);
    state->shutdown();

    QMutexLocker locker(&state->mutex);
    ResourceUsageSummary summary = state->summary;
    summary.breach = static_cast<ResourceBreach>(state->breach.load());
    AUDIOGATE_DEBUG("ResourceMonitor: run {} finished after {} samples, peak {:.1f} MB",
                    state->runId.toStdString(), summary.samples, summary.peakMemoryMb);
    return summary;
}

ResourceBreach ResourceMonitor::evaluate(const ResourceSample& sample, const MonitorLimits& limits,
                                         int& consecutiveCpuSamples) {
    if (limits.maxMemoryMb > 0 && sample.memoryMb > limits.maxMemoryMb) {
        return ResourceBreach::Memory;
    }

    if (limits.maxCpuPercent > 0 && sample.cpuPercent > limits.maxCpuPercent) {
        ++consecutiveCpuSamples;
    } else {
        consecutiveCpuSamples = 0;
    }

    if (consecutiveCpuSamples >= std::max(1, limits.cpuBreachSamples)) {
        return ResourceBreach::Cpu;
    }
    return ResourceBreach::None;
}

double ResourceMonitor::cpuPercent(quint64 previousTicks, quint64 currentTicks, qint64 elapsedMs,
                                   long ticksPerSecond, int cpuCount) {
    // A child that exits takes its ticks with it
    if (elapsedMs <= 0 || ticksPerSecond <= 0 || currentTicks <= previousTicks) {
        return 0.0;
    }
    const double cpuSeconds = static_cast<double>(currentTicks - previousTicks) / ticksPerSecond;
    return cpuSeconds / (elapsedMs / 1000.0) * 100.0 / std::max(1, cpuCount);
}

ResourceSample ResourceMonitor::sampleTree(qint64 rootPid, quint64& totalTicks) {
    ResourceSample sample;
    totalTicks = 0;

    const long pageKb = ProcFs::pageSizeKb();
    qint64 residentKb = 0;
    for (const ProcStat& stat : ProcFs::processTree(rootPid)) {
        if (stat.isZombie()) {
            continue;
        }
        totalTicks += stat.cpuTicks();
        residentKb += stat.rssPages * pageKb;
        ++sample.processCount;
    }

    sample.memoryMb = residentKb / 1024.0;
    return sample;
}

ResourceSample ResourceMonitor::samplePids(const QList<qint64>& pids, quint64& totalTicks) {
    ResourceSample sample;
    totalTicks = 0;

    const long pageKb = ProcFs::pageSizeKb();
    qint64 residentKb = 0;
    for (qint64 pid : pids) {
        auto stat = ProcFs::readStat(pid);
        if (!stat || stat.value().isZombie()) {
            continue;
        }
        totalTicks += stat.value().cpuTicks();
        residentKb += stat.value().rssPages * pageKb;
        ++sample.processCount;
    }

    sample.memoryMb = residentKb / 1024.0;
    return sample;
}

} // namespace AudioGate
