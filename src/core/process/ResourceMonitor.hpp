#pragma once

#include <QtCore/QJsonObject>
#include <QtCore/QList>
#include <QtCore/QString>
#include <functional>
#include <memory>

#include "ProcessRegistry.hpp"

namespace AudioGate {

enum class ResourceBreach {
    None,
    Memory,
    Cpu,
    Output
};

QString toString(ResourceBreach breach);

// Pids that make up one supervised workload at the time of the call
using WorkloadSource = std::function<QList<qint64>()>;

struct MonitorLimits {
    int maxMemoryMb = 2048;
    int maxCpuPercent = 80;         // share of all online CPUs, 0-100
    int cpuBreachSamples = 3;
    int intervalMs = 500;
};

struct ResourceUsageSummary {
    int samples = 0;
    double peakMemoryMb = 0.0;
    double peakCpuPercent = 0.0;
    double averageCpuPercent = 0.0;
    int peakProcessCount = 0;
    ResourceBreach breach = ResourceBreach::None;

    QJsonObject toJson() const;
};

/**
 * @brief Move-only handle on one monitored run.
 *
 * Destroying an active handle stops the sampling thread. The kill request
 * is cooperative: ProcessManager polls it and terminates the run itself.
 */
class MonitorHandle {
public:
    MonitorHandle() = default;
    ~MonitorHandle();

    MonitorHandle(MonitorHandle&& other) noexcept = default;
    MonitorHandle& operator=(MonitorHandle&& other) noexcept;
    MonitorHandle(const MonitorHandle&) = delete;
    MonitorHandle& operator=(const MonitorHandle&) = delete;

    bool isActive() const;
    bool killRequested() const;
    ResourceBreach breach() const;

private:
    friend class ResourceMonitor;
    struct State;
    std::shared_ptr<State> state_;
};

/**
 * @brief Samples CPU and resident memory of a supervised workload.
 *
 * The workload is whatever the WorkloadSource given to start() lists, by
 * default the root pid plus every descendant and process group member
 * visible in /proc. CPU is measured against the whole machine. Memory over
 * the limit breaches on the first sample; CPU over the limit breaches after
 * cpuBreachSamples consecutive samples.
 */
class ResourceMonitor {
public:
    ResourceMonitor(ProcessRegistry& registry, MonitorLimits defaults, bool enabled = true);

    MonitorHandle start(const ActiveProcessRecord& record, WorkloadSource source = {});
    ResourceUsageSummary stop(MonitorHandle& handle);

    bool isEnabled() const { return enabled_; }
    const MonitorLimits& defaults() const { return defaults_; }

    // Updates the consecutive CPU counter and reports the breach, if any
    static ResourceBreach evaluate(const ResourceSample& sample, const MonitorLimits& limits,
                                   int& consecutiveCpuSamples);

    // Percent of cpuCount CPUs used between two cumulative tick readings
    static double cpuPercent(quint64 previousTicks, quint64 currentTicks, qint64 elapsedMs,
                             long ticksPerSecond, int cpuCount);

    // Single reading of the tree; cumulative CPU ticks go to totalTicks
    static ResourceSample sampleTree(qint64 rootPid, quint64& totalTicks);
    static ResourceSample samplePids(const QList<qint64>& pids, quint64& totalTicks);

private:
    ProcessRegistry& registry_;
    MonitorLimits defaults_;
    bool enabled_;
};

} // namespace AudioGate
