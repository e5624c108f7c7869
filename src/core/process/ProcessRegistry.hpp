#pragma once

#include <QtCore/QJsonObject>
#include <QtCore/QList>
#include <QtCore/QMutex>
#include <QtCore/QSet>
#include <QtCore/QString>
#include <chrono>
#include <optional>
#include <unordered_map>

namespace AudioGate {

struct ResourceSample {
    qint64 timestampMs = 0;
    double cpuPercent = 0.0;
    double memoryMb = 0.0;
    int processCount = 0;
};

struct ActiveProcessRecord {
    QString runId;
    qint64 pid = 0;                 // also the process group id (setsid)
    QString sandboxId;
    int cpuLimitPercent = 0;
    int memoryLimitMb = 0;
    std::chrono::steady_clock::time_point startTime;
    std::chrono::steady_clock::time_point deadline;
    QList<ResourceSample> samples;  // appended by the monitor only
};

/**
 * @brief Process-wide table of supervised runs.
 *
 * ProcessManager registers a run for exactly the time its process is
 * alive; the monitor appends samples; the housekeeper reads it and reaps
 * process groups left behind by finished runs.
 */
class ProcessRegistry {
public:
    class Registration {
    public:
        Registration() = default;
        Registration(ProcessRegistry* registry, QString runId);
        ~Registration();

        Registration(Registration&& other) noexcept;
        Registration& operator=(Registration&& other) noexcept;
        Registration(const Registration&) = delete;
        Registration& operator=(const Registration&) = delete;

        const QString& runId() const { return runId_; }
        void release();

    private:
        ProcessRegistry* registry_ = nullptr;
        QString runId_;
    };

    ProcessRegistry() = default;
    ProcessRegistry(const ProcessRegistry&) = delete;
    ProcessRegistry& operator=(const ProcessRegistry&) = delete;

    [[nodiscard]] Registration registerProcess(const ActiveProcessRecord& record);

    void appendSample(const QString& runId, const ResourceSample& sample);

    std::optional<ActiveProcessRecord> find(const QString& runId) const;
    QList<ActiveProcessRecord> activeRecords() const;
    int activeCount() const;

    // Groups whose leader finished; the housekeeper drains them
    QList<qint64> lingeringGroups() const;
    void forgetGroup(qint64 pgid);

    static constexpr int kMaxSamplesPerRun = 240;

private:
    void deregister(const QString& runId);

    mutable QMutex mutex_;
    std::unordered_map<QString, ActiveProcessRecord> records_;
    QSet<qint64> lingering_;
};

} // namespace AudioGate
