#include "ProcessRegistry.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QMutexLocker>

namespace AudioGate {

ProcessRegistry::Registration::Registration(ProcessRegistry* registry, QString runId)
    : registry_(registry)
    , runId_(std::move(runId))
{
}

ProcessRegistry::Registration::~Registration() {
    release();
}

ProcessRegistry::Registration::Registration(Registration&& other) noexcept
    : registry_(other.registry_)
    , runId_(std::move(other.runId_))
{
    other.registry_ = nullptr;
}

ProcessRegistry::Registration& ProcessRegistry::Registration::operator=(Registration&& other) noexcept {
    if (this != &other) {
        release();
        registry_ = other.registry_;
        runId_ = std::move(other.runId_);
        other.registry_ = nullptr;
    }
    return *this;
}

void ProcessRegistry::Registration::release() {
    if (registry_) {
        registry_->deregister(runId_);
        registry_ = nullptr;
    }
}

ProcessRegistry::Registration ProcessRegistry::registerProcess(const ActiveProcessRecord& record) {
    QMutexLocker locker(&mutex_);
    records_[record.runId] = record;
    lingering_.remove(record.pid);
    AUDIOGATE_DEBUG("ProcessRegistry: registered run {} (pid {})", record.runId.toStdString(), record.pid);
    return Registration(this, record.runId);
}

void ProcessRegistry::deregister(const QString& runId) {
    QMutexLocker locker(&mutex_);
    auto it = records_.find(runId);
    if (it == records_.end()) {
        return;
    }
    if (it->second.pid > 0) {
        lingering_.insert(it->second.pid);
    }
    records_.erase(it);
    AUDIOGATE_DEBUG("ProcessRegistry: deregistered run {}", runId.toStdString());
}

void ProcessRegistry::appendSample(const QString& runId, const ResourceSample& sample) {
    QMutexLocker locker(&mutex_);
    auto it = records_.find(runId);
    if (it == records_.end()) {
        return;
    }
    auto& samples = it->second.samples;
    samples.append(sample);
    if (samples.size() > kMaxSamplesPerRun) {
        samples.removeFirst();
    }
}

std::optional<ActiveProcessRecord> ProcessRegistry::find(const QString& runId) const {
    QMutexLocker locker(&mutex_);
    auto it = records_.find(runId);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

QList<ActiveProcessRecord> ProcessRegistry::activeRecords() const {
    QMutexLocker locker(&mutex_);
    QList<ActiveProcessRecord> records;
    records.reserve(static_cast<qsizetype>(records_.size()));
    for (const auto& [runId, record] : records_) {
        records.append(record);
    }
    return records;
}

int ProcessRegistry::activeCount() const {
    QMutexLocker locker(&mutex_);
    return static_cast<int>(records_.size());
}

QList<qint64> ProcessRegistry::lingeringGroups() const {
    QMutexLocker locker(&mutex_);
    return QList<qint64>(lingering_.cbegin(), lingering_.cend());
}

void ProcessRegistry::forgetGroup(qint64 pgid) {
    QMutexLocker locker(&mutex_);
    lingering_.remove(pgid);
}

} // namespace AudioGate
