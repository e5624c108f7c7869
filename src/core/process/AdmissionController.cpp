#include "AdmissionController.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QMutexLocker>
#include <algorithm>

namespace AudioGate {

AdmissionSlot::AdmissionSlot(AdmissionController* controller, quint64 ticket)
    : controller_(controller)
    , ticket_(ticket)
{
}

AdmissionSlot::~AdmissionSlot() {
    release();
}

AdmissionSlot::AdmissionSlot(AdmissionSlot&& other) noexcept
    : controller_(other.controller_)
    , ticket_(other.ticket_)
{
    other.controller_ = nullptr;
}

AdmissionSlot& AdmissionSlot::operator=(AdmissionSlot&& other) noexcept {
    if (this != &other) {
        release();
        controller_ = other.controller_;
        ticket_ = other.ticket_;
        other.controller_ = nullptr;
    }
    return *this;
}

void AdmissionSlot::release() {
    if (controller_) {
        controller_->release(ticket_);
        controller_ = nullptr;
    }
}

AdmissionController::AdmissionController(int capacity, int maxQueueDepth)
    : capacity_(std::max(1, capacity))
    , maxQueueDepth_(std::max(0, maxQueueDepth))
{
}

AdmissionController::~AdmissionController() {
    shutdown();
}

Expected<AdmissionSlot, AdmissionError> AdmissionController::acquire() {
    QMutexLocker locker(&mutex_);
    if (shuttingDown_) {
        return makeUnexpected(AdmissionError::ShuttingDown);
    }

    // Fast path only when nobody is queued, so arrival order holds
    if (queue_.empty() && inUse_ < capacity_) {
        ++inUse_;
        const quint64 ticket = nextTicket_++;
        AUDIOGATE_DEBUG("AdmissionController: slot {} granted ({}/{})", ticket, inUse_, capacity_);
        return AdmissionSlot(this, ticket);
    }

    if (maxQueueDepth_ > 0 && static_cast<int>(queue_.size()) >= maxQueueDepth_) {
        AUDIOGATE_WARN("AdmissionController: queue full ({} waiting), request rejected", queue_.size());
        return makeUnexpected(AdmissionError::QueueFull);
    }

    const quint64 ticket = nextTicket_++;
    queue_.push_back(ticket);
    AUDIOGATE_DEBUG("AdmissionController: ticket {} queued at position {}", ticket, queue_.size());

    while (!shuttingDown_ && (queue_.front() != ticket || inUse_ >= capacity_)) {
        available_.wait(&mutex_);
    }

    if (shuttingDown_) {
        queue_.erase(std::find(queue_.begin(), queue_.end(), ticket));
        return makeUnexpected(AdmissionError::ShuttingDown);
    }

    queue_.pop_front();
    ++inUse_;
    // The next waiter may also fit when more than one slot freed up
    available_.wakeAll();
    AUDIOGATE_DEBUG("AdmissionController: slot {} granted after wait ({}/{})", ticket, inUse_, capacity_);
    return AdmissionSlot(this, ticket);
}

void AdmissionController::release(quint64 ticket) {
    QMutexLocker locker(&mutex_);
    if (inUse_ > 0) {
        --inUse_;
    }
    AUDIOGATE_DEBUG("AdmissionController: slot {} released ({}/{})", ticket, inUse_, capacity_);
    available_.wakeAll();
}

void AdmissionController::shutdown() {
    QMutexLocker locker(&mutex_);
    if (shuttingDown_) {
        return;
    }
    shuttingDown_ = true;
    available_.wakeAll();
}

int AdmissionController::inUse() const {
    QMutexLocker locker(&mutex_);
    return inUse_;
}

int AdmissionController::waiting() const {
    QMutexLocker locker(&mutex_);
    return static_cast<int>(queue_.size());
}

} // namespace AudioGate
