#pragma once

#include <QtCore/QMutex>
#include <QtCore/QWaitCondition>
#include <deque>

#include "core/common/Expected.hpp"

namespace AudioGate {

enum class AdmissionError {
    QueueFull,
    ShuttingDown
};

class AdmissionController;

/**
 * @brief One held unit of the concurrency pool; released on destruction.
 */
class AdmissionSlot {
public:
    AdmissionSlot() = default;
    ~AdmissionSlot();

    AdmissionSlot(AdmissionSlot&& other) noexcept;
    AdmissionSlot& operator=(AdmissionSlot&& other) noexcept;
    AdmissionSlot(const AdmissionSlot&) = delete;
    AdmissionSlot& operator=(const AdmissionSlot&) = delete;

    bool isHeld() const { return controller_ != nullptr; }
    quint64 ticket() const { return ticket_; }
    void release();

private:
    friend class AdmissionController;
    AdmissionSlot(AdmissionController* controller, quint64 ticket);

    AdmissionController* controller_ = nullptr;
    quint64 ticket_ = 0;
};

/**
 * @brief FIFO counting gate in front of sandboxed execution.
 *
 * At most capacity slots are held at once. Callers beyond that wait in
 * arrival order; when maxQueueDepth callers are already waiting a new caller
 * is turned away immediately. A depth of 0 means the queue is unbounded.
 */
class AdmissionController {
public:
    AdmissionController(int capacity, int maxQueueDepth);
    ~AdmissionController();

    AdmissionController(const AdmissionController&) = delete;
    AdmissionController& operator=(const AdmissionController&) = delete;

    Expected<AdmissionSlot, AdmissionError> acquire();

    // Wakes all waiters with ShuttingDown and refuses new callers
    void shutdown();

    int capacity() const { return capacity_; }
    int maxQueueDepth() const { return maxQueueDepth_; }
    int inUse() const;
    int waiting() const;

private:
    friend class AdmissionSlot;
    void release(quint64 ticket);

    const int capacity_;
    const int maxQueueDepth_;

    mutable QMutex mutex_;
    QWaitCondition available_;
    std::deque<quint64> queue_;
    quint64 nextTicket_ = 1;
    int inUse_ = 0;
    bool shuttingDown_ = false;
};

} // namespace AudioGate
