/**
 * @file admission_gate.hpp
 * @brief Counting admission primitive bounding in-flight file operations.
 */

#ifndef FLASHSYNC_ADMISSION_GATE_HPP
#define FLASHSYNC_ADMISSION_GATE_HPP

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <stop_token>

namespace flashsync {

/**
 * @brief Counting semaphore whose acquire can be interrupted by a stop token.
 *
 * @details std::counting_semaphore cannot be woken by a cancellation request,
 * so the gate is built on a mutex and a condition_variable_any.
 */
class AdmissionGate {
public:
    explicit AdmissionGate(std::size_t slots);

    AdmissionGate(const AdmissionGate&) = delete;
    AdmissionGate& operator=(const AdmissionGate&) = delete;

    /**
     * @brief Block until a slot is free or @p stop is requested.
     * @return true if a slot was taken, false if the wait was cancelled.
     */
    bool acquire(const std::stop_token& stop);

    void release();

    [[nodiscard]] std::size_t capacity() const { return capacity_; }
    [[nodiscard]] std::size_t in_use() const;

private:
    const std::size_t capacity_;
    std::size_t available_;
    mutable std::mutex mtx_;
    std::condition_variable_any cv_;
};

/**
 * @brief Scoped slot: releases the gate on every exit path when it holds a slot.
 */
class AdmissionSlot {
public:
    AdmissionSlot(AdmissionGate& gate, const std::stop_token& stop)
        : gate_(gate), acquired_(gate.acquire(stop)) {}

    ~AdmissionSlot() {
        if (acquired_) gate_.release();
    }

    AdmissionSlot(const AdmissionSlot&) = delete;
    AdmissionSlot& operator=(const AdmissionSlot&) = delete;

    /// False if the wait for a slot was cancelled.
    explicit operator bool() const { return acquired_; }

private:
    AdmissionGate& gate_;
    bool acquired_;
};

} // namespace flashsync

#endif // FLASHSYNC_ADMISSION_GATE_HPP
