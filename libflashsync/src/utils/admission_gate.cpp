#include "../../include/admission_gate.hpp"

namespace flashsync {

AdmissionGate::AdmissionGate(const std::size_t slots)
    : capacity_(slots == 0 ? 1 : slots), available_(capacity_) {}

bool AdmissionGate::acquire(const std::stop_token& stop) {
    std::unique_lock lock(mtx_);
    if (!cv_.wait(lock, stop, [this] { return available_ > 0; })) {
        return false;
    }
    --available_;
    return true;
}

void AdmissionGate::release() {
    {
        std::lock_guard lock(mtx_);
        if (available_ < capacity_) ++available_;
    }
    cv_.notify_one();
}

std::size_t AdmissionGate::in_use() const {
    std::lock_guard lock(mtx_);
    return capacity_ - available_;
}

} // namespace flashsync
