/**
 * @file fault_handler.cpp
 * @brief Fault recording, actuation halt and callbacks
 */

#include <tickflow/runtime/fault_handler.hpp>
#include <exception>
#include <iostream>

namespace tickflow {

FaultHandler::FaultHandler(FaultPolicy policy, std::size_t max_records)
    : policy_(policy), max_records_(max_records) {
}

void FaultHandler::report(Fault fault) {
    const uint64_t seen = counts_[static_cast<std::size_t>(fault.kind)].fetch_add(1, std::memory_order_relaxed);
    
    // Repeating faults (a stale input every tick) are logged a few times only
    if (seen < kLoggedPerKind) {
        std::cerr << "[FaultHandler] " << to_string(fault.kind) << " in " << fault.cycler;
        if (!fault.module.empty()) {
            std::cerr << "/" << fault.module;
        }
        std::cerr << " tick " << fault.tick << ": " << fault.message << "\n";
    } else if (seen == kLoggedPerKind) {
        std::cerr << "[FaultHandler] Further " << to_string(fault.kind) << " faults are counted, not logged\n";
    }
    
    if (policy_ == FaultPolicy::HaltActuation
        && !actuation_halted_.exchange(true, std::memory_order_acq_rel)) {
        std::cerr << "[FaultHandler] Actuation halted\n";
    }
    
    std::vector<Callback> callbacks;
    {
        Lock lock(mutex_);
        records_.push_back(fault);
        while (records_.size() > max_records_) {
            records_.pop_front();
        }
        callbacks = callbacks_;
    }
    
    for (const auto& callback : callbacks) {
        try {
            callback(fault);
        } catch (const std::exception& e) {
            std::cerr << "[FaultHandler] callback threw: " << e.what() << "\n";
        } catch (...) {
            std::cerr << "[FaultHandler] callback threw a non-standard exception\n";
        }
    }
}

void FaultHandler::on_fault(Callback callback) {
    Lock lock(mutex_);
    callbacks_.push_back(std::move(callback));
}

void FaultHandler::clear_actuation_halt() {
    if (actuation_halted_.exchange(false, std::memory_order_acq_rel)) {
        std::cout << "[FaultHandler] Actuation halt cleared\n";
    }
}

uint64_t FaultHandler::total() const noexcept {
    uint64_t sum = 0;
    for (const auto& count : counts_) {
        sum += count.load(std::memory_order_relaxed);
    }
    return sum;
}

std::vector<Fault> FaultHandler::records() const {
    Lock lock(mutex_);
    return {records_.begin(), records_.end()};
}

} // namespace tickflow
