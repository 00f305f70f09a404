/**
 * @file fault_handler.hpp
 * @brief Process-level sink for every contained runtime error
 * 
 * Cyclers report aborted ticks, out-of-order history pushes and stale
 * inputs here. Under the default policy the first fault latches an
 * actuation halt for the whole robot; cyclers keep ticking so their last
 * good state stays observable. Modules driving actuators check
 * CycleContext::actuation_enabled().
 */

#pragma once

#include <tickflow/platform/threading.hpp>
#include <tickflow/platform/timestamp.hpp>
#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <string>
#include <vector>

namespace tickflow {

enum class FaultKind {
    ModuleError,        ///< Module returned an error or threw; tick not published
    HistoryOutOfOrder,  ///< Tick timestamp older than the newest history entry
    StaleInput          ///< Cross-cycler input older than the configured bound
};

constexpr std::size_t kFaultKindCount = 3;

constexpr const char* to_string(FaultKind kind) {
    switch (kind) {
        case FaultKind::ModuleError:       return "ModuleError";
        case FaultKind::HistoryOutOfOrder: return "HistoryOutOfOrder";
        case FaultKind::StaleInput:        return "StaleInput";
    }
    return "Unknown";
}

enum class FaultPolicy {
    HaltActuation,      ///< Latch actuation_halted() on any fault
    RecordOnly          ///< Record and notify only
};

constexpr const char* to_string(FaultPolicy policy) {
    switch (policy) {
        case FaultPolicy::HaltActuation: return "HaltActuation";
        case FaultPolicy::RecordOnly:    return "RecordOnly";
    }
    return "Unknown";
}

struct Fault {
    FaultKind kind;
    std::string cycler;
    std::string module;     ///< Empty when not caused by a module
    uint64_t tick{0};
    Timestamp timestamp{0};
    std::string message;
};

class FaultHandler {
public:
    using Callback = std::function<void(const Fault&)>;
    
    explicit FaultHandler(FaultPolicy policy = FaultPolicy::HaltActuation,
                          std::size_t max_records = 256);
    
    FaultHandler(const FaultHandler&) = delete;
    FaultHandler& operator=(const FaultHandler&) = delete;
    
    /**
     * @brief Record a fault, apply the policy and run callbacks
     * 
     * Called from cycler threads. Callbacks run on the reporting thread.
     */
    void report(Fault fault);
    
    void on_fault(Callback callback);
    
    FaultPolicy policy() const noexcept { return policy_; }
    
    bool actuation_halted() const noexcept {
        return actuation_halted_.load(std::memory_order_acquire);
    }
    
    /**
     * @brief Operator reset after the cause has been dealt with
     */
    void clear_actuation_halt();
    
    uint64_t count(FaultKind kind) const noexcept {
        return counts_[static_cast<std::size_t>(kind)].load(std::memory_order_relaxed);
    }
    
    uint64_t total() const noexcept;
    
    /**
     * @brief Most recent faults, oldest first
     */
    std::vector<Fault> records() const;
    
private:
    static constexpr uint64_t kLoggedPerKind = 5;
    
    const FaultPolicy policy_;
    const std::size_t max_records_;
    std::atomic<bool> actuation_halted_{false};
    std::array<std::atomic<uint64_t>, kFaultKindCount> counts_{};
    
    mutable Mutex mutex_;
    std::deque<Fault> records_;
    std::vector<Callback> callbacks_;
};

} // namespace tickflow
