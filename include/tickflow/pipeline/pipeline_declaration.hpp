/**
 * @file pipeline_declaration.hpp
 * @brief Cyclers, their triggers and their modules, before compilation
 * 
 * @code
 * PipelineDeclaration pipeline;
 * 
 * pipeline.add_cycler("control", Trigger::periodic(Milliseconds(10)))
 *     .with_history<64>()
 *     .emplace<StateEstimator>()
 *     .emplace<GaitController>();
 * 
 * pipeline.add_cycler("vision", Trigger::event())
 *     .emplace<BallDetection>();
 * @endcode
 * 
 * Modules are registered in declaration order, which is also the tie-break
 * for the execution order the compiler computes.
 */

#pragma once

#include <tickflow/history/snapshot_history.hpp>
#include <tickflow/module/module.hpp>
#include <tickflow/platform/threading.hpp>
#include <tickflow/platform/timestamp.hpp>
#include <deque>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace tickflow {

enum class TriggerKind {
    Periodic,   ///< Fixed tick period
    Event,      ///< External notification, e.g. a sensor frame
    After       ///< Each publication of another cycler
};

constexpr const char* to_string(TriggerKind kind) {
    switch (kind) {
        case TriggerKind::Periodic: return "periodic";
        case TriggerKind::Event:    return "event";
        case TriggerKind::After:    return "after";
    }
    return "unknown";
}

class Trigger {
public:
    static Trigger periodic(Nanoseconds period) {
        return Trigger(TriggerKind::Periodic, period, {});
    }
    
    static Trigger event() {
        return Trigger(TriggerKind::Event, Nanoseconds(0), {});
    }
    
    static Trigger after(std::string cycler) {
        return Trigger(TriggerKind::After, Nanoseconds(0), std::move(cycler));
    }
    
    TriggerKind kind() const noexcept { return kind_; }
    Nanoseconds period() const noexcept { return period_; }
    const std::string& upstream() const noexcept { return upstream_; }
    
    std::string describe() const {
        switch (kind_) {
            case TriggerKind::Periodic:
                return "periodic " + std::to_string(period_.count()) + "ns";
            case TriggerKind::Event:
                return "event";
            case TriggerKind::After:
                return "after " + upstream_;
        }
        return "unknown";
    }
    
private:
    Trigger(TriggerKind kind, Nanoseconds period, std::string upstream)
        : kind_(kind), period_(period), upstream_(std::move(upstream)) {}
    
    TriggerKind kind_;
    Nanoseconds period_;
    std::string upstream_;
};

class CyclerDeclaration {
public:
    using HistoryFactory = std::function<std::unique_ptr<SnapshotHistory>()>;
    
    CyclerDeclaration(std::string name, Trigger trigger)
        : name_(std::move(name)), trigger_(std::move(trigger)) {
        thread_.name = name_;
    }
    
    CyclerDeclaration(CyclerDeclaration&&) = default;
    CyclerDeclaration& operator=(CyclerDeclaration&&) = default;
    
    /**
     * @brief Keep the last N published databases for historic inputs
     */
    template<std::size_t N>
    CyclerDeclaration& with_history() {
        static_assert(N > 0, "History capacity must be positive");
        history_capacity_ = N;
        history_factory_ = [] { return std::make_unique<FixedSnapshotHistory<N>>(); };
        return *this;
    }
    
    /**
     * @brief History capacity chosen at runtime, e.g. from a config file
     * @throws std::invalid_argument unless capacity is in supported_history_capacities()
     */
    CyclerDeclaration& with_history_capacity(std::size_t capacity) {
        if (!make_snapshot_history(capacity)) {
            throw std::invalid_argument("[" + name_ + "] unsupported history capacity "
                                        + std::to_string(capacity));
        }
        history_capacity_ = capacity;
        history_factory_ = [capacity] { return make_snapshot_history(capacity); };
        return *this;
    }
    
    CyclerDeclaration& with_thread(ThreadConfig config) {
        thread_ = std::move(config);
        return *this;
    }
    
    /**
     * @brief Raise a StaleInput fault when a cross-cycler input is older than this
     */
    CyclerDeclaration& with_max_input_staleness(Nanoseconds staleness) {
        max_input_staleness_ = staleness;
        return *this;
    }
    
    template<typename M, typename... Args>
    CyclerDeclaration& emplace(Args&&... args) {
        static_assert(std::is_base_of_v<Module, M>, "M must derive from tickflow::Module");
        modules_.push_back(std::make_unique<M>(std::forward<Args>(args)...));
        return *this;
    }
    
    CyclerDeclaration& add(std::unique_ptr<Module> module) {
        if (!module) {
            throw std::invalid_argument("[" + name_ + "] null module");
        }
        modules_.push_back(std::move(module));
        return *this;
    }
    
    const std::string& name() const noexcept { return name_; }
    const Trigger& trigger() const noexcept { return trigger_; }
    const ThreadConfig& thread() const noexcept { return thread_; }
    Nanoseconds max_input_staleness() const noexcept { return max_input_staleness_; }
    std::size_t history_capacity() const noexcept { return history_capacity_; }
    bool has_history() const noexcept { return history_capacity_ > 0; }
    
    const std::vector<std::unique_ptr<Module>>& modules() const noexcept { return modules_; }
    
    std::unique_ptr<SnapshotHistory> create_history() const {
        return history_factory_ ? history_factory_() : nullptr;
    }
    
private:
    std::string name_;
    Trigger trigger_;
    ThreadConfig thread_;
    Nanoseconds max_input_staleness_{0};
    std::size_t history_capacity_{0};
    HistoryFactory history_factory_;
    std::vector<std::unique_ptr<Module>> modules_;
};

class PipelineDeclaration {
public:
    PipelineDeclaration() = default;
    
    PipelineDeclaration(PipelineDeclaration&&) = default;
    PipelineDeclaration& operator=(PipelineDeclaration&&) = default;
    
    /**
     * @brief Append a cycler; the returned reference stays valid
     */
    CyclerDeclaration& add_cycler(std::string name, Trigger trigger) {
        return cyclers_.emplace_back(std::move(name), std::move(trigger));
    }
    
    const std::deque<CyclerDeclaration>& cyclers() const noexcept { return cyclers_; }
    
    const CyclerDeclaration* find(std::string_view name) const {
        for (const auto& cycler : cyclers_) {
            if (cycler.name() == name) {
                return &cycler;
            }
        }
        return nullptr;
    }
    
private:
    std::deque<CyclerDeclaration> cyclers_;
};

} // namespace tickflow
