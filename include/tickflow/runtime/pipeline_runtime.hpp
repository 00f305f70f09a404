/**
 * @file pipeline_runtime.hpp
 * @brief Single ownership root of a running pipeline
 * 
 * PipelineRuntime owns the declared modules, the compiled plan, one channel
 * and optional history per cycler, the fault handler and the telemetry
 * publisher. Cyclers receive read-only access to what they share; there is
 * no process-wide singleton.
 * 
 * @code
 * auto parameters = ParameterStore::from_json(text).value();
 * PipelineRuntime runtime(std::move(pipeline), parameters);
 * std::cout << runtime.plan().describe();
 * 
 * runtime.start();
 * camera.on_frame([&](Timestamp t) { runtime.notify("vision", t); });
 * ...
 * runtime.stop();
 * @endcode
 */

#pragma once

#include <tickflow/runtime/cycler.hpp>
#include <atomic>
#include <memory>
#include <string_view>
#include <vector>

namespace tickflow {

struct RuntimeOptions {
    FaultPolicy fault_policy = FaultPolicy::HaltActuation;
    uint32_t log_ticks = 3;         ///< Ticks logged per cycler after start
};

class PipelineRuntime {
public:
    /**
     * @brief Compile the pipeline and create all cyclers
     * @throws PipelineCompileError if the wiring is invalid
     */
    PipelineRuntime(PipelineDeclaration pipeline,
                    std::shared_ptr<ParameterStore> parameters,
                    RuntimeOptions options = {});
    
    ~PipelineRuntime();
    
    PipelineRuntime(const PipelineRuntime&) = delete;
    PipelineRuntime& operator=(const PipelineRuntime&) = delete;
    
    // ========================================================================
    // Lifecycle
    // ========================================================================
    
    /**
     * @brief Run every module's on_start(), then one thread per cycler
     * @throws std::runtime_error if a module fails to start; nothing runs then
     * @throws std::logic_error after stop(); a runtime is started once
     */
    void start();
    
    /**
     * @brief Stop and join all cyclers; safe from any state, idempotent
     */
    void stop();
    
    bool is_running() const noexcept { return running_.load(std::memory_order_acquire); }
    
    /**
     * @brief Trigger an event-driven cycler with the event's timestamp
     * @throws std::invalid_argument for unknown or non-event cyclers
     */
    void notify(std::string_view cycler, Timestamp timestamp);
    
    /**
     * @brief Run one tick of a cycler synchronously on the caller's thread
     * 
     * Intended for tests and replay with threads not started. After stop()
     * the tick is discarded.
     * @return True if the tick was published
     */
    bool tick_once(std::string_view cycler, Timestamp timestamp);
    
    // ========================================================================
    // Observation
    // ========================================================================
    
    const ExecutionPlan& plan() const noexcept { return *plan_; }
    
    const Channel<Database>& channel(std::string_view cycler) const;
    
    /**
     * @brief Latest published snapshot, nullptr before the first one
     */
    Snapshot latest(std::string_view cycler) const { return channel(cycler).read(); }
    
    /**
     * @brief History of a cycler, nullptr if it keeps none
     */
    const SnapshotHistory* history(std::string_view cycler) const;
    
    CyclerStatistics statistics(std::string_view cycler) const;
    
    ParameterStore& parameters() noexcept { return *parameters_; }
    FaultHandler& faults() noexcept { return faults_; }
    TelemetryPublisher& telemetry() noexcept { return *telemetry_; }
    
private:
    std::size_t index_of(std::string_view cycler) const;
    
    PipelineDeclaration pipeline_;
    std::shared_ptr<ParameterStore> parameters_;
    RuntimeOptions options_;
    std::unique_ptr<ExecutionPlan> plan_;
    FaultHandler faults_;
    std::unique_ptr<TelemetryPublisher> telemetry_;
    std::vector<std::unique_ptr<Channel<Database>>> channels_;
    std::vector<std::unique_ptr<SnapshotHistory>> histories_;
    SharedResources shared_;
    std::vector<std::unique_ptr<Cycler>> cyclers_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopped_{false};
};

} // namespace tickflow
