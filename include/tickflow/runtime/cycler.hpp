/**
 * @file cycler.hpp
 * @brief One execution context running its modules once per tick
 * 
 * Tick lifecycle: Idle -> Running -> Publishing -> Idle
 * 
 * Running:    parameter snapshot and upstream channel reads are taken once,
 *             then every module runs in compiled order against a fresh
 *             database. An error aborts the tick; nothing is published.
 * Publishing: the finished database goes into the history (if any), then
 *             the channel, then telemetry, then after-triggered cyclers.
 * 
 * Only one tick is ever in flight per cycler: the cycler thread and
 * tick_once() serialize on the same mutex.
 */

#pragma once

#include <tickflow/channel/channel.hpp>
#include <tickflow/history/snapshot_history.hpp>
#include <tickflow/parameters/parameter_store.hpp>
#include <tickflow/pipeline/pipeline_compiler.hpp>
#include <tickflow/platform/threading.hpp>
#include <tickflow/runtime/fault_handler.hpp>
#include <tickflow/runtime/tick_source.hpp>
#include <tickflow/telemetry/telemetry_publisher.hpp>
#include <any>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace tickflow {

enum class TickPhase {
    Idle,
    Running,
    Publishing,
    Stopped
};

constexpr const char* to_string(TickPhase phase) {
    switch (phase) {
        case TickPhase::Idle:       return "Idle";
        case TickPhase::Running:    return "Running";
        case TickPhase::Publishing: return "Publishing";
        case TickPhase::Stopped:    return "Stopped";
    }
    return "Unknown";
}

struct CyclerStatistics {
    uint64_t ticks_started{0};
    uint64_t ticks_published{0};
    uint64_t ticks_aborted{0};
    uint64_t ticks_discarded{0};        ///< Dropped because of shutdown
    uint64_t modules_skipped{0};        ///< Module runs skipped for absent required inputs
    Timestamp last_tick_duration{0};
    TickPhase phase{TickPhase::Idle};
};

/**
 * @brief Cross-cycler resources, owned by PipelineRuntime
 * 
 * Indexed by cycler index. These are the only state cyclers share.
 */
struct SharedResources {
    std::vector<const Channel<Database>*> channels;
    std::vector<const SnapshotHistory*> histories;
    ParameterStore* parameters{nullptr};
    FaultHandler* faults{nullptr};
    TelemetryPublisher* telemetry{nullptr};
};

class Cycler {
public:
    using PublishListener = std::function<void(Timestamp)>;
    
    Cycler(const CyclerPlan& plan,
           std::vector<Module*> modules,
           Channel<Database>& channel,
           SnapshotHistory* history,
           std::unique_ptr<TickSource> source,
           ThreadConfig thread,
           Nanoseconds max_input_staleness,
           const SharedResources& shared,
           uint32_t log_ticks);
    
    ~Cycler();
    
    Cycler(const Cycler&) = delete;
    Cycler& operator=(const Cycler&) = delete;
    
    const std::string& name() const noexcept { return plan_.name; }
    const CyclerPlan& plan() const noexcept { return plan_; }
    
    /**
     * @brief Call on_start() of every module, in execution order
     */
    void prepare();
    
    void start();
    
    /**
     * @brief Wake the thread; an in-flight tick is discarded before publishing
     */
    void request_stop();
    void join();
    
    /**
     * @brief Run one tick on the caller's thread
     * @return True if the tick was published
     */
    bool tick(Timestamp timestamp);
    
    /**
     * @brief Called with the tick timestamp after every publication
     * 
     * Register before start(); used to drive after-triggered cyclers.
     */
    void add_publish_listener(PublishListener listener);
    
    /**
     * @brief Event source of this cycler, nullptr for periodic cyclers
     */
    EventTickSource* event_source() noexcept;
    
    CyclerStatistics statistics() const noexcept;
    
private:
    void run();
    void check_staleness(Timestamp timestamp, uint64_t tick);
    bool run_module(std::size_t position, CycleContext& context, CycleResult& result);
    bool abort_tick(FaultKind kind, const std::string& module, uint64_t tick,
                    Timestamp timestamp, const std::string& message);
    
    const CyclerPlan& plan_;
    std::vector<Module*> modules_;          ///< Execution order
    Channel<Database>& channel_;
    SnapshotHistory* history_;
    std::unique_ptr<TickSource> source_;
    Thread thread_;
    Nanoseconds max_input_staleness_;
    const SharedResources& shared_;
    const uint32_t log_ticks_;
    
    Mutex tick_mutex_;
    std::vector<Snapshot> upstream_;        ///< Sized to all cyclers
    std::vector<std::any> states_;
    std::vector<PublishListener> listeners_;
    
    std::atomic<bool> stop_requested_{false};
    std::atomic<TickPhase> phase_{TickPhase::Idle};
    std::atomic<uint64_t> ticks_started_{0};
    std::atomic<uint64_t> ticks_published_{0};
    std::atomic<uint64_t> ticks_aborted_{0};
    std::atomic<uint64_t> ticks_discarded_{0};
    std::atomic<uint64_t> modules_skipped_{0};
    std::atomic<Timestamp> last_tick_duration_{0};
};

} // namespace tickflow
