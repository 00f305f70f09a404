/**
 * @file pipeline_runtime.cpp
 * @brief Pipeline assembly, thread lifecycle and event routing
 */

#include <tickflow/runtime/pipeline_runtime.hpp>
#include <iostream>
#include <stdexcept>
#include <string>

namespace tickflow {

PipelineRuntime::PipelineRuntime(PipelineDeclaration pipeline,
                                 std::shared_ptr<ParameterStore> parameters,
                                 RuntimeOptions options)
    : pipeline_(std::move(pipeline))
    , parameters_(std::move(parameters))
    , options_(options)
    , faults_(options.fault_policy) {
    if (!parameters_) {
        throw std::invalid_argument("[PipelineRuntime] parameter store is required");
    }
    
    CompileResult compiled = PipelineCompiler(*parameters_).compile(pipeline_);
    if (!compiled) {
        throw PipelineCompileError(std::move(compiled.diagnostics));
    }
    plan_ = std::make_unique<ExecutionPlan>(std::move(*compiled.plan));
    
    const auto& plans = plan_->cyclers();
    std::vector<std::shared_ptr<const DatabaseLayout>> layouts;
    for (const auto& cycler : plans) {
        layouts.push_back(cycler.layout);
        channels_.push_back(std::make_unique<Channel<Database>>());
        histories_.push_back(pipeline_.cyclers()[cycler.index].create_history());
        shared_.channels.push_back(channels_.back().get());
        shared_.histories.push_back(histories_.back().get());
    }
    telemetry_ = std::make_unique<TelemetryPublisher>(std::move(layouts));
    shared_.parameters = parameters_.get();
    shared_.faults = &faults_;
    shared_.telemetry = telemetry_.get();
    
    for (const auto& cycler : plans) {
        const CyclerDeclaration& declaration = pipeline_.cyclers()[cycler.index];
        
        std::vector<Module*> modules;
        for (std::size_t m : cycler.order) {
            modules.push_back(declaration.modules()[m].get());
        }
        
        std::unique_ptr<TickSource> source;
        if (cycler.trigger.kind() == TriggerKind::Periodic) {
            source = std::make_unique<PeriodicTickSource>(cycler.trigger.period());
        } else {
            source = std::make_unique<EventTickSource>();
        }
        
        cyclers_.push_back(std::make_unique<Cycler>(
            cycler,
            std::move(modules),
            *channels_[cycler.index],
            histories_[cycler.index].get(),
            std::move(source),
            declaration.thread(),
            declaration.max_input_staleness(),
            shared_,
            options_.log_ticks
        ));
    }
    
    // After-triggered cyclers tick on their upstream's timestamp
    for (const auto& cycler : plans) {
        if (cycler.trigger_source) {
            EventTickSource* source = cyclers_[cycler.index]->event_source();
            cyclers_[*cycler.trigger_source]->add_publish_listener(
                [source](Timestamp timestamp) { source->notify(timestamp); });
        }
    }
    
    std::cout << "[PipelineRuntime] Ready with " << cyclers_.size() << " cycler(s), fault policy "
              << to_string(options_.fault_policy) << "\n";
}

PipelineRuntime::~PipelineRuntime() {
    stop();
}

void PipelineRuntime::start() {
    if (stopped_.load(std::memory_order_acquire)) {
        throw std::logic_error("[PipelineRuntime] cannot restart after stop()");
    }
    if (running_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    
    for (auto& cycler : cyclers_) {
        try {
            cycler->prepare();
        } catch (const std::exception& e) {
            running_.store(false, std::memory_order_release);
            throw std::runtime_error("[" + cycler->name() + "] module failed to start: " + e.what());
        }
    }
    
    for (auto& cycler : cyclers_) {
        cycler->start();
    }
    std::cout << "[PipelineRuntime] Started\n";
}

void PipelineRuntime::stop() {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
        return;
    }
    
    stopped_.store(true, std::memory_order_release);
    std::cout << "[PipelineRuntime] Stopping...\n";
    for (auto& cycler : cyclers_) {
        cycler->request_stop();
    }
    for (auto& cycler : cyclers_) {
        cycler->join();
    }
    std::cout << "[PipelineRuntime] Stopped\n";
}

void PipelineRuntime::notify(std::string_view cycler, Timestamp timestamp) {
    const std::size_t index = index_of(cycler);
    const CyclerPlan& plan = plan_->cyclers()[index];
    if (plan.trigger.kind() != TriggerKind::Event) {
        throw std::invalid_argument("[PipelineRuntime] cycler '" + std::string(cycler)
                                    + "' is not event triggered");
    }
    cyclers_[index]->event_source()->notify(timestamp);
}

bool PipelineRuntime::tick_once(std::string_view cycler, Timestamp timestamp) {
    return cyclers_[index_of(cycler)]->tick(timestamp);
}

const Channel<Database>& PipelineRuntime::channel(std::string_view cycler) const {
    return *channels_[index_of(cycler)];
}

const SnapshotHistory* PipelineRuntime::history(std::string_view cycler) const {
    return histories_[index_of(cycler)].get();
}

CyclerStatistics PipelineRuntime::statistics(std::string_view cycler) const {
    return cyclers_[index_of(cycler)]->statistics();
}

std::size_t PipelineRuntime::index_of(std::string_view cycler) const {
    if (const CyclerPlan* plan = plan_->find(cycler)) {
        return plan->index;
    }
    throw std::invalid_argument("[PipelineRuntime] unknown cycler '" + std::string(cycler) + "'");
}

} // namespace tickflow
