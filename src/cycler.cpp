/**
 * @file cycler.cpp
 * @brief Tick execution, publication and the cycler thread loop
 */

#include <tickflow/runtime/cycler.hpp>
#include <exception>
#include <iostream>

namespace tickflow {

Cycler::Cycler(const CyclerPlan& plan,
               std::vector<Module*> modules,
               Channel<Database>& channel,
               SnapshotHistory* history,
               std::unique_ptr<TickSource> source,
               ThreadConfig thread,
               Nanoseconds max_input_staleness,
               const SharedResources& shared,
               uint32_t log_ticks)
    : plan_(plan)
    , modules_(std::move(modules))
    , channel_(channel)
    , history_(history)
    , source_(std::move(source))
    , thread_(thread)
    , max_input_staleness_(max_input_staleness)
    , shared_(shared)
    , log_ticks_(log_ticks)
    , upstream_(shared.channels.size()) {
    states_.reserve(plan_.states.size());
    for (const auto& slot : plan_.states) {
        states_.push_back(slot.make_default());
    }
}

Cycler::~Cycler() {
    request_stop();
    join();
}

void Cycler::prepare() {
    for (Module* module : modules_) {
        module->on_start();
    }
}

void Cycler::start() {
    stop_requested_.store(false, std::memory_order_release);
    thread_.start([this]() { run(); });
}

void Cycler::request_stop() {
    stop_requested_.store(true, std::memory_order_release);
    source_->stop();
}

void Cycler::join() {
    thread_.join();
}

void Cycler::add_publish_listener(PublishListener listener) {
    listeners_.push_back(std::move(listener));
}

EventTickSource* Cycler::event_source() noexcept {
    return dynamic_cast<EventTickSource*>(source_.get());
}

CyclerStatistics Cycler::statistics() const noexcept {
    return CyclerStatistics{
        ticks_started_.load(std::memory_order_relaxed),
        ticks_published_.load(std::memory_order_relaxed),
        ticks_aborted_.load(std::memory_order_relaxed),
        ticks_discarded_.load(std::memory_order_relaxed),
        modules_skipped_.load(std::memory_order_relaxed),
        last_tick_duration_.load(std::memory_order_relaxed),
        phase_.load(std::memory_order_relaxed)
    };
}

// ============================================================================
// Tick
// ============================================================================

bool Cycler::tick(Timestamp timestamp) {
    Lock lock(tick_mutex_);
    const Timestamp started = Time::now();
    const uint64_t tick = ticks_started_.fetch_add(1, std::memory_order_relaxed) + 1;
    phase_.store(TickPhase::Running, std::memory_order_relaxed);
    
    // Everything the modules observe is pinned here, once per tick
    auto parameters = shared_.parameters->snapshot();
    for (std::size_t source : plan_.upstream) {
        upstream_[source] = shared_.channels[source]->read();
    }
    check_staleness(timestamp, tick);
    
    auto database = std::make_shared<Database>(plan_.layout, tick, timestamp);
    auto wanted = shared_.telemetry->wanted_fields(plan_.index);
    CycleContext context(CycleResources{
        *database,
        upstream_,
        shared_.histories,
        *parameters,
        states_,
        *wanted,
        plan_.name,
        !shared_.faults->actuation_halted()
    });
    
    for (std::size_t position = 0; position < modules_.size(); ++position) {
        if (stop_requested_.load(std::memory_order_acquire)) {
            break;
        }
        
        CycleResult result = CycleResult::ok();
        if (!run_module(position, context, result)) {
            if (modules_skipped_.fetch_add(1, std::memory_order_relaxed) < log_ticks_) {
                std::cout << "[" << plan_.name << "] Tick " << tick << ": " << modules_[position]->name()
                          << " skipped, required input absent\n";
            }
            continue;
        }
        if (!result) {
            return abort_tick(FaultKind::ModuleError, modules_[position]->name(), tick, timestamp,
                              result.message());
        }
    }
    
    if (stop_requested_.load(std::memory_order_acquire)) {
        ticks_discarded_.fetch_add(1, std::memory_order_relaxed);
        phase_.store(TickPhase::Idle, std::memory_order_relaxed);
        std::cout << "[" << plan_.name << "] Tick " << tick << " discarded on shutdown\n";
        return false;
    }
    
    phase_.store(TickPhase::Publishing, std::memory_order_relaxed);
    Snapshot snapshot = std::move(database);
    
    if (history_) {
        auto pushed = history_->push(timestamp, snapshot);
        if (!pushed) {
            return abort_tick(FaultKind::HistoryOutOfOrder, "", tick, timestamp, to_string(pushed.error()));
        }
    }
    channel_.publish(snapshot);
    shared_.telemetry->offer(plan_.index, snapshot);
    for (const auto& listener : listeners_) {
        listener(timestamp);
    }
    
    const Timestamp duration = Time::now() - started;
    last_tick_duration_.store(duration, std::memory_order_relaxed);
    ticks_published_.fetch_add(1, std::memory_order_relaxed);
    phase_.store(TickPhase::Idle, std::memory_order_relaxed);
    
    if (tick <= log_ticks_) {
        std::cout << "[" << plan_.name << "] Tick " << tick << " published in "
                  << Time::ns_to_microseconds(duration) << "us\n";
    }
    return true;
}

/**
 * @brief Run one module unless a required input is absent
 * @return False if the module was skipped
 */
bool Cycler::run_module(std::size_t position, CycleContext& context, CycleResult& result) {
    for (const Wire& wire : plan_.required_inputs[position]) {
        if (!context.is_present(wire)) {
            return false;
        }
    }
    
    // A throwing module fails its tick, never the cycler thread
    try {
        result = modules_[position]->cycle(context);
    } catch (const std::exception& e) {
        result = CycleResult::error(std::string("exception: ") + e.what());
    } catch (...) {
        result = CycleResult::error("unknown exception");
    }
    return true;
}

void Cycler::check_staleness(Timestamp timestamp, uint64_t tick) {
    if (max_input_staleness_.count() <= 0) {
        return;
    }
    const Timestamp bound = Time::to_nanoseconds(max_input_staleness_);
    for (std::size_t source : plan_.upstream) {
        const Snapshot& snapshot = upstream_[source];
        if (!snapshot) {
            continue;
        }
        const Timestamp age = Time::age(snapshot->timestamp(), timestamp);
        if (age > bound) {
            shared_.faults->report(Fault{
                FaultKind::StaleInput, plan_.name, "", tick, timestamp,
                "input from '" + snapshot->layout().cycler() + "' is "
                + std::to_string(Time::ns_to_milliseconds(age)) + "ms old"
            });
        }
    }
}

bool Cycler::abort_tick(FaultKind kind, const std::string& module, uint64_t tick,
                        Timestamp timestamp, const std::string& message) {
    ticks_aborted_.fetch_add(1, std::memory_order_relaxed);
    phase_.store(TickPhase::Idle, std::memory_order_relaxed);
    shared_.faults->report(Fault{kind, plan_.name, module, tick, timestamp, message});
    return false;
}

// ============================================================================
// Thread loop
// ============================================================================

void Cycler::run() {
    std::cout << "[" << plan_.name << "] Cycler started (" << plan_.trigger.describe() << ")\n";
    
    while (!stop_requested_.load(std::memory_order_acquire)) {
        auto timestamp = source_->wait_next();
        if (!timestamp) {
            break;
        }
        tick(*timestamp);
    }
    
    phase_.store(TickPhase::Stopped, std::memory_order_relaxed);
    std::cout << "[" << plan_.name << "] Cycler stopped after "
              << ticks_started_.load(std::memory_order_relaxed) << " ticks\n";
}

} // namespace tickflow
