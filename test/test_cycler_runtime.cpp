/**
 * @file test_cycler_runtime.cpp
 * @brief End-to-end tick execution, publication, faults and threading
 * 
 * Validates:
 * - A failing tick publishes nothing; consumers keep seeing the last good one
 * - Historic lookups across cyclers by timestamp
 * - One parameter generation per tick under concurrent writes
 * - Cycler state shared between modules across ticks
 * - Out-of-order ticks and stale inputs become faults
 * - Periodic, event and after triggers on real threads, clean shutdown
 * - Modules skipped while a required input is absent, nullable parameters
 * - Non-standard exceptions and throwing fault callbacks
 * - A tick interrupted by stop() is discarded, the runtime never restarts
 */

#include "test_modules.hpp"
#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <thread>

using namespace tickflow;
using namespace tickflow::test;
using namespace tickflow::literals;

namespace {

class FailOnTick : public Module {
public:
    explicit FailOnTick(uint64_t failing_tick)
        : Module("fail_on_tick"), failing_tick_(failing_tick) {}
    
    void declare(ModuleDeclaration&) override {}
    
    CycleResult cycle(CycleContext& ctx) override {
        actuation_seen.push_back(ctx.actuation_enabled());
        if (ctx.tick() == failing_tick_) {
            return CycleResult::error("joint limit exceeded");
        }
        return CycleResult::ok();
    }
    
    std::vector<bool> actuation_seen;
    
private:
    uint64_t failing_tick_;
};

class TimestampLookup : public Module {
public:
    TimestampLookup() : Module("timestamp_lookup") {}
    
    void declare(ModuleDeclaration& d) override {
        d.historic_input(x_);
    }
    
    CycleResult cycle(CycleContext& ctx) override {
        auto early = ctx.get(x_, 90);
        early_error = early ? HistoryError::Empty : early.error();
        early_found = static_cast<bool>(early);
        
        auto at_120 = ctx.get(x_, 120);
        if (at_120) {
            value_at_120 = **at_120;
            timestamp_at_120 = at_120->timestamp;
        }
        return CycleResult::ok();
    }
    
    HistoricInput<int> x_{"a", "x"};
    bool early_found{true};
    HistoryError early_error{HistoryError::Empty};
    int value_at_120{-1};
    Timestamp timestamp_at_120{0};
};

class TwiceReader : public Module {
public:
    TwiceReader() : Module("twice_reader") {}
    
    void declare(ModuleDeclaration& d) override {
        d.parameter(gain_);
    }
    
    CycleResult cycle(CycleContext& ctx) override {
        const double first = ctx.get(gain_);
        std::this_thread::sleep_for(std::chrono::microseconds(50));
        const double second = ctx.get(gain_);
        if (first != second || static_cast<uint64_t>(first) != ctx.parameter_generation()) {
            torn = true;
        }
        last = second;
        return CycleResult::ok();
    }
    
    Parameter<double> gain_{"control.gain"};
    std::atomic<bool> torn{false};
    double last{0.0};
};

class StateReporter : public Module {
public:
    StateReporter() : Module("state_reporter") {}
    
    void declare(ModuleDeclaration& d) override {
        d.cycler_state(steps_).output(reported_).persistent_state<int>();
    }
    
    CycleResult cycle(CycleContext& ctx) override {
        ctx.set(reported_, ctx.state(steps_));
        return CycleResult::ok();
    }
    
    CyclerState<int> steps_{"steps"};
    Output<int> reported_{"reported_steps"};
};

class Thrower : public Module {
public:
    Thrower() : Module("thrower") {}
    void declare(ModuleDeclaration&) override {}
    CycleResult cycle(CycleContext&) override {
        throw std::runtime_error("sensor frame corrupt");
    }
};

class NumberThrower : public Module {
public:
    NumberThrower() : Module("number_thrower") {}
    void declare(ModuleDeclaration&) override {}
    CycleResult cycle(CycleContext&) override {
        throw 42;
    }
};

/**
 * @brief Sees the ball on even ticks only
 */
class BearingDetector : public Module {
public:
    BearingDetector() : Module("detector") {}
    
    void declare(ModuleDeclaration& d) override {
        d.output(bearing_);
    }
    
    CycleResult cycle(CycleContext& ctx) override {
        if (ctx.tick() % 2 == 0) {
            ctx.set(bearing_, 0.5);
        }
        return CycleResult::ok();
    }
    
    Output<std::optional<double>> bearing_{"ball_bearing"};
};

/**
 * @brief tracked = injected bearing if set, else 2 * detected bearing
 */
class BearingTracker : public Module {
public:
    BearingTracker() : Module("tracker") {}
    
    void declare(ModuleDeclaration& d) override {
        d.required_input(bearing_).parameter(injected_).output(tracked_);
    }
    
    CycleResult cycle(CycleContext& ctx) override {
        ++runs;
        auto injected = ctx.get(injected_);
        ctx.set(tracked_, injected ? *injected : 2.0 * ctx.get(bearing_));
        return CycleResult::ok();
    }
    
    RequiredInput<double> bearing_{"detector", "ball_bearing"};
    Parameter<std::optional<double>> injected_{"tracker.injected_bearing"};
    Output<double> tracked_{"tracked"};
    int runs{0};
};

class BearingCopy : public Module {
public:
    BearingCopy() : Module("copy") {}
    
    void declare(ModuleDeclaration& d) override {
        d.required_input(bearing_).output(copied_);
    }
    
    CycleResult cycle(CycleContext& ctx) override {
        ctx.set(copied_, ctx.get(bearing_));
        return CycleResult::ok();
    }
    
    RequiredInput<double> bearing_{"a", "ball_bearing"};
    Output<double> copied_{"copied"};
};

std::shared_ptr<ParameterStore> make_parameters() {
    return std::make_shared<ParameterStore>(ParameterLeaves{
        {"control.gain", ParameterValue{0.0}},
        {"tracker.injected_bearing", ParameterValue{std::monostate{}}}
    });
}

} // anonymous namespace

int main() {
    std::cout << "=== Cycler Runtime Tests ===\n\n";
    
    // Test 1: Failure on tick 5
    {
        std::cout << "Test 1: Tick 5 fails, tick 4 stays visible\n";
        
        auto failing = std::make_unique<FailOnTick>(5);
        FailOnTick* failing_ptr = failing.get();
        
        PipelineDeclaration pipeline;
        pipeline.add_cycler("a", Trigger::event())
            .with_history<8>()
            .emplace<Counter>("counter", "x")
            .add(std::move(failing));
        pipeline.add_cycler("b", Trigger::event())
            .emplace<Relay>("consumer", "a", "x", "y");
        
        PipelineRuntime runtime(std::move(pipeline), make_parameters());
        
        for (Timestamp t = 100; t <= 400; t += 100) {
            assert(runtime.tick_once("a", t));
        }
        assert(!runtime.faults().actuation_halted());
        
        assert(!runtime.tick_once("a", 500));
        
        auto latest = runtime.latest("a");
        assert(latest->tick() == 4);
        assert(*latest->find<int>("x") == 4);
        assert(runtime.history("a")->latest()->timestamp == 400);
        assert(runtime.history("a")->size() == 4);
        assert(runtime.channel("a").publications() == 4);
        
        assert(runtime.faults().count(FaultKind::ModuleError) == 1);
        auto records = runtime.faults().records();
        assert(records.size() == 1);
        assert(records[0].cycler == "a");
        assert(records[0].module == "fail_on_tick");
        assert(records[0].tick == 5);
        assert(runtime.faults().actuation_halted());
        
        auto stats = runtime.statistics("a");
        assert(stats.ticks_started == 5);
        assert(stats.ticks_published == 4);
        assert(stats.ticks_aborted == 1);
        assert(stats.phase == TickPhase::Idle);
        
        // The consumer sees tick 4 in full, never a tick-5 database
        assert(runtime.tick_once("b", 550));
        assert(*runtime.latest("b")->find<int>("y") == 5);
        
        // Later ticks publish again and see the halt
        assert(runtime.tick_once("a", 600));
        assert(runtime.latest("a")->tick() == 6);
        assert(failing_ptr->actuation_seen.back() == false);
        
        runtime.faults().clear_actuation_halt();
        assert(!runtime.faults().actuation_halted());
        
        std::cout << "  PASS: Aborted tick not published, fault recorded, actuation halted\n\n";
    }
    
    // Test 2: Historic lookup across cyclers
    {
        std::cout << "Test 2: Historic access at t=90 and t=120\n";
        
        auto lookup = std::make_unique<TimestampLookup>();
        TimestampLookup* lookup_ptr = lookup.get();
        
        PipelineDeclaration pipeline;
        pipeline.add_cycler("a", Trigger::event())
            .with_history<4>()
            .emplace<Counter>("counter", "x");
        pipeline.add_cycler("b", Trigger::event())
            .add(std::move(lookup));
        
        PipelineRuntime runtime(std::move(pipeline), make_parameters());
        
        assert(runtime.tick_once("a", 100));        // x = 1 at t=100
        assert(runtime.tick_once("b", 150));
        
        assert(!lookup_ptr->early_found);
        assert(lookup_ptr->early_error == HistoryError::NoEntryOldEnough);
        assert(lookup_ptr->value_at_120 == 1);
        assert(lookup_ptr->timestamp_at_120 == 100);
        
        std::cout << "  PASS: t=90 has no entry old enough, t=120 yields x=1\n\n";
    }
    
    // Test 3: Parameters are tick-aligned
    {
        std::cout << "Test 3: One parameter generation per tick\n";
        
        auto reader = std::make_unique<TwiceReader>();
        TwiceReader* reader_ptr = reader.get();
        auto parameters = make_parameters();
        
        PipelineDeclaration pipeline;
        pipeline.add_cycler("control", Trigger::event()).add(std::move(reader));
        PipelineRuntime runtime(std::move(pipeline), parameters);
        
        // Value written equals the generation it creates
        std::atomic<bool> done{false};
        std::thread writer([&]() {
            for (int k = 1; k <= 300; ++k) {
                auto written = parameters->write("control.gain", static_cast<double>(k));
                assert(written);
                std::this_thread::sleep_for(std::chrono::microseconds(20));
            }
            done.store(true);
        });
        
        Timestamp t = 1;
        while (!done.load()) {
            assert(runtime.tick_once("control", t++));
        }
        writer.join();
        assert(!reader_ptr->torn.load());
        
        assert(runtime.tick_once("control", t++));
        assert(reader_ptr->last == 300.0);
        
        std::cout << "  PASS: No tick observed two generations\n\n";
    }
    
    // Test 4: Cycler state
    {
        std::cout << "Test 4: Cycler state shared across modules and ticks\n";
        
        PipelineDeclaration pipeline;
        pipeline.add_cycler("gait", Trigger::event())
            .emplace<StateUser<int>>("stepper", "steps")
            .emplace<StateReporter>();
        PipelineRuntime runtime(std::move(pipeline), make_parameters());
        
        for (Timestamp t = 1; t <= 3; ++t) {
            assert(runtime.tick_once("gait", t));
        }
        assert(*runtime.latest("gait")->find<int>("reported_steps") == 3);
        
        std::cout << "  PASS: State accumulated to 3\n\n";
    }
    
    // Test 5: Out-of-order timestamps, exceptions, stale inputs
    {
        std::cout << "Test 5: History order, exceptions and staleness faults\n";
        
        PipelineDeclaration pipeline;
        pipeline.add_cycler("a", Trigger::event())
            .with_history<4>()
            .emplace<Counter>("counter", "x");
        pipeline.add_cycler("b", Trigger::event())
            .with_max_input_staleness(Milliseconds(10))
            .emplace<Relay>("consumer", "a", "x", "y");
        pipeline.add_cycler("c", Trigger::event())
            .emplace<Thrower>();
        
        PipelineRuntime runtime(std::move(pipeline), make_parameters(),
                                RuntimeOptions{.fault_policy = FaultPolicy::RecordOnly});
        
        assert(runtime.tick_once("a", 200_ms));
        assert(!runtime.tick_once("a", 100_ms));
        assert(runtime.faults().count(FaultKind::HistoryOutOfOrder) == 1);
        assert(runtime.latest("a")->tick() == 1);
        assert(runtime.channel("a").publications() == 1);
        
        assert(runtime.tick_once("b", 205_ms));
        assert(runtime.faults().count(FaultKind::StaleInput) == 0);
        assert(runtime.tick_once("b", 260_ms));        // input is 60ms old
        assert(runtime.faults().count(FaultKind::StaleInput) == 1);
        
        assert(!runtime.tick_once("c", 1));
        auto records = runtime.faults().records();
        assert(records.back().kind == FaultKind::ModuleError);
        assert(records.back().message.find("sensor frame corrupt") != std::string::npos);
        
        assert(!runtime.faults().actuation_halted());
        assert(runtime.faults().total() == 3);
        
        std::cout << "  PASS: Faults recorded, RecordOnly keeps actuation enabled\n\n";
    }
    
    // Test 6: Invalid pipelines never run
    {
        std::cout << "Test 6: Construction rejects invalid wiring\n";
        
        PipelineDeclaration pipeline;
        pipeline.add_cycler("c", Trigger::event())
            .emplace<Relay>("m1", "m2", "y", "x")
            .emplace<Relay>("m2", "m1", "x", "y");
        
        bool thrown = false;
        try {
            PipelineRuntime runtime(std::move(pipeline), make_parameters());
        } catch (const PipelineCompileError& e) {
            thrown = true;
            assert(e.diagnostics().size() == 1);
            assert(std::string(e.what()).find("m1 -> m2 -> m1") != std::string::npos);
        }
        assert(thrown);
        
        std::cout << "  PASS: PipelineCompileError carries the diagnostics\n\n";
    }
    
    // Test 7: Threads
    {
        std::cout << "Test 7: Periodic, event and after triggers on threads\n";
        
        PipelineDeclaration pipeline;
        pipeline.add_cycler("control", Trigger::periodic(Milliseconds(2)))
            .with_history<64>()
            .emplace<Counter>("counter", "x");
        pipeline.add_cycler("logger", Trigger::after("control"))
            .emplace<Relay>("follower", "control", "x", "y");
        pipeline.add_cycler("vision", Trigger::event())
            .emplace<Relay>("detector", "control", "x", "ball");
        
        PipelineRuntime runtime(std::move(pipeline), make_parameters());
        
        bool rejected = false;
        try {
            runtime.notify("control", Time::now());
        } catch (const std::invalid_argument&) {
            rejected = true;
        }
        assert(rejected);
        
        runtime.start();
        assert(runtime.is_running());
        
        for (int i = 0; i < 5; ++i) {
            Time::sleep(Milliseconds(20));
            runtime.notify("vision", Time::now());
        }
        Time::sleep(Milliseconds(20));
        
        runtime.stop();
        runtime.stop();
        assert(!runtime.is_running());
        
        auto control = runtime.statistics("control");
        auto logger = runtime.statistics("logger");
        auto vision = runtime.statistics("vision");
        assert(control.ticks_published >= 10);
        assert(logger.ticks_published >= 1);
        assert(vision.ticks_published >= 1);
        assert(control.phase == TickPhase::Stopped);
        assert(logger.phase == TickPhase::Stopped);
        assert(runtime.faults().total() == 0);
        
        // A published database is always complete
        auto follower = runtime.latest("logger");
        assert(*follower->find<int>("y") >= 2);
        assert(*runtime.latest("control")->find<int>("x") == static_cast<int>(runtime.latest("control")->tick()));
        
        std::cout << "  control=" << control.ticks_published << " logger=" << logger.ticks_published
                  << " vision=" << vision.ticks_published << " ticks\n";
        std::cout << "  PASS: All cyclers ticked and stopped cleanly\n\n";
    }
    
    // Test 8: Required inputs and nullable parameters
    {
        std::cout << "Test 8: Skipped modules and nullable parameters\n";
        
        auto tracker = std::make_unique<BearingTracker>();
        BearingTracker* tracker_ptr = tracker.get();
        auto parameters = make_parameters();
        
        PipelineDeclaration pipeline;
        pipeline.add_cycler("a", Trigger::event())
            .emplace<BearingDetector>()
            .add(std::move(tracker));
        pipeline.add_cycler("b", Trigger::event())
            .emplace<BearingCopy>();
        
        PipelineRuntime runtime(std::move(pipeline), parameters);
        
        // Producer never published: the copy is skipped, its output defaulted
        assert(runtime.tick_once("b", 1));
        assert(*runtime.latest("b")->find<double>("copied") == 0.0);
        assert(runtime.statistics("b").modules_skipped == 1);
        
        // Odd tick: no bearing, tracker skipped, the tick still publishes
        assert(runtime.tick_once("a", 10));
        assert(tracker_ptr->runs == 0);
        assert(*runtime.latest("a")->find<double>("tracked") == 0.0);
        assert(!runtime.latest("a")->find<std::optional<double>>("ball_bearing")->has_value());
        assert(runtime.statistics("a").modules_skipped == 1);
        
        // Published but empty is absent too
        assert(runtime.tick_once("b", 11));
        assert(runtime.statistics("b").modules_skipped == 2);
        
        assert(runtime.tick_once("a", 20));
        assert(tracker_ptr->runs == 1);
        assert(*runtime.latest("a")->find<double>("tracked") == 1.0);
        
        assert(runtime.tick_once("b", 21));
        assert(*runtime.latest("b")->find<double>("copied") == 0.5);
        assert(runtime.statistics("b").modules_skipped == 2);
        
        assert(parameters->write("tracker.injected_bearing", 3.0));
        assert(runtime.tick_once("a", 30));
        assert(runtime.tick_once("a", 40));
        assert(*runtime.latest("a")->find<double>("tracked") == 3.0);
        
        assert(parameters->write_null("tracker.injected_bearing"));
        assert(runtime.tick_once("a", 50));
        assert(runtime.tick_once("a", 60));
        assert(*runtime.latest("a")->find<double>("tracked") == 1.0);
        
        auto stats = runtime.statistics("a");
        assert(tracker_ptr->runs == 3);
        assert(stats.modules_skipped == 3);
        assert(stats.ticks_published == 6);
        assert(runtime.faults().total() == 0);
        
        std::cout << "  PASS: Absent inputs skip the module, null parameter reads as nullopt\n\n";
    }
    
    // Test 9: Non-standard exceptions
    {
        std::cout << "Test 9: throw 42 and a throwing fault callback\n";
        
        PipelineDeclaration pipeline;
        pipeline.add_cycler("c", Trigger::event())
            .emplace<NumberThrower>();
        pipeline.add_cycler("control", Trigger::periodic(Milliseconds(2)))
            .emplace<Counter>("counter", "x");
        
        PipelineRuntime runtime(std::move(pipeline), make_parameters(),
                                RuntimeOptions{.fault_policy = FaultPolicy::RecordOnly});
        
        std::atomic<int> delivered{0};
        runtime.faults().on_fault([](const Fault&) {
            throw std::runtime_error("dashboard disconnected");
        });
        runtime.faults().on_fault([](const Fault&) {
            throw 7;
        });
        runtime.faults().on_fault([&](const Fault&) {
            delivered.fetch_add(1);
        });
        
        assert(!runtime.tick_once("c", 1));
        assert(runtime.channel("c").publications() == 0);
        auto records = runtime.faults().records();
        assert(records.size() == 1);
        assert(records[0].kind == FaultKind::ModuleError);
        assert(records[0].module == "number_thrower");
        assert(records[0].message.find("unknown exception") != std::string::npos);
        assert(delivered.load() == 1);
        
        // The same module on a cycler thread leaves the thread running
        runtime.start();
        for (int i = 0; i < 3; ++i) {
            runtime.notify("c", Time::now());
            Time::sleep(Milliseconds(10));
        }
        runtime.stop();
        
        auto thrower = runtime.statistics("c");
        assert(thrower.ticks_aborted >= 2);
        assert(thrower.ticks_published == 0);
        assert(thrower.phase == TickPhase::Stopped);
        assert(runtime.statistics("control").ticks_published >= 1);
        assert(delivered.load() == static_cast<int>(runtime.faults().total()));
        
        std::cout << "  PASS: Fault recorded as unknown exception, callbacks isolated\n\n";
    }
    
    // Test 10: stop() during a tick
    {
        std::cout << "Test 10: Tick interrupted by shutdown is discarded\n";
        
        PipelineRuntime* runtime_ptr = nullptr;
        int after_stop_runs = 0;
        
        PipelineDeclaration pipeline;
        pipeline.add_cycler("a", Trigger::event())
            .with_history<4>()
            .emplace<Counter>("counter", "x")
            .emplace<Scripted>("stopper", [&](CycleContext& ctx) {
                if (ctx.tick() == 2) {
                    runtime_ptr->stop();
                }
                return CycleResult::ok();
            })
            .emplace<Scripted>("after_stopper", [&](CycleContext&) {
                ++after_stop_runs;
                return CycleResult::ok();
            });
        
        PipelineRuntime runtime(std::move(pipeline), make_parameters());
        runtime_ptr = &runtime;
        runtime.start();
        
        assert(runtime.tick_once("a", 100));
        assert(after_stop_runs == 1);
        
        assert(!runtime.tick_once("a", 200));
        assert(!runtime.is_running());
        assert(after_stop_runs == 1);
        
        auto stats = runtime.statistics("a");
        assert(stats.ticks_started == 2);
        assert(stats.ticks_published == 1);
        assert(stats.ticks_discarded == 1);
        assert(stats.ticks_aborted == 0);
        assert(runtime.channel("a").publications() == 1);
        assert(runtime.history("a")->size() == 1);
        assert(runtime.latest("a")->tick() == 1);
        assert(runtime.faults().total() == 0);
        
        // Later ticks are discarded as well
        assert(!runtime.tick_once("a", 300));
        assert(runtime.statistics("a").ticks_discarded == 2);
        assert(runtime.channel("a").publications() == 1);
        
        std::cout << "  PASS: Nothing published, no fault, later modules not run\n\n";
    }
    
    // Test 11: No restart
    {
        std::cout << "Test 11: start() after stop()\n";
        
        PipelineDeclaration pipeline;
        pipeline.add_cycler("control", Trigger::periodic(Milliseconds(2)))
            .emplace<Counter>("counter", "x");
        PipelineRuntime runtime(std::move(pipeline), make_parameters());
        
        runtime.start();
        runtime.start();
        Time::sleep(Milliseconds(10));
        runtime.stop();
        
        bool rejected = false;
        try {
            runtime.start();
        } catch (const std::logic_error&) {
            rejected = true;
        }
        assert(rejected);
        assert(!runtime.is_running());
        
        std::cout << "  PASS: Restart rejected with std::logic_error\n\n";
    }
    
    std::cout << "=== All Cycler Runtime Tests Passed ===\n";
    return 0;
}
