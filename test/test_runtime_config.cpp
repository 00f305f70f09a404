/**
 * @file test_runtime_config.cpp
 * @brief JSON runtime configuration, module catalog and pipeline assembly
 * 
 * Validates:
 * - RuntimeConfig / parameter files load through reflect-cpp
 * - Triggers, history and thread settings map onto the declaration
 * - Catalog and config errors raised before anything runs
 */

#include "test_modules.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

using namespace tickflow;
using namespace tickflow::test;

namespace {

std::string write_file(const std::string& name, const std::string& content) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream file(path);
    file << content;
    return path.string();
}

class GainFollower : public Module {
public:
    GainFollower() : Module("gain_follower") {}
    
    void declare(ModuleDeclaration& d) override {
        d.input(x_).parameter(gain_).output(scaled_);
    }
    
    CycleResult cycle(CycleContext& ctx) override {
        const int* x = ctx.get(x_);
        ctx.set(scaled_, x ? *x * ctx.get(gain_) : 0.0);
        return CycleResult::ok();
    }
    
    Input<int> x_{"sensors", "x"};
    Parameter<double> gain_{"follower.gain"};
    Output<double> scaled_{"scaled"};
};

ModuleCatalog make_catalog() {
    ModuleCatalog catalog;
    catalog.add("counter", [] { return std::make_unique<Counter>("counter", "x"); });
    catalog.add<GainFollower>("gain_follower");
    return catalog;
}

} // anonymous namespace

int main() {
    std::cout << "=== Runtime Config Tests ===\n\n";
    
    // Test 1: Catalog
    {
        std::cout << "Test 1: Module catalog\n";
        
        auto catalog = make_catalog();
        assert(catalog.contains("counter"));
        assert(!catalog.contains("planner"));
        assert(catalog.names() == (std::vector<std::string>{"counter", "gain_follower"}));
        assert(catalog.create("gain_follower")->name() == "gain_follower");
        
        bool unknown = false;
        try {
            catalog.create("planner");
        } catch (const std::invalid_argument&) {
            unknown = true;
        }
        assert(unknown);
        
        bool duplicate = false;
        try {
            catalog.add<GainFollower>("gain_follower");
        } catch (const std::invalid_argument&) {
            duplicate = true;
        }
        assert(duplicate);
        
        std::cout << "  PASS: Factories registered and resolved by name\n\n";
    }
    
    // Test 2: Load, build and run
    {
        std::cout << "Test 2: Config file to running pipeline\n";
        
        auto config_path = write_file("tickflow_test_config.json", R"({
            "cyclers": [
                {"name": "sensors", "modules": ["counter"], "history_capacity": 32},
                {"name": "follower", "modules": ["gain_follower"],
                 "triggered_by": "sensors", "max_input_staleness_ms": 100},
                {"name": "idle", "modules": [], "period_ms": 5, "cpu_affinity": 0}
            ],
            "parameters_file": "tickflow_test_parameters.json",
            "fault_policy": "RecordOnly",
            "log_ticks": 1
        })");
        auto parameters_path = write_file("tickflow_test_parameters.json",
                                          R"({"follower": {"gain": 2.5}})");
        
        RuntimeConfig config = load_runtime_config(config_path);
        assert(config.cyclers.size() == 3);
        assert(config.cyclers[0].history_capacity == 32u);
        assert(!config.cyclers[0].period_ms);
        assert(config.cyclers[1].triggered_by == std::string("sensors"));
        assert(config.parameters_file == std::string("tickflow_test_parameters.json"));
        
        RuntimeOptions options = runtime_options(config);
        assert(options.fault_policy == FaultPolicy::RecordOnly);
        assert(options.log_ticks == 1);
        
        auto pipeline = build_pipeline(config, make_catalog());
        const CyclerDeclaration* sensors = pipeline.find("sensors");
        assert(sensors->trigger().kind() == TriggerKind::Event);
        assert(sensors->history_capacity() == 32);
        assert(pipeline.find("follower")->trigger().kind() == TriggerKind::After);
        assert(pipeline.find("follower")->max_input_staleness() == Milliseconds(100));
        assert(pipeline.find("idle")->trigger().period() == Milliseconds(5));
        assert(pipeline.find("idle")->thread().cpu_affinity == 0);
        assert(pipeline.find("idle")->thread().name == "idle");
        
        PipelineRuntime runtime(std::move(pipeline), load_parameters(parameters_path), options);
        assert(runtime.plan().cyclers().size() == 3);
        assert(runtime.history("sensors")->capacity() == 32);
        
        assert(runtime.tick_once("sensors", 1));
        assert(runtime.tick_once("follower", 1));
        assert(*runtime.latest("follower")->find<double>("scaled") == 2.5);
        
        std::filesystem::remove(config_path);
        std::filesystem::remove(parameters_path);
        
        std::cout << "  PASS: Configured pipeline compiled and ticked\n\n";
    }
    
    // Test 3: Config errors
    {
        std::cout << "Test 3: Invalid configurations\n";
        
        auto catalog = make_catalog();
        
        auto expect_invalid = [&](RuntimeConfig config) {
            try {
                build_pipeline(config, catalog);
            } catch (const std::invalid_argument& e) {
                std::cout << "  rejected: " << e.what() << "\n";
                return true;
            }
            return false;
        };
        
        RuntimeConfig unknown_module;
        unknown_module.cyclers.push_back(CyclerConfig{.name = "a", .modules = {"planner"}});
        assert(expect_invalid(unknown_module));
        
        RuntimeConfig bad_capacity;
        bad_capacity.cyclers.push_back(CyclerConfig{.name = "a", .history_capacity = 100});
        assert(expect_invalid(bad_capacity));
        
        RuntimeConfig two_triggers;
        two_triggers.cyclers.push_back(CyclerConfig{.name = "a", .period_ms = 10, .triggered_by = "b"});
        assert(expect_invalid(two_triggers));
        
        bool missing_file = false;
        try {
            load_runtime_config("/nonexistent/tickflow.json");
        } catch (const std::runtime_error&) {
            missing_file = true;
        }
        assert(missing_file);
        
        bool bad_parameters = false;
        auto path = write_file("tickflow_bad_parameters.json", R"({"a": [1, "x"]})");
        try {
            load_parameters(path);
        } catch (const std::runtime_error&) {
            bad_parameters = true;
        }
        std::filesystem::remove(path);
        assert(bad_parameters);
        
        std::cout << "  PASS: Errors raised before any cycler exists\n\n";
    }
    
    std::cout << "=== All Runtime Config Tests Passed ===\n";
    return 0;
}
