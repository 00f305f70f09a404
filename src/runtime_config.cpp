/**
 * @file runtime_config.cpp
 * @brief Config loading and pipeline assembly from the module catalog
 */

#include <tickflow/runtime/runtime_config.hpp>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace tickflow {

// ============================================================================
// ModuleCatalog
// ============================================================================

ModuleCatalog& ModuleCatalog::add(std::string name, Factory factory) {
    if (!factory) {
        throw std::invalid_argument("[ModuleCatalog] empty factory for '" + name + "'");
    }
    if (!factories_.emplace(name, std::move(factory)).second) {
        throw std::invalid_argument("[ModuleCatalog] module '" + name + "' registered twice");
    }
    return *this;
}

bool ModuleCatalog::contains(std::string_view name) const {
    return factories_.find(name) != factories_.end();
}

std::unique_ptr<Module> ModuleCatalog::create(std::string_view name) const {
    auto it = factories_.find(name);
    if (it == factories_.end()) {
        throw std::invalid_argument("[ModuleCatalog] unknown module '" + std::string(name) + "'");
    }
    return it->second();
}

std::vector<std::string> ModuleCatalog::names() const {
    std::vector<std::string> names;
    for (const auto& [name, factory] : factories_) {
        names.push_back(name);
    }
    return names;
}

// ============================================================================
// Loading
// ============================================================================

RuntimeConfig load_runtime_config(const std::string& path) {
    auto config = rfl::json::load<RuntimeConfig>(path);
    if (!config) {
        throw std::runtime_error("[RuntimeConfig] cannot load '" + path + "'");
    }
    return config.value();
}

std::shared_ptr<ParameterStore> load_parameters(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("[RuntimeConfig] cannot open parameter file '" + path + "'");
    }
    std::stringstream text;
    text << file.rdbuf();
    
    auto store = ParameterStore::from_json(text.str());
    if (!store) {
        throw std::runtime_error("[RuntimeConfig] parameter file '" + path + "': "
                                 + to_string(store.error()));
    }
    return *store;
}

// ============================================================================
// Assembly
// ============================================================================

namespace {

Trigger make_trigger(const CyclerConfig& cycler) {
    if (cycler.triggered_by && cycler.period_ms) {
        throw std::invalid_argument("[" + cycler.name + "] period_ms and triggered_by are exclusive");
    }
    if (cycler.triggered_by) {
        return Trigger::after(*cycler.triggered_by);
    }
    if (cycler.period_ms) {
        return Trigger::periodic(Milliseconds(*cycler.period_ms));
    }
    return Trigger::event();
}

ThreadConfig make_thread_config(const CyclerConfig& cycler) {
    ThreadConfig thread;
    thread.name = cycler.name;
    if (cycler.realtime.value_or(false)) {
        thread.policy = SchedulingPolicy::FIFO;
        thread.priority = static_cast<ThreadPriority>(cycler.priority.value_or(
            static_cast<int>(ThreadPriority::HIGH)));
    }
    thread.cpu_affinity = cycler.cpu_affinity.value_or(-1);
    return thread;
}

} // anonymous namespace

PipelineDeclaration build_pipeline(const RuntimeConfig& config, const ModuleCatalog& catalog) {
    PipelineDeclaration pipeline;
    for (const auto& cycler : config.cyclers) {
        CyclerDeclaration& declaration = pipeline.add_cycler(cycler.name, make_trigger(cycler));
        declaration.with_thread(make_thread_config(cycler));
        
        if (cycler.history_capacity) {
            declaration.with_history_capacity(*cycler.history_capacity);
        }
        if (cycler.max_input_staleness_ms) {
            declaration.with_max_input_staleness(Milliseconds(*cycler.max_input_staleness_ms));
        }
        for (const auto& module : cycler.modules) {
            declaration.add(catalog.create(module));
        }
        
        std::cout << "[RuntimeConfig] Cycler " << cycler.name << ": " << cycler.modules.size()
                  << " module(s), " << declaration.trigger().describe() << "\n";
    }
    return pipeline;
}

RuntimeOptions runtime_options(const RuntimeConfig& config) {
    RuntimeOptions options;
    options.fault_policy = config.fault_policy.value_or(FaultPolicy::HaltActuation);
    options.log_ticks = config.log_ticks.value_or(options.log_ticks);
    return options;
}

} // namespace tickflow
