/**
 * @file runtime_config.hpp
 * @brief JSON-configured pipelines: cycler layout, module catalog, options
 * 
 * Example config:
 * @code{.json}
 * {
 *   "cyclers": [
 *     {"name": "control", "period_ms": 10, "history_capacity": 64,
 *      "realtime": true, "priority": 80,
 *      "modules": ["state_estimator", "gait_controller"]},
 *     {"name": "vision", "modules": ["ball_detection"],
 *      "max_input_staleness_ms": 50}
 *   ],
 *   "parameters_file": "parameters.json",
 *   "fault_policy": "HaltActuation"
 * }
 * @endcode
 * 
 * A cycler without period_ms and triggered_by is event driven.
 */

#pragma once

#include <tickflow/pipeline/pipeline_declaration.hpp>
#include <tickflow/runtime/pipeline_runtime.hpp>
#include <rfl.hpp>
#include <rfl/json.hpp>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tickflow {

struct CyclerConfig {
    std::string name;
    std::vector<std::string> modules;               ///< Catalog names, declaration order
    std::optional<uint32_t> period_ms;
    std::optional<std::string> triggered_by;        ///< Tick after each publication of this cycler
    std::optional<uint32_t> history_capacity;
    std::optional<uint32_t> max_input_staleness_ms;
    std::optional<int> priority;                    ///< 1-99, used with realtime
    std::optional<bool> realtime;                   ///< SCHED_FIFO
    std::optional<int> cpu_affinity;
};

struct RuntimeConfig {
    std::vector<CyclerConfig> cyclers;
    std::optional<std::string> parameters_file;     ///< Relative to the config file
    std::optional<FaultPolicy> fault_policy;
    std::optional<uint32_t> log_ticks;
};

/**
 * @brief Named module factories, so configs can refer to modules by name
 * 
 * A name creates a fresh module instance each time; the instance's module
 * name is whatever the module class reports.
 */
class ModuleCatalog {
public:
    using Factory = std::function<std::unique_ptr<Module>()>;
    
    /**
     * @throws std::invalid_argument if name is already registered
     */
    ModuleCatalog& add(std::string name, Factory factory);
    
    template<typename M>
    ModuleCatalog& add(std::string name) {
        return add(std::move(name), [] { return std::make_unique<M>(); });
    }
    
    bool contains(std::string_view name) const;
    
    /**
     * @throws std::invalid_argument for unknown names
     */
    std::unique_ptr<Module> create(std::string_view name) const;
    
    std::vector<std::string> names() const;
    
private:
    std::map<std::string, Factory, std::less<>> factories_;
};

/**
 * @throws std::runtime_error if the file is missing or malformed
 */
RuntimeConfig load_runtime_config(const std::string& path);

/**
 * @brief Seed a parameter store from a JSON file
 * @throws std::runtime_error if the file is missing or not a valid tree
 */
std::shared_ptr<ParameterStore> load_parameters(const std::string& path);

/**
 * @brief Declare the configured cyclers with modules from the catalog
 * @throws std::invalid_argument for unknown modules, unsupported history
 *         capacities or contradicting triggers
 */
PipelineDeclaration build_pipeline(const RuntimeConfig& config, const ModuleCatalog& catalog);

RuntimeOptions runtime_options(const RuntimeConfig& config);

} // namespace tickflow
