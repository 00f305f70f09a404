/**
 * @file runtime_main.hpp
 * @brief Process entry point for configured pipelines
 * 
 * Usage: ./robot config.json
 * 
 * Loads the RuntimeConfig and its parameter file, builds the pipeline from
 * a ModuleCatalog, prints the execution plan, runs until SIGINT/SIGTERM
 * and shuts down cleanly.
 */

#pragma once

#include <tickflow/runtime/runtime_config.hpp>
#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>

namespace tickflow {

inline std::atomic<bool> g_shutdown_requested{false};

inline void signal_handler(int /*signal*/) {
    g_shutdown_requested.store(true);
}

/**
 * @return Exit code (0=success, 1=error, 130=stopped by signal)
 */
inline int runtime_main(const RuntimeConfig& config,
                        const std::filesystem::path& config_dir,
                        const ModuleCatalog& catalog) {
    try {
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);
        
        std::shared_ptr<ParameterStore> parameters;
        if (config.parameters_file) {
            std::filesystem::path file(*config.parameters_file);
            if (file.is_relative()) {
                file = config_dir / file;
            }
            parameters = load_parameters(file.string());
        } else {
            parameters = std::make_shared<ParameterStore>();
        }
        
        PipelineRuntime runtime(build_pipeline(config, catalog), parameters, runtime_options(config));
        std::cout << runtime.plan().describe();
        
        runtime.start();
        std::cout << "Pipeline running (press Ctrl+C to stop)...\n";
        
        while (!g_shutdown_requested.load()) {
            Time::sleep(Milliseconds(100));
        }
        
        std::cout << "\nShutting down...\n";
        runtime.stop();
        
        std::cout << "Faults recorded: " << runtime.faults().total() << "\n";
        return 130;
        
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
}

inline int runtime_main(int argc, char** argv, const ModuleCatalog& catalog) {
    if (argc != 2) {
        std::cerr << "ERROR: Configuration file required\n";
        std::cerr << "Usage: " << argv[0] << " <config.json>\n";
        std::cerr << "Modules available:";
        for (const auto& name : catalog.names()) {
            std::cerr << " " << name;
        }
        std::cerr << "\n";
        return 1;
    }
    
    std::string filename = argv[1];
    if (!filename.ends_with(".json")) {
        std::cerr << "ERROR: Only JSON config files supported (got: " << filename << ")\n";
        return 1;
    }
    
    try {
        RuntimeConfig config = load_runtime_config(filename);
        return runtime_main(config, std::filesystem::path(filename).parent_path(), catalog);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}

} // namespace tickflow

/**
 * @brief Generate main() for a binary running a configured pipeline
 * 
 * @code
 * tickflow::ModuleCatalog robot_modules() {
 *     tickflow::ModuleCatalog catalog;
 *     catalog.add<StateEstimator>("state_estimator");
 *     return catalog;
 * }
 * 
 * TICKFLOW_RUNTIME_MAIN(robot_modules)
 * @endcode
 */
#define TICKFLOW_RUNTIME_MAIN(CatalogFunction) \
    int main(int argc, char** argv) { \
        return tickflow::runtime_main(argc, argv, CatalogFunction()); \
    }
