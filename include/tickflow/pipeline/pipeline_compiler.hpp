/**
 * @file pipeline_compiler.hpp
 * @brief Turns module declarations into a validated execution plan
 * 
 * For every cycler the compiler
 * 1. collects the ModuleDeclaration of each module,
 * 2. resolves each input to exactly one producer (own tick, another
 *    cycler's channel, a historic buffer) and each parameter to a leaf,
 * 3. orders the modules topologically, ties broken by declaration order,
 * 4. binds every handle to its wire.
 * 
 * All problems are collected into diagnostics; handles are only bound when
 * there are none, so a pipeline either compiles completely or not at all.
 */

#pragma once

#include <tickflow/pipeline/diagnostics.hpp>
#include <tickflow/pipeline/pipeline_declaration.hpp>
#include <tickflow/parameters/parameter_store.hpp>
#include <any>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tickflow {

/**
 * @brief One resolved requirement, for describe() and tooling
 */
struct WiringEntry {
    std::string module;
    std::string requirement;    ///< Field, parameter path or state name as declared
    WireKind kind;
    std::string source;         ///< Producer module, cycler or parameter path
};

struct StateSlot {
    std::string name;
    std::string type_name;
    std::function<std::any()> make_default;
};

struct CyclerPlan {
    std::string name;
    std::size_t index{0};
    Trigger trigger{Trigger::event()};
    std::optional<std::size_t> trigger_source;      ///< Cycler index for After triggers
    std::vector<std::size_t> order;                 ///< Module indices in execution order
    std::vector<std::string> module_names;          ///< Same order
    std::vector<std::vector<Wire>> required_inputs; ///< Same order; all must be present to run
    std::vector<std::string> persistent_states;     ///< Same order; empty if none declared
    std::shared_ptr<const DatabaseLayout> layout;
    std::vector<std::size_t> upstream;              ///< Cyclers read through channels
    std::vector<std::size_t> historic_sources;      ///< Cyclers read through histories
    std::vector<StateSlot> states;
    std::vector<WiringEntry> wiring;
    std::size_t history_capacity{0};
};

class ExecutionPlan {
public:
    explicit ExecutionPlan(std::vector<CyclerPlan> cyclers)
        : cyclers_(std::move(cyclers)) {}
    
    const std::vector<CyclerPlan>& cyclers() const noexcept { return cyclers_; }
    
    const CyclerPlan* find(std::string_view cycler) const {
        for (const auto& plan : cyclers_) {
            if (plan.name == cycler) {
                return &plan;
            }
        }
        return nullptr;
    }
    
    /**
     * @brief Render order and wiring as text; identical input gives identical text
     */
    std::string describe() const;
    
private:
    std::vector<CyclerPlan> cyclers_;
};

struct CompileResult {
    std::optional<ExecutionPlan> plan;
    std::vector<Diagnostic> diagnostics;
    
    explicit operator bool() const noexcept { return plan.has_value(); }
};

class PipelineCompiler {
public:
    explicit PipelineCompiler(const ParameterStore& parameters)
        : parameters_(parameters) {}
    
    /**
     * @brief Validate and plan the pipeline
     * 
     * Calls declare() on every module. On success every handle of every
     * module is bound; on failure no handle is touched.
     */
    CompileResult compile(const PipelineDeclaration& pipeline) const;
    
private:
    const ParameterStore& parameters_;
};

} // namespace tickflow
