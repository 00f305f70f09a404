/**
 * @file pipeline_compiler.cpp
 * @brief Dependency extraction, wiring and ordering of cycler pipelines
 */

#include <tickflow/pipeline/pipeline_compiler.hpp>
#include <algorithm>
#include <deque>
#include <iostream>
#include <map>
#include <set>
#include <sstream>
#include <tuple>
#include <typeindex>

namespace tickflow {

namespace {

struct ModuleInfo {
    Module* module;
    ModuleDeclaration declaration;
};

struct CyclerInfo {
    const CyclerDeclaration* declaration;
    std::vector<ModuleInfo> modules;
    std::vector<FieldDescriptor> fields;
    std::vector<std::size_t> field_owner;           ///< Module index per field
    std::vector<HandleBase*> field_handles;
    std::set<std::pair<std::size_t, std::size_t>> edges;  ///< producer -> consumer
    std::set<std::size_t> upstream;
    std::set<std::size_t> historic_sources;
    std::vector<StateSlot> states;
    std::vector<std::size_t> state_owner;
    std::vector<std::type_index> state_types;
    std::vector<WiringEntry> wiring;
    std::vector<std::size_t> order;
};

struct Candidate {
    Wire wire;
    std::string source;
    std::optional<std::size_t> producer_module;     ///< Set for current-tick wires
    const FieldDescriptor* descriptor;
};

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string text;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            text += separator;
        }
        text += parts[i];
    }
    return text;
}

std::string qualified(const std::string& producer, const std::string& field) {
    return producer.empty() ? field : producer + "." + field;
}

/**
 * @brief Strongly connected components, Tarjan's algorithm
 */
class ComponentFinder {
public:
    explicit ComponentFinder(const std::vector<std::set<std::size_t>>& successors)
        : successors_(successors),
          index_(successors.size(), kUnvisited),
          lowlink_(successors.size(), 0),
          on_stack_(successors.size(), false) {}
    
    std::vector<std::vector<std::size_t>> find(const std::set<std::size_t>& nodes) {
        nodes_ = &nodes;
        for (std::size_t node : nodes) {
            if (index_[node] == kUnvisited) {
                visit(node);
            }
        }
        return components_;
    }
    
private:
    static constexpr std::size_t kUnvisited = static_cast<std::size_t>(-1);
    
    void visit(std::size_t node) {
        index_[node] = lowlink_[node] = next_index_++;
        stack_.push_back(node);
        on_stack_[node] = true;
        
        for (std::size_t next : successors_[node]) {
            if (!nodes_->contains(next)) {
                continue;
            }
            if (index_[next] == kUnvisited) {
                visit(next);
                lowlink_[node] = std::min(lowlink_[node], lowlink_[next]);
            } else if (on_stack_[next]) {
                lowlink_[node] = std::min(lowlink_[node], index_[next]);
            }
        }
        
        if (lowlink_[node] == index_[node]) {
            std::vector<std::size_t> component;
            std::size_t member;
            do {
                member = stack_.back();
                stack_.pop_back();
                on_stack_[member] = false;
                component.push_back(member);
            } while (member != node);
            std::sort(component.begin(), component.end());
            components_.push_back(std::move(component));
        }
    }
    
    const std::vector<std::set<std::size_t>>& successors_;
    const std::set<std::size_t>* nodes_{nullptr};
    std::vector<std::size_t> index_;
    std::vector<std::size_t> lowlink_;
    std::vector<bool> on_stack_;
    std::vector<std::size_t> stack_;
    std::size_t next_index_{0};
    std::vector<std::vector<std::size_t>> components_;
};

/**
 * @brief Shortest cycle through the smallest node of a cyclic component
 * @return Node sequence, first node repeated at the end
 */
std::vector<std::size_t> shortest_cycle(const std::vector<std::set<std::size_t>>& successors,
                                        const std::vector<std::size_t>& component) {
    const std::size_t start = component.front();
    const std::set<std::size_t> members(component.begin(), component.end());
    
    std::map<std::size_t, std::size_t> parent;
    std::deque<std::size_t> queue{start};
    std::set<std::size_t> seen{start};
    
    while (!queue.empty()) {
        std::size_t node = queue.front();
        queue.pop_front();
        for (std::size_t next : successors[node]) {
            if (!members.contains(next)) {
                continue;
            }
            if (next == start) {
                std::vector<std::size_t> cycle{start};
                for (std::size_t at = node; at != start; at = parent[at]) {
                    cycle.insert(cycle.begin() + 1, at);
                }
                cycle.push_back(start);
                return cycle;
            }
            if (seen.insert(next).second) {
                parent[next] = node;
                queue.push_back(next);
            }
        }
    }
    return {};
}

class CompilerPass {
public:
    CompilerPass(const PipelineDeclaration& pipeline, const ParameterSnapshot& parameters)
        : pipeline_(pipeline), parameters_(parameters) {}
    
    CompileResult run() {
        collect();
        check_triggers();
        for (std::size_t i = 0; i < cyclers_.size(); ++i) {
            wire_cycler(i);
            order_cycler(i);
        }
        
        CompileResult result;
        if (!diagnostics_.empty()) {
            for (const auto& diagnostic : diagnostics_) {
                std::cerr << "[PipelineCompiler] " << to_string(diagnostic) << "\n";
            }
            result.diagnostics = std::move(diagnostics_);
            return result;
        }
        
        for (const auto& [handle, wire] : bindings_) {
            handle->bind(wire);
        }
        result.plan.emplace(build_plans());
        std::cout << "[PipelineCompiler] Compiled " << cyclers_.size() << " cycler(s)\n";
        return result;
    }
    
private:
    void report(DiagnosticKind kind, std::size_t cycler, std::vector<std::string> modules,
                std::string path, std::string message) {
        diagnostics_.push_back(Diagnostic{
            kind, cyclers_[cycler].declaration->name(), std::move(modules),
            std::move(path), std::move(message)
        });
    }
    
    // ========================================================================
    // Declarations and outputs
    // ========================================================================
    
    void collect() {
        for (const auto& declaration : pipeline_.cyclers()) {
            const std::size_t index = cyclers_.size();
            cyclers_.push_back(CyclerInfo{});
            CyclerInfo& info = cyclers_.back();
            info.declaration = &declaration;
            
            if (!cycler_index_.emplace(declaration.name(), index).second) {
                report(DiagnosticKind::DuplicateCycler, index, {}, declaration.name(),
                       "cycler '" + declaration.name() + "' is declared more than once");
            }
            
            std::set<std::string> module_names;
            for (const auto& module : declaration.modules()) {
                ModuleDeclaration module_declaration(module->name());
                module->declare(module_declaration);
                if (!module_names.insert(module->name()).second) {
                    report(DiagnosticKind::DuplicateModule, index, {module->name()}, module->name(),
                           "module '" + module->name() + "' appears more than once");
                }
                info.modules.push_back(ModuleInfo{module.get(), std::move(module_declaration)});
            }
            
            for (std::size_t m = 0; m < info.modules.size(); ++m) {
                for (const auto& output : info.modules[m].declaration.outputs()) {
                    const auto& name = output.descriptor.name;
                    auto existing = std::find_if(info.fields.begin(), info.fields.end(),
                        [&](const FieldDescriptor& field) { return field.name == name; });
                    if (existing != info.fields.end()) {
                        std::size_t owner = info.field_owner[existing - info.fields.begin()];
                        report(DiagnosticKind::DuplicateOutput, index,
                               {info.modules[owner].module->name(), info.modules[m].module->name()},
                               name,
                               "field '" + name + "' is written by both '"
                               + info.modules[owner].module->name() + "' and '"
                               + info.modules[m].module->name() + "'");
                        continue;
                    }
                    bindings_.emplace_back(output.handle,
                                           Wire{WireKind::CurrentTick, index, info.fields.size()});
                    info.fields.push_back(output.descriptor);
                    info.field_owner.push_back(m);
                    info.field_handles.push_back(output.handle);
                }
            }
        }
    }
    
    void check_triggers() {
        for (std::size_t i = 0; i < cyclers_.size(); ++i) {
            const CyclerDeclaration& declaration = *cyclers_[i].declaration;
            const Trigger& trigger = declaration.trigger();
            if (trigger.kind() == TriggerKind::Periodic && trigger.period().count() <= 0) {
                report(DiagnosticKind::InvalidTrigger, i, {}, "",
                       "periodic trigger needs a positive period");
            } else if (trigger.kind() == TriggerKind::After) {
                if (trigger.upstream() == declaration.name()) {
                    report(DiagnosticKind::InvalidTrigger, i, {}, trigger.upstream(),
                           "cycler cannot be triggered by its own publications");
                } else if (!cycler_index_.contains(trigger.upstream())) {
                    report(DiagnosticKind::InvalidTrigger, i, {}, trigger.upstream(),
                           "trigger names unknown cycler '" + trigger.upstream() + "'");
                }
            }
        }
    }
    
    // ========================================================================
    // Wiring
    // ========================================================================
    
    void wire_cycler(std::size_t i) {
        CyclerInfo& info = cyclers_[i];
        for (std::size_t m = 0; m < info.modules.size(); ++m) {
            const ModuleDeclaration& declaration = info.modules[m].declaration;
            for (const auto& input : declaration.inputs()) {
                wire_input(i, m, input);
            }
            for (const auto& input : declaration.historic_inputs()) {
                wire_historic_input(i, m, input);
            }
            for (const auto& parameter : declaration.parameters()) {
                wire_parameter(i, m, parameter);
            }
            for (const auto& state : declaration.states()) {
                wire_state(i, m, state);
            }
        }
    }
    
    void add_own_candidates(std::size_t i, const std::string& field,
                            std::optional<std::size_t> only_module,
                            std::vector<Candidate>& candidates) const {
        const CyclerInfo& info = cyclers_[i];
        for (std::size_t f = 0; f < info.fields.size(); ++f) {
            if (info.fields[f].name != field) {
                continue;
            }
            std::size_t owner = info.field_owner[f];
            if (only_module && *only_module != owner) {
                continue;
            }
            candidates.push_back(Candidate{
                Wire{WireKind::CurrentTick, i, f},
                info.modules[owner].module->name() + "." + field,
                owner,
                &info.fields[f]
            });
        }
    }
    
    void add_channel_candidates(std::size_t j, const std::string& field,
                                std::vector<Candidate>& candidates) const {
        const CyclerInfo& info = cyclers_[j];
        for (std::size_t f = 0; f < info.fields.size(); ++f) {
            if (info.fields[f].name == field) {
                candidates.push_back(Candidate{
                    Wire{WireKind::Channel, j, f},
                    info.declaration->name() + "." + field,
                    std::nullopt,
                    &info.fields[f]
                });
            }
        }
    }
    
    std::optional<std::size_t> find_module(std::size_t i, const std::string& name) const {
        const auto& modules = cyclers_[i].modules;
        for (std::size_t m = 0; m < modules.size(); ++m) {
            if (modules[m].module->name() == name) {
                return m;
            }
        }
        return std::nullopt;
    }
    
    std::optional<std::size_t> find_cycler(const std::string& name) const {
        auto it = cycler_index_.find(name);
        if (it == cycler_index_.end()) {
            return std::nullopt;
        }
        return it->second;
    }
    
    void wire_input(std::size_t i, std::size_t m, const InputRequirement& input) {
        CyclerInfo& info = cyclers_[i];
        const std::string& module_name = info.modules[m].module->name();
        const std::string path = qualified(input.producer, input.field);
        
        std::vector<Candidate> candidates;
        if (input.producer.empty()) {
            add_own_candidates(i, input.field, std::nullopt, candidates);
            if (candidates.empty()) {
                for (const auto& [name, j] : cycler_index_) {
                    if (j != i) {
                        add_channel_candidates(j, input.field, candidates);
                    }
                }
            }
        } else {
            if (auto producer = find_module(i, input.producer)) {
                add_own_candidates(i, input.field, producer, candidates);
            }
            if (auto j = find_cycler(input.producer)) {
                if (*j == i) {
                    add_own_candidates(i, input.field, std::nullopt, candidates);
                } else {
                    add_channel_candidates(*j, input.field, candidates);
                }
            }
        }
        
        // A module named like its own cycler finds the same field twice
        std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
            return std::tie(a.wire.kind, a.wire.source, a.wire.field)
                 < std::tie(b.wire.kind, b.wire.source, b.wire.field);
        });
        candidates.erase(std::unique(candidates.begin(), candidates.end(),
            [](const Candidate& a, const Candidate& b) {
                return a.wire.kind == b.wire.kind && a.wire.source == b.wire.source
                    && a.wire.field == b.wire.field;
            }), candidates.end());
        
        if (candidates.empty()) {
            report(DiagnosticKind::UnresolvedInput, i, {module_name}, path,
                   "module '" + module_name + "' requires '" + path + "' but nothing produces it");
            return;
        }
        if (candidates.size() > 1) {
            std::vector<std::string> sources;
            for (const auto& candidate : candidates) {
                sources.push_back(candidate.source);
            }
            report(DiagnosticKind::AmbiguousInput, i, {module_name}, path,
                   "module '" + module_name + "' requires '" + path + "' which is produced by "
                   + join(sources, ", "));
            return;
        }
        
        const Candidate& candidate = candidates.front();
        if (candidate.descriptor->additional) {
            report(DiagnosticKind::UnresolvedInput, i, {module_name}, path,
                   "module '" + module_name + "' requires '" + candidate.source
                   + "' which is an additional output and cannot be consumed");
            return;
        }
        if (candidate.descriptor->type != input.type) {
            report(DiagnosticKind::InputTypeMismatch, i, {module_name}, path,
                   "module '" + module_name + "' reads '" + candidate.source + "' as "
                   + input.type_name + " but it is " + candidate.descriptor->type_name);
            return;
        }
        
        if (candidate.producer_module) {
            info.edges.emplace(*candidate.producer_module, m);
        } else {
            info.upstream.insert(candidate.wire.source);
        }
        bindings_.emplace_back(input.handle, candidate.wire);
        info.wiring.push_back(WiringEntry{module_name, (input.required ? "required " : "input ") + path,
                                          candidate.wire.kind, candidate.source});
    }
    
    void wire_historic_input(std::size_t i, std::size_t m, const InputRequirement& input) {
        CyclerInfo& info = cyclers_[i];
        const std::string& module_name = info.modules[m].module->name();
        const std::string path = qualified(input.producer, input.field);
        
        auto j = find_cycler(input.producer);
        if (!j) {
            report(DiagnosticKind::UnresolvedInput, i, {module_name}, path,
                   "module '" + module_name + "' requires history of unknown cycler '"
                   + input.producer + "'");
            return;
        }
        const CyclerInfo& source = cyclers_[*j];
        if (!source.declaration->has_history()) {
            report(DiagnosticKind::MissingHistoricBuffer, i, {module_name}, path,
                   "module '" + module_name + "' requires historic '" + path + "' but cycler '"
                   + input.producer + "' keeps no historic buffer");
            return;
        }
        
        auto field = std::find_if(source.fields.begin(), source.fields.end(),
            [&](const FieldDescriptor& descriptor) { return descriptor.name == input.field; });
        if (field == source.fields.end() || field->additional) {
            report(DiagnosticKind::UnresolvedInput, i, {module_name}, path,
                   "module '" + module_name + "' requires historic '" + path + "' but cycler '"
                   + input.producer + "' has no such output");
            return;
        }
        if (field->type != input.type) {
            report(DiagnosticKind::InputTypeMismatch, i, {module_name}, path,
                   "module '" + module_name + "' reads historic '" + path + "' as "
                   + input.type_name + " but it is " + field->type_name);
            return;
        }
        
        info.historic_sources.insert(*j);
        bindings_.emplace_back(input.handle,
                               Wire{WireKind::History, *j, static_cast<std::size_t>(field - source.fields.begin())});
        info.wiring.push_back(WiringEntry{module_name, "historic " + path, WireKind::History, path});
    }
    
    void wire_parameter(std::size_t i, std::size_t m, const ParameterRequirement& parameter) {
        CyclerInfo& info = cyclers_[i];
        const std::string& module_name = info.modules[m].module->name();
        
        const ParameterValue* value = parameters_.find(parameter.path);
        if (!value) {
            std::string reason = parameters_.contains_subtree(parameter.path)
                ? "' is a subtree, not a value" : "' does not exist";
            report(DiagnosticKind::UnknownParameter, i, {module_name}, parameter.path,
                   "module '" + module_name + "' requires parameter '" + parameter.path + reason);
            return;
        }
        const bool nullable_leaf = parameters_.is_nullable(parameter.path);
        if (nullable_leaf && !parameter.nullable) {
            report(DiagnosticKind::ParameterTypeMismatch, i, {module_name}, parameter.path,
                   "module '" + module_name + "' reads nullable parameter '" + parameter.path
                   + "' without std::optional");
            return;
        }
        const bool null_now = kind_of(*value) == ParameterKind::Null;
        if (kind_of(*value) != parameter.kind && !(nullable_leaf && null_now)) {
            report(DiagnosticKind::ParameterTypeMismatch, i, {module_name}, parameter.path,
                   "module '" + module_name + "' reads parameter '" + parameter.path + "' as "
                   + to_string(parameter.kind) + " but it holds " + to_string(kind_of(*value)));
            return;
        }
        
        bindings_.emplace_back(parameter.handle, Wire{WireKind::Parameter, 0, 0});
        info.wiring.push_back(WiringEntry{module_name, "parameter " + parameter.path,
                                          WireKind::Parameter, parameter.path});
    }
    
    void wire_state(std::size_t i, std::size_t m, const StateRequirement& state) {
        CyclerInfo& info = cyclers_[i];
        const std::string& module_name = info.modules[m].module->name();
        
        std::size_t slot = 0;
        while (slot < info.states.size() && info.states[slot].name != state.name) {
            ++slot;
        }
        if (slot == info.states.size()) {
            info.states.push_back(StateSlot{state.name, state.type_name, state.make_default});
            info.state_owner.push_back(m);
            info.state_types.push_back(state.type);
        } else if (info.state_types[slot] != state.type) {
            const std::string& first = info.modules[info.state_owner[slot]].module->name();
            report(DiagnosticKind::StateTypeMismatch, i, {first, module_name}, state.name,
                   "cycler state '" + state.name + "' is " + info.states[slot].type_name
                   + " in '" + first + "' but " + state.type_name + " in '" + module_name + "'");
            return;
        }
        
        bindings_.emplace_back(state.handle, Wire{WireKind::CyclerState, slot, 0});
        info.wiring.push_back(WiringEntry{module_name, "state " + state.name,
                                          WireKind::CyclerState, state.name});
    }
    
    // ========================================================================
    // Ordering
    // ========================================================================
    
    void order_cycler(std::size_t i) {
        CyclerInfo& info = cyclers_[i];
        const std::size_t count = info.modules.size();
        
        std::vector<std::set<std::size_t>> successors(count);
        std::vector<std::size_t> indegree(count, 0);
        for (const auto& [from, to] : info.edges) {
            successors[from].insert(to);
            ++indegree[to];
        }
        
        // Kahn's algorithm; the smallest ready index runs first
        std::set<std::size_t> ready;
        for (std::size_t m = 0; m < count; ++m) {
            if (indegree[m] == 0) {
                ready.insert(m);
            }
        }
        while (!ready.empty()) {
            std::size_t node = *ready.begin();
            ready.erase(ready.begin());
            info.order.push_back(node);
            for (std::size_t next : successors[node]) {
                if (--indegree[next] == 0) {
                    ready.insert(next);
                }
            }
        }
        
        if (info.order.size() == count) {
            return;
        }
        
        std::set<std::size_t> remaining;
        for (std::size_t m = 0; m < count; ++m) {
            if (indegree[m] > 0) {
                remaining.insert(m);
            }
        }
        
        auto components = ComponentFinder(successors).find(remaining);
        std::sort(components.begin(), components.end());
        for (const auto& component : components) {
            const bool self_loop = component.size() == 1
                && successors[component.front()].contains(component.front());
            if (component.size() < 2 && !self_loop) {
                continue;
            }
            
            std::vector<std::size_t> cycle = shortest_cycle(successors, component);
            std::vector<std::string> names;
            for (std::size_t node : cycle) {
                names.push_back(info.modules[node].module->name());
            }
            std::string text = join(names, " -> ");
            names.pop_back();
            report(DiagnosticKind::DependencyCycle, i, names, "",
                   "modules depend on each other: " + text);
        }
    }
    
    // ========================================================================
    // Plans
    // ========================================================================
    
    ExecutionPlan build_plans() {
        std::vector<CyclerPlan> plans;
        for (std::size_t i = 0; i < cyclers_.size(); ++i) {
            CyclerInfo& info = cyclers_[i];
            CyclerPlan plan;
            plan.name = info.declaration->name();
            plan.index = i;
            plan.trigger = info.declaration->trigger();
            if (plan.trigger.kind() == TriggerKind::After) {
                plan.trigger_source = cycler_index_.at(plan.trigger.upstream());
            }
            plan.order = info.order;
            for (std::size_t m : info.order) {
                const ModuleDeclaration& declaration = info.modules[m].declaration;
                plan.module_names.push_back(info.modules[m].module->name());
                plan.persistent_states.push_back(declaration.persistent_state_type());
                
                // Handles are bound by now
                std::vector<Wire> required;
                for (const auto& input : declaration.inputs()) {
                    if (input.required) {
                        required.push_back(input.handle->wire());
                    }
                }
                plan.required_inputs.push_back(std::move(required));
            }
            plan.layout = std::make_shared<const DatabaseLayout>(plan.name, info.fields);
            plan.upstream.assign(info.upstream.begin(), info.upstream.end());
            plan.historic_sources.assign(info.historic_sources.begin(), info.historic_sources.end());
            plan.states = info.states;
            plan.wiring = info.wiring;
            plan.history_capacity = info.declaration->history_capacity();
            plans.push_back(std::move(plan));
        }
        return ExecutionPlan(std::move(plans));
    }
    
    const PipelineDeclaration& pipeline_;
    const ParameterSnapshot& parameters_;
    std::vector<CyclerInfo> cyclers_;
    std::map<std::string, std::size_t> cycler_index_;
    std::vector<std::pair<HandleBase*, Wire>> bindings_;
    std::vector<Diagnostic> diagnostics_;
};

} // anonymous namespace

CompileResult PipelineCompiler::compile(const PipelineDeclaration& pipeline) const {
    auto parameters = parameters_.snapshot();
    return CompilerPass(pipeline, *parameters).run();
}

std::string ExecutionPlan::describe() const {
    std::ostringstream out;
    for (const auto& cycler : cyclers_) {
        out << "cycler " << cycler.name << " (" << cycler.trigger.describe();
        if (cycler.history_capacity > 0) {
            out << ", history " << cycler.history_capacity;
        }
        out << ")\n";
        
        for (std::size_t position = 0; position < cycler.order.size(); ++position) {
            const std::string& module = cycler.module_names[position];
            out << "  " << (position + 1) << ". " << module;
            if (!cycler.persistent_states[position].empty()) {
                out << " [state " << cycler.persistent_states[position] << "]";
            }
            out << "\n";
            for (const auto& entry : cycler.wiring) {
                if (entry.module == module) {
                    out << "       " << entry.requirement << " <- "
                        << to_string(entry.kind) << " " << entry.source << "\n";
                }
            }
        }
        
        out << "  outputs:";
        for (const auto& field : cycler.layout->fields()) {
            out << " " << field.name << (field.additional ? "*" : "");
        }
        out << "\n";
    }
    return out.str();
}

} // namespace tickflow
