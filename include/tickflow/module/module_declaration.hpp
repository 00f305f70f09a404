/**
 * @file module_declaration.hpp
 * @brief Descriptor of what one module consumes and produces
 * 
 * Module::declare() fills a ModuleDeclaration by registering its handles.
 * The pipeline compiler only ever looks at declarations, never at module
 * code, to build the execution order and the wiring table.
 */

#pragma once

#include <tickflow/module/handles.hpp>
#include <any>
#include <functional>
#include <optional>
#include <string>
#include <typeindex>
#include <vector>

namespace tickflow {

struct InputRequirement {
    std::string producer;
    std::string field;
    std::type_index type;
    std::string type_name;
    HandleBase* handle;
    bool required{false};       ///< Module is skipped while the value is absent
};

struct ParameterRequirement {
    std::string path;
    ParameterKind kind;
    HandleBase* handle;
    bool nullable{false};       ///< Declared as std::optional
};

struct OutputProvision {
    FieldDescriptor descriptor;
    HandleBase* handle;
};

struct StateRequirement {
    std::string name;
    std::type_index type;
    std::string type_name;
    std::function<std::any()> make_default;
    HandleBase* handle;
};

class ModuleDeclaration {
public:
    explicit ModuleDeclaration(std::string module_name)
        : module_name_(std::move(module_name)) {}
    
    const std::string& module_name() const noexcept { return module_name_; }
    
    template<DatabaseField T>
    ModuleDeclaration& input(Input<T>& handle) {
        inputs_.push_back(InputRequirement{
            handle.producer(), handle.field(), std::type_index(typeid(T)), type_name<T>(), &handle
        });
        return *this;
    }
    
    template<DatabaseField T>
    ModuleDeclaration& required_input(RequiredInput<T>& handle) {
        inputs_.push_back(InputRequirement{
            handle.producer(), handle.field(), std::type_index(typeid(std::optional<T>)),
            type_name<std::optional<T>>(), &handle, true
        });
        return *this;
    }
    
    template<DatabaseField T>
    ModuleDeclaration& historic_input(HistoricInput<T>& handle) {
        historic_inputs_.push_back(InputRequirement{
            handle.cycler(), handle.field(), std::type_index(typeid(T)), type_name<T>(), &handle
        });
        return *this;
    }
    
    template<ParameterType T>
    ModuleDeclaration& parameter(Parameter<T>& handle) {
        parameters_.push_back(ParameterRequirement{
            handle.path(), parameter_kind_of<T>(), &handle, nullable_parameter<T>::value
        });
        return *this;
    }
    
    template<DatabaseField T>
    ModuleDeclaration& output(Output<T>& handle) {
        outputs_.push_back(OutputProvision{
            make_field_descriptor<T>(handle.field(), module_name_, false), &handle
        });
        return *this;
    }
    
    template<DatabaseField T>
    ModuleDeclaration& additional_output(AdditionalOutput<T>& handle) {
        outputs_.push_back(OutputProvision{
            make_field_descriptor<T>(handle.field(), module_name_, true), &handle
        });
        return *this;
    }
    
    template<DatabaseField T>
    ModuleDeclaration& cycler_state(CyclerState<T>& handle) {
        states_.push_back(StateRequirement{
            handle.name(), std::type_index(typeid(T)), type_name<T>(),
            [] { return std::any(T{}); }, &handle
        });
        return *this;
    }
    
    /**
     * @brief Record the type of the state the module keeps across ticks
     */
    template<typename S>
    ModuleDeclaration& persistent_state() {
        persistent_state_type_ = type_name<S>();
        return *this;
    }
    
    const std::vector<InputRequirement>& inputs() const noexcept { return inputs_; }
    const std::vector<InputRequirement>& historic_inputs() const noexcept { return historic_inputs_; }
    const std::vector<ParameterRequirement>& parameters() const noexcept { return parameters_; }
    const std::vector<OutputProvision>& outputs() const noexcept { return outputs_; }
    const std::vector<StateRequirement>& states() const noexcept { return states_; }
    const std::string& persistent_state_type() const noexcept { return persistent_state_type_; }
    
private:
    std::string module_name_;
    std::vector<InputRequirement> inputs_;
    std::vector<InputRequirement> historic_inputs_;
    std::vector<ParameterRequirement> parameters_;
    std::vector<OutputProvision> outputs_;
    std::vector<StateRequirement> states_;
    std::string persistent_state_type_;
};

} // namespace tickflow
