/**
 * @file test_modules.hpp
 * @brief Small configurable modules shared by the pipeline tests
 */

#pragma once

#include "tickflow/tickflow.hpp"
#include <functional>
#include <string>
#include <vector>

namespace tickflow::test {

struct Pose {
    double x{0.0};
    double y{0.0};
};

/**
 * @brief Writes the tick number (optionally shifted) into an int field
 */
class Counter : public Module {
public:
    Counter(std::string name, std::string field, int offset = 0)
        : Module(std::move(name)), out_(std::move(field)), offset_(offset) {}
    
    void declare(ModuleDeclaration& d) override {
        d.output(out_);
    }
    
    CycleResult cycle(CycleContext& ctx) override {
        ctx.set(out_, static_cast<int>(ctx.tick()) + offset_);
        return CycleResult::ok();
    }
    
    Output<int> out_;
    
private:
    int offset_;
};

/**
 * @brief out = in + 1, or -1 while the input is not published yet
 */
class Relay : public Module {
public:
    Relay(std::string name, std::string producer, std::string in_field, std::string out_field)
        : Module(std::move(name)), in_(std::move(producer), std::move(in_field)), out_(std::move(out_field)) {}
    
    void declare(ModuleDeclaration& d) override {
        d.input(in_).output(out_);
    }
    
    CycleResult cycle(CycleContext& ctx) override {
        const int* value = ctx.get(in_);
        ctx.set(out_, value ? *value + 1 : -1);
        return CycleResult::ok();
    }
    
    Input<int> in_;
    Output<int> out_;
};

/**
 * @brief Consumes an input of any type without producing anything
 */
template<typename T>
class Sink : public Module {
public:
    Sink(std::string name, std::string producer, std::string field)
        : Module(std::move(name)), in_(std::move(producer), std::move(field)) {}
    
    void declare(ModuleDeclaration& d) override {
        d.input(in_);
    }
    
    CycleResult cycle(CycleContext& ctx) override {
        last_seen = ctx.get(in_) != nullptr;
        return CycleResult::ok();
    }
    
    Input<T> in_;
    bool last_seen{false};
};

template<typename T>
class HistoricReader : public Module {
public:
    HistoricReader(std::string name, std::string cycler, std::string field)
        : Module(std::move(name)), in_(std::move(cycler), std::move(field)) {}
    
    void declare(ModuleDeclaration& d) override {
        d.historic_input(in_);
    }
    
    CycleResult cycle(CycleContext&) override {
        return CycleResult::ok();
    }
    
    HistoricInput<T> in_;
};

template<typename T>
class ParameterReader : public Module {
public:
    ParameterReader(std::string name, std::string path)
        : Module(std::move(name)), parameter_(std::move(path)) {}
    
    void declare(ModuleDeclaration& d) override {
        d.parameter(parameter_);
    }
    
    CycleResult cycle(CycleContext& ctx) override {
        last_value = ctx.get(parameter_);
        return CycleResult::ok();
    }
    
    Parameter<T> parameter_;
    T last_value{};
};

template<typename T>
class StateUser : public Module {
public:
    StateUser(std::string name, std::string state)
        : Module(std::move(name)), state_(std::move(state)) {}
    
    void declare(ModuleDeclaration& d) override {
        d.cycler_state(state_);
    }
    
    CycleResult cycle(CycleContext& ctx) override {
        ctx.state(state_) += T{1};
        return CycleResult::ok();
    }
    
    CyclerState<T> state_;
};

/**
 * @brief Module whose cycle body is supplied by the test
 */
class Scripted : public Module {
public:
    using Body = std::function<CycleResult(CycleContext&)>;
    
    Scripted(std::string name, Body body)
        : Module(std::move(name)), body_(std::move(body)) {}
    
    void declare(ModuleDeclaration&) override {}
    
    CycleResult cycle(CycleContext& ctx) override {
        return body_(ctx);
    }
    
private:
    Body body_;
};

inline bool has_diagnostic(const CompileResult& result, DiagnosticKind kind) {
    for (const auto& diagnostic : result.diagnostics) {
        if (diagnostic.kind == kind) {
            return true;
        }
    }
    return false;
}

inline const Diagnostic* find_diagnostic(const CompileResult& result, DiagnosticKind kind) {
    for (const auto& diagnostic : result.diagnostics) {
        if (diagnostic.kind == kind) {
            return &diagnostic;
        }
    }
    return nullptr;
}

} // namespace tickflow::test
