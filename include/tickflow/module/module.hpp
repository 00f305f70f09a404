/**
 * @file module.hpp
 * @brief Base class for units of computation run by a cycler
 * 
 * A module declares its requirements once (declare) and is then invoked
 * once per tick (cycle), in the order computed by the pipeline compiler.
 * Module-private state lives in the derived class and persists across ticks.
 * 
 * @code
 * class LegKinematics : public Module {
 * public:
 *     LegKinematics() : Module("leg_kinematics") {}
 *     
 *     void declare(ModuleDeclaration& d) override {
 *         d.input(joints_).parameter(offset_).output(feet_);
 *     }
 *     
 *     CycleResult cycle(CycleContext& ctx) override {
 *         const JointAngles* joints = ctx.get(joints_);
 *         if (!joints) return CycleResult::error("no joint angles yet");
 *         ctx.set(feet_, solve(*joints, ctx.get(offset_)));
 *         return CycleResult::ok();
 *     }
 * 
 * private:
 *     Input<JointAngles> joints_{"sensors", "joint_angles"};
 *     Parameter<double> offset_{"kinematics.hip_offset"};
 *     Output<FootPositions> feet_{"foot_positions"};
 * };
 * @endcode
 */

#pragma once

#include <tickflow/module/cycle_context.hpp>
#include <tickflow/module/module_declaration.hpp>
#include <string>
#include <utility>

namespace tickflow {

class CycleResult {
public:
    static CycleResult ok() { return CycleResult(); }
    static CycleResult error(std::string message) { return CycleResult(std::move(message)); }
    
    explicit operator bool() const noexcept { return !failed_; }
    bool failed() const noexcept { return failed_; }
    const std::string& message() const noexcept { return message_; }
    
private:
    CycleResult() = default;
    explicit CycleResult(std::string message)
        : failed_(true), message_(std::move(message)) {}
    
    bool failed_{false};
    std::string message_;
};

class Module {
public:
    explicit Module(std::string name)
        : name_(std::move(name)) {}
    
    virtual ~Module() = default;
    
    Module(const Module&) = delete;
    Module& operator=(const Module&) = delete;
    
    const std::string& name() const noexcept { return name_; }
    
    /**
     * @brief Register handles; called exactly once, before compilation
     */
    virtual void declare(ModuleDeclaration& declaration) = 0;
    
    /**
     * @brief Called on the cycler thread before the first tick
     */
    virtual void on_start() {}
    
    /**
     * @brief Run one tick
     * 
     * Returning an error, or throwing, aborts the tick: nothing of it is
     * published and the fault handler is notified.
     */
    virtual CycleResult cycle(CycleContext& context) = 0;
    
private:
    std::string name_;
};

} // namespace tickflow
