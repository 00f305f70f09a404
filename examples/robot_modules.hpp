/**
 * @file robot_modules.hpp
 * @brief Simplified legged-robot modules used by the example binaries
 * 
 * Sensors and algorithms are synthetic; the point is the wiring:
 * 
 *   control (periodic 10ms, history) : imu_driver -> odometry -> gait_controller
 *   vision  (camera frames)          : ball_detection
 *   world   (after vision)           : ball_fusion (vision latest + control history)
 */

#pragma once

#include <tickflow/tickflow.hpp>
#include <cmath>
#include <numbers>
#include <optional>
#include <vector>

namespace robot {

using namespace tickflow;

struct ImuSample {
    double yaw_rate{0.0};       ///< rad/s
    double forward_speed{0.0};  ///< m/s
};

struct RobotPose {
    double x{0.0};
    double y{0.0};
    double yaw{0.0};
};

struct BallPercept {
    double bearing{0.0};        ///< rad, robot frame
    double distance{0.0};       ///< m
};

struct BallModel {
    bool valid{false};
    double x{0.0};              ///< m, field frame
    double y{0.0};
    Timestamp observed_at{0};
};

struct MotorCommand {
    std::vector<double> joint_targets;
    bool safe_stop{true};
};

struct GaitDebug {
    double phase{0.0};
    double step_frequency{0.0};
};

// ============================================================================
// control cycler
// ============================================================================

class ImuDriver : public Module {
public:
    ImuDriver() : Module("imu_driver") {}
    
    void declare(ModuleDeclaration& d) override {
        d.parameter(speed_).output(imu_);
    }
    
    CycleResult cycle(CycleContext& ctx) override {
        auto& imu = ctx.output(imu_);
        imu.yaw_rate = 0.2 * std::sin(static_cast<double>(ctx.tick()) * 0.01);
        imu.forward_speed = ctx.get(speed_);
        return CycleResult::ok();
    }
    
private:
    Parameter<double> speed_{"walk.speed"};
    Output<ImuSample> imu_{"imu"};
};

/**
 * @brief Dead reckoning from IMU; keeps the pose between ticks
 */
class Odometry : public Module {
public:
    Odometry() : Module("odometry") {}
    
    void declare(ModuleDeclaration& d) override {
        d.input(imu_).output(pose_).persistent_state<RobotPose>();
    }
    
    CycleResult cycle(CycleContext& ctx) override {
        const ImuSample* imu = ctx.get(imu_);
        const double dt = last_timestamp_ ? static_cast<double>(ctx.timestamp() - last_timestamp_) * 1e-9 : 0.0;
        last_timestamp_ = ctx.timestamp();
        
        pose_estimate_.yaw += imu->yaw_rate * dt;
        pose_estimate_.x += imu->forward_speed * dt * std::cos(pose_estimate_.yaw);
        pose_estimate_.y += imu->forward_speed * dt * std::sin(pose_estimate_.yaw);
        ctx.set(pose_, pose_estimate_);
        return CycleResult::ok();
    }
    
private:
    Input<ImuSample> imu_{"imu_driver", "imu"};
    Output<RobotPose> pose_{"pose"};
    RobotPose pose_estimate_;
    Timestamp last_timestamp_{0};
};

class GaitController : public Module {
public:
    GaitController() : Module("gait_controller") {}
    
    void declare(ModuleDeclaration& d) override {
        d.input(pose_)
         .input(ball_)
         .parameter(step_frequency_)
         .parameter(joint_count_)
         .output(command_)
         .additional_output(debug_);
    }
    
    CycleResult cycle(CycleContext& ctx) override {
        const int64_t joints = ctx.get(joint_count_);
        if (joints <= 0) {
            return CycleResult::error("legs.joint_count must be positive");
        }
        
        auto& command = ctx.output(command_);
        command.joint_targets.assign(static_cast<std::size_t>(joints), 0.0);
        command.safe_stop = !ctx.actuation_enabled();
        if (command.safe_stop) {
            return CycleResult::ok();
        }
        
        const double frequency = ctx.get(step_frequency_);
        const double phase = std::fmod(static_cast<double>(ctx.timestamp()) * 1e-9 * frequency, 1.0);
        
        // Lean towards the ball once the world model has one
        double lean = 0.0;
        const BallModel* ball = ctx.get(ball_);
        const RobotPose* pose = ctx.get(pose_);
        if (ball && ball->valid) {
            lean = std::atan2(ball->y - pose->y, ball->x - pose->x) - pose->yaw;
        }
        
        for (std::size_t j = 0; j < command.joint_targets.size(); ++j) {
            command.joint_targets[j] = 0.3 * std::sin(2.0 * std::numbers::pi * phase + static_cast<double>(j)) + 0.05 * lean;
        }
        ctx.fill_if_subscribed(debug_, [&] { return GaitDebug{phase, frequency}; });
        return CycleResult::ok();
    }
    
private:
    Input<RobotPose> pose_{"odometry", "pose"};
    Input<BallModel> ball_{"world", "ball_model"};
    Parameter<double> step_frequency_{"walk.step_frequency"};
    Parameter<int64_t> joint_count_{"legs.joint_count"};
    Output<MotorCommand> command_{"motor_command"};
    AdditionalOutput<GaitDebug> debug_{"gait_debug"};
};

// ============================================================================
// vision cycler
// ============================================================================

class BallDetection : public Module {
public:
    BallDetection() : Module("ball_detection") {}
    
    void declare(ModuleDeclaration& d) override {
        d.parameter(threshold_).output(percept_);
    }
    
    CycleResult cycle(CycleContext& ctx) override {
        const double confidence = 0.5 + 0.5 * std::sin(static_cast<double>(ctx.tick()) * 0.3);
        if (confidence > ctx.get(threshold_)) {
            ctx.set(percept_, BallPercept{
                .bearing = 0.1 * std::cos(static_cast<double>(ctx.tick()) * 0.1),
                .distance = 2.0
            });
        }
        return CycleResult::ok();
    }
    
private:
    Parameter<double> threshold_{"vision.threshold"};
    Output<std::optional<BallPercept>> percept_{"ball_percept"};
};

// ============================================================================
// world cycler
// ============================================================================

/**
 * @brief Projects a percept into the field frame using the pose at capture time
 * 
 * The vision tick is stamped with the camera capture time; the pose the
 * robot had at that moment comes from the control history, not from the
 * control cycler's latest state.
 */
class BallFusion : public Module {
public:
    BallFusion() : Module("ball_fusion") {}
    
    void declare(ModuleDeclaration& d) override {
        d.required_input(percept_).historic_input(pose_at_capture_).output(model_);
    }
    
    CycleResult cycle(CycleContext& ctx) override {
        auto& model = ctx.output(model_);
        const BallPercept& percept = ctx.get(percept_);
        
        auto pose = ctx.get(pose_at_capture_, ctx.timestamp());
        if (!pose) {
            // Frame older than the retained control history
            return CycleResult::ok();
        }
        
        const double angle = pose->value->yaw + percept.bearing;
        model.valid = true;
        model.x = pose->value->x + percept.distance * std::cos(angle);
        model.y = pose->value->y + percept.distance * std::sin(angle);
        model.observed_at = ctx.timestamp();
        return CycleResult::ok();
    }
    
private:
    RequiredInput<BallPercept> percept_{"vision", "ball_percept"};  // skipped while no ball is seen
    HistoricInput<RobotPose> pose_at_capture_{"control", "pose"};
    Output<BallModel> model_{"ball_model"};
};

inline ModuleCatalog robot_catalog() {
    ModuleCatalog catalog;
    catalog.add<ImuDriver>("imu_driver")
           .add<Odometry>("odometry")
           .add<GaitController>("gait_controller")
           .add<BallDetection>("ball_detection")
           .add<BallFusion>("ball_fusion");
    return catalog;
}

} // namespace robot
