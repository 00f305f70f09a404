/**
 * @file legged_robot_demo.cpp
 * @brief Builds the robot pipeline in code and drives the camera by hand
 * 
 * The vision cycler is event-triggered: a camera thread notifies it with
 * capture timestamps that lag wall time by the exposure/transfer latency.
 * The world cycler follows vision and looks the control pose up in history
 * at capture time.
 * 
 * Usage: legged_robot_demo [seconds]
 */

#include "robot_modules.hpp"
#include <atomic>
#include <cstdlib>
#include <iostream>

using namespace tickflow;
using namespace tickflow::literals;

namespace {

constexpr Timestamp kCameraLatency = 25_ms;
constexpr Milliseconds kCameraPeriod{33};

const char* kParameters = R"({
    "walk": {"speed": 0.3, "step_frequency": 1.5},
    "legs": {"joint_count": 12},
    "vision": {"threshold": 0.4}
})";

PipelineDeclaration make_pipeline() {
    PipelineDeclaration pipeline;
    
    pipeline.add_cycler("control", Trigger::periodic(Milliseconds(10)))
            .with_history<128>()
            .with_max_input_staleness(Milliseconds(200))
            .emplace<robot::ImuDriver>()
            .emplace<robot::GaitController>()   // declared before odometry; ordering fixes it
            .emplace<robot::Odometry>();
    
    pipeline.add_cycler("vision", Trigger::event())
            .emplace<robot::BallDetection>();
    
    pipeline.add_cycler("world", Trigger::after("vision"))
            .emplace<robot::BallFusion>();
    
    return pipeline;
}

} // namespace

int main(int argc, char** argv) {
    const int seconds = argc > 1 ? std::atoi(argv[1]) : 2;
    
    auto parameters = ParameterStore::from_json(kParameters);
    if (!parameters) {
        std::cerr << "[Demo] " << to_string(parameters.error()) << "\n";
        return 1;
    }
    
    try {
        PipelineRuntime runtime(make_pipeline(), parameters.value());
        std::cout << runtime.plan().describe() << "\n";
        
        auto subscription = runtime.telemetry().subscribe("control", {"motor_command", "gait_debug"});
        if (!subscription) {
            std::cerr << "[Demo] subscribe failed: " << to_string(subscription.error()) << "\n";
            return 1;
        }
        
        runtime.start();
        
        std::atomic<bool> camera_running{true};
        Thread camera(ThreadConfig{.name = "camera"});
        camera.start([&] {
            while (camera_running.load()) {
                Time::sleep(kCameraPeriod);
                runtime.notify("vision", Time::now() - kCameraLatency);
            }
        });
        
        // Speed up halfway through; control picks it up at its next tick
        const Timestamp duration = Time::to_nanoseconds(std::chrono::seconds(seconds));
        const Timestamp halfway = Time::now() + duration / 2;
        const Timestamp end = halfway + duration / 2;
        bool sped_up = false;
        while (Time::now() < end) {
            auto frame = runtime.telemetry().receive(subscription.value(), Milliseconds(100));
            if (frame && frame->tick % 50 == 0) {
                std::cout << "[Demo] control tick " << frame->tick << ": " << frame->payload << "\n";
            }
            if (!sped_up && Time::now() > halfway) {
                auto generation = runtime.parameters().write("walk.speed", 0.6);
                if (generation) {
                    std::cout << "[Demo] walk.speed -> 0.6 (generation " << generation.value() << ")\n";
                }
                sped_up = true;
            }
        }
        
        camera_running.store(false);
        camera.join();
        runtime.stop();
        
        if (auto world = runtime.latest("world")) {
            if (const auto* ball = world->find<robot::BallModel>("ball_model"); ball && ball->valid) {
                std::cout << "[Demo] ball at " << ball->x << ", " << ball->y << "\n";
            }
        }
        for (const char* name : {"control", "vision", "world"}) {
            auto stats = runtime.statistics(name);
            std::cout << "[Demo] " << name << ": " << stats.ticks_published << " published, "
                      << stats.ticks_aborted << " aborted\n";
        }
        auto telemetry = runtime.telemetry().stats(subscription.value());
        if (telemetry) {
            std::cout << "[Demo] telemetry: " << telemetry->delivered << " delivered, "
                      << telemetry->dropped << " dropped\n";
        }
        std::cout << "[Demo] faults: " << runtime.faults().total() << "\n";
    } catch (const PipelineCompileError& e) {
        std::cerr << "[Demo] " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[Demo] " << e.what() << "\n";
        return 1;
    }
    return 0;
}
