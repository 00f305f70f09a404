/**
 * @file legged_robot_main.cpp
 * @brief Config-driven robot binary
 * 
 * Usage: legged_robot config/legged_robot.json
 * 
 * Cyclers, their modules and triggers come from the JSON file; modules are
 * created by name from the robot catalog. Runs until SIGINT/SIGTERM.
 */

#include "robot_modules.hpp"
#include <tickflow/runtime/runtime_main.hpp>

TICKFLOW_RUNTIME_MAIN(robot::robot_catalog)
