/**
 * @file handles.hpp
 * @brief Typed requirement handles a module declares as data members
 * 
 * Handles carry what a module needs (producer, field, parameter path) and,
 * after pipeline compilation, where the runtime finds it (the Wire). Modules
 * pass handles to CycleContext to read inputs and write outputs.
 * 
 * @code
 * class Localization : public Module {
 *     Input<Odometry> odometry_{"odometry", "odometry"};
 *     RequiredInput<Image> image_{"camera", "image"};       // std::optional<Image> field
 *     HistoricInput<Pose> past_pose_{"control", "pose"};
 *     Parameter<double> gain_{"localization.gain"};
 *     Output<Pose> pose_{"pose"};
 *     AdditionalOutput<Covariance> covariance_{"pose_covariance"};
 * };
 * @endcode
 */

#pragma once

#include <tickflow/database/database.hpp>
#include <tickflow/parameters/parameter_store.hpp>
#include <cstddef>
#include <string>
#include <utility>

namespace tickflow {

enum class WireKind {
    Unbound,
    CurrentTick,    ///< Field of the cycler's in-progress database
    Channel,        ///< Latest snapshot of another cycler
    History,        ///< Historic Buffer of a cycler
    Parameter,      ///< Leaf of the tick's parameter snapshot
    CyclerState     ///< State slot owned by the cycler
};

constexpr const char* to_string(WireKind kind) {
    switch (kind) {
        case WireKind::Unbound:     return "unbound";
        case WireKind::CurrentTick: return "current tick";
        case WireKind::Channel:     return "channel";
        case WireKind::History:     return "history";
        case WireKind::Parameter:   return "parameter";
        case WireKind::CyclerState: return "cycler state";
    }
    return "unknown";
}

struct Wire {
    WireKind kind{WireKind::Unbound};
    std::size_t source{0};      ///< Cycler index or state slot
    std::size_t field{0};       ///< Field index in the source layout
};

/**
 * @brief Binding storage shared by all handle types
 * 
 * bind() is called by the pipeline compiler once the whole pipeline has
 * been validated; module code only reads the wire through CycleContext.
 */
class HandleBase {
public:
    const Wire& wire() const noexcept { return wire_; }
    bool is_bound() const noexcept { return wire_.kind != WireKind::Unbound; }
    void bind(const Wire& wire) noexcept { wire_ = wire; }
    
private:
    Wire wire_;
};

/**
 * @brief Latest value of a field
 * 
 * The producer is either a module of the same cycler (value of the current
 * tick, produced earlier in the order) or another cycler (its most recent
 * publication). An empty producer searches the own cycler by field name.
 */
template<DatabaseField T>
class Input : public HandleBase {
public:
    explicit Input(std::string field)
        : field_(std::move(field)) {}
    
    Input(std::string producer, std::string field)
        : producer_(std::move(producer)), field_(std::move(field)) {}
    
    const std::string& producer() const noexcept { return producer_; }
    const std::string& field() const noexcept { return field_; }
    
private:
    std::string producer_;
    std::string field_;
};

/**
 * @brief Input the module cannot run without
 * 
 * Reads a field of type std::optional<T>, resolved like Input. When the
 * producer has not published yet or the optional is empty, the module's
 * cycle() is skipped for that tick and its main outputs keep their
 * defaults.
 */
template<DatabaseField T>
class RequiredInput : public HandleBase {
public:
    explicit RequiredInput(std::string field)
        : field_(std::move(field)) {}
    
    RequiredInput(std::string producer, std::string field)
        : producer_(std::move(producer)), field_(std::move(field)) {}
    
    const std::string& producer() const noexcept { return producer_; }
    const std::string& field() const noexcept { return field_; }
    
private:
    std::string producer_;
    std::string field_;
};

/**
 * @brief Timestamp-addressed value from a cycler's Historic Buffer
 */
template<DatabaseField T>
class HistoricInput : public HandleBase {
public:
    HistoricInput(std::string cycler, std::string field)
        : cycler_(std::move(cycler)), field_(std::move(field)) {}
    
    const std::string& cycler() const noexcept { return cycler_; }
    const std::string& field() const noexcept { return field_; }
    
private:
    std::string cycler_;
    std::string field_;
};

template<ParameterType T>
class Parameter : public HandleBase {
public:
    explicit Parameter(std::string path)
        : path_(std::move(path)) {}
    
    const std::string& path() const noexcept { return path_; }
    
private:
    std::string path_;
};

template<DatabaseField T>
class Output : public HandleBase {
public:
    explicit Output(std::string field)
        : field_(std::move(field)) {}
    
    const std::string& field() const noexcept { return field_; }
    
private:
    std::string field_;
};

/**
 * @brief Debug output, only computed while telemetry subscribes to it
 * 
 * Cannot be consumed by other modules.
 */
template<DatabaseField T>
class AdditionalOutput : public HandleBase {
public:
    explicit AdditionalOutput(std::string field)
        : field_(std::move(field)) {}
    
    const std::string& field() const noexcept { return field_; }
    
private:
    std::string field_;
};

/**
 * @brief Mutable state owned by the cycler, shared by its modules across ticks
 */
template<DatabaseField T>
class CyclerState : public HandleBase {
public:
    explicit CyclerState(std::string name)
        : name_(std::move(name)) {}
    
    const std::string& name() const noexcept { return name_; }
    
private:
    std::string name_;
};

} // namespace tickflow
