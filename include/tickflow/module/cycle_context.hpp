/**
 * @file cycle_context.hpp
 * @brief Per-tick view a module works through
 * 
 * The cycler builds one CycleContext per tick. It pins everything a tick
 * may observe: the in-progress database, the upstream snapshots read at
 * tick start, the parameter snapshot, and the cycler's state slots. Values
 * returned by reference stay valid until cycle() returns.
 */

#pragma once

#include <tickflow/module/handles.hpp>
#include <tickflow/history/snapshot_history.hpp>
#include <any>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace tickflow {

/**
 * @brief One value taken from a Historic Buffer
 * 
 * Keeps the whole snapshot alive through the aliasing shared_ptr.
 */
template<typename T>
struct Sample {
    Timestamp timestamp;
    std::shared_ptr<const T> value;
    
    const T& operator*() const { return *value; }
    const T* operator->() const { return value.get(); }
};

struct CycleResources {
    Database& database;
    const std::vector<Snapshot>& upstream;                  ///< By cycler index
    const std::vector<const SnapshotHistory*>& histories;   ///< By cycler index
    const ParameterSnapshot& parameters;
    std::vector<std::any>& states;
    const std::vector<bool>& subscribed;                    ///< By field index
    const std::string& cycler;
    bool actuation_enabled;
};

class CycleContext {
public:
    explicit CycleContext(const CycleResources& resources)
        : res_(resources) {}
    
    // ========================================================================
    // Metadata
    // ========================================================================
    
    uint64_t tick() const noexcept { return res_.database.tick(); }
    Timestamp timestamp() const noexcept { return res_.database.timestamp(); }
    uint64_t parameter_generation() const noexcept { return res_.parameters.generation(); }
    const std::string& cycler_name() const noexcept { return res_.cycler; }
    
    /**
     * @brief False while the fault handler halts actuation
     * 
     * Modules commanding actuators send safe commands when this is false.
     */
    bool actuation_enabled() const noexcept { return res_.actuation_enabled; }
    
    // ========================================================================
    // Inputs
    // ========================================================================
    
    /**
     * @brief Latest value of an input
     * @return nullptr while the producing cycler has not published yet
     */
    template<typename T>
    const T* get(const Input<T>& input) const {
        return resolve<T>(input.wire(), input.field());
    }
    
    /**
     * @brief Value of a required input
     * 
     * The cycler only runs a module once all its required inputs are
     * present, so inside cycle() this never throws.
     * @throws std::logic_error if the value is absent
     */
    template<typename T>
    const T& get(const RequiredInput<T>& input) const {
        const std::optional<T>* value = resolve<std::optional<T>>(input.wire(), input.field());
        if (!value || !value->has_value()) {
            throw std::logic_error("required input '" + input.field() + "' is absent");
        }
        return **value;
    }
    
    /**
     * @brief True if a wired input has a value this tick
     * 
     * Channel inputs are absent before the producer's first publication,
     * optional fields while empty.
     */
    bool is_present(const Wire& wire) const {
        switch (wire.kind) {
            case WireKind::CurrentTick:
                return res_.database.is_engaged(wire.field);
            case WireKind::Channel: {
                const Snapshot& snapshot = res_.upstream[wire.source];
                return snapshot && snapshot->is_engaged(wire.field);
            }
            default:
                return false;
        }
    }
    
    /**
     * @brief Value of the newest entry at or before timestamp
     */
    template<typename T>
    HistoryResult<Sample<T>> get(const HistoricInput<T>& input, Timestamp timestamp) const {
        const SnapshotHistory* history = history_for(input);
        auto entry = history->get(timestamp);
        if (!entry) {
            return entry.error();
        }
        return to_sample<T>(*entry, input.wire().field);
    }
    
    template<typename T>
    HistoryResult<Sample<T>> latest(const HistoricInput<T>& input) const {
        const SnapshotHistory* history = history_for(input);
        auto entry = history->latest();
        if (!entry) {
            return entry.error();
        }
        return to_sample<T>(*entry, input.wire().field);
    }
    
    template<typename T>
    const T& get(const Parameter<T>& parameter) const {
        return res_.parameters.template get<T>(parameter.path());
    }
    
    /**
     * @brief Nullable parameter; std::nullopt while the leaf holds null
     */
    template<typename T>
    std::optional<T> get(const Parameter<std::optional<T>>& parameter) const {
        return res_.parameters.template get_optional<T>(parameter.path());
    }
    
    // ========================================================================
    // Outputs
    // ========================================================================
    
    template<typename T>
    void set(const Output<T>& output, std::type_identity_t<T> value) {
        res_.database.set(output.wire().field, std::move(value));
    }
    
    /**
     * @brief In-place access to an output, starting from its default value
     */
    template<typename T>
    T& output(const Output<T>& output) {
        return res_.database.template get_mutable<T>(output.wire().field);
    }
    
    template<typename T>
    bool is_subscribed(const AdditionalOutput<T>& output) const {
        return res_.subscribed[output.wire().field];
    }
    
    /**
     * @brief Compute and store an additional output only while subscribed
     * @param producer Callable returning T, not invoked otherwise
     */
    template<typename T, typename F>
    void fill_if_subscribed(const AdditionalOutput<T>& output, F&& producer) {
        if (is_subscribed(output)) {
            res_.database.set(output.wire().field, static_cast<T>(producer()));
        }
    }
    
    // ========================================================================
    // Cycler state
    // ========================================================================
    
    template<typename T>
    T& state(const CyclerState<T>& handle) {
        return std::any_cast<T&>(res_.states[handle.wire().source]);
    }
    
private:
    template<typename T>
    const T* resolve(const Wire& wire, const std::string& field) const {
        switch (wire.kind) {
            case WireKind::CurrentTick:
                return &res_.database.template get<T>(wire.field);
            case WireKind::Channel: {
                const Snapshot& snapshot = res_.upstream[wire.source];
                return snapshot ? &snapshot->template get<T>(wire.field) : nullptr;
            }
            default:
                throw std::logic_error("input '" + field + "' is not wired");
        }
    }
    
    template<typename T>
    const SnapshotHistory* history_for(const HistoricInput<T>& input) const {
        const Wire& wire = input.wire();
        if (wire.kind != WireKind::History || !res_.histories[wire.source]) {
            throw std::logic_error("historic input '" + input.field() + "' is not wired");
        }
        return res_.histories[wire.source];
    }
    
    template<typename T>
    static Sample<T> to_sample(const SnapshotEntry& entry, std::size_t field) {
        const T& value = entry.value->template get<T>(field);
        return Sample<T>{entry.timestamp, std::shared_ptr<const T>(entry.value, &value)};
    }
    
    CycleResources res_;
};

} // namespace tickflow
