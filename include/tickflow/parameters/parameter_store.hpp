/**
 * @file parameter_store.hpp
 * @brief Path-addressable, generation-versioned configuration tree
 * 
 * Parameters live in a flat map keyed by dotted paths ("walking.step_height").
 * A path that is a prefix of other paths ("walking") addresses a subtree.
 * 
 * Every successful write produces a new immutable ParameterSnapshot with a
 * higher generation. Cyclers take one snapshot at the start of each tick and
 * hand it to all their modules, so a write landing mid-tick only becomes
 * visible at that cycler's next tick boundary.
 * 
 * Writes never add paths or change a leaf's type. The set of paths and their
 * kinds is fixed when the store is seeded, which lets the pipeline compiler
 * validate parameter wiring once before the robot runs.
 * 
 * A leaf seeded as null is nullable: it holds null or a value of any kind
 * (an injected override, for example) and is read through
 * Parameter<std::optional<T>>.
 */

#pragma once

#include <tickflow/platform/threading.hpp>
#include <tickflow/result.hpp>
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <stdexcept>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace tickflow {

using ParameterValue = std::variant<bool, int64_t, double, std::string, std::vector<double>, std::monostate>;

enum class ParameterKind {
    Bool,
    Integer,
    Double,
    String,
    DoubleList,
    Null
};

constexpr const char* to_string(ParameterKind kind) {
    switch (kind) {
        case ParameterKind::Bool:       return "bool";
        case ParameterKind::Integer:    return "integer";
        case ParameterKind::Double:     return "double";
        case ParameterKind::String:     return "string";
        case ParameterKind::DoubleList: return "list of doubles";
        case ParameterKind::Null:       return "null";
    }
    return "unknown";
}

enum class ParameterError {
    UnknownPath,
    TypeMismatch,
    EmptyBatch,
    InvalidDocument
};

constexpr const char* to_string(ParameterError error) {
    switch (error) {
        case ParameterError::UnknownPath:     return "Unknown parameter path";
        case ParameterError::TypeMismatch:    return "Parameter type mismatch";
        case ParameterError::EmptyBatch:      return "Empty parameter batch";
        case ParameterError::InvalidDocument: return "Invalid parameter document";
    }
    return "Unknown error";
}

template<typename T>
using ParameterResult = Result<T, ParameterError>;

template<typename T>
concept ParameterLeafType = std::is_same_v<T, bool> ||
                            std::is_same_v<T, int64_t> ||
                            std::is_same_v<T, double> ||
                            std::is_same_v<T, std::string> ||
                            std::is_same_v<T, std::vector<double>>;

template<typename T>
struct nullable_parameter : std::false_type {};

template<ParameterLeafType T>
struct nullable_parameter<std::optional<T>> : std::true_type {
    using value_type = T;
};

template<typename T>
concept ParameterType = ParameterLeafType<T> || nullable_parameter<T>::value;

/**
 * @brief Kind of a parameter type; std::optional<T> maps to the kind of T
 */
template<ParameterType T>
constexpr ParameterKind parameter_kind_of() {
    if constexpr (nullable_parameter<T>::value) {
        return parameter_kind_of<typename nullable_parameter<T>::value_type>();
    } else if constexpr (std::is_same_v<T, bool>) {
        return ParameterKind::Bool;
    } else if constexpr (std::is_same_v<T, int64_t>) {
        return ParameterKind::Integer;
    } else if constexpr (std::is_same_v<T, double>) {
        return ParameterKind::Double;
    } else if constexpr (std::is_same_v<T, std::string>) {
        return ParameterKind::String;
    } else {
        return ParameterKind::DoubleList;
    }
}

inline ParameterKind kind_of(const ParameterValue& value) {
    return static_cast<ParameterKind>(value.index());
}

struct ParameterReading {
    ParameterValue value;
    uint64_t generation{0};
};

using ParameterLeaves = std::map<std::string, ParameterValue, std::less<>>;
using NullablePaths = std::set<std::string, std::less<>>;

/**
 * @brief Immutable view of the whole tree at one generation
 */
class ParameterSnapshot {
public:
    ParameterSnapshot(ParameterLeaves leaves, uint64_t generation,
                      std::shared_ptr<const NullablePaths> nullable = nullptr)
        : leaves_(std::move(leaves)), generation_(generation), nullable_(std::move(nullable)) {}
    
    uint64_t generation() const noexcept { return generation_; }
    
    const ParameterLeaves& leaves() const noexcept { return leaves_; }
    
    bool is_nullable(std::string_view path) const {
        return nullable_ && nullable_->contains(path);
    }
    
    /**
     * @brief Leaf value at path, nullptr if the path is not a leaf
     */
    const ParameterValue* find(std::string_view path) const {
        auto it = leaves_.find(path);
        return it != leaves_.end() ? &it->second : nullptr;
    }
    
    bool contains_leaf(std::string_view path) const {
        return find(path) != nullptr;
    }
    
    bool contains_subtree(std::string_view path) const;
    
    /**
     * @brief All leaves at or below path ("" = whole tree)
     */
    std::vector<std::pair<std::string, ParameterValue>> subtree(std::string_view path) const;
    
    /**
     * @brief Typed leaf access for wiring already validated by the compiler
     * @throws std::out_of_range if path is not a leaf
     * @throws std::bad_variant_access on kind mismatch
     */
    template<ParameterLeafType T>
    const T& get(std::string_view path) const {
        return std::get<T>(at(path));
    }
    
    /**
     * @brief Typed access to a nullable leaf, std::nullopt while it holds null
     * @throws std::bad_variant_access if the leaf holds another kind
     */
    template<ParameterLeafType T>
    std::optional<T> get_optional(std::string_view path) const {
        const ParameterValue& value = at(path);
        if (std::holds_alternative<std::monostate>(value)) {
            return std::nullopt;
        }
        if constexpr (std::is_same_v<T, double>) {
            if (const int64_t* integer = std::get_if<int64_t>(&value)) {
                return static_cast<double>(*integer);
            }
        }
        return std::get<T>(value);
    }
    
private:
    const ParameterValue& at(std::string_view path) const {
        const ParameterValue* value = find(path);
        if (!value) {
            throw std::out_of_range("parameter path not found: " + std::string(path));
        }
        return *value;
    }
    
    ParameterLeaves leaves_;
    uint64_t generation_;
    std::shared_ptr<const NullablePaths> nullable_;
};

/**
 * @brief Shared parameter tree with atomic, tick-aligned updates
 * 
 * Thread Safety:
 * - snapshot() and read() are lock-free loads of the current snapshot
 * - write() calls are serialized; each commits a whole new generation
 * 
 * Writing an integer to a double leaf is accepted and widened. Nullable
 * leaves accept null and every kind. Every other kind change is a
 * TypeMismatch and leaves the store untouched.
 */
class ParameterStore {
public:
    using ChangeCallback = std::function<void(uint64_t generation, const std::vector<std::string>& paths)>;
    using Batch = std::vector<std::pair<std::string, ParameterValue>>;
    
    ParameterStore();
    explicit ParameterStore(ParameterLeaves initial);
    
    ParameterStore(const ParameterStore&) = delete;
    ParameterStore& operator=(const ParameterStore&) = delete;
    
    /**
     * @brief Seed a store from a JSON object; nested objects become dotted paths
     * 
     * Numbers without a fraction become integers, arrays must hold only
     * numbers. null leaves become nullable leaves; mixed arrays make the
     * document invalid.
     */
    static ParameterResult<std::shared_ptr<ParameterStore>> from_json(std::string_view json);
    
    std::shared_ptr<const ParameterSnapshot> snapshot() const noexcept {
        return current_.load(std::memory_order_acquire);
    }
    
    uint64_t generation() const noexcept {
        return snapshot()->generation();
    }
    
    ParameterResult<ParameterReading> read(std::string_view path) const;
    
    ParameterResult<std::vector<std::pair<std::string, ParameterReading>>>
    read_subtree(std::string_view path) const;
    
    /**
     * @brief Update one leaf
     * @return New generation, or the error that left the store unchanged
     */
    ParameterResult<uint64_t> write(std::string_view path, ParameterValue value);
    
    /**
     * @brief Update several leaves as one generation, all or nothing
     */
    ParameterResult<uint64_t> write(const Batch& batch);
    
    template<ParameterLeafType T>
    ParameterResult<uint64_t> write(std::string_view path, T value) {
        return write(path, ParameterValue{std::move(value)});
    }
    
    /**
     * @brief Clear a nullable leaf
     */
    ParameterResult<uint64_t> write_null(std::string_view path) {
        return write(path, ParameterValue{std::monostate{}});
    }
    
    /**
     * @brief Register a callback invoked after every committed write
     * 
     * Runs on the writer's thread after the write lock is released, so a
     * callback may write again. Callbacks of concurrent writers may
     * interleave.
     */
    void on_change(ChangeCallback callback);
    
private:
    static ParameterResult<ParameterValue> coerce(const ParameterValue& current, ParameterValue value,
                                                  bool nullable);
    
    std::shared_ptr<const NullablePaths> nullable_;
    std::atomic<std::shared_ptr<const ParameterSnapshot>> current_;
    Mutex write_mutex_;
    std::vector<ChangeCallback> callbacks_;
};

} // namespace tickflow
