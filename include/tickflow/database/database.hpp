/**
 * @file database.hpp
 * @brief Output record produced by one cycler in one tick
 * 
 * A Database holds one slot per output field declared by the modules of a
 * cycler. The slot set is described by a DatabaseLayout computed by the
 * pipeline compiler; all databases of a cycler share the same layout.
 * 
 * While a tick runs, the database is private to the cycler thread. Once
 * published it is only ever handled through shared_ptr<const Database>,
 * which is the snapshot type of both the Channel and the Historic Buffer.
 */

#pragma once

#include <tickflow/platform/timestamp.hpp>
#include <rfl.hpp>
#include <rfl/json.hpp>
#include <any>
#include <concepts>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <vector>

namespace tickflow {

/**
 * @brief Requirements for anything stored in a database or cycler state
 * 
 * Values must also be reflectable by rfl (aggregates, standard containers,
 * arithmetic types) so telemetry can serialize them.
 */
template<typename T>
concept DatabaseField = std::default_initializable<T> && std::copy_constructible<T>;

/**
 * @brief Human-readable type name for diagnostics
 */
template<typename T>
struct is_optional : std::false_type {};

template<typename T>
struct is_optional<std::optional<T>> : std::true_type {};

template<typename T>
std::string type_name() {
    return rfl::type_name_t<T>().str();
}

struct FieldDescriptor {
    std::string name;
    std::string producer;                           ///< Module writing the field
    std::type_index type;
    std::string type_name;
    bool additional{false};                         ///< Only filled while subscribed
    std::function<std::any()> make_default;
    std::function<std::string(const std::any&)> to_json;
    std::function<bool(const std::any&)> engaged;  ///< Set for std::optional fields only
};

template<DatabaseField T>
FieldDescriptor make_field_descriptor(std::string name, std::string producer, bool additional) {
    FieldDescriptor descriptor{
        .name = std::move(name),
        .producer = std::move(producer),
        .type = std::type_index(typeid(T)),
        .type_name = type_name<T>(),
        .additional = additional,
        .make_default = [] { return std::any(T{}); },
        .to_json = [](const std::any& value) {
            return rfl::json::write(std::any_cast<const T&>(value));
        }
    };
    if constexpr (is_optional<T>::value) {
        descriptor.engaged = [](const std::any& value) {
            return std::any_cast<const T&>(value).has_value();
        };
    }
    return descriptor;
}

class DatabaseLayout {
public:
    DatabaseLayout(std::string cycler, std::vector<FieldDescriptor> fields)
        : cycler_(std::move(cycler)), fields_(std::move(fields)) {}
    
    const std::string& cycler() const noexcept { return cycler_; }
    const std::vector<FieldDescriptor>& fields() const noexcept { return fields_; }
    std::size_t size() const noexcept { return fields_.size(); }
    
    std::optional<std::size_t> find(std::string_view field) const {
        for (std::size_t i = 0; i < fields_.size(); ++i) {
            if (fields_[i].name == field) {
                return i;
            }
        }
        return std::nullopt;
    }
    
private:
    std::string cycler_;
    std::vector<FieldDescriptor> fields_;
};

class Database {
public:
    Database(std::shared_ptr<const DatabaseLayout> layout, uint64_t tick, Timestamp timestamp);
    
    uint64_t tick() const noexcept { return tick_; }
    Timestamp timestamp() const noexcept { return timestamp_; }
    const DatabaseLayout& layout() const noexcept { return *layout_; }
    
    /**
     * @brief True for main outputs; additional outputs only once filled
     */
    bool is_filled(std::size_t index) const { return filled_[index]; }
    
    /**
     * @brief Filled, and holding a value if the field is a std::optional
     */
    bool is_engaged(std::size_t index) const {
        const auto& engaged = layout_->fields()[index].engaged;
        return filled_[index] && (!engaged || engaged(fields_[index]));
    }
    
    template<typename T>
    const T& get(std::size_t index) const {
        return std::any_cast<const T&>(fields_[index]);
    }
    
    template<typename T>
    T& get_mutable(std::size_t index) {
        filled_[index] = true;
        return std::any_cast<T&>(fields_[index]);
    }
    
    template<typename T>
    void set(std::size_t index, T value) {
        fields_[index] = std::move(value);
        filled_[index] = true;
    }
    
    /**
     * @brief Lookup by field name, nullptr if absent, unfilled or of another type
     */
    template<typename T>
    const T* find(std::string_view field) const {
        auto index = layout_->find(field);
        if (!index || !filled_[*index]) {
            return nullptr;
        }
        return std::any_cast<T>(&fields_[*index]);
    }
    
    std::string field_to_json(std::size_t index) const;
    
    /**
     * @brief Serialize filled fields as one JSON object
     * @param selection Field indices to include; empty means every field
     */
    std::string to_json(const std::vector<std::size_t>& selection = {}) const;
    
private:
    std::shared_ptr<const DatabaseLayout> layout_;
    uint64_t tick_;
    Timestamp timestamp_;
    std::vector<std::any> fields_;
    std::vector<bool> filled_;
};

using Snapshot = std::shared_ptr<const Database>;

} // namespace tickflow
