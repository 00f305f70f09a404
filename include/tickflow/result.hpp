/**
 * @file result.hpp
 * @brief Value-or-error result used across TickFlow's runtime APIs
 * 
 * Hot paths (history lookups, parameter reads, telemetry receives) report
 * expected failures as values instead of exceptions. Each component defines
 * its own error enum with a to_string() overload and aliases Result<T, E>.
 */

#pragma once

#include <optional>
#include <utility>

namespace tickflow {

template<typename T, typename E>
class Result {
private:
    std::optional<T> value_;
    std::optional<E> error_;
    
public:
    Result(T value) : value_(std::move(value)), error_(std::nullopt) {}
    Result(E error) : value_(std::nullopt), error_(error) {}
    
    explicit operator bool() const { return value_.has_value(); }
    bool has_value() const { return value_.has_value(); }
    
    T& operator*() & { return *value_; }
    const T& operator*() const & { return *value_; }
    T&& operator*() && { return std::move(*value_); }
    
    T* operator->() { return &(*value_); }
    const T* operator->() const { return &(*value_); }
    
    T& value() & { return *value_; }
    const T& value() const & { return *value_; }
    T&& value() && { return std::move(*value_); }
    
    E error() const { return *error_; }
};

template<typename E>
class Result<void, E> {
private:
    std::optional<E> error_;
    
public:
    Result() : error_(std::nullopt) {}
    Result(E error) : error_(error) {}
    
    static Result ok() { return Result(); }
    
    explicit operator bool() const { return !error_.has_value(); }
    bool has_value() const { return !error_.has_value(); }
    
    E error() const { return *error_; }
};

} // namespace tickflow
