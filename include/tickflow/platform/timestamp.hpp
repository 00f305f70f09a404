/**
 * @file timestamp.hpp
 * @brief Timestamp type and clock access for ticks, channels and histories
 * 
 * All timestamps in TickFlow are uint64_t nanoseconds on the steady clock.
 * Historic lookups compare these values directly, so producers and consumers
 * must agree on the clock; sensor drivers that stamp frames themselves are
 * expected to convert into this time base before triggering a cycler.
 */

#pragma once

#include <chrono>
#include <thread>
#include <cstdint>

namespace tickflow {

/**
 * @brief Nanoseconds on the steady clock
 */
using Timestamp = uint64_t;

using Nanoseconds = std::chrono::nanoseconds;
using Microseconds = std::chrono::microseconds;
using Milliseconds = std::chrono::milliseconds;
using Seconds = std::chrono::seconds;

class Time {
public:
    /**
     * @brief Current steady-clock time in nanoseconds
     */
    static Timestamp now() noexcept {
        auto duration = std::chrono::steady_clock::now().time_since_epoch();
        return static_cast<Timestamp>(
            std::chrono::duration_cast<std::chrono::nanoseconds>(duration).count());
    }
    
    template<typename Rep, typename Period>
    static constexpr Timestamp to_nanoseconds(std::chrono::duration<Rep, Period> duration) noexcept {
        return static_cast<Timestamp>(
            std::chrono::duration_cast<std::chrono::nanoseconds>(duration).count()
        );
    }
    
    template<typename Duration>
    static constexpr Duration from_nanoseconds(Timestamp ns) noexcept {
        return std::chrono::duration_cast<Duration>(std::chrono::nanoseconds(ns));
    }
    
    static constexpr Timestamp milliseconds_to_ns(uint64_t ms) noexcept {
        return ms * 1'000'000;
    }
    
    static constexpr Timestamp microseconds_to_ns(uint64_t us) noexcept {
        return us * 1'000;
    }
    
    static constexpr uint64_t ns_to_milliseconds(Timestamp ns) noexcept {
        return ns / 1'000'000;
    }
    
    static constexpr uint64_t ns_to_microseconds(Timestamp ns) noexcept {
        return ns / 1'000;
    }
    
    /**
     * @brief Age of a timestamp relative to now; 0 if it lies in the future
     */
    static constexpr Timestamp age(Timestamp timestamp, Timestamp now_ns) noexcept {
        return now_ns > timestamp ? now_ns - timestamp : 0;
    }
    
    template<typename Rep, typename Period>
    static void sleep(std::chrono::duration<Rep, Period> duration) noexcept {
        std::this_thread::sleep_for(duration);
    }
};

/**
 * @brief Literals producing Timestamp values
 * 
 * Usage:
 *   using namespace tickflow::literals;
 *   history.get(now - 120_ms);
 */
namespace literals {
    constexpr Timestamp operator""_ns(unsigned long long ns) noexcept {
        return static_cast<Timestamp>(ns);
    }
    
    constexpr Timestamp operator""_us(unsigned long long us) noexcept {
        return Time::microseconds_to_ns(us);
    }
    
    constexpr Timestamp operator""_ms(unsigned long long ms) noexcept {
        return Time::milliseconds_to_ns(ms);
    }
    
    constexpr Timestamp operator""_s(unsigned long long s) noexcept {
        return Time::milliseconds_to_ns(s * 1000);
    }
} // namespace literals

} // namespace tickflow
