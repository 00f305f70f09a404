/**
 * @file tick_source.hpp
 * @brief What a cycler thread waits on between ticks
 * 
 * - PeriodicTickSource: absolute deadlines, missed ticks are skipped rather
 *   than run back to back
 * - EventTickSource: notify(timestamp) from a sensor driver or from the
 *   publication of another cycler; pending events coalesce to the latest
 * 
 * stop() wakes a waiting cycler immediately, wait_next() then returns nullopt.
 */

#pragma once

#include <tickflow/platform/threading.hpp>
#include <tickflow/platform/timestamp.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>

namespace tickflow {

class TickSource {
public:
    virtual ~TickSource() = default;
    
    /**
     * @brief Block until the next tick is due
     * @return Tick timestamp, or nullopt once stopped
     */
    virtual std::optional<Timestamp> wait_next() = 0;
    
    virtual void stop() = 0;
};

class PeriodicTickSource final : public TickSource {
public:
    explicit PeriodicTickSource(Nanoseconds period)
        : period_(period) {}
    
    std::optional<Timestamp> wait_next() override;
    void stop() override;
    
    /**
     * @brief Deadlines passed over because a tick overran
     */
    uint64_t skipped() const noexcept { return skipped_.load(std::memory_order_relaxed); }
    
private:
    using Clock = std::chrono::steady_clock;
    
    Nanoseconds period_;
    std::optional<Clock::time_point> next_deadline_;
    Mutex mutex_;
    ConditionVariable cv_;
    bool stopped_{false};
    std::atomic<uint64_t> skipped_{0};
};

class EventTickSource final : public TickSource {
public:
    EventTickSource() = default;
    
    /**
     * @brief Request a tick stamped with timestamp
     * 
     * Called from any thread. If the cycler has not picked up the previous
     * event yet, that event is replaced.
     */
    void notify(Timestamp timestamp);
    
    std::optional<Timestamp> wait_next() override;
    void stop() override;
    
    /**
     * @brief Events replaced before the cycler picked them up
     */
    uint64_t coalesced() const noexcept { return coalesced_.load(std::memory_order_relaxed); }
    
private:
    Mutex mutex_;
    ConditionVariable cv_;
    std::optional<Timestamp> pending_;
    bool stopped_{false};
    std::atomic<uint64_t> coalesced_{0};
};

} // namespace tickflow
