/**
 * @file telemetry_publisher.hpp
 * @brief Best-effort mirror of published databases to external subscribers
 * 
 * Each subscription holds at most one pending frame. offer() is called by
 * the producing cycler after publishing and only swaps a shared_ptr per
 * subscriber: it never blocks, never allocates per subscriber and never
 * serializes. A subscriber that does not keep up loses intermediate frames
 * (counted as dropped) and on its next receive gets the newest one.
 * Serialization to JSON happens on the receiving thread.
 * 
 * @code
 * auto id = telemetry.subscribe("control", {"pose", "pose_covariance"});
 * while (running) {
 *     if (auto frame = telemetry.receive(*id, Milliseconds(100))) {
 *         recorder.write(frame->cycler, frame->tick, frame->payload);
 *     }
 * }
 * @endcode
 */

#pragma once

#include <tickflow/database/database.hpp>
#include <tickflow/platform/threading.hpp>
#include <tickflow/result.hpp>
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace tickflow {

enum class SubscriptionError {
    UnknownCycler,
    UnknownField,
    UnknownSubscription,
    NoFrame,
    Timeout
};

constexpr const char* to_string(SubscriptionError error) {
    switch (error) {
        case SubscriptionError::UnknownCycler:       return "Unknown cycler";
        case SubscriptionError::UnknownField:        return "Unknown field";
        case SubscriptionError::UnknownSubscription: return "Unknown subscription";
        case SubscriptionError::NoFrame:             return "No frame available";
        case SubscriptionError::Timeout:             return "Timeout";
    }
    return "Unknown error";
}

template<typename T>
using SubscriptionResult = Result<T, SubscriptionError>;

using SubscriptionId = uint64_t;

struct TelemetryFrame {
    std::string cycler;
    uint64_t tick{0};
    Timestamp timestamp{0};
    std::string payload;        ///< JSON object, one member per selected field
};

struct SubscriptionStats {
    uint64_t delivered{0};
    uint64_t dropped{0};
};

class TelemetryPublisher {
public:
    /**
     * @param layouts Database layout per cycler index
     */
    explicit TelemetryPublisher(std::vector<std::shared_ptr<const DatabaseLayout>> layouts);
    
    TelemetryPublisher(const TelemetryPublisher&) = delete;
    TelemetryPublisher& operator=(const TelemetryPublisher&) = delete;
    
    // ========================================================================
    // Subscriber side
    // ========================================================================
    
    /**
     * @brief Subscribe to a cycler's publications
     * @param fields Fields to include; empty selects every field, additional
     *        outputs included
     */
    SubscriptionResult<SubscriptionId> subscribe(std::string_view cycler,
                                                 const std::vector<std::string>& fields = {});
    
    SubscriptionResult<void> unsubscribe(SubscriptionId id);
    
    /**
     * @brief Newest undelivered frame, NoFrame if there is none
     */
    SubscriptionResult<TelemetryFrame> try_receive(SubscriptionId id);
    
    SubscriptionResult<TelemetryFrame> receive(SubscriptionId id, Milliseconds timeout);
    
    SubscriptionResult<SubscriptionStats> stats(SubscriptionId id) const;
    
    // ========================================================================
    // Cycler side
    // ========================================================================
    
    /**
     * @brief Hand a freshly published database to all subscribers of a cycler
     */
    void offer(std::size_t cycler, const Snapshot& snapshot) noexcept;
    
    /**
     * @brief Per-field flags: true while some subscriber wants the field
     * 
     * Cyclers read this once per tick to decide which additional outputs
     * to compute.
     */
    std::shared_ptr<const std::vector<bool>> wanted_fields(std::size_t cycler) const noexcept {
        return cyclers_[cycler].wanted.load(std::memory_order_acquire);
    }
    
private:
    struct Subscription {
        SubscriptionId id;
        std::size_t cycler;
        std::vector<std::size_t> fields;
        std::atomic<Snapshot> pending;
        std::atomic<uint64_t> last_delivered_tick{0};
        std::atomic<uint64_t> delivered{0};
        std::atomic<uint64_t> dropped{0};
        Mutex mutex;
        ConditionVariable cv;
    };
    
    using SubscriptionList = std::vector<std::shared_ptr<Subscription>>;
    
    struct CyclerSlot {
        std::shared_ptr<const DatabaseLayout> layout;
        std::atomic<std::shared_ptr<const SubscriptionList>> subscribers;
        std::atomic<std::shared_ptr<const std::vector<bool>>> wanted;
    };
    
    std::shared_ptr<Subscription> find(SubscriptionId id) const;
    SubscriptionResult<TelemetryFrame> take(Subscription& subscription);
    void rebuild(std::size_t cycler);
    TelemetryFrame make_frame(const Subscription& subscription, const Database& database) const;
    
    std::vector<CyclerSlot> cyclers_;
    
    mutable Mutex registry_mutex_;      ///< Subscriber side only; offer() never takes it
    std::map<SubscriptionId, std::shared_ptr<Subscription>> subscriptions_;
    SubscriptionId next_id_{1};
};

} // namespace tickflow
