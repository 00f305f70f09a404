/**
 * @file historic_buffer.hpp
 * @brief Fixed-capacity, timestamp-indexed ring of past values
 * 
 * Backs delayed-measurement fusion: a consumer holding a measurement stamped
 * in the past asks for the producer's state "as of" that time. Lookups never
 * consume entries; eviction only happens when a push exceeds capacity.
 * 
 * Storage is a SeRTial RingBuffer, so capacity is a compile-time constant
 * chosen when the owning cycler is declared. Size it to cover the largest
 * delay any historic consumer will ask for.
 * 
 * @code
 * HistoricBuffer<Pose, 64> poses;
 * poses.push(t_100, pose_a);
 * poses.push(t_150, pose_b);
 * 
 * auto at_120 = poses.get(t_120);   // -> entry pushed at t_100
 * auto at_90  = poses.get(t_90);    // -> HistoryError::NoEntryOldEnough
 * @endcode
 */

#pragma once

#include <tickflow/platform/threading.hpp>
#include <tickflow/platform/timestamp.hpp>
#include <tickflow/result.hpp>
#include <sertial/containers/ring_buffer.hpp>
#include <cstddef>
#include <utility>

namespace tickflow {

enum class HistoryError {
    Empty,              ///< Nothing has been pushed yet
    NoEntryOldEnough,   ///< Query precedes every retained entry
    OutOfOrder          ///< push() with a timestamp older than the newest entry
};

constexpr const char* to_string(HistoryError error) {
    switch (error) {
        case HistoryError::Empty:            return "History is empty";
        case HistoryError::NoEntryOldEnough: return "No entry old enough";
        case HistoryError::OutOfOrder:       return "Timestamp older than newest entry";
    }
    return "Unknown error";
}

template<typename T>
using HistoryResult = Result<T, HistoryError>;

template<typename T>
struct HistoricEntry {
    Timestamp timestamp{0};
    T value{};
};

/**
 * @brief Timestamp-ordered ring buffer with floor lookup
 * 
 * @tparam T Stored value type (copied out on lookup, so prefer cheap handles
 *           such as shared_ptr snapshots for large records)
 * @tparam Capacity Maximum retained entries; oldest evicted first
 * 
 * Thread Safety:
 * - One writer (the owning cycler) calls push()
 * - Any number of readers call get() concurrently; a reader holds the shared
 *   lock only for the O(log n) search and the copy of one entry
 */
template<typename T, std::size_t Capacity>
class HistoricBuffer {
    static_assert(Capacity > 0, "Capacity must be greater than 0");
    
public:
    using value_type = T;
    using entry_type = HistoricEntry<T>;
    using size_type = std::size_t;
    
    HistoricBuffer() = default;
    
    HistoricBuffer(const HistoricBuffer&) = delete;
    HistoricBuffer& operator=(const HistoricBuffer&) = delete;
    
    static constexpr size_type capacity() {
        return Capacity;
    }
    
    size_type size() const {
        SharedLock lock(mutex_);
        return buffer_.size();
    }
    
    bool empty() const {
        SharedLock lock(mutex_);
        return buffer_.empty();
    }
    
    void clear() {
        UniqueLockShared lock(mutex_);
        buffer_.clear();
    }
    
    /**
     * @brief Append an entry, evicting the oldest one when full
     * 
     * Timestamps must be non-decreasing. A decreasing timestamp is a bug in
     * the producer and is rejected with HistoryError::OutOfOrder; the buffer
     * is left unchanged.
     */
    HistoryResult<void> push(Timestamp timestamp, T value) {
        UniqueLockShared lock(mutex_);
        
        if (!buffer_.empty() && timestamp < buffer_[buffer_.size() - 1].timestamp) {
            return HistoryError::OutOfOrder;
        }
        
        buffer_.push_back(entry_type{timestamp, std::move(value)});
        return HistoryResult<void>::ok();
    }
    
    /**
     * @brief Newest entry whose timestamp is <= the query
     * 
     * With several entries sharing the floor timestamp, the most recently
     * pushed one wins.
     */
    HistoryResult<entry_type> get(Timestamp timestamp) const {
        SharedLock lock(mutex_);
        
        if (buffer_.empty()) {
            return HistoryError::Empty;
        }
        
        // Binary search for the first entry newer than the query
        size_type low = 0;
        size_type high = buffer_.size();
        while (low < high) {
            size_type mid = low + (high - low) / 2;
            if (buffer_[mid].timestamp <= timestamp) {
                low = mid + 1;
            } else {
                high = mid;
            }
        }
        
        if (low == 0) {
            return HistoryError::NoEntryOldEnough;
        }
        return buffer_[low - 1];
    }
    
    /**
     * @brief Newest entry, regardless of timestamp
     */
    HistoryResult<entry_type> latest() const {
        SharedLock lock(mutex_);
        if (buffer_.empty()) {
            return HistoryError::Empty;
        }
        return buffer_[buffer_.size() - 1];
    }
    
    /**
     * @brief {oldest, newest} retained timestamps, or {0, 0} if empty
     */
    std::pair<Timestamp, Timestamp> timestamp_range() const {
        SharedLock lock(mutex_);
        if (buffer_.empty()) {
            return {0, 0};
        }
        return {buffer_[0].timestamp, buffer_[buffer_.size() - 1].timestamp};
    }
    
private:
    mutable SharedMutex mutex_;
    sertial::RingBuffer<entry_type, Capacity> buffer_;
};

} // namespace tickflow
