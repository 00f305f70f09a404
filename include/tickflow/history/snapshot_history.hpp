/**
 * @file snapshot_history.hpp
 * @brief Historic Buffer of published databases, type-erased over capacity
 * 
 * Cyclers are assembled at runtime, but HistoricBuffer capacities are
 * template arguments. SnapshotHistory is the runtime seam: each cycler that
 * keeps history owns one FixedSnapshotHistory<N> through this interface.
 * Entries share the snapshots published on the channel; nothing is copied.
 */

#pragma once

#include <tickflow/database/database.hpp>
#include <tickflow/history/historic_buffer.hpp>
#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

namespace tickflow {

using SnapshotEntry = HistoricEntry<Snapshot>;

class SnapshotHistory {
public:
    virtual ~SnapshotHistory() = default;
    
    virtual HistoryResult<void> push(Timestamp timestamp, Snapshot snapshot) = 0;
    virtual HistoryResult<SnapshotEntry> get(Timestamp timestamp) const = 0;
    virtual HistoryResult<SnapshotEntry> latest() const = 0;
    virtual std::pair<Timestamp, Timestamp> timestamp_range() const = 0;
    virtual std::size_t size() const = 0;
    virtual std::size_t capacity() const = 0;
};

template<std::size_t Capacity>
class FixedSnapshotHistory final : public SnapshotHistory {
public:
    HistoryResult<void> push(Timestamp timestamp, Snapshot snapshot) override {
        return buffer_.push(timestamp, std::move(snapshot));
    }
    
    HistoryResult<SnapshotEntry> get(Timestamp timestamp) const override {
        return buffer_.get(timestamp);
    }
    
    HistoryResult<SnapshotEntry> latest() const override {
        return buffer_.latest();
    }
    
    std::pair<Timestamp, Timestamp> timestamp_range() const override {
        return buffer_.timestamp_range();
    }
    
    std::size_t size() const override {
        return buffer_.size();
    }
    
    std::size_t capacity() const override {
        return Capacity;
    }
    
private:
    HistoricBuffer<Snapshot, Capacity> buffer_;
};

/**
 * @brief Capacities selectable from runtime configuration files
 */
inline const std::vector<std::size_t>& supported_history_capacities() {
    static const std::vector<std::size_t> capacities{4, 8, 16, 32, 64, 128, 256, 512, 1024};
    return capacities;
}

/**
 * @brief Create a history for a capacity read from configuration
 * @return nullptr if capacity is not one of supported_history_capacities()
 */
std::unique_ptr<SnapshotHistory> make_snapshot_history(std::size_t capacity);

} // namespace tickflow
