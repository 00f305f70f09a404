/**
 * @file channel.hpp
 * @brief Single-writer, multi-reader slot holding the latest published snapshot
 * 
 * A Channel connects one producing cycler to any number of consumers running
 * on other threads. The producer publishes immutable snapshots; readers obtain
 * a shared reference to whichever snapshot was complete when they looked.
 * 
 * Guarantees:
 * - publish() replaces the slot atomically. A reader sees the previous
 *   snapshot in full or the new one in full, never a mixture.
 * - A snapshot a reader already holds is never mutated or freed underneath it;
 *   it stays alive until the last reader drops its reference.
 * - Neither side holds a lock across a tick. The slot swap is a single
 *   atomic shared_ptr operation.
 * 
 * @code
 * Channel<Database> channel;
 * 
 * // Producer thread, end of tick
 * channel.publish(std::move(finished_database));
 * 
 * // Consumer thread
 * if (auto snapshot = channel.read()) {
 *     use(*snapshot);
 * }
 * @endcode
 */

#pragma once

#include <atomic>
#include <memory>
#include <cstdint>

namespace tickflow {

template<typename T>
class Channel {
public:
    using Snapshot = std::shared_ptr<const T>;
    
    Channel() = default;
    
    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;
    
    /**
     * @brief Replace the latest snapshot
     * 
     * Must only be called from the owning cycler's thread. Null snapshots
     * are ignored so the slot can never regress to "not yet published".
     */
    void publish(Snapshot snapshot) noexcept {
        if (!snapshot) {
            return;
        }
        slot_.store(std::move(snapshot), std::memory_order_release);
        publications_.fetch_add(1, std::memory_order_release);
    }
    
    /**
     * @brief Latest complete snapshot, or nullptr before the first publish
     */
    [[nodiscard]] Snapshot read() const noexcept {
        return slot_.load(std::memory_order_acquire);
    }
    
    [[nodiscard]] bool has_publication() const noexcept {
        return publications_.load(std::memory_order_acquire) > 0;
    }
    
    /**
     * @brief Number of completed publications
     */
    [[nodiscard]] uint64_t publications() const noexcept {
        return publications_.load(std::memory_order_acquire);
    }
    
private:
    std::atomic<Snapshot> slot_{};
    std::atomic<uint64_t> publications_{0};
};

} // namespace tickflow
