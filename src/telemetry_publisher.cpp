/**
 * @file telemetry_publisher.cpp
 * @brief Conflating per-subscriber delivery of published databases
 */

#include <tickflow/telemetry/telemetry_publisher.hpp>
#include <algorithm>
#include <chrono>
#include <iostream>

namespace tickflow {

namespace {

constexpr Milliseconds kReceiveSlice{5};

} // anonymous namespace

TelemetryPublisher::TelemetryPublisher(std::vector<std::shared_ptr<const DatabaseLayout>> layouts)
    : cyclers_(layouts.size()) {
    for (std::size_t i = 0; i < layouts.size(); ++i) {
        cyclers_[i].wanted.store(std::make_shared<const std::vector<bool>>(layouts[i]->size(), false));
        cyclers_[i].layout = std::move(layouts[i]);
    }
}

// ============================================================================
// Subscriber side
// ============================================================================

SubscriptionResult<SubscriptionId> TelemetryPublisher::subscribe(std::string_view cycler,
                                                                 const std::vector<std::string>& fields) {
    auto slot = std::find_if(cyclers_.begin(), cyclers_.end(),
        [&](const CyclerSlot& candidate) { return candidate.layout->cycler() == cycler; });
    if (slot == cyclers_.end()) {
        return SubscriptionError::UnknownCycler;
    }
    
    std::vector<std::size_t> indices;
    for (const auto& field : fields) {
        auto index = slot->layout->find(field);
        if (!index) {
            std::cerr << "[Telemetry] " << cycler << " has no field '" << field << "'\n";
            return SubscriptionError::UnknownField;
        }
        indices.push_back(*index);
    }
    
    auto subscription = std::make_shared<Subscription>();
    subscription->cycler = static_cast<std::size_t>(slot - cyclers_.begin());
    subscription->fields = std::move(indices);
    
    Lock lock(registry_mutex_);
    subscription->id = next_id_++;
    subscriptions_.emplace(subscription->id, subscription);
    rebuild(subscription->cycler);
    
    std::cout << "[Telemetry] Subscription " << subscription->id << " to " << cycler << "\n";
    return subscription->id;
}

SubscriptionResult<void> TelemetryPublisher::unsubscribe(SubscriptionId id) {
    Lock lock(registry_mutex_);
    auto it = subscriptions_.find(id);
    if (it == subscriptions_.end()) {
        return SubscriptionError::UnknownSubscription;
    }
    std::size_t cycler = it->second->cycler;
    subscriptions_.erase(it);
    rebuild(cycler);
    return SubscriptionResult<void>::ok();
}

SubscriptionResult<TelemetryFrame> TelemetryPublisher::try_receive(SubscriptionId id) {
    auto subscription = find(id);
    if (!subscription) {
        return SubscriptionError::UnknownSubscription;
    }
    return take(*subscription);
}

SubscriptionResult<TelemetryFrame> TelemetryPublisher::receive(SubscriptionId id, Milliseconds timeout) {
    auto subscription = find(id);
    if (!subscription) {
        return SubscriptionError::UnknownSubscription;
    }
    
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        auto frame = take(*subscription);
        if (frame || frame.error() != SubscriptionError::NoFrame) {
            return frame;
        }
        
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return SubscriptionError::Timeout;
        }
        
        // offer() notifies without the lock; the slice bounds a missed wakeup
        auto slice = std::min<std::chrono::steady_clock::duration>(kReceiveSlice, deadline - now);
        UniqueLock lock(subscription->mutex);
        subscription->cv.wait_for(lock, slice, [&] {
            return subscription->pending.load(std::memory_order_acquire) != nullptr;
        });
    }
}

SubscriptionResult<SubscriptionStats> TelemetryPublisher::stats(SubscriptionId id) const {
    auto subscription = find(id);
    if (!subscription) {
        return SubscriptionError::UnknownSubscription;
    }
    return SubscriptionStats{
        subscription->delivered.load(std::memory_order_relaxed),
        subscription->dropped.load(std::memory_order_relaxed)
    };
}

// ============================================================================
// Cycler side
// ============================================================================

void TelemetryPublisher::offer(std::size_t cycler, const Snapshot& snapshot) noexcept {
    auto subscribers = cyclers_[cycler].subscribers.load(std::memory_order_acquire);
    if (!subscribers) {
        return;
    }
    for (const auto& subscription : *subscribers) {
        auto replaced = subscription->pending.exchange(snapshot, std::memory_order_acq_rel);
        if (replaced) {
            subscription->dropped.fetch_add(1, std::memory_order_relaxed);
        }
        subscription->cv.notify_one();
    }
}

// ============================================================================
// Internals
// ============================================================================

std::shared_ptr<TelemetryPublisher::Subscription> TelemetryPublisher::find(SubscriptionId id) const {
    Lock lock(registry_mutex_);
    auto it = subscriptions_.find(id);
    return it != subscriptions_.end() ? it->second : nullptr;
}

SubscriptionResult<TelemetryFrame> TelemetryPublisher::take(Subscription& subscription) {
    auto snapshot = subscription.pending.exchange(nullptr, std::memory_order_acq_rel);
    if (!snapshot) {
        return SubscriptionError::NoFrame;
    }
    
    // Ticks only grow; anything not newer was already delivered
    uint64_t last = subscription.last_delivered_tick.load(std::memory_order_relaxed);
    if (snapshot->tick() <= last) {
        return SubscriptionError::NoFrame;
    }
    subscription.last_delivered_tick.store(snapshot->tick(), std::memory_order_relaxed);
    subscription.delivered.fetch_add(1, std::memory_order_relaxed);
    return make_frame(subscription, *snapshot);
}

void TelemetryPublisher::rebuild(std::size_t cycler) {
    CyclerSlot& slot = cyclers_[cycler];
    auto list = std::make_shared<SubscriptionList>();
    auto wanted = std::make_shared<std::vector<bool>>(slot.layout->size(), false);
    
    for (const auto& [id, subscription] : subscriptions_) {
        if (subscription->cycler != cycler) {
            continue;
        }
        list->push_back(subscription);
        if (subscription->fields.empty()) {
            std::fill(wanted->begin(), wanted->end(), true);
        }
        for (std::size_t field : subscription->fields) {
            (*wanted)[field] = true;
        }
    }
    
    slot.subscribers.store(std::move(list), std::memory_order_release);
    slot.wanted.store(std::move(wanted), std::memory_order_release);
}

TelemetryFrame TelemetryPublisher::make_frame(const Subscription& subscription, const Database& database) const {
    return TelemetryFrame{
        cyclers_[subscription.cycler].layout->cycler(),
        database.tick(),
        database.timestamp(),
        database.to_json(subscription.fields)
    };
}

} // namespace tickflow
