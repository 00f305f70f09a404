/**
 * @file tick_source.cpp
 * @brief Periodic and event tick sources
 */

#include <tickflow/runtime/tick_source.hpp>

namespace tickflow {

// ============================================================================
// PeriodicTickSource
// ============================================================================

std::optional<Timestamp> PeriodicTickSource::wait_next() {
    UniqueLock lock(mutex_);
    if (stopped_) {
        return std::nullopt;
    }
    
    auto now = Clock::now();
    if (!next_deadline_) {
        next_deadline_ = now;
    } else if (now > *next_deadline_ + period_) {
        // Overran by more than a period: drop the missed deadlines
        auto missed = (now - *next_deadline_) / period_;
        skipped_.fetch_add(static_cast<uint64_t>(missed), std::memory_order_relaxed);
        *next_deadline_ += missed * period_;
    }
    
    const auto deadline = *next_deadline_;
    if (cv_.wait_until(lock, deadline, [this] { return stopped_; })) {
        return std::nullopt;
    }
    
    *next_deadline_ += period_;
    return Time::now();
}

void PeriodicTickSource::stop() {
    {
        Lock lock(mutex_);
        stopped_ = true;
    }
    cv_.notify_all();
}

// ============================================================================
// EventTickSource
// ============================================================================

void EventTickSource::notify(Timestamp timestamp) {
    {
        Lock lock(mutex_);
        if (pending_) {
            coalesced_.fetch_add(1, std::memory_order_relaxed);
        }
        pending_ = timestamp;
    }
    cv_.notify_one();
}

std::optional<Timestamp> EventTickSource::wait_next() {
    UniqueLock lock(mutex_);
    cv_.wait(lock, [this] { return stopped_ || pending_.has_value(); });
    if (stopped_) {
        return std::nullopt;
    }
    Timestamp timestamp = *pending_;
    pending_.reset();
    return timestamp;
}

void EventTickSource::stop() {
    {
        Lock lock(mutex_);
        stopped_ = true;
    }
    cv_.notify_all();
}

} // namespace tickflow
