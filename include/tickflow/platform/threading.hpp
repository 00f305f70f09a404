/**
 * @file threading.hpp
 * @brief Thread and synchronization wrappers used by the cycler runtime
 * 
 * Every cycler owns one Thread. Priority, scheduling policy and CPU pinning
 * come from the cycler configuration so control-rate cyclers can run as
 * SCHED_FIFO on an isolated core while perception stays on the default policy.
 */

#pragma once

#include <thread>
#include <mutex>
#include <shared_mutex>
#include <condition_variable>
#include <chrono>
#include <string>
#include <cstdint>

#include <pthread.h>
#include <sched.h>

namespace tickflow {

/**
 * @brief Thread priority levels
 */
enum class ThreadPriority {
    IDLE = 0,
    LOW = 10,
    NORMAL = 50,
    HIGH = 75,
    REALTIME = 99
};

/**
 * @brief Thread scheduling policy
 */
enum class SchedulingPolicy {
    NORMAL,         ///< SCHED_OTHER
    FIFO,           ///< SCHED_FIFO
    ROUND_ROBIN     ///< SCHED_RR
};

struct ThreadConfig {
    std::string name{"cycler"};
    ThreadPriority priority = ThreadPriority::NORMAL;
    SchedulingPolicy policy = SchedulingPolicy::NORMAL;
    int cpu_affinity = -1;  ///< -1 = no affinity
};

/**
 * @brief std::thread with name, priority and affinity applied on entry
 * 
 * Joins on destruction. Failing to raise the priority (missing CAP_SYS_NICE)
 * is reported on stderr and the thread keeps running with default policy.
 */
class Thread {
public:
    Thread() = default;
    
    explicit Thread(const ThreadConfig& config)
        : config_(config) {
    }
    
    ~Thread() {
        join();
    }
    
    Thread(const Thread&) = delete;
    Thread& operator=(const Thread&) = delete;
    
    /**
     * @brief Start the thread; no-op while a previous run is still joinable
     */
    template<typename Func>
    void start(Func&& func) {
        if (thread_.joinable()) {
            return;
        }
        thread_ = std::thread([this, f = std::forward<Func>(func)]() mutable {
            apply_thread_config();
            f();
        });
    }
    
    void join() {
        if (thread_.joinable()) {
            thread_.join();
        }
    }
    
    bool joinable() const noexcept {
        return thread_.joinable();
    }
    
    const ThreadConfig& config() const noexcept {
        return config_;
    }

private:
    void apply_thread_config();
    
    ThreadConfig config_;
    std::thread thread_;
};

/**
 * @brief Mutex wrapper (future: priority-inheriting mutex)
 */
class Mutex {
public:
    Mutex() = default;
    
    Mutex(const Mutex&) = delete;
    Mutex& operator=(const Mutex&) = delete;
    
    void lock() { mutex_.lock(); }
    bool try_lock() { return mutex_.try_lock(); }
    void unlock() { mutex_.unlock(); }
    
private:
    std::mutex mutex_;
};

/**
 * @brief Reader-writer mutex; lookups share, the owning cycler writes
 */
class SharedMutex {
public:
    SharedMutex() = default;
    
    SharedMutex(const SharedMutex&) = delete;
    SharedMutex& operator=(const SharedMutex&) = delete;
    
    void lock() { mutex_.lock(); }
    void lock_shared() { mutex_.lock_shared(); }
    bool try_lock() { return mutex_.try_lock(); }
    bool try_lock_shared() { return mutex_.try_lock_shared(); }
    void unlock() { mutex_.unlock(); }
    void unlock_shared() { mutex_.unlock_shared(); }
    
private:
    std::shared_mutex mutex_;
};

using Lock = std::lock_guard<Mutex>;
using UniqueLock = std::unique_lock<Mutex>;
using SharedLock = std::shared_lock<SharedMutex>;
using UniqueLockShared = std::unique_lock<SharedMutex>;

/**
 * @brief Condition variable bound to tickflow::Mutex
 */
class ConditionVariable {
public:
    ConditionVariable() = default;
    
    ConditionVariable(const ConditionVariable&) = delete;
    ConditionVariable& operator=(const ConditionVariable&) = delete;
    
    void notify_one() noexcept { cv_.notify_one(); }
    void notify_all() noexcept { cv_.notify_all(); }
    
    template<typename Predicate>
    void wait(UniqueLock& lock, Predicate pred) {
        cv_.wait(lock, pred);
    }
    
    template<typename Rep, typename Period, typename Predicate>
    bool wait_for(UniqueLock& lock,
                  const std::chrono::duration<Rep, Period>& rel_time,
                  Predicate pred) {
        return cv_.wait_for(lock, rel_time, pred);
    }
    
    template<typename Clock, typename Duration, typename Predicate>
    bool wait_until(UniqueLock& lock,
                    const std::chrono::time_point<Clock, Duration>& deadline,
                    Predicate pred) {
        return cv_.wait_until(lock, deadline, pred);
    }
    
private:
    std::condition_variable_any cv_;
};

} // namespace tickflow
