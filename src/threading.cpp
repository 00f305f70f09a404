#include "tickflow/platform/threading.hpp"
#include <iostream>
#include <cstring>

namespace tickflow {

void Thread::apply_thread_config() {
    pthread_t handle = pthread_self();
    
#ifdef __linux__
    if (!config_.name.empty()) {
        // Linux limits thread names to 15 characters plus terminator
        std::string short_name = config_.name.substr(0, 15);
        pthread_setname_np(handle, short_name.c_str());
    }
#endif
    
    if (config_.policy != SchedulingPolicy::NORMAL) {
        int policy = SCHED_OTHER;
        switch (config_.policy) {
            case SchedulingPolicy::FIFO:
                policy = SCHED_FIFO;
                break;
            case SchedulingPolicy::ROUND_ROBIN:
                policy = SCHED_RR;
                break;
            case SchedulingPolicy::NORMAL:
                break;
        }
        
        struct sched_param param{};
        param.sched_priority = static_cast<int>(config_.priority);
        
        // Requires CAP_SYS_NICE or root
        int rc = pthread_setschedparam(handle, policy, &param);
        if (rc != 0) {
            std::cerr << "[" << config_.name << "] could not apply realtime scheduling: "
                      << std::strerror(rc) << "\n";
        }
    }
    
    if (config_.cpu_affinity >= 0) {
        cpu_set_t cpuset;
        CPU_ZERO(&cpuset);
        CPU_SET(config_.cpu_affinity, &cpuset);
        int rc = pthread_setaffinity_np(handle, sizeof(cpu_set_t), &cpuset);
        if (rc != 0) {
            std::cerr << "[" << config_.name << "] could not pin to CPU "
                      << config_.cpu_affinity << ": " << std::strerror(rc) << "\n";
        }
    }
}

} // namespace tickflow
