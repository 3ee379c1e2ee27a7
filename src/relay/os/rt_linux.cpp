#include "relay/os/rt.hpp"

#if defined(__linux__)

#include <pthread.h>
#include <sched.h>

namespace relay::os {

/// Linux limits thread names to 16 bytes including the terminator.
static bool set_name(const std::string& name) {
    if (name.empty()) return true;
    const std::string shortened = name.substr(0, 15);
    return pthread_setname_np(pthread_self(), shortened.c_str()) == 0;
}

/**
 * @brief Pin current thread to a CPU (if cpu >= 0). Best-effort.
 */
static bool set_affinity(int cpu) {
    if (cpu < 0) return true; // nothing to do
    cpu_set_t mask; CPU_ZERO(&mask); CPU_SET(cpu, &mask);
    return pthread_setaffinity_np(pthread_self(), sizeof(mask), &mask) == 0;
}

static bool set_sched(RtSchedPolicy pol, int prio) {
    if (prio <= 0) return true; // keep SCHED_OTHER
    const int policy = (pol == RtSchedPolicy::RoundRobin) ? SCHED_RR : SCHED_FIFO;
    sched_param sp{}; sp.sched_priority = prio;
    return pthread_setschedparam(pthread_self(), policy, &sp) == 0;
}

bool bind_and_prioritize(const RtConfig& cfg) {
    // Every step is attempted even if an earlier one failed.
    bool ok = set_name(cfg.name);
    // Affinity before policy to avoid migrating to another CPU after becoming RT.
    ok = set_affinity(cfg.cpu) && ok;
    ok = set_sched(cfg.policy, cfg.priority) && ok;
    return ok;
}

} // namespace relay::os

#else

namespace relay::os {

bool bind_and_prioritize(const RtConfig& cfg) {
    return cfg.cpu < 0 && cfg.priority <= 0;
}

} // namespace relay::os

#endif
