#include "cjitter/scheduler.hpp"

#include <spdlog/spdlog.h>

namespace cjitter {

Scheduler::Scheduler() : rng_(std::random_device{}()) {}

Scheduler::Scheduler(uint32_t seed) : rng_(seed) {}

std::chrono::milliseconds Scheduler::next_delay(std::chrono::milliseconds min_interval,
                                                std::chrono::milliseconds max_interval)
{
    // Covers both "immediately" (0/0) and the fixed interval case
    if (max_interval <= min_interval)
        return min_interval;

    std::uniform_int_distribution<long long> dist(min_interval.count(),
                                                  max_interval.count());
    auto delay = std::chrono::milliseconds(dist(rng_));
    SPDLOG_DEBUG("Random interval between {}ms and {}ms: {}ms",
                 min_interval.count(), max_interval.count(), delay.count());
    return delay;
}

} // namespace cjitter
