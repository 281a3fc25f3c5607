#pragma once
#include <chrono>
#include <cstdint>
#include <random>
#include "cjitter/visibility.hpp"

namespace cjitter {

/**
 * Decides how long to wait between two probes.
 *
 *  - min == max == 0 : send immediately
 *  - min == max      : fixed interval
 *  - otherwise       : uniform draw in [min, max], whole milliseconds
 *
 * min <= max is validated with the rest of the configuration, before
 * any probe is sent.
 */
class CJITTER_API Scheduler {
public:
    Scheduler();
    explicit Scheduler(uint32_t seed);

    std::chrono::milliseconds next_delay(std::chrono::milliseconds min_interval,
                                         std::chrono::milliseconds max_interval);

private:
    std::mt19937 rng_;
};

} // namespace cjitter
