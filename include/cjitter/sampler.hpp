#pragma once
#include <chrono>
#include <functional>
#include <vector>
#include "cjitter/error.hpp"
#include "cjitter/probe.hpp"
#include "cjitter/resolver.hpp"
#include "cjitter/scheduler.hpp"
#include "cjitter/visibility.hpp"

namespace cjitter {

// One run never exceeds this many probes
constexpr int kMaxSamples = 255;

/**
 * Blocks the caller for the given delay. Replaced by a recorder in tests.
 */
using Sleeper = std::function<void(std::chrono::milliseconds)>;

CJITTER_API Sleeper thread_sleeper();

/**
 * Outcome of a sampling run: one entry per configured sample, in
 * transmission order, with outcome_index(samples[i]) == i.
 */
struct SampleRun {
    std::vector<ProbeOutcome> samples;
    CheckError error;

    bool ok() const { return !error.is_error(); }
};

/**
 * Drives a Prober across N probes, pacing them with a Scheduler.
 */
class CJITTER_API Sampler {
public:
    Sampler(Prober& prober, Scheduler& scheduler, Sleeper sleeper = thread_sleeper());

    /**
     * Send `sample_count` probes to `target`.
     *
     * Failed probes are recorded, never retried, and never end the run
     * early. Returns an error without probing when sample_count is not
     * in [3, kMaxSamples] or min_interval > max_interval.
     */
    SampleRun run(const Target& target,
                  int sample_count,
                  std::chrono::milliseconds timeout,
                  std::chrono::milliseconds min_interval,
                  std::chrono::milliseconds max_interval);

private:
    Prober& prober_;
    Scheduler& scheduler_;
    Sleeper sleeper_;
};

} // namespace cjitter
