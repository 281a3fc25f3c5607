/**
 * Sampling loop: N blocking probes, paced by the Scheduler.
 *
 * The loop is strictly sequential. A failed probe is recorded like any
 * other outcome; deciding what it means is left to compute_deltas().
 */

#include "cjitter/sampler.hpp"

#include <spdlog/spdlog.h>

#include <thread>
#include <utility>

namespace cjitter {

Sleeper thread_sleeper() {
    return [](std::chrono::milliseconds d) {
        if (d.count() > 0)
            std::this_thread::sleep_for(d);
    };
}

Sampler::Sampler(Prober& prober, Scheduler& scheduler, Sleeper sleeper)
    : prober_(prober),
      scheduler_(scheduler),
      sleeper_(std::move(sleeper))
{
}

SampleRun Sampler::run(const Target& target,
                       int sample_count,
                       std::chrono::milliseconds timeout,
                       std::chrono::milliseconds min_interval,
                       std::chrono::milliseconds max_interval)
{
    SampleRun run{};

    if (sample_count < 3) {
        run.error = make_error(ErrorKind::InvalidSampleCount,
                               "At least 3 samples are required to calculate jitter, got " +
                               std::to_string(sample_count) + ".");
        return run;
    }

    if (sample_count > kMaxSamples) {
        run.error = make_error(ErrorKind::InvalidSampleCount,
                               "At most " + std::to_string(kMaxSamples) +
                               " samples are supported, got " +
                               std::to_string(sample_count) + ".");
        return run;
    }

    if (min_interval > max_interval) {
        run.error = make_error(ErrorKind::InvalidInterval,
                               "Invalid min/max interval: min: " +
                               std::to_string(min_interval.count()) + ", max: " +
                               std::to_string(max_interval.count()));
        return run;
    }

    run.samples.reserve(static_cast<size_t>(sample_count));

    for (int i = 0; i < sample_count; ++i) {
        const auto index = static_cast<std::size_t>(i);
        ProbeOutcome outcome = prober_.probe(target, timeout, index);

        if (const auto* failure = std::get_if<ProbeFailure>(&outcome)) {
            SPDLOG_INFO("Ping round {} failed ({}): {}", i + 1,
                        failure_reason_name(failure->reason), failure->detail);
        }

        run.samples.push_back(std::move(outcome));

        if (i + 1 < sample_count) {
            auto delay = scheduler_.next_delay(min_interval, max_interval);
            if (delay.count() > 0) {
                SPDLOG_DEBUG("Sleeping for {}ms...", delay.count());
            }
            if (sleeper_)
                sleeper_(delay);
        }
    }

    return run;
}

} // namespace cjitter
