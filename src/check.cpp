/**
 * Check pipeline: Sampler -> compute_deltas -> aggregate -> evaluate.
 *
 * Single pass, no stage looks at the output of a later one. The first
 * fatal error ends the run with status Unknown.
 */

#include "cjitter/check.hpp"
#include "cjitter/util.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace cjitter {

// ============================================================================
// Configuration
// ============================================================================
CheckError validate_config(const CheckConfig& cfg) {
    if (cfg.min_interval > cfg.max_interval) {
        return make_error(ErrorKind::InvalidInterval,
                          "Invalid min/max interval: min: " +
                          std::to_string(cfg.min_interval.count()) + ", max: " +
                          std::to_string(cfg.max_interval.count()));
    }

    if (cfg.samples < 3) {
        return make_error(ErrorKind::InvalidSampleCount,
                          "At least 3 samples are required to calculate jitter, got " +
                          std::to_string(cfg.samples) + ".");
    }

    if (cfg.samples > kMaxSamples) {
        return make_error(ErrorKind::InvalidSampleCount,
                          "At most " + std::to_string(kMaxSamples) +
                          " samples are supported, got " +
                          std::to_string(cfg.samples) + ".");
    }

    if (cfg.timeout.count() <= 0) {
        return make_error(ErrorKind::InvalidTimeout,
                          "The timeout must be greater than 0ms, got " +
                          std::to_string(cfg.timeout.count()) + "ms.");
    }

    return {};
}


static CheckError parse_one(const std::optional<std::string>& expr,
                            std::optional<ThresholdRange>& out)
{
    if (!expr)
        return {};

    RangeParseResult parsed = parse_range(*expr);
    if (!parsed.ok()) {
        return make_error(parsed.error.kind,
                          "Unable to parse range '" + *expr + "' with error: " +
                          parsed.error.message);
    }

    out = parsed.range;
    return {};
}

ThresholdsResult parse_thresholds(const CheckConfig& cfg) {
    ThresholdsResult res{};

    res.error = parse_one(cfg.warning, res.thresholds.warning);
    if (res.error.is_error())
        return res;

    res.error = parse_one(cfg.critical, res.thresholds.critical);
    return res;
}


// ============================================================================
// Pipeline
// ============================================================================
CheckResult run_check(const CheckConfig& cfg,
                      const Target& target,
                      Prober& prober,
                      Scheduler& scheduler,
                      const Sleeper& sleeper)
{
    CheckResult res{};
    res.jitter.method    = cfg.method;
    res.jitter.precision = cfg.precision;

    // Fail fast: nothing is sent on a bad configuration
    res.error = validate_config(cfg);
    if (res.error.is_error())
        return res;

    ThresholdsResult th = parse_thresholds(cfg);
    if (!th.ok()) {
        res.error = th.error;
        return res;
    }
    res.thresholds = th.thresholds;

    // --- Sampling
    Sampler sampler(prober, scheduler, sleeper);
    SampleRun run = sampler.run(target, cfg.samples, cfg.timeout,
                                cfg.min_interval, cfg.max_interval);
    if (!run.ok()) {
        res.error = run.error;
        return res;
    }
    res.samples = std::move(run.samples);

    // --- Deltas
    DeltaResult deltas = compute_deltas(res.samples);
    if (!deltas.ok()) {
        res.error = deltas.error;
        return res;
    }
    res.deltas = std::move(deltas.deltas);

    // --- Aggregation
    JitterResult jitter = aggregate(res.deltas, cfg.method);
    if (!jitter.ok()) {
        res.error = jitter.error;
        return res;
    }
    res.jitter.value = jitter.jitter.value;

    // --- Thresholds, on the full precision value
    res.status = evaluate(res.jitter.value, res.thresholds);
    SPDLOG_INFO("Check finished: {} ({} jitter {}ms, {} of {} samples answered)",
                status_name(res.status), aggregation_method_name(cfg.method),
                format_number(res.jitter.value),
                std::count_if(res.samples.begin(), res.samples.end(), is_success),
                res.samples.size());
    return res;
}

} // namespace cjitter
