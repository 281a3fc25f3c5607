/**
 * Runner: orchestrates one check invocation.
 *
 * Every configuration error is caught here, in a fixed order, before
 * the ICMP socket is opened. Only then is the sampling pipeline started.
 */

#include "runner.hpp"
#include "logging.hpp"
#include "report.hpp"
#include "cjitter/check.hpp"
#include "cjitter/probe.hpp"
#include "cjitter/resolver.hpp"
#include "cjitter/scheduler.hpp"

#include <spdlog/spdlog.h>

using namespace cjitter;

static int fail(std::ostream& out, const CheckError& error) {
    out << format_unknown(error) << "\n";
    return exit_code(Status::Unknown);
}

static void log_config(const CheckConfig& cfg, const Thresholds& th) {
    SPDLOG_INFO("{:<34}{}", "Host:", cfg.host);
    SPDLOG_INFO("{:<34}{}", "Aggregation method:", aggregation_method_name(cfg.method));
    SPDLOG_INFO("{:<34}{}", "Samples:", cfg.samples);
    SPDLOG_INFO("{:<34}{}ms", "Timeout:", cfg.timeout.count());
    SPDLOG_INFO("{:<34}{}ms", "Min interval:", cfg.min_interval.count());
    SPDLOG_INFO("{:<34}{}ms", "Max interval:", cfg.max_interval.count());
    SPDLOG_INFO("{:<34}{}", "Precision:", cfg.precision);
    SPDLOG_INFO("{:<34}{}", "Socket type:", socket_type_name(cfg.socket_type));
    SPDLOG_INFO("{:<34}{}", "Warning threshold:",
                th.warning ? th.warning->to_string() : std::string("-"));
    SPDLOG_INFO("{:<34}{}", "Critical threshold:",
                th.critical ? th.critical->to_string() : std::string("-"));
}


/**
 * Main execution entry for the plugin.
 *
 * The function never throws; every failure becomes an UNKNOWN line
 * and exit code 3.
 */
int run_jitter_check(const CliOptions& opt, std::ostream& out) {
    // -------------------------------------------------------------
    // Informational modes
    // -------------------------------------------------------------
    if (opt.show_help) {
        out << usage_text();
        return exit_code(Status::Unknown);
    }
    if (opt.show_version) {
        out << version_text() << "\n";
        return exit_code(Status::Unknown);
    }

    if (opt.error.is_error())
        return fail(out, opt.error);

    CheckError err = init_logging(opt.verbose);
    if (err.is_error())
        return fail(out, err);

    const CheckConfig& cfg = opt.check;

    // -------------------------------------------------------------
    // Configuration, nothing sent yet
    // -------------------------------------------------------------
    if (cfg.min_interval > cfg.max_interval) {
        return fail(out, make_error(ErrorKind::InvalidInterval,
                                    "Invalid min/max interval: min: " +
                                    std::to_string(cfg.min_interval.count()) +
                                    ", max: " +
                                    std::to_string(cfg.max_interval.count())));
    }

    if (!validate_host(cfg.host)) {
        return fail(out, make_error(ErrorKind::InvalidHost,
                                    "Invalid address or hostname: " + cfg.host));
    }

    if (!cfg.warning && !cfg.critical) {
        return fail(out, make_error(ErrorKind::NoThresholds,
                                    "No thresholds provided. Provide at least one threshold."));
    }

    ThresholdsResult th = parse_thresholds(cfg);
    if (!th.ok())
        return fail(out, th.error);

    err = validate_config(cfg);
    if (err.is_error())
        return fail(out, err);

    log_config(cfg, th.thresholds);

    // -------------------------------------------------------------
    // Transport
    // -------------------------------------------------------------
    ResolveResult resolved = resolve_host(cfg.host);
    if (!resolved.ok())
        return fail(out, resolved.error);
    SPDLOG_INFO("{:<34}{}", "Resolved address:", resolved.target.ip);

    IcmpProber prober(cfg.socket_type);
    err = prober.open(resolved.target);
    if (err.is_error()) {
        SPDLOG_ERROR("{}", err.message);
        return fail(out, err);
    }

    // -------------------------------------------------------------
    // Measurement
    // -------------------------------------------------------------
    Scheduler scheduler;
    CheckResult result = run_check(cfg, resolved.target, prober, scheduler);
    if (!result.ok())
        SPDLOG_ERROR("{}: {}", error_kind_name(result.error.kind), result.error.message);

    out << format_result(result) << "\n";
    return exit_code(result.ok() ? result.status : Status::Unknown);
}
