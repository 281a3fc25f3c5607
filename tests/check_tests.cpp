#include "harness.hpp"
#include "cli.hpp"
#include "report.hpp"
#include "runner.hpp"
#include "cjitter/check.hpp"
#include "cjitter/icmp.hpp"
#include "cjitter/ip.hpp"
#include "cjitter/resolver.hpp"
#include "cjitter/util.hpp"

#include <spdlog/spdlog.h>

#include <cstring>
#include <sstream>
#include <utility>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>

using namespace cjitter;
using std::chrono::milliseconds;

// ============================================================================
// Helpers
// ============================================================================

/**
 * Answers every probe with the next RTT of a fixed list; a negative RTT
 * stands for a timeout.
 */
class FakeProber : public Prober {
public:
    explicit FakeProber(std::vector<double> rtts) : rtts_(std::move(rtts)) {}

    ProbeOutcome probe(const Target&, milliseconds, std::size_t index) override {
        double rtt = rtts_.at(calls++);
        if (rtt < 0)
            return ProbeFailure{index, FailureReason::Timeout, "timed out"};
        return ProbeSuccess{rtt, index};
    }

    size_t calls{0};

private:
    std::vector<double> rtts_;
};

static void no_sleep(milliseconds) {}

static CheckConfig config_for(int samples) {
    CheckConfig cfg;
    cfg.host    = "192.0.2.1";
    cfg.samples = samples;
    return cfg;
}

static std::string run_runner(const CliOptions& opt, int& code) {
    std::ostringstream out;
    code = run_jitter_check(opt, out);
    spdlog::set_level(spdlog::level::off);
    return out.str();
}


// ============================================================================
// End-to-end pipeline
// ============================================================================
bool test_scenario_average_ok() {
    CheckConfig cfg = config_for(4);
    cfg.warning  = "5";
    cfg.critical = "10";

    FakeProber prober({10, 12, 11, 13});
    Scheduler scheduler(1);
    CheckResult res = run_check(cfg, Target{}, prober, scheduler, no_sleep);

    return res.ok() && res.status == Status::Ok && res.deltas.size() == 3 &&
           approx(res.jitter.value, 5.0 / 3.0) &&
           format_result(res) ==
               "OK - Average Jitter: 1.667ms|'Average Jitter'=1.667ms;0:5;0:10;0";
}

bool test_scenario_max_warning() {
    CheckConfig cfg = config_for(4);
    cfg.method  = AggregationMethod::Max;
    cfg.warning = "1:1.5";

    FakeProber prober({10, 12, 11, 13});
    Scheduler scheduler(1);
    CheckResult res = run_check(cfg, Target{}, prober, scheduler, no_sleep);

    return res.ok() && res.status == Status::Warning &&
           format_result(res) == "WARNING - Max Jitter: 2ms|'Max Jitter'=2ms;1:1.5;;0";
}

bool test_scenario_sample_count_boundary() {
    CheckConfig three = config_for(3);
    three.critical = "10";
    FakeProber p3({1, 2, 4});
    Scheduler s3(1);
    CheckResult ok = run_check(three, Target{}, p3, s3, no_sleep);

    CheckConfig two = config_for(2);
    two.critical = "10";
    FakeProber p2({1, 2});
    Scheduler s2(1);
    CheckResult bad = run_check(two, Target{}, p2, s2, no_sleep);

    return ok.ok() && ok.status == Status::Ok && p3.calls == 3 &&
           bad.error.kind == ErrorKind::InvalidSampleCount && p2.calls == 0 &&
           error_category(bad.error.kind) == ErrorCategory::Configuration;
}

bool test_scenario_interval_rejected() {
    CheckConfig cfg = config_for(5);
    cfg.critical     = "10";
    cfg.min_interval = milliseconds(50);
    cfg.max_interval = milliseconds(10);

    FakeProber prober({1, 2, 3, 4, 5});
    Scheduler scheduler(1);
    CheckResult res = run_check(cfg, Target{}, prober, scheduler, no_sleep);

    return res.error.kind == ErrorKind::InvalidInterval && prober.calls == 0 &&
           res.status == Status::Unknown;
}

bool test_all_timeouts_is_unknown() {
    CheckConfig cfg = config_for(3);
    cfg.warning = "5";

    FakeProber prober({-1, -1, -1});
    Scheduler scheduler(1);
    CheckResult res = run_check(cfg, Target{}, prober, scheduler, no_sleep);

    return res.error.kind == ErrorKind::EmptyDeltas && res.samples.size() == 3 &&
           error_category(res.error.kind) == ErrorCategory::Measurement &&
           format_result(res) ==
               "UNKNOWN - An error occurred: 'The delta count is 0. Cannot calculate jitter.'";
}

bool test_thresholds_use_full_precision() {
    // 1.0004 rounds to "1" for display but is still outside 0:1
    CheckConfig cfg = config_for(3);
    cfg.critical = "1";

    FakeProber prober({10, 11.0004, 11.0004});
    Scheduler scheduler(1);
    cfg.method = AggregationMethod::Max;
    CheckResult res = run_check(cfg, Target{}, prober, scheduler, no_sleep);

    return res.ok() && res.status == Status::Critical &&
           format_result(res) == "CRITICAL - Max Jitter: 1ms|'Max Jitter'=1ms;;0:1;0";
}

bool test_bad_range_message() {
    CheckConfig cfg = config_for(5);
    cfg.warning = "20:10";

    ThresholdsResult th = parse_thresholds(cfg);
    return th.error.kind == ErrorKind::RangeBounds &&
           format_unknown(th.error).rfind("UNKNOWN - Unable to parse range '20:10' with error: ", 0) == 0;
}


// ============================================================================
// Reporter
// ============================================================================
bool test_report_precision() {
    JitterValue v{1.23456, AggregationMethod::Median, 1};
    Thresholds th;
    return format_status(Status::Critical, v, th) ==
               "CRITICAL - Median Jitter: 1.2ms|'Median Jitter'=1.2ms;;;0" &&
           jitter_label(AggregationMethod::Min) == "Min Jitter";
}

bool test_report_unknown_lines() {
    return format_unknown(make_error(ErrorKind::CommandLine, "boom")) ==
               "UNKNOWN - Command line parsing produced an error: boom" &&
           format_unknown(make_error(ErrorKind::LoggerInit, "sink")) ==
               "UNKNOWN - Failed to initialize logger with error: 'sink'" &&
           format_unknown(make_error(ErrorKind::PermissionDenied, "denied")) ==
               "UNKNOWN - An error occurred: 'denied'";
}


// ============================================================================
// Command line
// ============================================================================
bool test_cli_defaults() {
    CliOptions opt = parse_args(std::vector<std::string>{"-H", "example.com", "-w", "5"});
    const CheckConfig& c = opt.check;
    return !opt.error.is_error() && c.host == "example.com" && c.warning == std::string("5") &&
           !c.critical && c.samples == 10 && c.timeout == milliseconds(1000) &&
           c.min_interval == milliseconds(0) && c.max_interval == milliseconds(0) &&
           c.precision == 3 && c.method == AggregationMethod::Average &&
           c.socket_type == SocketType::Raw && opt.verbose == 0;
}

bool test_cli_all_flags() {
    CliOptions opt = parse_args(std::vector<std::string>{
        "--host=10.0.0.1", "-a", "median", "-c", "@10:20", "-s5", "--timeout", "250",
        "-m", "10", "--max-interval=40", "-p", "1", "-D", "-vv", "-v"});
    const CheckConfig& c = opt.check;
    return !opt.error.is_error() && c.host == "10.0.0.1" &&
           c.method == AggregationMethod::Median && c.critical == std::string("@10:20") &&
           c.samples == 5 && c.timeout == milliseconds(250) &&
           c.min_interval == milliseconds(10) && c.max_interval == milliseconds(40) &&
           c.precision == 1 && c.socket_type == SocketType::Datagram && opt.verbose == 3;
}

bool test_cli_errors() {
    auto kind = [](std::vector<std::string> args) { return parse_args(args).error.kind; };
    return kind({"-w", "5"}) == ErrorKind::CommandLine &&
           kind({"-H", "h", "--bogus"}) == ErrorKind::CommandLine &&
           kind({"-H", "h", "-s"}) == ErrorKind::CommandLine &&
           kind({"-H", "h", "-s", "-3"}) == ErrorKind::CommandLine &&
           kind({"-H", "h", "-t", "1s"}) == ErrorKind::CommandLine &&
           kind({"-H", "h", "-a", "mode"}) == ErrorKind::CommandLine &&
           kind({"-H", "h", "-vvvv"}) == ErrorKind::CommandLine &&
           kind({"--help"}) == ErrorKind::None;
}

bool test_cli_sample_limit() {
    CliOptions max = parse_args(std::vector<std::string>{"-H", "h", "-w", "5", "-s", "255"});
    CliOptions over = parse_args(std::vector<std::string>{"-H", "h", "-w", "5", "-s", "256"});
    CliOptions huge = parse_args(std::vector<std::string>{"-H", "h", "-w", "5", "-s", "2147483647"});
    return !max.error.is_error() && max.check.samples == 255 &&
           over.error.kind == ErrorKind::CommandLine &&
           over.error.message.find("256") != std::string::npos &&
           huge.error.kind == ErrorKind::CommandLine;
}

bool test_cli_switch_with_value() {
    CliOptions dgram = parse_args(std::vector<std::string>{"-H", "h", "--dgram-socket=yes"});
    CliOptions verbose = parse_args(std::vector<std::string>{"-H", "h", "--verbose=2"});
    CliOptions help = parse_args(std::vector<std::string>{"--help=now"});
    return dgram.error.kind == ErrorKind::CommandLine &&
           dgram.error.message.find("unexpected value 'yes'") != std::string::npos &&
           dgram.check.socket_type == SocketType::Raw &&
           verbose.error.kind == ErrorKind::CommandLine && verbose.verbose == 0 &&
           help.error.kind == ErrorKind::CommandLine && !help.show_help;
}

bool test_too_many_samples_rejected() {
    CheckConfig cfg = config_for(256);
    cfg.warning = "5";

    FakeProber prober({});
    Scheduler scheduler(1);
    CheckResult res = run_check(cfg, Target{}, prober, scheduler, no_sleep);

    return validate_config(cfg).kind == ErrorKind::InvalidSampleCount &&
           res.error.kind == ErrorKind::InvalidSampleCount && prober.calls == 0;
}

bool test_cli_missing_host_message() {
    CliOptions opt = parse_args(std::vector<std::string>{"-c", "10"});
    return opt.error.message.find("--host") != std::string::npos;
}


// ============================================================================
// Host handling
// ============================================================================
bool test_validate_host() {
    return validate_host("127.0.0.1") && validate_host("::1") &&
           validate_host("example.com") && validate_host("example.com.") &&
           validate_host("my-host") &&
           !validate_host("") && !validate_host("999.999.999.999") &&
           !validate_host("bad host") && !validate_host("under_score.example") &&
           !validate_host("-leading.example") &&
           !validate_host("a..b");
}

bool test_resolve_literals() {
    ResolveResult v4 = resolve_host("127.0.0.1");
    ResolveResult v6 = resolve_host("::1");
    return v4.ok() && v4.target.family == AF_INET && v4.target.ip == "127.0.0.1" &&
           v4.target.addr_len == sizeof(sockaddr_in) &&
           v6.ok() && v6.target.is_ipv6() && v6.target.addr_len == sizeof(sockaddr_in6);
}


// ============================================================================
// ICMP codec
// ============================================================================
static std::vector<uint8_t> with_ip_header(const std::vector<uint8_t>& icmp) {
    IpHeader ip{};
    ip.ver_ihl  = 0x45;
    ip.protocol = IPPROTO_ICMP;
    std::vector<uint8_t> out(sizeof(ip));
    std::memcpy(out.data(), &ip, sizeof(ip));
    out.insert(out.end(), icmp.begin(), icmp.end());
    return out;
}

bool test_echo_request_layout() {
    auto pkt = build_echo_request(false, 0x1234, 7, 42);
    IcmpHeader hdr{};
    std::memcpy(&hdr, pkt.data(), sizeof(hdr));
    return pkt.size() == sizeof(IcmpHeader) + kEchoPayloadSize &&
           hdr.type == kIcmpEchoRequest && ntohs(hdr.id) == 0x1234 &&
           ntohs(hdr.seq) == 7 && checksum16(pkt.data(), pkt.size()) == 0;
}

bool test_classify_echo_reply() {
    auto reply = build_echo_request(false, 0x1234, 7, 42);
    reply[0] = kIcmpEchoReply;
    auto raw = with_ip_header(reply);

    return classify_reply(raw.data(), raw.size(), false, true, 0x1234, 7, true) ==
               ReplyKind::EchoReply &&
           classify_reply(raw.data(), raw.size(), false, true, 0x1234, 8, true) ==
               ReplyKind::Unrelated &&
           classify_reply(raw.data(), raw.size(), false, true, 0x9999, 7, true) ==
               ReplyKind::Unrelated &&
           classify_reply(reply.data(), reply.size(), false, false, 0x9999, 7, false) ==
               ReplyKind::EchoReply;
}

bool test_classify_unreachable() {
    auto request = build_echo_request(false, 0x1234, 3, 0);
    auto quoted = with_ip_header(std::vector<uint8_t>(request.begin(),
                                                      request.begin() + sizeof(IcmpHeader)));
    std::vector<uint8_t> icmp(sizeof(IcmpHeader), 0);
    icmp[0] = kIcmpDestUnreachable;
    icmp[1] = 1;
    icmp.insert(icmp.end(), quoted.begin(), quoted.end());
    auto raw = with_ip_header(icmp);

    return classify_reply(raw.data(), raw.size(), false, true, 0x1234, 3, true) ==
               ReplyKind::Unreachable &&
           classify_reply(raw.data(), raw.size(), false, true, 0x1234, 4, true) ==
               ReplyKind::Unrelated;
}

bool test_classify_ipv6_reply() {
    auto reply = build_echo_request(true, 0x0101, 9, 0);
    IcmpHeader hdr{};
    std::memcpy(&hdr, reply.data(), sizeof(hdr));
    bool request_ok = hdr.type == kIcmp6EchoRequest && hdr.checksum == 0;
    reply[0] = kIcmp6EchoReply;

    return request_ok &&
           classify_reply(reply.data(), reply.size(), true, false, 0x0101, 9, true) ==
               ReplyKind::EchoReply &&
           classify_reply(reply.data(), 4, true, false, 0x0101, 9, true) ==
               ReplyKind::Unrelated;
}


// ============================================================================
// Runner error paths (no socket is ever opened)
// ============================================================================
bool test_runner_help_and_version() {
    CliOptions help;
    help.show_help = true;
    CliOptions version;
    version.show_version = true;

    int c1 = 0;
    int c2 = 0;
    std::string h = run_runner(help, c1);
    std::string v = run_runner(version, c2);
    return c1 == 3 && c2 == 3 && h.find("THRESHOLD SYNTAX") != std::string::npos &&
           v.rfind("check_jitter ", 0) == 0;
}

bool test_runner_configuration_errors() {
    int code = 0;

    CliOptions bad_cli = parse_args(std::vector<std::string>{"--nope"});
    std::string cli = run_runner(bad_cli, code);
    if (code != 3 || cli.rfind("UNKNOWN - Command line parsing produced an error: ", 0) != 0)
        return false;

    CliOptions host = parse_args(std::vector<std::string>{"-H", "999.999.999.999", "-w", "5"});
    if (run_runner(host, code) != "UNKNOWN - Invalid address or hostname: 999.999.999.999\n")
        return false;

    CliOptions none = parse_args(std::vector<std::string>{"-H", "127.0.0.1"});
    if (run_runner(none, code) !=
        "UNKNOWN - No thresholds provided. Provide at least one threshold.\n")
        return false;

    CliOptions interval = parse_args(std::vector<std::string>{
        "-H", "999.999.999.999", "-m", "50", "-M", "10"});
    if (run_runner(interval, code) != "UNKNOWN - Invalid min/max interval: min: 50, max: 10\n")
        return false;

    CliOptions range = parse_args(std::vector<std::string>{"-H", "127.0.0.1", "-c", "x"});
    if (run_runner(range, code).rfind("UNKNOWN - Unable to parse range 'x' with error: ", 0) != 0)
        return false;

    CliOptions samples = parse_args(std::vector<std::string>{"-H", "127.0.0.1", "-c", "5", "-s", "2"});
    return run_runner(samples, code) ==
               "UNKNOWN - An error occurred: 'At least 3 samples are required to calculate jitter, got 2.'\n" &&
           code == 3;
}


int main() {
    spdlog::set_level(spdlog::level::off);
    std::cout << "Running check_jitter check tests...\n";

    run_test("Scenario A: average, OK", test_scenario_average_ok);
    run_test("Scenario B: max, WARNING", test_scenario_max_warning);
    run_test("Scenario C: sample count boundary", test_scenario_sample_count_boundary);
    run_test("Scenario D: min interval above max", test_scenario_interval_rejected);
    run_test("All timeouts -> UNKNOWN", test_all_timeouts_is_unknown);
    run_test("Thresholds on full precision", test_thresholds_use_full_precision);
    run_test("Range error message", test_bad_range_message);

    run_test("Report: precision", test_report_precision);
    run_test("Report: UNKNOWN lines", test_report_unknown_lines);

    run_test("CLI: defaults", test_cli_defaults);
    run_test("CLI: all flags", test_cli_all_flags);
    run_test("CLI: errors", test_cli_errors);
    run_test("CLI: missing host message", test_cli_missing_host_message);
    run_test("CLI: sample limit", test_cli_sample_limit);
    run_test("CLI: switch with inline value", test_cli_switch_with_value);
    run_test("Check: more than 255 samples", test_too_many_samples_rejected);

    run_test("Host: validation", test_validate_host);
    run_test("Host: literal resolution", test_resolve_literals);

    run_test("ICMP: echo request layout", test_echo_request_layout);
    run_test("ICMP: echo reply matching", test_classify_echo_reply);
    run_test("ICMP: quoted unreachable", test_classify_unreachable);
    run_test("ICMP: IPv6 echo reply", test_classify_ipv6_reply);

    run_test("Runner: help and version", test_runner_help_and_version);
    run_test("Runner: configuration errors", test_runner_configuration_errors);

    std::cout << "\nTests completed with " << g_failures << " failures.\n";
    return g_failures > 0 ? 1 : 0;
}
