#include "cli.hpp"

#include <cctype>
#include <climits>
#include <cstdlib>
#include <optional>

#ifndef CJITTER_VERSION
#define CJITTER_VERSION "0.0.0"
#endif

using namespace cjitter;

static const char* const kAbout = R"(check_jitter - A monitoring plugin that measures network jitter.

Usage: check_jitter -H <HOST> [-w <RANGE>] [-c <RANGE>] [OPTIONS]

Options:
  -H, --host <HOST>                  Hostname or IP address to ping
  -a, --aggregation-method <METHOD>  Aggregation method to use for multiple samples
                                     [default: average]
  -w, --warning <RANGE>              Warning limit for network jitter in milliseconds
  -c, --critical <RANGE>             Critical limit for network jitter in milliseconds
  -s, --samples <SAMPLES>            Sample size: the number of pings to send [default: 10]
  -t, --timeout <MS>                 Timeout in milliseconds per individual ping check
                                     [default: 1000]
  -m, --min-interval <MS>            Minimum interval between ping samples in milliseconds
                                     [default: 0]
  -M, --max-interval <MS>            Maximum interval between ping samples in milliseconds
                                     [default: 0]
  -p, --precision <DIGITS>           Precision of the output decimal places [default: 3]
  -D, --dgram-socket                 Use a datagram socket instead of a raw socket
                                     (expert option)
  -v, --verbose...                   Enable verbose output. Use multiple times to
                                     increase verbosity (e.g. -vvv)
  -h, --help                         Print help
  -V, --version                      Print version

AGGREGATION METHOD

The plugin can aggregate the deltas from multiple samples in the following ways:
- average: the average of all deltas (arithmetic mean) [default]
- median: the median of all deltas
- max: the maximum of all deltas
- min: the minimum of all deltas

Deltas are only taken between consecutive pings that both got a reply. A lost
ping breaks the sequence on both sides.

HOSTNAME

If the hostname resolves to multiple IP addresses, the plugin will use the first
address returned by the DNS resolver and skip the rest.

SAMPLES

The number of pings to send to the target host. Must be between 3 and 255.

SAMPLE INTERVALS

When -m and -M are both set to 0, the plugin will send pings immediately after
receiving a response.

When -m and -M are set to the same value, the plugin will send pings at a fixed
interval.

When -m and -M are set to different values, the plugin will send pings at random
intervals between the two values.

-m must be less than or equal to -M.

RUNTIME

A run takes at most samples x (timeout + max interval) milliseconds. Keep the
check interval and the scheduler timeout of the monitoring system above that.

SOCKETS

Raw sockets (the default) need root or CAP_NET_RAW. Datagram sockets (-D) work
unprivileged when the user's group is allowed by net.ipv4.ping_group_range.

THRESHOLD SYNTAX

Thresholds are defined using monitoring plugin range syntax.

+------------------+-------------------------------------------------+
| Range definition | Generate an alert if x...                       |
+------------------+-------------------------------------------------+
| 10               | < 0 or > 10, (outside the range of {0 .. 10})   |
+------------------+-------------------------------------------------+
| 10:              | < 10, (outside {10 .. inf})                     |
+------------------+-------------------------------------------------+
| ~:10             | > 10, (outside the range of {-inf .. 10})       |
+------------------+-------------------------------------------------+
| 10:20            | < 10 or > 20, (outside the range of {10 .. 20}) |
+------------------+-------------------------------------------------+
| @10:20           | >= 10 and <= 20, (inside the range of {10 .. 20})|
+------------------+-------------------------------------------------+
)";

std::string usage_text() {
    return kAbout;
}

std::string version_text() {
    return std::string("check_jitter ") + CJITTER_VERSION;
}


// ------------------------------
// Value helpers
// ------------------------------
static CheckError invalid_value(const std::string& value,
                                const std::string& flag,
                                const std::string& why)
{
    return make_error(ErrorKind::CommandLine,
                      "invalid value '" + value + "' for '" + flag + "': " + why);
}

// Unsigned decimal only: "-5", "1e3" and "10ms" are all rejected
static std::optional<long long> parse_unsigned(const std::string& s, std::string& why) {
    if (s.empty()) {
        why = "cannot parse integer from empty string";
        return std::nullopt;
    }
    for (unsigned char c : s) {
        if (!std::isdigit(c)) {
            why = "invalid digit found in string";
            return std::nullopt;
        }
    }
    if (s.size() > 10 || std::strtoll(s.c_str(), nullptr, 10) > INT_MAX) {
        why = "number too large to fit in target type";
        return std::nullopt;
    }
    return std::strtoll(s.c_str(), nullptr, 10);
}

static bool takes_value(char short_flag) {
    switch (short_flag) {
    case 'H': case 'a': case 'w': case 'c': case 's':
    case 't': case 'm': case 'M': case 'p':
        return true;
    default:
        return false;
    }
}

static bool is_verbose_group(const std::string& a) {
    if (a.size() < 2 || a[0] != '-' || a[1] != 'v')
        return false;
    return a.find_first_not_of('v', 1) == std::string::npos;
}


/**
 * Parse command-line arguments into a CliOptions struct.
 *
 * Accepted forms: "-s 10", "-s10", "--samples 10", "--samples=10",
 * and grouped verbosity ("-vvv").
 */
CliOptions parse_args(const std::vector<std::string>& args) {
    CliOptions opt{};
    CheckConfig& cfg = opt.check;

    for (size_t i = 0; i < args.size(); ++i) {
        std::string a = args[i];
        std::string inline_value;
        bool has_inline = false;

        if (a.rfind("--", 0) == 0) {
            size_t eq = a.find('=');
            if (eq != std::string::npos) {
                inline_value = a.substr(eq + 1);
                a = a.substr(0, eq);
                has_inline = true;
            }
        } else if (a.size() > 2 && a[0] == '-' && takes_value(a[1])) {
            inline_value = a.substr(2);
            a = a.substr(0, 2);
            has_inline = true;
        }

        auto take_value = [&](std::string& out) -> bool {
            if (has_inline) {
                out = inline_value;
                return true;
            }
            if (i + 1 < args.size()) {
                out = args[++i];
                return true;
            }
            opt.error = make_error(ErrorKind::CommandLine,
                                   "a value is required for '" + a +
                                   "' but none was supplied");
            return false;
        };

        auto take_number = [&](const std::string& flag, long long& out) -> bool {
            std::string value;
            if (!take_value(value))
                return false;
            std::string why;
            auto n = parse_unsigned(value, why);
            if (!n) {
                opt.error = invalid_value(value, flag, why);
                return false;
            }
            out = *n;
            return true;
        };

        // Switches: "--dgram-socket=yes" is an error, not a silent yes
        auto no_value = [&]() -> bool {
            if (!has_inline)
                return true;
            opt.error = make_error(ErrorKind::CommandLine,
                                   "unexpected value '" + inline_value + "' for '" + a +
                                   "' found; no more were expected");
            return false;
        };

        long long n = 0;
        std::string value;

        // ------------------------------
        // Target and thresholds
        // ------------------------------
        if (a == "-H" || a == "--host") {
            if (!take_value(cfg.host)) return opt;

        } else if (a == "-w" || a == "--warning") {
            if (!take_value(value)) return opt;
            cfg.warning = value;

        } else if (a == "-c" || a == "--critical") {
            if (!take_value(value)) return opt;
            cfg.critical = value;

        } else if (a == "-a" || a == "--aggregation-method") {
            if (!take_value(value)) return opt;
            if (!parse_aggregation_method(value, cfg.method)) {
                opt.error = invalid_value(value, "--aggregation-method <AGGREGATION_METHOD>",
                                          "'" + value + "' is not a valid aggregation method");
                return opt;
            }

        // ------------------------------
        // Sampling
        // ------------------------------
        } else if (a == "-s" || a == "--samples") {
            if (!take_number("--samples <SAMPLES>", n)) return opt;
            if (n > kMaxSamples) {
                opt.error = invalid_value(std::to_string(n), "--samples <SAMPLES>",
                                          std::to_string(n) + " is not in 0..=" +
                                          std::to_string(kMaxSamples));
                return opt;
            }
            cfg.samples = static_cast<int>(n);

        } else if (a == "-t" || a == "--timeout") {
            if (!take_number("--timeout <TIMEOUT>", n)) return opt;
            cfg.timeout = std::chrono::milliseconds(n);

        } else if (a == "-m" || a == "--min-interval") {
            if (!take_number("--min-interval <MIN_INTERVAL>", n)) return opt;
            cfg.min_interval = std::chrono::milliseconds(n);

        } else if (a == "-M" || a == "--max-interval") {
            if (!take_number("--max-interval <MAX_INTERVAL>", n)) return opt;
            cfg.max_interval = std::chrono::milliseconds(n);

        } else if (a == "-D" || a == "--dgram-socket") {
            if (!no_value()) return opt;
            cfg.socket_type = SocketType::Datagram;

        // ------------------------------
        // Output
        // ------------------------------
        } else if (a == "-p" || a == "--precision") {
            if (!take_number("--precision <PRECISION>", n)) return opt;
            if (n > 255) {
                opt.error = invalid_value(std::to_string(n), "--precision <PRECISION>",
                                          "number too large to fit in target type");
                return opt;
            }
            cfg.precision = static_cast<int>(n);

        } else if (a == "--verbose") {
            if (!no_value()) return opt;
            opt.verbose++;

        } else if (is_verbose_group(a)) {
            opt.verbose += static_cast<int>(a.size() - 1);

        } else if (a == "-h" || a == "--help") {
            if (!no_value()) return opt;
            opt.show_help = true;

        } else if (a == "-V" || a == "--version") {
            if (!no_value()) return opt;
            opt.show_version = true;

        // ------------------------------
        // Unknown argument
        // ------------------------------
        } else {
            opt.error = make_error(ErrorKind::CommandLine,
                                   "unexpected argument '" + args[i] + "' found");
            return opt;
        }
    }

    if (opt.show_help || opt.show_version)
        return opt;

    if (opt.verbose > 3) {
        opt.error = invalid_value(std::to_string(opt.verbose), "--verbose...",
                                  std::to_string(opt.verbose) + " is not in 0..=3");
        return opt;
    }

    if (cfg.host.empty()) {
        opt.error = make_error(ErrorKind::CommandLine,
                               "the following required arguments were not provided: "
                               "--host <HOST>");
    }

    return opt;
}


CliOptions parse_args(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i)
        args.emplace_back(argv[i]);
    return parse_args(args);
}
