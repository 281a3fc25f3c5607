#include "logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

using namespace cjitter;

CheckError init_logging(int verbosity) {
    auto level = spdlog::level::err;
    bool file_info = false;

    if (verbosity >= 3) {
        level = spdlog::level::debug;
        file_info = true;
    } else if (verbosity == 2) {
        level = spdlog::level::info;
    }

    const char* pattern = file_info
        ? "%Y-%m-%d %H:%M:%S.%e [%n] [%l] [%s:%#] %v"
        : "%Y-%m-%d %H:%M:%S.%e [%n] [%l] %v";

    try {
        // Safe to call more than once in the same process
        spdlog::drop("check_jitter");
        auto logger = spdlog::stderr_color_mt("check_jitter");
        logger->set_level(level);
        logger->set_pattern(pattern, spdlog::pattern_time_type::utc);
        spdlog::set_default_logger(logger);
    } catch (const spdlog::spdlog_ex& e) {
        return make_error(ErrorKind::LoggerInit, e.what());
    }

    return {};
}
