#include "utils/Logging.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <string>

namespace code_interpreter {

void configure_logging(bool verbose, bool debug) {
    if (const char* env = std::getenv("DEBUG")) {
        std::string v = env;
        if (v == "true" || v == "TRUE" || v == "1" || v == "yes") debug = true;
    }

    auto logger = spdlog::get("code_interpreter");
    if (!logger) logger = spdlog::stderr_color_mt("code_interpreter");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("%l - %n - %v");

    if (debug) {
        spdlog::set_level(spdlog::level::debug);
    } else if (verbose) {
        spdlog::set_level(spdlog::level::info);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }
}

}
