//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include "Config.hpp"

std::filesystem::path Config::searchRoot() const {
    std::error_code error;
    auto resolved = std::filesystem::weakly_canonical(root, error);
    if(error) {
        return std::filesystem::absolute(root).lexically_normal();
    }
    return resolved;
}

void setupLogging(const std::string &level) {
    auto logger = spdlog::get("git-wip");
    if(!logger) {
        logger = spdlog::stderr_color_mt("git-wip");
    }
    logger->set_pattern("%^%l%$: %v");
    spdlog::set_default_logger(logger);

    auto parsed = spdlog::level::from_str(level);
    if(parsed == spdlog::level::off && level != "off") {
        spdlog::warn("unknown log level '{}', using warn", level);
        parsed = spdlog::level::warn;
    }
    spdlog::set_level(parsed);
}
