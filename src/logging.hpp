#pragma once

#include <spdlog/fmt/fmt.h>
#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace hmarshal::internal {

using Logger = spdlog::logger;
using LoggerPtr = std::shared_ptr<Logger>;

// The library logger is a clone of the default logger, so applications
// configure sinks and levels on spdlog as usual.
inline LoggerPtr get_logger() {
    static const std::string name = "hmarshal";
    if (auto logger = spdlog::get(name)) {
        return logger;
    }
    auto logger = spdlog::default_logger()->clone(name);
    try {
        spdlog::register_logger(logger);
    } catch (const spdlog::spdlog_ex&) {
        // registered concurrently; use that one
        if (auto existing = spdlog::get(name)) return existing;
    }
    return logger;
}

} // namespace hmarshal::internal
