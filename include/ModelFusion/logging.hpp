#pragma once

#include <memory>
#include <string>

#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

namespace ModelFusion {

namespace logging {

using Logger    = spdlog::logger;
using LoggerPtr = std::shared_ptr<Logger>;

inline constexpr const char* logger_name = "modelfusion";

// Clone of the default logger, registered once under "modelfusion" so that
// applications can reconfigure it through the spdlog registry.
inline LoggerPtr getLogger() {
    if (auto logger = spdlog::get(logger_name)) {
        return logger;
    }

    auto logger = spdlog::default_logger()->clone(logger_name);
    try {
        spdlog::register_logger(logger);
    } catch (const spdlog::spdlog_ex&) {
        // Registered concurrently by another thread
        if (auto existing = spdlog::get(logger_name)) {
            return existing;
        }
        throw;
    }
    return logger;
}

inline void setLevel(spdlog::level::level_enum level) {
    getLogger()->set_level(level);
}

} // namespace logging

} // namespace ModelFusion
