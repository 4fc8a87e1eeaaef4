// SPDX-License-Identifier: MIT

#include "lib/stream/log.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace chanserv {

namespace {

constexpr const char* kLoggerName = "chanserv";

}  // namespace

std::shared_ptr<spdlog::logger> Logger() {
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> logger;
    std::call_once(once, [] {
        // Another component may already have registered the name
        logger = spdlog::get(kLoggerName);
        if (!logger) {
            auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v");
            logger = std::make_shared<spdlog::logger>(kLoggerName, sink);
            logger->set_level(spdlog::level::warn);
            spdlog::register_logger(logger);
        }
    });
    return logger;
}

void SetLogLevel(spdlog::level::level_enum level) {
    Logger()->set_level(level);
}

}  // namespace chanserv
