// SPDX-License-Identifier: MIT

// lib/stream/log.hpp
#pragma once

#include <memory>

#include <spdlog/spdlog.h>

namespace chanserv {

/// Return the process-wide "chanserv" logger, creating it on first use.
///
/// The logger writes to a colored stdout sink and starts at the warn level
/// so library users only see background failures unless they opt in.
std::shared_ptr<spdlog::logger> Logger();

/// Change the level of the "chanserv" logger.
void SetLogLevel(spdlog::level::level_enum level);

}  // namespace chanserv

#define CHANSERV_TRACE(...) ::chanserv::Logger()->trace(__VA_ARGS__)
#define CHANSERV_DEBUG(...) ::chanserv::Logger()->debug(__VA_ARGS__)
#define CHANSERV_INFO(...) ::chanserv::Logger()->info(__VA_ARGS__)
#define CHANSERV_WARN(...) ::chanserv::Logger()->warn(__VA_ARGS__)
#define CHANSERV_ERROR(...) ::chanserv::Logger()->error(__VA_ARGS__)
