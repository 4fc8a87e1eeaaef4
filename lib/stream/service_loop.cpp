// SPDX-License-Identifier: MIT

#include "lib/stream/service_loop.hpp"

#include <exception>
#include <string>
#include <utility>

#include <fmt/format.h>

#include "lib/stream/log.hpp"

namespace chanserv {

ServiceLoop::ServiceLoop(ErrorHandler on_error)
    : on_error_(std::move(on_error)),
      thread_([this] { loop_.Run(); }) {}

ServiceLoop::~ServiceLoop() {
    Stop();
}

void ServiceLoop::Report(const Error& e) {
    CHANSERV_WARN("{} error: {} ({}){}", error_category(e.code), e.message,
                  error_name(e.code),
                  e.os_errno != 0 ? fmt::format(" errno={}", e.os_errno) : std::string{});
    if (!on_error_) {
        return;
    }
    loop().Defer([this, e]() {
        try {
            on_error_(e);
        } catch (const std::exception& ex) {
            CHANSERV_ERROR("diagnostic hook threw: {}", ex.what());
        }
    });
}

void ServiceLoop::After(std::chrono::milliseconds delay, std::function<void()> fn) {
    loop().Schedule(delay, std::move(fn));
}

void ServiceLoop::Stop() {
    loop_.Stop();
    if (thread_.joinable()) {
        thread_.join();
    }
}

}  // namespace chanserv
