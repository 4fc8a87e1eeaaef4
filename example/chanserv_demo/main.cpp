// SPDX-License-Identifier: MIT

// example/chanserv_demo/main.cpp
//
// Dispatcher and Subscriber in one process over the loopback transport.
// The dispatcher answers every request with N sources; source i sends
// "wait for me!", sleeps (i + 1) * delay, sends "ok I'm ready" and closes.
// The subscriber reads every source concurrently and prints what arrives.
//
// Usage: chanserv_demo [--sources N] [--delay-ms MS] [--compress LEVEL] [--verbose]

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <limits>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <fmt/format.h>

#include "lib/stream/log.hpp"
#include "lib/stream/memory_transport.hpp"
#include "src/chanserv.hpp"
#include "src/dispatcher.hpp"
#include "src/subscriber.hpp"

namespace {

struct Options {
    int sources = 5;
    int delay_ms = 100;
    int compress = 0;
    bool verbose = false;
};

bool ParseInt(std::string_view text, int& out) {
    char* end = nullptr;
    std::string copy(text);
    errno = 0;
    long value = std::strtol(copy.c_str(), &end, 10);
    if (end == copy.c_str() || *end != '\0' || errno == ERANGE || value < 0 ||
        value > std::numeric_limits<int>::max()) {
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

bool ParseArgs(int argc, char** argv, Options& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        auto value = [&](int& out) {
            return i + 1 < argc && ParseInt(argv[++i], out);
        };
        if (arg == "--sources") {
            if (!value(opts.sources)) return false;
        } else if (arg == "--delay-ms") {
            if (!value(opts.delay_ms)) return false;
        } else if (arg == "--compress") {
            if (!value(opts.compress)) return false;
        } else if (arg == "--verbose") {
            opts.verbose = true;
        } else {
            return false;
        }
    }
    return true;
}

chanserv::Receiver<chanserv::SourcePtr> AnnounceSources(const Options& opts,
                                                        std::span<const std::byte> body) {
    fmt::print("server: request \"{}\"\n", chanserv::ToString(body));

    auto [announce, sources] = chanserv::MakeChannel<chanserv::SourcePtr>(opts.sources);
    std::thread([announce = std::move(announce), opts]() mutable {
        for (int i = 0; i < opts.sources; ++i) {
            auto feed = chanserv::MakeSource(chanserv::ToBytes(fmt::format("source @{}", i)));
            if (!announce.Send(feed.source)) {
                return;
            }
            std::thread([frames = std::move(feed.frames), i, delay = opts.delay_ms]() mutable {
                if (!frames.Send(chanserv::BytesFrame::From("wait for me!"))) return;
                std::this_thread::sleep_for(std::chrono::milliseconds((i + 1) * delay));
                frames.Send(chanserv::BytesFrame::From("ok I'm ready"));
            }).detach();
        }
    }).detach();
    return std::move(sources);
}

}  // namespace

int main(int argc, char** argv) {
    Options opts;
    if (!ParseArgs(argc, argv, opts)) {
        fmt::print(stderr,
                   "usage: {} [--sources N] [--delay-ms MS] [--compress LEVEL] [--verbose]\n",
                   argv[0]);
        return 2;
    }
    if (opts.verbose) {
        chanserv::SetLogLevel(spdlog::level::debug);
    }

    chanserv::MemoryMultiplexer mux;

    chanserv::ServerConfig server_config;
    server_config.compression_level = opts.compress;
    server_config.on_error = [](const chanserv::Error& e) {
        fmt::print(stderr, "server error: {}\n", e.message);
    };
    chanserv::Dispatcher dispatcher(mux, server_config);
    auto started = dispatcher.Start("demo", [&opts](std::span<const std::byte> body) {
        return AnnounceSources(opts, body);
    });
    if (!started) {
        fmt::print(stderr, "start failed: {}\n", started.error().message);
        return 1;
    }

    chanserv::ClientConfig client_config;
    client_config.dial_timeout = std::chrono::seconds(2);
    client_config.on_error = [](const chanserv::Error& e) {
        fmt::print(stderr, "client error: {}\n", e.message);
    };
    chanserv::Subscriber subscriber(mux, client_config);

    auto sources = subscriber.LookupAndPost("demo", chanserv::ToBytes("hello"));
    if (!sources) {
        fmt::print(stderr, "post failed: {}\n", sources.error().message);
        return 1;
    }

    std::mutex print_mutex;
    std::vector<std::jthread> readers;
    while (auto source = sources->Receive()) {
        std::string header = chanserv::ToString((*source)->Header());
        {
            std::lock_guard<std::mutex> lock(print_mutex);
            fmt::print("client: announced \"{}\" from {}\n", header, (*source)->Meta()->RemoteAddr());
        }
        readers.emplace_back([source = *source, header, &print_mutex] {
            while (auto frame = source->Out().Receive()) {
                std::lock_guard<std::mutex> lock(print_mutex);
                fmt::print("client: {} -> \"{}\"\n", header, chanserv::ToString((*frame)->Bytes()));
            }
            std::lock_guard<std::mutex> lock(print_mutex);
            fmt::print("client: {} closed\n", header);
        });
    }
    readers.clear();

    fmt::print("done\n");
    dispatcher.Stop();
    return 0;
}
