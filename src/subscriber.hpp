// SPDX-License-Identifier: MIT

// src/subscriber.hpp
#pragma once

#include <expected>
#include <memory>
#include <span>
#include <string_view>

#include "lib/stream/channel.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/transport.hpp"
#include "src/chanserv.hpp"
#include "src/config.hpp"

namespace chanserv {

/// Client role: posts a request to a dispatcher and receives its Sources.
///
/// LookupAndPost() dials the dispatcher and writes the request, then a
/// background thread turns each announcement into a Source handle. A
/// Source's sub-address is dialed only on the first call to its Out().
/// Every sequence handed out closes when the remote side finishes or
/// fails; failures are reported through ClientConfig::on_error only.
///
/// Dropping the announcement Receiver or a Source's frame Receiver
/// abandons it, and the dispatcher cancels the matching producer.
/// Destroying the Subscriber cancels all of its background threads;
/// Source handles that outlive it yield closed, empty frame sequences.
///
/// The multiplexer must outlive the subscriber.
class Subscriber {
public:
    explicit Subscriber(IMultiplexer& mux, ClientConfig config = {});
    ~Subscriber();

    Subscriber(const Subscriber&) = delete;
    Subscriber& operator=(const Subscriber&) = delete;
    Subscriber(Subscriber&&) = delete;
    Subscriber& operator=(Subscriber&&) = delete;

    /// Dial @p vaddr and post @p body.
    ///
    /// A Bucket tag is passed to the multiplexer as DialOptions::bucket.
    /// @return the sequence of announced Sources, or the dial / write error.
    std::expected<Receiver<SourcePtr>, Error> LookupAndPost(
        std::string_view vaddr,
        std::span<const std::byte> body,
        const RequestTags& tags = {});

    struct Context;

private:
    std::shared_ptr<Context> ctx_;
};

}  // namespace chanserv
