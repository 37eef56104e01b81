/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#pragma once

#include "mdnspub/container/event_source.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/local/stream_protocol.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace mdnspub::container::docker {

/**
 * Event source which talks to the Docker Engine API over its unix socket.
 *
 * The event subscription is a single long-lived GET /events request whose chunked body carries one JSON object per
 * line. Each list request uses its own connection.
 */
class DockerEventSource: public EventSource {
  public:
    static constexpr auto k_default_docker_host = "unix:///var/run/docker.sock";
    static constexpr auto k_default_api_version = "v1.41";

    struct Configuration {
        /// Path of the Docker Engine API socket.
        std::string socket_path {"/var/run/docker.sock"};
        /// Version prefix of the API paths.
        std::string api_version {k_default_api_version};
        /// Only containers carrying this label are listed.
        std::string publish_label {"mdns.publish"};
        /// Time allowed for connecting, sending a request and receiving response headers.
        std::chrono::milliseconds request_timeout {std::chrono::seconds(10)};
    };

    /**
     * Extracts the socket path from a DOCKER_HOST value.
     * @param docker_host A unix:// url or an absolute path.
     * @return The socket path, or a message when the host is not a unix socket.
     */
    static tl::expected<std::string, std::string> socket_path_from_docker_host(std::string_view docker_host);

    DockerEventSource(boost::asio::io_context& io_context, Configuration config);
    ~DockerEventSource() override;

    /**
     * @return The request target of the events subscription.
     */
    [[nodiscard]] std::string events_target() const;

    /**
     * @return The request target of the container list.
     */
    [[nodiscard]] std::string list_target() const;

    // EventSource overrides
    void async_list_running(ListHandler handler) override;
    void subscribe(EventHandler on_event, ErrorHandler on_error, SubscribedHandler on_subscribed) override;
    void cancel() override;

  private:
    class ListSession;
    class EventSession;

    boost::asio::io_context& io_context_;
    Configuration config_;
    std::vector<std::weak_ptr<ListSession>> list_sessions_;
    std::shared_ptr<EventSession> event_session_;
    bool cancelled_ = false;
};

}  // namespace mdnspub::container::docker
