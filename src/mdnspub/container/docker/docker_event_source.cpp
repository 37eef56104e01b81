/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnspub/container/docker/docker_event_source.hpp"

#include "mdnspub/container/docker/docker_json.hpp"
#include "mdnspub/core/exception.hpp"
#include "mdnspub/core/log.hpp"
#include "mdnspub/core/string.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/url.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <utility>

namespace {

namespace http = boost::beast::http;
using local = boost::asio::local::stream_protocol;
using Stream = boost::beast::basic_stream<local>;

http::request<http::empty_body> make_request(const std::string& target) {
    http::request<http::empty_body> request(http::verb::get, target, 11);
    request.set(http::field::host, "localhost");
    request.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    request.set(http::field::accept, "application/json");
    return request;
}

}  // namespace

/**
 * A single GET request on its own connection. Keeps itself alive until the response arrived or the session was
 * abandoned.
 */
class mdnspub::container::docker::DockerEventSource::ListSession:
    public std::enable_shared_from_this<ListSession> {
  public:
    ListSession(
        boost::asio::io_context& io_context, const Configuration& config, const std::string& target,
        ListHandler handler
    ) :
        stream_(io_context),
        socket_path_(config.socket_path),
        timeout_(config.request_timeout),
        request_(make_request(target)),
        handler_(std::move(handler)) {}

    void start() {
        stream_.expires_after(timeout_);
        stream_.async_connect(
            local::endpoint(socket_path_), boost::beast::bind_front_handler(&ListSession::on_connect, shared_from_this())
        );
    }

    void abandon() {
        handler_ = nullptr;
        stream_.close();
    }

  private:
    Stream stream_;
    std::string socket_path_;
    std::chrono::milliseconds timeout_;
    http::request<http::empty_body> request_;
    http::response<http::string_body> response_;
    boost::beast::flat_buffer buffer_;
    ListHandler handler_;

    void on_connect(const boost::beast::error_code& ec) {
        if (ec) {
            finish(tl::unexpected(SourceError {fmt::format("Failed to connect to {}: {}", socket_path_, ec.message())})
            );
            return;
        }

        stream_.expires_after(timeout_);
        http::async_write(
            stream_, request_, boost::beast::bind_front_handler(&ListSession::on_write, shared_from_this())
        );
    }

    void on_write(const boost::beast::error_code& ec, std::size_t) {
        if (ec) {
            finish(tl::unexpected(SourceError {fmt::format("Failed to send list request: {}", ec.message())}));
            return;
        }

        stream_.expires_after(timeout_);
        http::async_read(
            stream_, buffer_, response_, boost::beast::bind_front_handler(&ListSession::on_read, shared_from_this())
        );
    }

    void on_read(const boost::beast::error_code& ec, std::size_t) {
        if (ec) {
            finish(tl::unexpected(SourceError {fmt::format("Failed to read list response: {}", ec.message())}));
            return;
        }

        if (response_.result() != http::status::ok) {
            finish(tl::unexpected(SourceError {
                fmt::format("Container list failed with status {}: {}", response_.result_int(), response_.body())
            }));
            return;
        }

        auto containers = parse_container_list(response_.body());
        if (!containers) {
            finish(tl::unexpected(SourceError {fmt::format("Invalid container list: {}", containers.error())}));
            return;
        }

        finish(std::move(*containers));
    }

    void finish(tl::expected<std::vector<ContainerInfo>, SourceError> result) {
        boost::beast::error_code ec;
        stream_.socket().shutdown(local::socket::shutdown_both, ec);

        if (!handler_) {
            return;  // Session was abandoned, nothing to do.
        }
        const auto handler = std::move(handler_);
        handler_ = nullptr;
        handler(std::move(result));
    }
};

/**
 * The long-lived events request. Splits the chunked response body into lines and reports each container event.
 */
class mdnspub::container::docker::DockerEventSource::EventSession:
    public std::enable_shared_from_this<EventSession> {
  public:
    EventSession(
        boost::asio::io_context& io_context, const Configuration& config, const std::string& target,
        EventHandler on_event, ErrorHandler on_error, SubscribedHandler on_subscribed
    ) :
        stream_(io_context),
        socket_path_(config.socket_path),
        timeout_(config.request_timeout),
        request_(make_request(target)),
        on_event_(std::move(on_event)),
        on_error_(std::move(on_error)),
        on_subscribed_(std::move(on_subscribed)) {
        parser_.body_limit(boost::none);
        chunk_body_callback_ = [this](std::uint64_t, const boost::beast::string_view body, boost::beast::error_code&) {
            on_chunk_body(body);
            return body.size();
        };
        parser_.on_chunk_body(chunk_body_callback_);
    }

    void start() {
        stream_.expires_after(timeout_);
        stream_.async_connect(
            local::endpoint(socket_path_),
            boost::beast::bind_front_handler(&EventSession::on_connect, shared_from_this())
        );
    }

    void abandon() {
        on_event_ = nullptr;
        on_error_ = nullptr;
        on_subscribed_ = nullptr;
        stream_.close();
    }

  private:
    Stream stream_;
    std::string socket_path_;
    std::chrono::milliseconds timeout_;
    http::request<http::empty_body> request_;
    http::response_parser<http::empty_body> parser_;
    boost::beast::flat_buffer buffer_;
    std::string line_buffer_;
    std::function<std::size_t(std::uint64_t, boost::beast::string_view, boost::beast::error_code&)>
        chunk_body_callback_;
    EventHandler on_event_;
    ErrorHandler on_error_;
    SubscribedHandler on_subscribed_;

    void on_connect(const boost::beast::error_code& ec) {
        if (ec) {
            fail(fmt::format("Failed to connect to {}: {}", socket_path_, ec.message()));
            return;
        }

        stream_.expires_after(timeout_);
        http::async_write(
            stream_, request_, boost::beast::bind_front_handler(&EventSession::on_write, shared_from_this())
        );
    }

    void on_write(const boost::beast::error_code& ec, std::size_t) {
        if (ec) {
            fail(fmt::format("Failed to send events request: {}", ec.message()));
            return;
        }

        stream_.expires_after(timeout_);
        http::async_read_header(
            stream_, buffer_, parser_, boost::beast::bind_front_handler(&EventSession::on_header, shared_from_this())
        );
    }

    void on_header(const boost::beast::error_code& ec, std::size_t) {
        if (ec) {
            fail(fmt::format("Failed to read events response: {}", ec.message()));
            return;
        }

        if (parser_.get().result() != http::status::ok) {
            fail(fmt::format("Events request failed with status {}", parser_.get().result_int()));
            return;
        }

        MDNSPUB_INFO("Subscribed to container events");

        // The stream is infinite, the timeout only covers setting it up.
        stream_.expires_never();

        // Before reading the body: no event has been delivered yet. The handler may abandon this session.
        if (on_subscribed_) {
            const auto on_subscribed = std::move(on_subscribed_);
            on_subscribed_ = nullptr;
            on_subscribed();
        }

        http::async_read(
            stream_, buffer_, parser_, boost::beast::bind_front_handler(&EventSession::on_read, shared_from_this())
        );
    }

    void on_read(const boost::beast::error_code& ec, std::size_t) {
        if (ec) {
            fail(fmt::format("Event stream failed: {}", ec.message()));
            return;
        }
        fail("Event stream ended");
    }

    void on_chunk_body(const boost::beast::string_view body) {
        line_buffer_.append(body.data(), body.size());

        size_t pos = 0;
        while ((pos = line_buffer_.find('\n')) != std::string::npos) {
            const auto line = line_buffer_.substr(0, pos);
            line_buffer_.erase(0, pos + 1);
            handle_line(line);
        }
    }

    void handle_line(const std::string& line) {
        if (!on_event_) {
            return;  // Session was abandoned, nothing to do.
        }

        const auto trimmed = string_trim(line);
        if (trimmed.empty()) {
            return;
        }

        const auto message = parse_event_message(trimmed);
        if (!message) {
            MDNSPUB_WARNING("Ignoring malformed event: {}", message.error());
            return;
        }

        const auto event = message->to_container_event();
        if (!event) {
            MDNSPUB_TRACE("Ignoring event {} {}", message->type, message->action);
            return;
        }

        MDNSPUB_DEBUG("Container event: {} {}", to_string(event->type), event->id);

        // Copy, the handler may abandon this session.
        const auto on_event = on_event_;
        on_event(*event);
    }

    void fail(const std::string& message) {
        boost::beast::error_code ec;
        stream_.socket().shutdown(local::socket::shutdown_both, ec);

        if (!on_error_) {
            return;  // Session was abandoned, nothing to do.
        }
        const auto on_error = std::move(on_error_);
        on_error_ = nullptr;
        on_event_ = nullptr;
        on_subscribed_ = nullptr;
        on_error(SourceError {message});
    }
};

tl::expected<std::string, std::string>
mdnspub::container::docker::DockerEventSource::socket_path_from_docker_host(const std::string_view docker_host) {
    constexpr std::string_view unix_scheme = "unix://";

    const auto host = string_trim(docker_host);
    if (string_starts_with(host, unix_scheme)) {
        const auto path = host.substr(unix_scheme.size());
        if (path.empty()) {
            return tl::unexpected(fmt::format("No socket path in docker host '{}'", host));
        }
        return std::string(path);
    }
    if (string_starts_with(host, "/")) {
        return std::string(host);
    }
    return tl::unexpected(fmt::format("Docker host '{}' is not a unix socket", host));
}

mdnspub::container::docker::DockerEventSource::DockerEventSource(
    boost::asio::io_context& io_context, Configuration config
) :
    io_context_(io_context), config_(std::move(config)) {}

mdnspub::container::docker::DockerEventSource::~DockerEventSource() {
    cancel();
}

std::string mdnspub::container::docker::DockerEventSource::events_target() const {
    boost::urls::url url;
    url.set_path(fmt::format("/{}/events", config_.api_version));
    url.params().append(
        {"filters", filters_json({{"type", {"container"}}, {"event", {"start", "stop", "die", "destroy"}}})}
    );
    return std::string(url.buffer());
}

std::string mdnspub::container::docker::DockerEventSource::list_target() const {
    boost::urls::url url;
    url.set_path(fmt::format("/{}/containers/json", config_.api_version));
    url.params().append({"filters", filters_json({{"label", {config_.publish_label}}})});
    return std::string(url.buffer());
}

void mdnspub::container::docker::DockerEventSource::async_list_running(ListHandler handler) {
    if (cancelled_) {
        return;
    }

    list_sessions_.erase(
        std::remove_if(
            list_sessions_.begin(), list_sessions_.end(),
            [](const std::weak_ptr<ListSession>& s) {
                return s.expired();
            }
        ),
        list_sessions_.end()
    );

    auto session = std::make_shared<ListSession>(io_context_, config_, list_target(), std::move(handler));
    list_sessions_.push_back(session);
    session->start();
}

void mdnspub::container::docker::DockerEventSource::subscribe(
    EventHandler on_event, ErrorHandler on_error, SubscribedHandler on_subscribed
) {
    if (event_session_ || cancelled_) {
        MDNSPUB_THROW_EXCEPTION("The event subscription cannot be restarted");
    }

    event_session_ = std::make_shared<EventSession>(
        io_context_, config_, events_target(), std::move(on_event), std::move(on_error), std::move(on_subscribed)
    );
    event_session_->start();
}

void mdnspub::container::docker::DockerEventSource::cancel() {
    cancelled_ = true;

    if (event_session_) {
        event_session_->abandon();
        event_session_.reset();
    }

    for (auto& weak_session : list_sessions_) {
        if (const auto session = weak_session.lock()) {
            session->abandon();
        }
    }
    list_sessions_.clear();
}
