/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnspub/container/mock/mock_event_source.hpp"

#include "mdnspub/core/exception.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>

#include <algorithm>

mdnspub::container::MockEventSource::MockEventSource(boost::asio::io_context& io_context) : io_context_(io_context) {}

void mdnspub::container::MockEventSource::mock_running(std::vector<ContainerInfo> containers) {
    running_ = std::move(containers);
}

void mdnspub::container::MockEventSource::mock_list_failure(SourceError error) {
    list_failure_ = std::move(error);
}

void mdnspub::container::MockEventSource::mock_started(const ContainerId& id, const Labels& labels) {
    running_.erase(
        std::remove_if(
            running_.begin(), running_.end(),
            [&id](const ContainerInfo& info) {
                return info.id == id;
            }
        ),
        running_.end()
    );
    running_.push_back({id, labels});
    mock_event({EventType::start, id, labels});
}

void mdnspub::container::MockEventSource::mock_stopped(const ContainerId& id) {
    running_.erase(
        std::remove_if(
            running_.begin(), running_.end(),
            [&id](const ContainerInfo& info) {
                return info.id == id;
            }
        ),
        running_.end()
    );
    mock_event({EventType::stop, id, std::nullopt});
}

void mdnspub::container::MockEventSource::mock_event(ContainerEvent event) {
    boost::asio::dispatch(io_context_, [this, event = std::move(event)] {
        if (cancelled_ || !on_event_) {
            return;
        }
        on_event_(event);
    });
}

void mdnspub::container::MockEventSource::mock_hold_subscription() {
    hold_subscription_ = true;
}

void mdnspub::container::MockEventSource::mock_subscription_accepted() {
    hold_subscription_ = false;
    boost::asio::post(io_context_, [this] {
        if (cancelled_ || !on_subscribed_) {
            return;
        }
        auto on_subscribed = std::move(on_subscribed_);
        on_subscribed_ = nullptr;
        on_subscribed();
    });
}

void mdnspub::container::MockEventSource::mock_error(SourceError error) {
    boost::asio::dispatch(io_context_, [this, error = std::move(error)] {
        if (cancelled_ || !on_error_) {
            return;
        }
        auto on_error = std::move(on_error_);
        on_event_ = nullptr;
        on_error_ = nullptr;
        on_subscribed_ = nullptr;
        on_error(error);
    });
}

void mdnspub::container::MockEventSource::async_list_running(ListHandler handler) {
    ++list_count_;

    if (list_failure_) {
        auto error = std::move(*list_failure_);
        list_failure_.reset();
        boost::asio::post(io_context_, [this, h = std::move(handler), error = std::move(error)] {
            if (!cancelled_) {
                h(tl::unexpected(error));
            }
        });
        return;
    }

    boost::asio::post(io_context_, [this, h = std::move(handler), containers = running_] {
        if (!cancelled_) {
            h(containers);
        }
    });
}

void mdnspub::container::MockEventSource::subscribe(
    EventHandler on_event, ErrorHandler on_error, SubscribedHandler on_subscribed
) {
    if (on_event_) {
        MDNSPUB_THROW_EXCEPTION("Already subscribed");
    }
    on_event_ = std::move(on_event);
    on_error_ = std::move(on_error);
    on_subscribed_ = std::move(on_subscribed);

    if (!hold_subscription_) {
        mock_subscription_accepted();
    }
}

void mdnspub::container::MockEventSource::cancel() {
    cancelled_ = true;
    on_event_ = nullptr;
    on_error_ = nullptr;
    on_subscribed_ = nullptr;
}
