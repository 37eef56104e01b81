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

#include <optional>
#include <vector>

namespace mdnspub::container {

/**
 * Event source which is driven by the test: it holds a list of running containers and emits the events it is told to.
 */
class MockEventSource: public EventSource {
  public:
    explicit MockEventSource(boost::asio::io_context& io_context);
    ~MockEventSource() override = default;

    /**
     * Replaces the list of running containers.
     * @param containers The containers which are reported as running.
     */
    void mock_running(std::vector<ContainerInfo> containers);

    /**
     * Makes the next list request fail.
     * @param error The error to fail with.
     */
    void mock_list_failure(SourceError error);

    /**
     * Mocks a container starting: adds it to the running list and emits a start event.
     * @param id The id of the container.
     * @param labels The labels of the container.
     */
    void mock_started(const ContainerId& id, const Labels& labels);

    /**
     * Mocks a container stopping: removes it from the running list and emits a stop event.
     * @param id The id of the container.
     */
    void mock_stopped(const ContainerId& id);

    /**
     * Emits an event without touching the running list.
     * @param event The event to emit.
     */
    void mock_event(ContainerEvent event);

    /**
     * Holds back the acknowledgement of the next subscription until mock_subscription_accepted is called. Without
     * this, a subscription is acknowledged right away.
     */
    void mock_hold_subscription();

    /**
     * Acknowledges a held subscription.
     */
    void mock_subscription_accepted();

    /**
     * Fails the subscription.
     * @param error The error to report.
     */
    void mock_error(SourceError error);

    [[nodiscard]] bool is_subscribed() const {
        return static_cast<bool>(on_event_);
    }

    [[nodiscard]] bool is_cancelled() const {
        return cancelled_;
    }

    [[nodiscard]] size_t get_list_count() const {
        return list_count_;
    }

    // EventSource overrides
    void async_list_running(ListHandler handler) override;
    void subscribe(EventHandler on_event, ErrorHandler on_error, SubscribedHandler on_subscribed) override;
    void cancel() override;

  private:
    boost::asio::io_context& io_context_;
    std::vector<ContainerInfo> running_;
    std::optional<SourceError> list_failure_;
    EventHandler on_event_;
    ErrorHandler on_error_;
    SubscribedHandler on_subscribed_;
    bool hold_subscription_ = false;
    bool cancelled_ = false;
    size_t list_count_ = 0;
};

}  // namespace mdnspub::container
