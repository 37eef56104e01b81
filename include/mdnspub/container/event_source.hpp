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

#include "container_event.hpp"
#include "mdnspub/core/expected.hpp"

#include <functional>
#include <string>
#include <vector>

namespace mdnspub::container {

/**
 * The container runtime could not be reached, or its event stream ended.
 */
struct SourceError {
    std::string message;
};

/**
 * Base class for sources of container lifecycle events.
 *
 * All handlers are invoked through the io_context the source was constructed with.
 */
class EventSource {
  public:
    using ListHandler = std::function<void(tl::expected<std::vector<ContainerInfo>, SourceError> result)>;
    using EventHandler = std::function<void(const ContainerEvent& event)>;
    using ErrorHandler = std::function<void(const SourceError& error)>;
    using SubscribedHandler = std::function<void()>;

    EventSource() = default;
    virtual ~EventSource() = default;

    EventSource(const EventSource&) = delete;
    EventSource& operator=(const EventSource&) = delete;

    /**
     * Lists the running containers which carry the publish label.
     * @param handler Called once with the containers or an error.
     */
    virtual void async_list_running(ListHandler handler) = 0;

    /**
     * Starts the event subscription. Events are delivered in the order the runtime reports them. The subscription
     * cannot be restarted: after an error or cancel no more events are delivered.
     * @param on_event Called for every event.
     * @param on_error Called once when the subscription fails.
     * @param on_subscribed Called once the runtime accepted the subscription. Every event from then on is delivered,
     * so a list requested after this call misses nothing.
     */
    virtual void subscribe(EventHandler on_event, ErrorHandler on_error, SubscribedHandler on_subscribed) = 0;

    /**
     * Cancels the subscription and outstanding list requests. Handlers are not called after this.
     */
    virtual void cancel() = 0;
};

}  // namespace mdnspub::container
