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

#include "mdnspub/container/container_event.hpp"
#include "mdnspub/core/json.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mdnspub::container::docker {

/**
 * A message of the Docker Engine API events endpoint (GET /events).
 */
struct EventMessage {
    std::string type;      // Type: container, network, image, ...
    std::string action;    // Action: start, stop, exec_start: sh, ...
    std::string actor_id;  // Actor.ID
    std::optional<Labels> attributes;

    /**
     * @return The container event this message describes, or nullopt when it is not a container event handled by the
     * daemon.
     */
    [[nodiscard]] std::optional<ContainerEvent> to_container_event() const;
};

/**
 * Parses a single message of the events stream.
 * @param json One JSON object.
 * @return The message, or a message describing the parse error.
 */
tl::expected<EventMessage, std::string> parse_event_message(std::string_view json);

/**
 * Parses the response of the container list endpoint (GET /containers/json).
 * @param json A JSON array of container summaries.
 * @return The containers, or a message describing the parse error.
 */
tl::expected<std::vector<ContainerInfo>, std::string> parse_container_list(std::string_view json);

/**
 * Builds the value of the filters query parameter: a JSON object mapping each filter to its values.
 * @param filters The filters, e.g. {"label", {"mdns.publish"}}.
 * @return The JSON, not yet encoded for use in a url.
 */
std::string filters_json(const std::vector<std::pair<std::string, std::vector<std::string>>>& filters);

EventMessage tag_invoke(const boost::json::value_to_tag<EventMessage>&, const boost::json::value& jv);

}  // namespace mdnspub::container::docker

namespace mdnspub::container {

/**
 * Converts a container summary of the Docker Engine API (Id, Labels) to ContainerInfo.
 */
ContainerInfo tag_invoke(const boost::json::value_to_tag<ContainerInfo>&, const boost::json::value& jv);

}  // namespace mdnspub::container
