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

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace mdnspub::container {

/// Identifies a container on the host.
using ContainerId = std::string;

/// Metadata labels of a container.
using Labels = std::map<std::string, std::string>;

/**
 * The lifecycle events which matter for publishing.
 */
enum class EventType {
    start,
    stop,
    die,
    destroy,
};

/**
 * @param type The type to convert.
 * @return The string representation of the type, as used by the container runtime.
 */
const char* to_string(EventType type);

/**
 * @param str The string to convert.
 * @return The event type, or nullopt when the string is not one of the handled types.
 */
std::optional<EventType> event_type_from_string(std::string_view str);

/**
 * A lifecycle event of a container.
 */
struct ContainerEvent {
    EventType type {EventType::start};
    ContainerId id;
    std::optional<Labels> labels;
};

/**
 * A running container.
 */
struct ContainerInfo {
    ContainerId id;
    Labels labels;
};

}  // namespace mdnspub::container
