/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnspub/container/container_event.hpp"

const char* mdnspub::container::to_string(const EventType type) {
    switch (type) {
        case EventType::start:
            return "start";
        case EventType::stop:
            return "stop";
        case EventType::die:
            return "die";
        case EventType::destroy:
            return "destroy";
        default:
            return "unknown";
    }
}

std::optional<mdnspub::container::EventType> mdnspub::container::event_type_from_string(const std::string_view str) {
    if (str == "start") {
        return EventType::start;
    }
    if (str == "stop") {
        return EventType::stop;
    }
    if (str == "die") {
        return EventType::die;
    }
    if (str == "destroy") {
        return EventType::destroy;
    }
    return std::nullopt;
}
