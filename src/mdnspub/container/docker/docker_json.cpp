/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnspub/container/docker/docker_json.hpp"

#include <boost/json/serialize.hpp>

#include <stdexcept>

namespace {

std::string get_string(const boost::json::object& obj, const char* key) {
    const auto* v = obj.if_contains(key);
    if (v == nullptr) {
        return {};
    }
    if (const auto* str = v->if_string()) {
        return std::string(*str);
    }
    return {};
}

std::optional<mdnspub::container::Labels> get_labels(const boost::json::object& obj, const char* key) {
    const auto* v = obj.if_contains(key);
    if (v == nullptr) {
        return std::nullopt;
    }
    const auto* labels_obj = v->if_object();
    if (labels_obj == nullptr) {
        return std::nullopt;  // "Labels": null for containers without labels
    }

    mdnspub::container::Labels labels;
    for (const auto& [name, value] : *labels_obj) {
        if (const auto* str = value.if_string()) {
            labels.emplace(std::string(name), std::string(*str));
        }
    }
    return labels;
}

}  // namespace

std::optional<mdnspub::container::ContainerEvent> mdnspub::container::docker::EventMessage::to_container_event() const {
    if (type != "container" || actor_id.empty()) {
        return std::nullopt;
    }
    const auto event_type = event_type_from_string(action);
    if (!event_type) {
        return std::nullopt;
    }
    return ContainerEvent {*event_type, actor_id, attributes};
}

mdnspub::container::docker::EventMessage
mdnspub::container::docker::tag_invoke(const boost::json::value_to_tag<EventMessage>&, const boost::json::value& jv) {
    const auto& obj = jv.as_object();

    EventMessage message;
    message.type = get_string(obj, "Type");
    message.action = get_string(obj, "Action");
    if (message.action.empty()) {
        message.action = get_string(obj, "status");  // Older API versions
    }

    if (const auto* actor = obj.if_contains("Actor"); actor != nullptr && actor->is_object()) {
        message.actor_id = get_string(actor->get_object(), "ID");
        message.attributes = get_labels(actor->get_object(), "Attributes");
    }
    if (message.actor_id.empty()) {
        message.actor_id = get_string(obj, "id");
    }

    return message;
}

mdnspub::container::ContainerInfo
mdnspub::container::tag_invoke(const boost::json::value_to_tag<ContainerInfo>&, const boost::json::value& jv) {
    const auto& obj = jv.as_object();

    ContainerInfo info;
    info.id = get_string(obj, "Id");
    if (info.id.empty()) {
        throw std::invalid_argument("Container without Id");
    }
    info.labels = get_labels(obj, "Labels").value_or(Labels {});
    return info;
}

tl::expected<mdnspub::container::docker::EventMessage, std::string>
mdnspub::container::docker::parse_event_message(const std::string_view json) {
    return parse_json<EventMessage>(json);
}

tl::expected<std::vector<mdnspub::container::ContainerInfo>, std::string>
mdnspub::container::docker::parse_container_list(const std::string_view json) {
    return parse_json<std::vector<ContainerInfo>>(json);
}

std::string mdnspub::container::docker::filters_json(
    const std::vector<std::pair<std::string, std::vector<std::string>>>& filters
) {
    boost::json::object obj;
    for (const auto& [name, values] : filters) {
        boost::json::array array;
        for (const auto& value : values) {
            array.emplace_back(value);
        }
        obj[name] = std::move(array);
    }
    return boost::json::serialize(obj);
}
