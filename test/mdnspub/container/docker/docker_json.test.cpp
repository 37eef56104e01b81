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

#include <catch2/catch_all.hpp>
#include <fmt/format.h>

TEST_CASE("mdnspub::container::docker | Event messages") {
    SECTION("Container start") {
        constexpr auto json = R"({
            "status": "start",
            "id": "4ee1d1c0b1a2",
            "from": "nginx",
            "Type": "container",
            "Action": "start",
            "Actor": {
                "ID": "4ee1d1c0b1a2",
                "Attributes": {"image": "nginx", "mdns.publish": "test2.local:8080", "name": "web"}
            },
            "scope": "local",
            "time": 1714566615,
            "timeNano": 1714566615000000000
        })";

        const auto message = mdnspub::container::docker::parse_event_message(json);
        REQUIRE(message.has_value());
        REQUIRE(message->type == "container");
        REQUIRE(message->action == "start");
        REQUIRE(message->actor_id == "4ee1d1c0b1a2");

        const auto event = message->to_container_event();
        REQUIRE(event.has_value());
        REQUIRE(event->type == mdnspub::container::EventType::start);
        REQUIRE(event->id == "4ee1d1c0b1a2");
        REQUIRE(event->labels.has_value());
        REQUIRE(event->labels->at("mdns.publish") == "test2.local:8080");
    }

    SECTION("Die, stop and destroy") {
        for (const auto* action : {"die", "stop", "destroy"}) {
            const auto json = fmt::format(R"({{"Type":"container","Action":"{}","Actor":{{"ID":"abc"}}}})", action);
            const auto message = mdnspub::container::docker::parse_event_message(json);
            REQUIRE(message.has_value());
            const auto event = message->to_container_event();
            REQUIRE(event.has_value());
            REQUIRE(mdnspub::container::to_string(event->type) == std::string(action));
            REQUIRE_FALSE(event->labels.has_value());
        }
    }

    SECTION("Older messages without Action and Actor") {
        const auto message =
            mdnspub::container::docker::parse_event_message(R"({"Type":"container","status":"die","id":"abc"})");
        REQUIRE(message.has_value());
        REQUIRE(message->to_container_event()->type == mdnspub::container::EventType::die);
        REQUIRE(message->to_container_event()->id == "abc");
    }

    SECTION("Events which are not handled") {
        const auto exec = mdnspub::container::docker::parse_event_message(
            R"({"Type":"container","Action":"exec_start: sh","Actor":{"ID":"abc"}})"
        );
        REQUIRE(exec.has_value());
        REQUIRE_FALSE(exec->to_container_event().has_value());

        const auto network = mdnspub::container::docker::parse_event_message(
            R"({"Type":"network","Action":"destroy","Actor":{"ID":"abc"}})"
        );
        REQUIRE(network.has_value());
        REQUIRE_FALSE(network->to_container_event().has_value());
    }

    SECTION("Malformed messages") {
        REQUIRE_FALSE(mdnspub::container::docker::parse_event_message("{\"Type\":").has_value());
        REQUIRE_FALSE(mdnspub::container::docker::parse_event_message("[1, 2]").has_value());
    }
}

TEST_CASE("mdnspub::container::docker | Container list") {
    SECTION("Ids and labels") {
        constexpr auto json = R"([
            {"Id": "aaa", "Names": ["/web"], "Labels": {"mdns.publish": "web.local"}, "State": "running"},
            {"Id": "bbb", "Labels": null},
            {"Id": "ccc"}
        ])";

        const auto containers = mdnspub::container::docker::parse_container_list(json);
        REQUIRE(containers.has_value());
        REQUIRE(containers->size() == 3);
        REQUIRE((*containers)[0].id == "aaa");
        REQUIRE((*containers)[0].labels.at("mdns.publish") == "web.local");
        REQUIRE((*containers)[1].labels.empty());
        REQUIRE((*containers)[2].labels.empty());
    }

    SECTION("Empty list") {
        const auto containers = mdnspub::container::docker::parse_container_list("[]");
        REQUIRE(containers.has_value());
        REQUIRE(containers->empty());
    }

    SECTION("Container without id") {
        REQUIRE_FALSE(mdnspub::container::docker::parse_container_list(R"([{"Labels": {}}])").has_value());
    }

    SECTION("Not a list") {
        REQUIRE_FALSE(mdnspub::container::docker::parse_container_list(R"({"message": "error"})").has_value());
    }
}

TEST_CASE("mdnspub::container::docker | Filters") {
    SECTION("Single filter") {
        const auto json = mdnspub::container::docker::filters_json({{"label", {"mdns.publish"}}});
        REQUIRE(json == R"({"label":["mdns.publish"]})");
    }

    SECTION("Filters keep their order and values") {
        const auto json =
            mdnspub::container::docker::filters_json({{"type", {"container"}}, {"event", {"start", "die"}}});
        REQUIRE(json == R"({"type":["container"],"event":["start","die"]})");
    }
}
