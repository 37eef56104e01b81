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

#include <catch2/catch_all.hpp>

TEST_CASE("mdnspub::container::MockEventSource") {
    boost::asio::io_context io_context;
    mdnspub::container::MockEventSource source(io_context);

    std::vector<mdnspub::container::ContainerEvent> events;
    std::vector<mdnspub::container::SourceError> errors;
    size_t subscribed = 0;
    auto subscribe = [&] {
        source.subscribe(
            [&](const mdnspub::container::ContainerEvent& event) {
                events.push_back(event);
            },
            [&](const mdnspub::container::SourceError& error) {
                errors.push_back(error);
            },
            [&] {
                ++subscribed;
            }
        );
    };

    SECTION("Started and stopped containers") {
        subscribe();
        source.mock_started("c1", {{"mdns.publish", "test2.local"}});
        source.mock_started("c2", {});
        source.mock_stopped("c1");
        io_context.run();

        REQUIRE(events.size() == 3);
        REQUIRE(events[0].type == mdnspub::container::EventType::start);
        REQUIRE(events[0].labels->at("mdns.publish") == "test2.local");
        REQUIRE(events[2].type == mdnspub::container::EventType::stop);
        REQUIRE_FALSE(events[2].labels.has_value());

        std::vector<mdnspub::container::ContainerInfo> running;
        source.async_list_running([&](auto result) {
            REQUIRE(result.has_value());
            running = *result;
        });
        io_context.restart();
        io_context.run();

        REQUIRE(running.size() == 1);
        REQUIRE(running[0].id == "c2");
        REQUIRE(source.get_list_count() == 1);
    }

    SECTION("List failure applies to the next list only") {
        source.mock_running({{"c1", {}}});
        source.mock_list_failure({"Boom"});

        std::vector<bool> outcomes;
        source.async_list_running([&](auto result) {
            outcomes.push_back(result.has_value());
        });
        source.async_list_running([&](auto result) {
            outcomes.push_back(result.has_value());
        });
        io_context.run();

        REQUIRE(outcomes == std::vector<bool> {false, true});
    }

    SECTION("Subscriptions are acknowledged") {
        subscribe();
        io_context.run();
        REQUIRE(subscribed == 1);
    }

    SECTION("A held subscription is acknowledged when accepted") {
        source.mock_hold_subscription();
        subscribe();
        io_context.run();
        REQUIRE(subscribed == 0);

        source.mock_subscription_accepted();
        io_context.restart();
        io_context.run();
        REQUIRE(subscribed == 1);
    }

    SECTION("Errors end the subscription") {
        subscribe();
        source.mock_error({"Gone"});
        source.mock_started("c1", {});
        io_context.run();

        REQUIRE(errors.size() == 1);
        REQUIRE(events.empty());
        REQUIRE_FALSE(source.is_subscribed());
    }

    SECTION("Subscribing twice throws") {
        subscribe();
        REQUIRE_THROWS(subscribe());
    }

    SECTION("Cancel suppresses handlers") {
        subscribe();
        source.mock_started("c1", {});
        source.async_list_running([&](auto) {
            FAIL("List handler called after cancel");
        });
        source.cancel();
        io_context.run();

        REQUIRE(events.empty());
        REQUIRE(subscribed == 0);
        REQUIRE(source.is_cancelled());
    }
}
