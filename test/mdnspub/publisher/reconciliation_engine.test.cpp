/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnspub/publisher/reconciliation_engine.hpp"

#include "mdnspub/container/mock/mock_event_source.hpp"
#include "mdnspub/dnssd/mock/mock_responder.hpp"

#include <catch2/catch_all.hpp>

namespace {

using CallType = mdnspub::dnssd::MockResponder::Call::Type;

mdnspub::container::Labels publish_labels(const std::string& value) {
    return {{"mdns.publish", value}};
}

mdnspub::ReconciliationEngine::Configuration test_config() {
    mdnspub::ReconciliationEngine::Configuration config;
    config.resync_interval = std::chrono::milliseconds(0);
    config.responder_timeout = std::chrono::milliseconds(100);
    config.shutdown_grace = std::chrono::milliseconds(200);
    return config;
}

const mdnspub::dnssd::ServiceRecord::Key k_test2 {"test2", "_http._tcp"};

}  // namespace

TEST_CASE("mdnspub::ReconciliationEngine") {
    boost::asio::io_context io_context;
    mdnspub::container::MockEventSource source(io_context);
    mdnspub::dnssd::MockResponder responder(io_context);
    mdnspub::PublicationTable table;
    mdnspub::ReconciliationEngine engine(io_context, source, responder, table, test_config());

    std::vector<mdnspub::container::SourceError> source_errors;
    engine.on<mdnspub::container::SourceError>([&](const mdnspub::container::SourceError& error) {
        source_errors.push_back(error);
    });

    SECTION("A started container gets published") {
        engine.start();
        source.mock_started("c1", {{"mdns.publish", "test2.local:8080"}, {"mdns.txt", "path=/,v=1"}});
        io_context.run();

        REQUIRE(source.is_subscribed());
        REQUIRE(responder.count_calls(CallType::register_record) == 1);
        REQUIRE(responder.get_registered().size() == 1);

        const auto& record = responder.get_registered().at(k_test2);
        REQUIRE(record.instance_name == "test2");
        REQUIRE(record.target_host == "test2.local");
        REQUIRE(record.port == 8080);
        REQUIRE(record.ttl_seconds == 3600);
        REQUIRE(record.txt.size() == 2);
        REQUIRE(record.txt[1].to_string() == "v=1");

        const auto* state = table.get("c1");
        REQUIRE(state != nullptr);
        REQUIRE(state->phase == mdnspub::PublicationState::Phase::published);
        REQUIRE(engine.is_idle());
        REQUIRE(source_errors.empty());
    }

    SECTION("Containers without publish label or with malformed labels are ignored") {
        engine.start();
        source.mock_started("c1", {{"other", "label"}});
        source.mock_started("c2", publish_labels("test2.example.com"));
        source.mock_started("c3", publish_labels("test3.local:http"));
        source.mock_started("c4", {{"mdns.publish", "test4.local"}, {"mdns.txt", "novalue"}});
        io_context.run();

        REQUIRE(responder.get_calls().empty());
        REQUIRE(table.empty());
    }

    SECTION("Repeated starts with identical labels register once") {
        engine.start();
        source.mock_started("c1", publish_labels("test2.local"));
        source.mock_started("c1", publish_labels("test2.local"));
        io_context.run();

        source.mock_event({mdnspub::container::EventType::start, "c1", publish_labels("test2.local")});
        io_context.restart();
        io_context.run();

        REQUIRE(responder.count_calls(CallType::register_record) == 1);
        REQUIRE(table.size() == 1);
    }

    SECTION("Startup resync runs before live events") {
        source.mock_running({{"c1", publish_labels("first.local")}});
        engine.start();
        source.mock_event({mdnspub::container::EventType::start, "c2", publish_labels("second.local")});
        io_context.run();

        REQUIRE(source.get_list_count() == 1);
        REQUIRE(responder.get_calls().size() == 2);
        REQUIRE(responder.get_calls()[0].key.first == "first");
        REQUIRE(responder.get_calls()[1].key.first == "second");
        REQUIRE(table.size() == 2);
    }

    SECTION("Startup list failure is reported as source error") {
        source.mock_list_failure({"Connection refused"});
        engine.start();
        io_context.run();

        REQUIRE(source_errors.size() == 1);
        REQUIRE(source_errors[0].message == "Connection refused");
    }

    SECTION("Event stream failure is reported as source error") {
        engine.start();
        source.mock_error({"Event stream ended"});
        io_context.run();

        REQUIRE(source_errors.size() == 1);
        REQUIRE(source_errors[0].message == "Event stream ended");
    }

    SECTION("Stop unpublishes and a following start publishes again") {
        engine.start();
        source.mock_started("c1", publish_labels("test2.local"));
        source.mock_stopped("c1");
        source.mock_started("c1", publish_labels("test2.local"));
        io_context.run();

        const auto& calls = responder.get_calls();
        REQUIRE(calls.size() == 3);
        REQUIRE(calls[0].type == CallType::register_record);
        REQUIRE(calls[1].type == CallType::unregister_record);
        REQUIRE(calls[2].type == CallType::register_record);
        REQUIRE(responder.get_registered().count(k_test2) == 1);
        REQUIRE(table.get("c1")->phase == mdnspub::PublicationState::Phase::published);
    }

    SECTION("Die and destroy unpublish as well") {
        engine.start();
        source.mock_started("c1", publish_labels("one.local"));
        source.mock_started("c2", publish_labels("two.local"));
        source.mock_event({mdnspub::container::EventType::die, "c1", std::nullopt});
        source.mock_event({mdnspub::container::EventType::destroy, "c2", std::nullopt});
        source.mock_event({mdnspub::container::EventType::destroy, "c3", std::nullopt});
        io_context.run();

        REQUIRE(responder.count_calls(CallType::unregister_record) == 2);
        REQUIRE(responder.get_registered().empty());
        REQUIRE(table.empty());
    }

    SECTION("A changed record is unregistered before the new one is registered") {
        engine.start();
        source.mock_started("c1", publish_labels("test2.local"));
        source.mock_event({mdnspub::container::EventType::start, "c1", publish_labels("test2.local:8080")});
        io_context.run();

        const auto& calls = responder.get_calls();
        REQUIRE(calls.size() == 3);
        REQUIRE(calls[1].type == CallType::unregister_record);
        REQUIRE(calls[2].type == CallType::register_record);
        REQUIRE(calls[2].record.port == 8080);
        REQUIRE(responder.get_registered().at(k_test2).port == 8080);
        REQUIRE(table.get("c1")->record->port == 8080);
    }

    SECTION("The first container to claim a name keeps it") {
        engine.start();
        source.mock_started("c1", publish_labels("test2.local"));
        source.mock_started("c2", publish_labels("test2.local"));
        io_context.run();

        REQUIRE(responder.count_calls(CallType::register_record) == 1);
        REQUIRE(table.size() == 1);
        REQUIRE(table.get("c1") != nullptr);
        REQUIRE(table.get("c2") == nullptr);

        SECTION("Names differing only in case conflict") {
            source.mock_started("c3", publish_labels("TEST2.Local"));
            io_context.restart();
            io_context.run();

            REQUIRE(responder.count_calls(CallType::register_record) == 1);
            REQUIRE(table.size() == 1);
            REQUIRE(table.get("c3") == nullptr);
        }

        SECTION("The same name with another service type is no conflict") {
            source.mock_started(
                "c3", {{"mdns.publish", "test2.local:1883"}, {"mdns.servicetype", "_mqtt._tcp"}}
            );
            io_context.restart();
            io_context.run();

            REQUIRE(table.size() == 2);
            REQUIRE(responder.get_registered().size() == 2);
        }

        SECTION("The name is free again once the holder stops") {
            source.mock_stopped("c1");
            io_context.restart();
            io_context.run();
            REQUIRE(table.empty());

            engine.request_resync();
            io_context.restart();
            io_context.run();

            REQUIRE(table.get("c2") != nullptr);
            REQUIRE(table.get("c2")->phase == mdnspub::PublicationState::Phase::published);
        }
    }

    SECTION("A failed registration leaves the container unpublished until the next resync") {
        responder.mock_failure(k_test2, {mdnspub::dnssd::ResponderError::Kind::failed, "Bad"});
        source.mock_running({{"c1", publish_labels("test2.local")}});
        engine.start();
        io_context.run();

        REQUIRE(responder.count_calls(CallType::register_record) == 1);
        REQUIRE(table.empty());
        REQUIRE(engine.is_idle());

        responder.mock_success(k_test2);
        engine.request_resync();
        io_context.restart();
        io_context.run();

        REQUIRE(responder.count_calls(CallType::register_record) == 2);
        REQUIRE(table.get("c1")->phase == mdnspub::PublicationState::Phase::published);
    }

    SECTION("A responder call which never completes times out and does not block the queue") {
        responder.mock_hanging("slow");
        engine.start();
        source.mock_started("c1", publish_labels("slow.local"));
        source.mock_started("c2", publish_labels("test2.local"));
        io_context.run();

        REQUIRE(table.get("c1") == nullptr);
        REQUIRE(table.get("c2") != nullptr);
        REQUIRE(responder.get_registered().count(k_test2) == 1);
    }

    SECTION("A registration completing after its timeout is withdrawn") {
        responder.mock_delayed("test2", std::chrono::milliseconds(300));
        engine.start();
        source.mock_started("c1", publish_labels("test2.local"));
        io_context.run();

        REQUIRE(table.empty());
        REQUIRE(responder.count_calls(CallType::register_record) == 1);
        REQUIRE(responder.count_calls(CallType::unregister_record) == 1);
        REQUIRE(responder.get_registered().empty());

        source.mock_stopped("c1");
        io_context.restart();
        io_context.run();

        REQUIRE(responder.get_registered().empty());
        REQUIRE(engine.is_idle());
    }

    SECTION("Startup resync waits for the subscription") {
        source.mock_hold_subscription();
        engine.start();
        io_context.run();

        REQUIRE(source.is_subscribed());
        REQUIRE(source.get_list_count() == 0);

        // Started while the subscription was being set up, no event is delivered for it.
        source.mock_running({{"c1", publish_labels("test2.local")}});
        source.mock_subscription_accepted();
        io_context.restart();
        io_context.run();

        REQUIRE(source.get_list_count() == 1);
        REQUIRE(responder.get_registered().count(k_test2) == 1);
        REQUIRE(table.get("c1")->phase == mdnspub::PublicationState::Phase::published);
    }

    SECTION("Periodic resync unpublishes containers which disappeared") {
        engine.start();
        source.mock_started("c1", publish_labels("one.local"));
        source.mock_started("c2", publish_labels("two.local"));
        io_context.run();
        REQUIRE(table.size() == 2);

        // c1 died without an event.
        source.mock_running({{"c2", publish_labels("two.local")}});
        engine.request_resync();
        engine.request_resync();
        io_context.restart();
        io_context.run();

        REQUIRE(source.get_list_count() == 2);
        REQUIRE(table.size() == 1);
        REQUIRE(table.get("c2") != nullptr);
        REQUIRE(responder.count_calls(CallType::unregister_record) == 1);
        REQUIRE(responder.count_calls(CallType::register_record) == 2);
    }

    SECTION("A failing periodic resync is skipped") {
        engine.start();
        source.mock_started("c1", publish_labels("one.local"));
        io_context.run();

        source.mock_list_failure({"Timeout"});
        engine.request_resync();
        io_context.restart();
        io_context.run();

        REQUIRE(source_errors.empty());
        REQUIRE(table.size() == 1);
        REQUIRE(engine.is_idle());
    }

    SECTION("A name conflict on the wire unpublishes the record") {
        engine.start();
        source.mock_started("c1", publish_labels("test2.local"));
        io_context.run();
        REQUIRE(table.size() == 1);

        responder.mock_name_conflict(k_test2);
        io_context.restart();
        io_context.run();

        REQUIRE(table.empty());
        REQUIRE(responder.count_calls(CallType::unregister_record) == 1);
    }

    SECTION("Shutdown unregisters everything and empties the table") {
        engine.start();
        source.mock_started("c1", publish_labels("one.local"));
        source.mock_started("c2", publish_labels("two.local"));
        io_context.run();
        REQUIRE(responder.get_registered().size() == 2);

        bool shut_down = false;
        engine.async_shutdown([&] {
            shut_down = true;
        });
        io_context.restart();
        io_context.run();

        REQUIRE(shut_down);
        REQUIRE(engine.is_shut_down());
        REQUIRE(source.is_cancelled());
        REQUIRE(responder.get_registered().empty());
        REQUIRE(responder.count_calls(CallType::unregister_record) == 2);
        REQUIRE(table.empty());

        SECTION("Events after shutdown are ignored") {
            source.mock_started("c3", publish_labels("three.local"));
            engine.request_resync();
            io_context.restart();
            io_context.run();
            REQUIRE(responder.count_calls(CallType::register_record) == 2);
        }
    }

    SECTION("Shutdown before start completes immediately") {
        bool shut_down = false;
        engine.async_shutdown([&] {
            shut_down = true;
        });
        io_context.run();
        REQUIRE(shut_down);
        REQUIRE(engine.is_shut_down());
    }
}

TEST_CASE("mdnspub::ReconciliationEngine | Shutdown completes within the grace period") {
    boost::asio::io_context io_context;
    mdnspub::container::MockEventSource source(io_context);
    mdnspub::dnssd::MockResponder responder(io_context);
    mdnspub::PublicationTable table;

    auto config = test_config();
    config.responder_timeout = std::chrono::milliseconds(2000);
    config.shutdown_grace = std::chrono::milliseconds(100);
    mdnspub::ReconciliationEngine engine(io_context, source, responder, table, config);

    responder.mock_hanging("slow");
    engine.start();
    source.mock_started("c1", publish_labels("fast.local"));
    source.mock_started("c2", publish_labels("slow.local"));

    // Run until the registration of slow.local hangs.
    while (io_context.poll() > 0) {}
    REQUIRE(!engine.is_idle());
    REQUIRE(table.get("c2") != nullptr);
    REQUIRE(table.get("c2")->phase == mdnspub::PublicationState::Phase::publishing);

    const auto start = std::chrono::steady_clock::now();
    std::optional<std::chrono::steady_clock::duration> elapsed;
    engine.async_shutdown([&] {
        elapsed = std::chrono::steady_clock::now() - start;
    });

    io_context.restart();
    io_context.run();

    REQUIRE(elapsed.has_value());
    REQUIRE(*elapsed < std::chrono::milliseconds(1500));
    REQUIRE(engine.is_shut_down());
    REQUIRE(table.empty());
    REQUIRE(responder.get_registered().count({"fast", "_http._tcp"}) == 0);
}
