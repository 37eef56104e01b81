/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnspub/dnssd/mock/mock_responder.hpp"

#include <catch2/catch_all.hpp>

TEST_CASE("mdnspub::dnssd::MockResponder") {
    boost::asio::io_context io_context;
    mdnspub::dnssd::MockResponder responder(io_context);

    mdnspub::dnssd::ServiceRecord record;
    record.instance_name = "test2";
    record.service_type = "_http._tcp";
    record.target_host = "test2.local";
    record.port = 80;

    std::vector<mdnspub::dnssd::Responder::Result> results;
    auto handler = [&](mdnspub::dnssd::Responder::Result result) {
        results.push_back(std::move(result));
    };

    SECTION("Completions are posted") {
        responder.register_record(record, handler);
        REQUIRE(results.empty());
        REQUIRE(responder.get_registered().empty());

        io_context.run();
        REQUIRE(results.size() == 1);
        REQUIRE(results[0].has_value());
        REQUIRE(responder.get_registered().count(record.key()) == 1);
    }

    SECTION("Unregistering an unknown record succeeds") {
        responder.unregister_record("unknown", "_http._tcp", handler);
        io_context.run();
        REQUIRE(results.size() == 1);
        REQUIRE(results[0].has_value());
    }

    SECTION("Update requires a registered record") {
        responder.update_record(record, handler);
        io_context.run();
        REQUIRE(results.size() == 1);
        REQUIRE_FALSE(results[0].has_value());

        responder.register_record(record, handler);
        record.txt = {{"a", "1"}};
        responder.update_record(record, handler);
        io_context.restart();
        io_context.run();

        REQUIRE(results.size() == 3);
        REQUIRE(results[2].has_value());
        REQUIRE(responder.get_registered().at(record.key()).txt.size() == 1);
        REQUIRE(responder.count_calls(mdnspub::dnssd::MockResponder::Call::Type::update_record) == 2);
    }

    SECTION("Mocked failure") {
        responder.mock_failure(record.key(), {mdnspub::dnssd::ResponderError::Kind::unavailable, "Daemon down"});
        responder.register_record(record, handler);
        io_context.run();

        REQUIRE(results.size() == 1);
        REQUIRE(results[0].error().kind == mdnspub::dnssd::ResponderError::Kind::unavailable);
        REQUIRE(results[0].error().to_string() == "unavailable: Daemon down");
        REQUIRE(responder.get_registered().empty());
    }

    SECTION("Mocked hanging call never completes") {
        responder.mock_hanging("test2");
        responder.register_record(record, handler);
        io_context.run();
        REQUIRE(results.empty());
        REQUIRE(responder.get_calls().size() == 1);
    }

    SECTION("Mocked delayed registration") {
        responder.mock_delayed("test2", std::chrono::milliseconds(20));
        responder.register_record(record, handler);
        io_context.poll();
        REQUIRE(results.empty());

        io_context.restart();
        io_context.run();
        REQUIRE(results.size() == 1);
        REQUIRE(results[0].has_value());
        REQUIRE(responder.get_registered().count(record.key()) == 1);
    }

    SECTION("Unregistering withdraws a delayed registration") {
        responder.mock_delayed("test2", std::chrono::milliseconds(20));
        responder.register_record(record, handler);
        responder.unregister_record(record.instance_name, record.service_type, handler);
        io_context.run();

        REQUIRE(results.size() == 2);
        REQUIRE_FALSE(results[0].has_value());
        REQUIRE(results[1].has_value());
        REQUIRE(responder.get_registered().empty());
    }

    SECTION("Mocked name conflict") {
        std::vector<mdnspub::dnssd::Responder::NameConflict> conflicts;
        responder.on<mdnspub::dnssd::Responder::NameConflict>([&](const auto& event) {
            conflicts.push_back(event);
        });

        responder.register_record(record, handler);
        responder.mock_name_conflict(record.key());
        io_context.run();

        REQUIRE(conflicts.size() == 1);
        REQUIRE(conflicts[0].instance_name == "test2");
        REQUIRE(responder.get_registered().empty());
    }
}
