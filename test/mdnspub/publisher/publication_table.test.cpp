/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnspub/publisher/publication_table.hpp"

#include <catch2/catch_all.hpp>

namespace {

mdnspub::dnssd::ServiceRecord make_record(const std::string& instance_name, const uint16_t port = 80) {
    mdnspub::dnssd::ServiceRecord record;
    record.instance_name = instance_name;
    record.service_type = "_http._tcp";
    record.target_host = instance_name + ".local";
    record.port = port;
    record.ttl_seconds = 3600;
    return record;
}

}  // namespace

TEST_CASE("mdnspub::PublicationTable") {
    mdnspub::PublicationTable table;
    const auto record = make_record("test2");

    SECTION("Absent entries are unpublished") {
        REQUIRE(table.get("c1") == nullptr);
        REQUIRE(table.empty());
        REQUIRE_FALSE(table.remove("c1"));
    }

    SECTION("Put, get and remove") {
        REQUIRE(table.put("c1", mdnspub::PublicationState::published(record)));
        REQUIRE(table.size() == 1);
        REQUIRE(table.get("c1")->phase == mdnspub::PublicationState::Phase::published);
        REQUIRE(table.get("c1")->record == record);

        REQUIRE(table.put("c1", mdnspub::PublicationState::unpublished()));
        REQUIRE(table.empty());

        REQUIRE(table.put("c1", mdnspub::PublicationState::publishing(record)));
        REQUIRE(table.remove("c1"));
        REQUIRE(table.empty());
    }

    SECTION("Compare and transition") {
        REQUIRE(table.compare_and_transition(
            "c1", mdnspub::PublicationState::unpublished(), mdnspub::PublicationState::publishing(record)
        ));
        REQUIRE_FALSE(table.compare_and_transition(
            "c1", mdnspub::PublicationState::unpublished(), mdnspub::PublicationState::publishing(record)
        ));

        // Same phase, different record.
        REQUIRE_FALSE(table.compare_and_transition(
            "c1", mdnspub::PublicationState::publishing(make_record("test2", 8080)),
            mdnspub::PublicationState::published(record)
        ));
        REQUIRE(table.get("c1")->phase == mdnspub::PublicationState::Phase::publishing);

        REQUIRE(table.compare_and_transition(
            "c1", mdnspub::PublicationState::publishing(record), mdnspub::PublicationState::published(record)
        ));
        REQUIRE(table.get("c1")->phase == mdnspub::PublicationState::Phase::published);

        REQUIRE(table.compare_and_transition(
            "c1", mdnspub::PublicationState::published(record), mdnspub::PublicationState::unpublished()
        ));
        REQUIRE(table.get("c1") == nullptr);
    }

    SECTION("A key is claimed by one container only") {
        REQUIRE(table.put("c1", mdnspub::PublicationState::publishing(record)));
        REQUIRE(table.find_claim(record.key()) == "c1");
        REQUIRE_FALSE(table.find_claim(record.key(), "c1").has_value());

        REQUIRE_FALSE(table.put("c2", mdnspub::PublicationState::publishing(make_record("test2", 8080))));
        REQUIRE_FALSE(table.put("c2", mdnspub::PublicationState::published(record)));
        REQUIRE(table.size() == 1);

        // The holder itself may change its state.
        REQUIRE(table.put("c1", mdnspub::PublicationState::published(record)));

        // Unpublishing entries do not claim.
        REQUIRE(table.put("c1", mdnspub::PublicationState::unpublishing(record)));
        REQUIRE_FALSE(table.find_claim(record.key()).has_value());
        REQUIRE(table.put("c2", mdnspub::PublicationState::publishing(record)));
        REQUIRE(table.find_claim(record.key()) == "c2");
    }

    SECTION("Clear") {
        REQUIRE(table.put("c1", mdnspub::PublicationState::published(make_record("one"))));
        REQUIRE(table.put("c2", mdnspub::PublicationState::published(make_record("two"))));
        REQUIRE(table.all_entries().size() == 2);
        table.clear();
        REQUIRE(table.empty());
    }
}
