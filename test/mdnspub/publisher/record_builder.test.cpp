/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnspub/publisher/record_builder.hpp"

#include "mdnspub/publisher/label_parser.hpp"

#include <catch2/catch_all.hpp>

TEST_CASE("mdnspub::RecordBuilder") {
    // 2024-05-01T12:30:15Z
    const auto timestamp = std::chrono::system_clock::time_point(std::chrono::seconds(1714566615));

    SECTION("Labels to record") {
        const mdnspub::LabelParser parser;
        const auto intent = parser.parse({{"mdns.publish", "test2.local:8080"}, {"mdns.txt", "path=/,a=1"}});
        REQUIRE(intent.has_value());
        REQUIRE(intent->has_value());

        mdnspub::ProcessContext context;
        context.ttl_seconds = 120;
        context.container_id = "0123456789abcdef";
        context.timestamp = timestamp;

        const auto record = mdnspub::RecordBuilder::build(**intent, context);
        REQUIRE(record.instance_name == "test2");
        REQUIRE(record.service_type == "_http._tcp");
        REQUIRE(record.target_host == "test2.local");
        REQUIRE(record.port == 8080);
        REQUIRE(record.ttl_seconds == 120);
        REQUIRE(record.txt.size() == 2);
        REQUIRE(record.provenance.empty());
        REQUIRE(record.key() == mdnspub::dnssd::ServiceRecord::Key {"test2", "_http._tcp"});
    }

    SECTION("Debug mode adds provenance") {
        mdnspub::PublicationIntent intent;
        intent.host_label = "foo.sub.local";
        intent.port = 80;
        intent.service_type = "_http._tcp";
        intent.txt_entries = {{"k", "v"}};

        mdnspub::ProcessContext context;
        context.debug = true;
        context.container_id = "0123456789abcdef";
        context.timestamp = timestamp;

        const auto record = mdnspub::RecordBuilder::build(intent, context);
        REQUIRE(record.instance_name == "foo.sub");
        REQUIRE(record.txt.size() == 1);
        REQUIRE(record.provenance.size() == 2);
        REQUIRE(record.provenance[0].to_string() == "registered=2024-05-01T12:30:15Z");
        REQUIRE(record.provenance[1].to_string() == "container=0123456789abcdef");

        const auto wire = record.wire_txt();
        REQUIRE(wire.size() == 3);
        REQUIRE(wire[0].key == "k");
        REQUIRE(wire[2].key == "container");

        SECTION("Provenance does not make a record different") {
            context.debug = false;
            context.timestamp += std::chrono::hours(1);
            REQUIRE(mdnspub::RecordBuilder::build(intent, context) == record);
        }
    }

    SECTION("Names are lower cased") {
        mdnspub::PublicationIntent intent;
        intent.host_label = "Web.Local";
        intent.port = 80;
        intent.service_type = "_HTTP._tcp";

        const auto record = mdnspub::RecordBuilder::build(intent, {});
        REQUIRE(record.target_host == "web.local");
        REQUIRE(record.instance_name == "web");
        REQUIRE(record.service_type == "_http._tcp");

        intent.host_label = "web.local";
        REQUIRE(mdnspub::RecordBuilder::build(intent, {}).key() == record.key());
    }

    SECTION("Instance name") {
        REQUIRE(mdnspub::RecordBuilder::instance_name_for("test2.local", ".local") == "test2");
        REQUIRE(mdnspub::RecordBuilder::instance_name_for("Test2.LOCAL", ".local") == "Test2");
        REQUIRE(mdnspub::RecordBuilder::instance_name_for("a.b.local", ".local") == "a.b");
        REQUIRE(mdnspub::RecordBuilder::instance_name_for("a.home.arpa", ".home.arpa") == "a");
        REQUIRE(mdnspub::RecordBuilder::instance_name_for("other.lan", ".local") == "other.lan");
    }
}
