/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnspub/dnssd/txt_rdata.hpp"

#include <catch2/catch_all.hpp>

TEST_CASE("mdnspub::dnssd::TxtRdata") {
    SECTION("Encode keeps duplicates in order") {
        const auto rdata = mdnspub::dnssd::TxtRdata::encode({{"a", "1"}, {"b", ""}, {"a", "2"}});
        REQUIRE(rdata.has_value());

        const std::vector<uint8_t> expected {3, 'a', '=', '1', 2, 'b', '=', 3, 'a', '=', '2'};
        REQUIRE(rdata->bytes() == expected);
        REQUIRE(rdata->length() == expected.size());
    }

    SECTION("Empty record is a single empty string") {
        const auto rdata = mdnspub::dnssd::TxtRdata::encode({});
        REQUIRE(rdata.has_value());
        REQUIRE(rdata->bytes() == std::vector<uint8_t> {0});
    }

    SECTION("Entry of 255 bytes fits, 256 does not") {
        REQUIRE(mdnspub::dnssd::TxtRdata::encode({{"k", std::string(253, 'x')}}).has_value());
        REQUIRE_FALSE(mdnspub::dnssd::TxtRdata::encode({{"k", std::string(254, 'x')}}).has_value());
    }

    SECTION("Record larger than 65535 bytes is rejected") {
        const mdnspub::dnssd::TxtRecord txt(300, {"key", std::string(250, 'v')});
        REQUIRE_FALSE(mdnspub::dnssd::TxtRdata::encode(txt).has_value());
    }
}
