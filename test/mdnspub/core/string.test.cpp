/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnspub/core/string.hpp"

#include <catch2/catch_all.hpp>

TEST_CASE("string | trim") {
    REQUIRE(mdnspub::string_trim("  test2.local \t") == "test2.local");
    REQUIRE(mdnspub::string_trim("   ").empty());
    REQUIRE(mdnspub::string_trim("").empty());
    REQUIRE(mdnspub::string_trim("a b") == "a b");
}

TEST_CASE("string | ends_with_case_insensitive") {
    REQUIRE(mdnspub::string_ends_with_case_insensitive("test2.LOCAL", ".local"));
    REQUIRE(mdnspub::string_ends_with_case_insensitive(".local", ".local"));
    REQUIRE_FALSE(mdnspub::string_ends_with_case_insensitive("local", ".local"));
    REQUIRE_FALSE(mdnspub::string_ends_with_case_insensitive("test2.lan", ".local"));
}

TEST_CASE("string | to_int") {
    REQUIRE(mdnspub::string_to_int<int>("8080", true) == 8080);
    REQUIRE(mdnspub::string_to_int<int>("80a", false) == 80);
    REQUIRE_FALSE(mdnspub::string_to_int<int>("80a", true).has_value());
    REQUIRE_FALSE(mdnspub::string_to_int<int>("", true).has_value());
    REQUIRE_FALSE(mdnspub::string_to_int<uint16_t>("65536", true).has_value());
}

TEST_CASE("string | to_lower") {
    REQUIRE(mdnspub::string_to_lower("Test2.LOCAL") == "test2.local");
}
