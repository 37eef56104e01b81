/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnspub/core/net/interfaces/adapter_selector.hpp"

#include <catch2/catch_all.hpp>

namespace {

boost::asio::ip::address addr(const char* str) {
    return boost::asio::ip::make_address(str);
}

std::vector<mdnspub::NetworkInterface> test_adapters() {
    using Type = mdnspub::NetworkInterface::Type;
    return {
        {"lo", {addr("127.0.0.1"), addr("::1")}, Type::loopback, 1},
        {"eth0", {addr("192.168.1.10"), addr("fe80::1")}, Type::other, 2},
        {"docker0", {addr("172.17.0.1")}, Type::other, 3},
        {"wlan0", {addr("10.0.0.5"), addr("10.1.0.5")}, Type::other, 4},
    };
}

}  // namespace

TEST_CASE("mdnspub::AdapterSelector") {
    const auto adapters = test_adapters();

    SECTION("All adapters, skipping loopback and IPv6") {
        const auto bindings = mdnspub::AdapterSelector::select({}, {}, adapters);
        REQUIRE(bindings.size() == 4);
        REQUIRE(bindings[0] == mdnspub::AdapterBinding {"eth0", 2, boost::asio::ip::make_address_v4("192.168.1.10")});
        REQUIRE(bindings[1].identifier == "docker0");
        REQUIRE(bindings[2].address.to_string() == "10.0.0.5");
        REQUIRE(bindings[3].address.to_string() == "10.1.0.5");
    }

    SECTION("Excluded networks") {
        const auto excluded = mdnspub::AdapterSelector::parse_networks({"172.16.0.0/12", "10.1.0.0/16"});
        REQUIRE(excluded.has_value());

        const auto bindings = mdnspub::AdapterSelector::select({}, *excluded, adapters);
        REQUIRE(bindings.size() == 2);
        REQUIRE(bindings[0].identifier == "eth0");
        REQUIRE(bindings[1].address.to_string() == "10.0.0.5");
    }

    SECTION("Configured adapters") {
        const auto bindings = mdnspub::AdapterSelector::select({"wlan0", "missing", "lo"}, {}, adapters);
        REQUIRE(bindings.size() == 2);
        REQUIRE(bindings[0].identifier == "wlan0");
        REQUIRE(bindings[0].interface_index == 4);
        REQUIRE(bindings[1].identifier == "wlan0");
    }

    SECTION("Configured adapters honour excluded networks") {
        const auto excluded = mdnspub::AdapterSelector::parse_networks({"10.0.0.0/8"});
        REQUIRE(excluded.has_value());
        REQUIRE(mdnspub::AdapterSelector::select({"wlan0"}, *excluded, adapters).empty());
    }

    SECTION("Unknown interface index binds to index 0") {
        const std::vector<mdnspub::NetworkInterface> unindexed {
            {"eth1", {addr("192.168.2.1")}, mdnspub::NetworkInterface::Type::other},
        };
        const auto bindings = mdnspub::AdapterSelector::select({}, {}, unindexed);
        REQUIRE(bindings.size() == 1);
        REQUIRE(bindings[0].interface_index == 0);
    }

    SECTION("Malformed network fails parsing") {
        const auto result = mdnspub::AdapterSelector::parse_networks({"172.16.0.0/12", "nonsense"});
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().find("nonsense") != std::string::npos);
    }
}
