/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#pragma once

#include "network_interface.hpp"
#include "mdnspub/core/net/ipv4_network.hpp"

#include <boost/asio/ip/address_v4.hpp>

#include <cstdint>
#include <string>
#include <tuple>
#include <vector>

namespace mdnspub {

/**
 * An IPv4 address on a network interface which records are published on.
 */
struct AdapterBinding {
    NetworkInterface::Identifier identifier;
    uint32_t interface_index {};
    boost::asio::ip::address_v4 address;

    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const AdapterBinding& lhs, const AdapterBinding& rhs) {
        return std::tie(lhs.identifier, lhs.interface_index, lhs.address)
            == std::tie(rhs.identifier, rhs.interface_index, rhs.address);
    }

    friend bool operator!=(const AdapterBinding& lhs, const AdapterBinding& rhs) {
        return !(lhs == rhs);
    }
};

/**
 * Resolves which adapters and addresses records are published on. The selection is made once at startup, adapters
 * which appear later are not picked up.
 */
class AdapterSelector {
  public:
    /**
     * Selects the bindings to publish on.
     *
     * When configured is not empty only the named adapters are used, names which don't exist are logged and skipped.
     * Otherwise all adapters are considered. In both cases loopback adapters, non IPv4 addresses and addresses inside
     * any of the excluded networks are left out.
     *
     * @param configured The adapter names to use, or empty to use all adapters.
     * @param excluded_nets Networks whose addresses are never used.
     * @param all_adapters The adapters present on the system.
     * @return The bindings, in adapter order.
     */
    static std::vector<AdapterBinding> select(
        const std::vector<std::string>& configured, const std::vector<Ipv4Network>& excluded_nets,
        const std::vector<NetworkInterface>& all_adapters
    );

    /**
     * Parses a list of networks in CIDR notation.
     * @param cidrs The networks to parse.
     * @return The parsed networks, or the message of the first one which failed to parse.
     */
    static tl::expected<std::vector<Ipv4Network>, std::string> parse_networks(const std::vector<std::string>& cidrs);
};

}  // namespace mdnspub
