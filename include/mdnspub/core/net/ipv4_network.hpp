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

#include "mdnspub/core/expected.hpp"

#include <boost/asio/ip/address_v4.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace mdnspub {

/**
 * An IPv4 network in CIDR notation (e.g. 172.17.0.0/16).
 */
class Ipv4Network {
  public:
    Ipv4Network() = default;

    /**
     * Constructs a network from an address and a prefix length. Host bits of the address are cleared.
     * @param address Any address inside the network.
     * @param prefix_length The number of network bits, [0, 32].
     */
    Ipv4Network(boost::asio::ip::address_v4 address, uint8_t prefix_length);

    /**
     * Parses a network in CIDR notation. A bare address is accepted as a /32 network. Like Python's ipaddress module
     * in non-strict mode, host bits are allowed and cleared.
     * @param cidr The string to parse.
     * @return The network, or a message describing why the string is invalid.
     */
    static tl::expected<Ipv4Network, std::string> parse(std::string_view cidr);

    /**
     * @return The network address (with host bits cleared).
     */
    [[nodiscard]] boost::asio::ip::address_v4 network_address() const {
        return network_;
    }

    [[nodiscard]] uint8_t prefix_length() const {
        return prefix_length_;
    }

    /**
     * @param address The address to test.
     * @return True if the address lies inside this network.
     */
    [[nodiscard]] bool contains(const boost::asio::ip::address_v4& address) const;

    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const Ipv4Network& lhs, const Ipv4Network& rhs) {
        return lhs.network_ == rhs.network_ && lhs.prefix_length_ == rhs.prefix_length_;
    }

    friend bool operator!=(const Ipv4Network& lhs, const Ipv4Network& rhs) {
        return !(lhs == rhs);
    }

  private:
    boost::asio::ip::address_v4 network_ {};
    uint8_t prefix_length_ {0};

    [[nodiscard]] uint32_t mask() const;
};

}  // namespace mdnspub
