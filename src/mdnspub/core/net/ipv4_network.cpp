/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnspub/core/net/ipv4_network.hpp"

#include "mdnspub/core/assert.hpp"
#include "mdnspub/core/string.hpp"

#include <fmt/format.h>

mdnspub::Ipv4Network::Ipv4Network(const boost::asio::ip::address_v4 address, const uint8_t prefix_length) :
    prefix_length_(prefix_length) {
    MDNSPUB_ASSERT(prefix_length <= 32, "Prefix length must be in the range [0, 32]");
    if (prefix_length_ > 32) {
        prefix_length_ = 32;
    }
    network_ = boost::asio::ip::address_v4(address.to_uint() & mask());
}

tl::expected<mdnspub::Ipv4Network, std::string> mdnspub::Ipv4Network::parse(const std::string_view cidr) {
    const auto trimmed = string_trim(cidr);
    if (trimmed.empty()) {
        return tl::unexpected(std::string("empty network"));
    }

    const auto slash = trimmed.find('/');
    const auto address_part = trimmed.substr(0, slash);

    boost::system::error_code ec;
    const auto address = boost::asio::ip::make_address_v4(std::string(address_part), ec);
    if (ec) {
        return tl::unexpected(fmt::format("invalid address '{}' in network '{}'", address_part, trimmed));
    }

    uint8_t prefix_length = 32;
    if (slash != std::string_view::npos) {
        const auto prefix_part = trimmed.substr(slash + 1);
        const auto prefix = string_to_int<int>(prefix_part, true);
        if (prefix_part.empty() || !prefix || *prefix < 0 || *prefix > 32) {
            return tl::unexpected(fmt::format("invalid prefix length '{}' in network '{}'", prefix_part, trimmed));
        }
        prefix_length = static_cast<uint8_t>(*prefix);
    }

    return Ipv4Network(address, prefix_length);
}

bool mdnspub::Ipv4Network::contains(const boost::asio::ip::address_v4& address) const {
    return (address.to_uint() & mask()) == network_.to_uint();
}

std::string mdnspub::Ipv4Network::to_string() const {
    return fmt::format("{}/{}", network_.to_string(), prefix_length_);
}

uint32_t mdnspub::Ipv4Network::mask() const {
    if (prefix_length_ == 0) {
        return 0;
    }
    return ~uint32_t {0} << (32 - prefix_length_);
}
