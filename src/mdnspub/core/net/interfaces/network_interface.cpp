/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnspub/core/net/interfaces/network_interface.hpp"

#include "mdnspub/core/log.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iterator>
#include <memory>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/socket.h>

std::vector<boost::asio::ip::address_v4> mdnspub::NetworkInterface::get_ipv4_addresses() const {
    std::vector<boost::asio::ip::address_v4> result;
    for (const auto& addr : addresses_) {
        if (addr.is_v4()) {
            result.push_back(addr.to_v4());
        }
    }
    return result;
}

std::string mdnspub::NetworkInterface::to_string() const {
    std::string output = fmt::format("{}\n", identifier_);

    fmt::format_to(std::back_inserter(output), "  type:\n    {}\n", type_to_string(type_));
    fmt::format_to(std::back_inserter(output), "  index:\n    {}\n", index_.value_or(0));

    if (!addresses_.empty()) {
        fmt::format_to(std::back_inserter(output), "  addrs:\n");
        for (const auto& address : addresses_) {
            fmt::format_to(std::back_inserter(output), "    {}\n", address.to_string());
        }
    }

    return output;
}

const char* mdnspub::NetworkInterface::type_to_string(const Type type) {
    switch (type) {
        case Type::loopback:
            return "loopback";
        case Type::other:
            return "other";
        case Type::undefined:
        default:
            return "undefined";
    }
}

tl::expected<std::vector<mdnspub::NetworkInterface>, int> mdnspub::NetworkInterface::get_all() {
    std::vector<NetworkInterface> network_interfaces;

    ifaddrs* ifap = nullptr;

    if (getifaddrs(&ifap) != 0) {
        return tl::unexpected(errno);
    }

    const std::unique_ptr<ifaddrs, decltype(&freeifaddrs)> cleanup(ifap, &freeifaddrs);

    for (const ifaddrs* ifa = ifap; ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_name == nullptr) {
            MDNSPUB_WARNING("Network interface name is null");
            continue;
        }

        auto it = std::find_if(
            network_interfaces.begin(), network_interfaces.end(),
            [&ifa](const NetworkInterface& network_interface) {
                return network_interface.identifier_ == ifa->ifa_name;
            }
        );

        if (it == network_interfaces.end()) {
            it = network_interfaces.emplace(network_interfaces.end(), ifa->ifa_name);
            if (const auto index = if_nametoindex(ifa->ifa_name); index != 0) {
                it->index_ = index;
            }
        }

        it->type_ = (ifa->ifa_flags & IFF_LOOPBACK) != 0 ? Type::loopback : Type::other;

        if (ifa->ifa_addr == nullptr) {
            continue;
        }

        if (ifa->ifa_addr->sa_family == AF_INET) {
            const auto* sa = reinterpret_cast<const sockaddr_in*>(ifa->ifa_addr);
            it->addresses_.emplace_back(boost::asio::ip::address_v4(ntohl(sa->sin_addr.s_addr)));
        } else if (ifa->ifa_addr->sa_family == AF_INET6) {
            const auto* sa = reinterpret_cast<const sockaddr_in6*>(ifa->ifa_addr);
            boost::asio::ip::address_v6::bytes_type bytes;
            std::memcpy(bytes.data(), &sa->sin6_addr, bytes.size());
            it->addresses_.emplace_back(boost::asio::ip::address_v6(bytes, sa->sin6_scope_id));
        }
    }

    return network_interfaces;
}
