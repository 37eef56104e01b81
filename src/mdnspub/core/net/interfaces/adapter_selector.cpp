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

#include "mdnspub/core/log.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace {

bool is_excluded(const boost::asio::ip::address_v4& address, const std::vector<mdnspub::Ipv4Network>& excluded_nets) {
    return std::any_of(excluded_nets.begin(), excluded_nets.end(), [&address](const mdnspub::Ipv4Network& net) {
        return net.contains(address);
    });
}

void add_bindings(
    const mdnspub::NetworkInterface& adapter, const std::vector<mdnspub::Ipv4Network>& excluded_nets,
    std::vector<mdnspub::AdapterBinding>& bindings
) {
    if (adapter.get_type() == mdnspub::NetworkInterface::Type::loopback) {
        MDNSPUB_DEBUG("Skipping loopback adapter {}", adapter.get_identifier());
        return;
    }

    for (const auto& address : adapter.get_ipv4_addresses()) {
        if (address.is_loopback()) {
            continue;
        }
        if (is_excluded(address, excluded_nets)) {
            MDNSPUB_DEBUG("Skipping excluded address {} on {}", address.to_string(), adapter.get_identifier());
            continue;
        }
        bindings.push_back({adapter.get_identifier(), adapter.get_interface_index().value_or(0), address});
    }
}

}  // namespace

std::string mdnspub::AdapterBinding::to_string() const {
    return fmt::format("{} (index {}): {}", identifier, interface_index, address.to_string());
}

std::vector<mdnspub::AdapterBinding> mdnspub::AdapterSelector::select(
    const std::vector<std::string>& configured, const std::vector<Ipv4Network>& excluded_nets,
    const std::vector<NetworkInterface>& all_adapters
) {
    std::vector<AdapterBinding> bindings;

    if (configured.empty()) {
        for (const auto& adapter : all_adapters) {
            add_bindings(adapter, excluded_nets, bindings);
        }
        return bindings;
    }

    for (const auto& name : configured) {
        const auto it = std::find_if(all_adapters.begin(), all_adapters.end(), [&name](const NetworkInterface& a) {
            return a.get_identifier() == name;
        });

        if (it == all_adapters.end()) {
            MDNSPUB_ERROR("Adapter {} does not exist, skipping", name);
            continue;
        }

        add_bindings(*it, excluded_nets, bindings);
    }

    return bindings;
}

tl::expected<std::vector<mdnspub::Ipv4Network>, std::string>
mdnspub::AdapterSelector::parse_networks(const std::vector<std::string>& cidrs) {
    std::vector<Ipv4Network> networks;
    networks.reserve(cidrs.size());
    for (const auto& cidr : cidrs) {
        auto network = Ipv4Network::parse(cidr);
        if (!network) {
            return tl::unexpected(network.error());
        }
        networks.push_back(*network);
    }
    return networks;
}
