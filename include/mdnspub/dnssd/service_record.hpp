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

#include <cstdint>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace mdnspub::dnssd {

/**
 * A single key/value item of a TXT record.
 */
struct TxtEntry {
    std::string key;
    std::string value;

    /**
     * @return The entry as it appears on the wire: key=value.
     */
    [[nodiscard]] std::string to_string() const {
        return key + "=" + value;
    }

    friend bool operator==(const TxtEntry& lhs, const TxtEntry& rhs) {
        return std::tie(lhs.key, lhs.value) == std::tie(rhs.key, rhs.value);
    }

    friend bool operator!=(const TxtEntry& lhs, const TxtEntry& rhs) {
        return !(lhs == rhs);
    }
};

/// Ordered list of TXT entries. Keys need not be unique, all entries are published in order.
using TxtRecord = std::vector<TxtEntry>;

/**
 * A struct containing the data which describes a service to publish on the network.
 */
struct ServiceRecord {
    /// Identifies a record on the wire: instance name and service type.
    using Key = std::pair<std::string, std::string>;

    /// The name of the service instance (ie. test2).
    std::string instance_name;

    /// The type of the service (ie. _http._tcp).
    std::string service_type;

    /// The host target of the service (ie. test2.local).
    std::string target_host;

    /// The port of the service (in native endian).
    uint16_t port {};

    /// The time to live of the host and service records.
    uint32_t ttl_seconds {};

    /// The TXT entries of the service.
    TxtRecord txt;

    /// Diagnostic entries (registration time, container id) which are published after txt but are not part of the
    /// record's identity.
    TxtRecord provenance;

    /**
     * @return The key of this record.
     */
    [[nodiscard]] Key key() const {
        return {instance_name, service_type};
    }

    /**
     * @return All TXT entries which go on the wire, txt followed by provenance.
     */
    [[nodiscard]] TxtRecord wire_txt() const;

    /// Returns a description of this struct, which might be handy for debugging or logging purposes.
    [[nodiscard]] std::string description() const;

    [[nodiscard]] auto tie() const {
        return std::tie(instance_name, service_type, target_host, port, ttl_seconds, txt);
    }

    /**
     * Structural equality over all fields except provenance.
     */
    friend bool operator==(const ServiceRecord& lhs, const ServiceRecord& rhs) {
        return lhs.tie() == rhs.tie();
    }

    friend bool operator!=(const ServiceRecord& lhs, const ServiceRecord& rhs) {
        return !(lhs == rhs);
    }
};

}  // namespace mdnspub::dnssd
