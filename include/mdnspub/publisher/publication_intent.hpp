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

#include "mdnspub/dnssd/service_record.hpp"

#include <cstdint>
#include <string>
#include <tuple>

namespace mdnspub {

/**
 * The validated wish of a container to be published, as expressed by its labels.
 */
struct PublicationIntent {
    /// The host to publish (ie. test2.local), without trailing dot.
    std::string host_label;

    /// The port of the service.
    uint16_t port {80};

    /// The service type, either given by label or derived from the port.
    std::string service_type;

    /// The TXT entries in label order, duplicates included.
    dnssd::TxtRecord txt_entries;

    [[nodiscard]] auto tie() const {
        return std::tie(host_label, port, service_type, txt_entries);
    }

    friend bool operator==(const PublicationIntent& lhs, const PublicationIntent& rhs) {
        return lhs.tie() == rhs.tie();
    }

    friend bool operator!=(const PublicationIntent& lhs, const PublicationIntent& rhs) {
        return lhs.tie() != rhs.tie();
    }
};

}  // namespace mdnspub
