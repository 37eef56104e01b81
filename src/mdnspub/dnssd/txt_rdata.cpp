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

#include <fmt/format.h>

#include <limits>

tl::expected<mdnspub::dnssd::TxtRdata, std::string> mdnspub::dnssd::TxtRdata::encode(const TxtRecord& txt) {
    TxtRdata rdata;

    for (const auto& entry : txt) {
        const auto item = entry.to_string();
        if (item.size() > k_max_string_length) {
            return tl::unexpected(fmt::format("TXT entry for key '{}' exceeds {} bytes", entry.key, k_max_string_length));
        }
        rdata.bytes_.push_back(static_cast<uint8_t>(item.size()));
        rdata.bytes_.insert(rdata.bytes_.end(), item.begin(), item.end());
    }

    // An empty TXT record is a single empty string.
    if (rdata.bytes_.empty()) {
        rdata.bytes_.push_back(0);
    }

    if (rdata.bytes_.size() > std::numeric_limits<uint16_t>::max()) {
        return tl::unexpected(fmt::format("TXT record of {} bytes is too large", rdata.bytes_.size()));
    }

    return rdata;
}
