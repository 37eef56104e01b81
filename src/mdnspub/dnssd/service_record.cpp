/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnspub/dnssd/service_record.hpp"

#include <fmt/format.h>

mdnspub::dnssd::TxtRecord mdnspub::dnssd::ServiceRecord::wire_txt() const {
    TxtRecord result;
    result.reserve(txt.size() + provenance.size());
    result.insert(result.end(), txt.begin(), txt.end());
    result.insert(result.end(), provenance.begin(), provenance.end());
    return result;
}

std::string mdnspub::dnssd::ServiceRecord::description() const {
    std::string txt_description;
    for (const auto& entry : wire_txt()) {
        if (!txt_description.empty()) {
            txt_description += ", ";
        }
        txt_description += entry.to_string();
    }

    return fmt::format(
        "instance: {}, type: {}, target: {}, port: {}, ttl: {}, txt: [{}]", instance_name, service_type, target_host,
        port, ttl_seconds, txt_description
    );
}
