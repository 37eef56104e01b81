/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnspub/publisher/record_builder.hpp"

#include "mdnspub/core/string.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>

mdnspub::dnssd::ServiceRecord
mdnspub::RecordBuilder::build(const PublicationIntent& intent, const ProcessContext& context) {
    // DNS names compare case-insensitively, keys and the wire use the lower case form.
    dnssd::ServiceRecord record;
    record.target_host = string_to_lower(intent.host_label);
    record.instance_name = instance_name_for(record.target_host, context.local_domain);
    record.service_type = string_to_lower(intent.service_type);
    record.port = intent.port;
    record.ttl_seconds = context.ttl_seconds;
    record.txt = intent.txt_entries;

    if (context.debug) {
        record.provenance.push_back({"registered", format_timestamp(context.timestamp)});
        record.provenance.push_back({"container", context.container_id});
    }

    return record;
}

std::string mdnspub::RecordBuilder::instance_name_for(const std::string_view host, const std::string_view local_domain) {
    if (local_domain.empty() || host.size() <= local_domain.size()
        || !string_ends_with_case_insensitive(host, local_domain)) {
        return std::string(host);
    }
    return std::string(host.substr(0, host.size() - local_domain.size()));
}

std::string mdnspub::RecordBuilder::format_timestamp(const std::chrono::system_clock::time_point timestamp) {
    const auto time = std::chrono::system_clock::to_time_t(timestamp);
    return fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", fmt::gmtime(time));
}
