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

#include "publication_intent.hpp"
#include "mdnspub/container/container_event.hpp"
#include "mdnspub/dnssd/service_record.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace mdnspub {

/**
 * Process wide inputs to building a record, besides the intent itself.
 */
struct ProcessContext {
    uint32_t ttl_seconds {3600};
    bool debug {false};
    container::ContainerId container_id;
    std::chrono::system_clock::time_point timestamp;
    std::string local_domain {".local"};
};

class RecordBuilder {
  public:
    /**
     * Builds the record to publish for given intent.
     * @param intent The intent of a container.
     * @param context The process context. In debug mode the record gets provenance entries.
     * @return The record.
     */
    static dnssd::ServiceRecord build(const PublicationIntent& intent, const ProcessContext& context);

    /**
     * @return The host without the local domain suffix (test2.local -> test2). Hosts outside the domain are
     * returned as is.
     */
    static std::string instance_name_for(std::string_view host, std::string_view local_domain);

    /**
     * @return The time point formatted as ISO-8601 in UTC, at second resolution (ie. 2024-05-01T12:00:00Z).
     */
    static std::string format_timestamp(std::chrono::system_clock::time_point timestamp);
};

}  // namespace mdnspub
