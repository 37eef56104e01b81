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

#include "errors.hpp"
#include "publication_intent.hpp"
#include "mdnspub/container/container_event.hpp"
#include "mdnspub/core/expected.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace mdnspub {

/**
 * Turns container labels into a publication intent.
 *
 * Label contract:
 *  - mdns.publish=<name>.local[:<port>]  required to publish
 *  - mdns.servicetype=<_type._proto>     optional, overrides the type derived from the port
 *  - mdns.txt=k1=v1,k2=v2,...            optional TXT entries
 */
class LabelParser {
  public:
    static constexpr uint16_t k_default_port = 80;
    static constexpr auto k_default_service_type = "_http._tcp";

    struct Configuration {
        std::string publish_key {"mdns.publish"};
        std::string service_type_key {"mdns.servicetype"};
        std::string txt_key {"mdns.txt"};
        /// The domain published hosts must be in, with leading dot.
        std::string local_domain {".local"};
    };

    LabelParser();
    explicit LabelParser(Configuration config);

    /**
     * Parses the labels of a container.
     * @param labels The labels.
     * @return nullopt when the publish label is absent, the intent when all labels are valid, or the error of the first
     * malformed label. An invalid service type falls back to the type derived from the port and only logs a warning.
     */
    [[nodiscard]] tl::expected<std::optional<PublicationIntent>, ParseError>
    parse(const container::Labels& labels) const;

    [[nodiscard]] const Configuration& get_configuration() const {
        return config_;
    }

    /**
     * @param port The port of a service.
     * @return The well-known service type for the port, or _http._tcp.
     */
    static const char* service_type_for_port(uint16_t port);

    /**
     * Tests for the form _label._tcp or _label._udp, where label has 1-15 letters, digits or hyphens.
     */
    static bool is_valid_service_type(std::string_view service_type);

    /**
     * Tests whether every dot separated label of given host is 1-63 letters, digits, underscores or hyphens.
     */
    static bool is_valid_hostname(std::string_view host);

    /**
     * Parses comma separated key=value items.
     * @param txt The value of the TXT label.
     * @return The entries in order, or an error when an item has no '=', an empty or non-printable key, or exceeds
     * 255 bytes.
     */
    static tl::expected<dnssd::TxtRecord, ParseError> parse_txt(std::string_view txt);

    /**
     * Brings a configured domain into the form .domain (leading dot, no trailing dot).
     */
    static std::string normalize_domain(std::string_view domain);

  private:
    Configuration config_;

    [[nodiscard]] tl::expected<std::pair<std::string, uint16_t>, ParseError> parse_publish(std::string_view value
    ) const;
};

}  // namespace mdnspub
