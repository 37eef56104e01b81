/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnspub/publisher/label_parser.hpp"

#include "mdnspub/core/log.hpp"
#include "mdnspub/core/string.hpp"
#include "mdnspub/dnssd/txt_rdata.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>

namespace {

bool is_host_char(const char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '-' || c == '_';
}

bool is_service_char(const char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '-';
}

}  // namespace

mdnspub::LabelParser::LabelParser() : LabelParser(Configuration()) {}

mdnspub::LabelParser::LabelParser(Configuration config) : config_(std::move(config)) {
    config_.local_domain = normalize_domain(config_.local_domain);
}

tl::expected<std::optional<mdnspub::PublicationIntent>, mdnspub::ParseError>
mdnspub::LabelParser::parse(const container::Labels& labels) const {
    const auto publish = labels.find(config_.publish_key);
    if (publish == labels.end()) {
        return std::nullopt;
    }

    auto host_and_port = parse_publish(publish->second);
    if (!host_and_port) {
        return tl::unexpected(host_and_port.error());
    }

    PublicationIntent intent;
    intent.host_label = std::move(host_and_port->first);
    intent.port = host_and_port->second;
    intent.service_type = service_type_for_port(intent.port);

    if (const auto type = labels.find(config_.service_type_key); type != labels.end()) {
        const auto service_type = string_trim(type->second);
        if (is_valid_service_type(service_type)) {
            intent.service_type = std::string(service_type);
        } else {
            MDNSPUB_WARNING(
                "Invalid service type '{}' for {}, using {}", type->second, intent.host_label, intent.service_type
            );
        }
    }

    if (const auto txt = labels.find(config_.txt_key); txt != labels.end()) {
        auto entries = parse_txt(txt->second);
        if (!entries) {
            return tl::unexpected(entries.error());
        }
        intent.txt_entries = std::move(*entries);
    }

    return intent;
}

tl::expected<std::pair<std::string, uint16_t>, mdnspub::ParseError>
mdnspub::LabelParser::parse_publish(const std::string_view value) const {
    auto host = string_trim(value);
    uint16_t port = k_default_port;

    if (const auto colon = host.rfind(':'); colon != std::string_view::npos) {
        const auto port_str = string_trim(host.substr(colon + 1));
        const auto parsed = string_to_int<int>(port_str, true);
        if (port_str.empty() || !parsed || *parsed < 1 || *parsed > 65535) {
            return tl::unexpected(ParseError {
                ParseError::Kind::invalid_port,
                fmt::format("'{}' is not a valid port in '{}'", port_str, value),
            });
        }
        port = static_cast<uint16_t>(*parsed);
        host = string_trim(host.substr(0, colon));
    }

    if (string_ends_with(host, ".")) {
        host.remove_suffix(1);
    }

    if (host.empty()) {
        return tl::unexpected(ParseError {ParseError::Kind::invalid_host, fmt::format("No host in '{}'", value)});
    }

    if (!is_valid_hostname(host)) {
        return tl::unexpected(ParseError {ParseError::Kind::invalid_host, fmt::format("'{}' is not a valid host", host)}
        );
    }

    if (host.size() <= config_.local_domain.size()
        || !string_ends_with_case_insensitive(host, config_.local_domain)) {
        return tl::unexpected(ParseError {
            ParseError::Kind::invalid_domain,
            fmt::format("'{}' is not in the {} domain", host, config_.local_domain),
        });
    }

    return std::make_pair(std::string(host), port);
}

const char* mdnspub::LabelParser::service_type_for_port(const uint16_t port) {
    switch (port) {
        case 80:
        case 443:
            return "_http._tcp";
        case 515:
            return "_printer._tcp";
        case 631:
            return "_ipp._tcp";
        case 1883:
            return "_mqtt._tcp";
        case 9100:
            return "_pdl-datastream._tcp";
        default:
            return k_default_service_type;
    }
}

bool mdnspub::LabelParser::is_valid_service_type(const std::string_view service_type) {
    // _<label>._<tcp|udp>
    const auto dot = service_type.find('.');
    if (dot == std::string_view::npos) {
        return false;
    }

    const auto label = service_type.substr(0, dot);
    const auto proto = service_type.substr(dot + 1);

    if (label.size() < 2 || label.size() > 16 || label.front() != '_') {
        return false;
    }
    if (!std::all_of(label.begin() + 1, label.end(), is_service_char)) {
        return false;
    }

    return proto == "_tcp" || proto == "_udp";
}

bool mdnspub::LabelParser::is_valid_hostname(const std::string_view host) {
    if (host.empty()) {
        return false;
    }

    size_t start = 0;
    while (true) {
        const auto dot = host.find('.', start);
        const auto label = host.substr(start, dot == std::string_view::npos ? std::string_view::npos : dot - start);
        if (label.empty() || label.size() > 63 || !std::all_of(label.begin(), label.end(), is_host_char)) {
            return false;
        }
        if (dot == std::string_view::npos) {
            return true;
        }
        start = dot + 1;
    }
}

tl::expected<mdnspub::dnssd::TxtRecord, mdnspub::ParseError>
mdnspub::LabelParser::parse_txt(const std::string_view txt) {
    dnssd::TxtRecord entries;

    if (string_trim(txt).empty()) {
        return entries;
    }

    // Empty items are kept, they make the label malformed.
    size_t start = 0;
    while (start <= txt.size()) {
        auto end = txt.find(',', start);
        if (end == std::string_view::npos) {
            end = txt.size();
        }
        const auto item = string_trim(txt.substr(start, end - start));
        start = end + 1;

        if (item.empty()) {
            return tl::unexpected(ParseError {
                ParseError::Kind::invalid_txt,
                fmt::format("TXT label '{}' contains an empty item", txt),
            });
        }

        const auto eq = item.find('=');
        if (eq == std::string_view::npos) {
            return tl::unexpected(ParseError {
                ParseError::Kind::invalid_txt,
                fmt::format("TXT item '{}' is not of the form key=value", item),
            });
        }

        const auto key = string_trim(item.substr(0, eq));
        const auto value = item.substr(eq + 1);

        if (key.empty()) {
            return tl::unexpected(ParseError {
                ParseError::Kind::invalid_txt,
                fmt::format("TXT item '{}' has an empty key", item),
            });
        }

        const auto printable = std::all_of(key.begin(), key.end(), [](const char c) {
            return c >= 0x20 && c <= 0x7e;
        });
        if (!printable) {
            return tl::unexpected(ParseError {
                ParseError::Kind::invalid_txt,
                fmt::format("TXT key '{}' contains non-printable characters", key),
            });
        }

        if (key.size() + 1 + value.size() > dnssd::TxtRdata::k_max_string_length) {
            return tl::unexpected(ParseError {
                ParseError::Kind::invalid_txt,
                fmt::format("TXT item for key '{}' exceeds {} bytes", key, dnssd::TxtRdata::k_max_string_length),
            });
        }

        entries.push_back({std::string(key), std::string(value)});
    }

    return entries;
}

std::string mdnspub::LabelParser::normalize_domain(const std::string_view domain) {
    auto trimmed = string_trim(domain);
    if (string_ends_with(trimmed, ".")) {
        trimmed.remove_suffix(1);
    }
    if (trimmed.empty()) {
        return ".local";
    }
    if (!string_starts_with(trimmed, ".")) {
        return "." + std::string(trimmed);
    }
    return std::string(trimmed);
}
