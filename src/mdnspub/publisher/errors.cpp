/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnspub/publisher/errors.hpp"

#include <fmt/format.h>

std::string mdnspub::ParseError::to_string() const {
    return fmt::format("{}: {}", kind_to_string(kind), message);
}

const char* mdnspub::ParseError::kind_to_string(const Kind kind) {
    switch (kind) {
        case Kind::invalid_host:
            return "invalid host";
        case Kind::invalid_domain:
            return "invalid domain";
        case Kind::invalid_port:
            return "invalid port";
        case Kind::invalid_txt:
            return "invalid txt";
        default:
            return "unknown";
    }
}

std::string mdnspub::ConflictError::to_string() const {
    return fmt::format(
        "{} {} is already published for container {}, not publishing it for container {}", key.first, key.second,
        holder, rejected
    );
}
