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

#include "mdnspub/container/container_event.hpp"
#include "mdnspub/dnssd/service_record.hpp"

#include <string>

namespace mdnspub {

/**
 * The publish labels of a container are present but malformed.
 */
struct ParseError {
    enum class Kind {
        invalid_host,
        invalid_domain,
        invalid_port,
        invalid_txt,
    };

    Kind kind {Kind::invalid_host};
    std::string message;

    [[nodiscard]] std::string to_string() const;

    static const char* kind_to_string(Kind kind);
};

/**
 * A record cannot be published because another container already holds its name and type.
 */
struct ConflictError {
    dnssd::ServiceRecord::Key key;
    container::ContainerId holder;
    container::ContainerId rejected;

    [[nodiscard]] std::string to_string() const;
};

}  // namespace mdnspub
