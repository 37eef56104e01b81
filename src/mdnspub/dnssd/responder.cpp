/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnspub/dnssd/responder.hpp"

#include "mdnspub/dnssd/bonjour/bonjour_responder.hpp"

#include <fmt/format.h>

std::string mdnspub::dnssd::ResponderError::to_string() const {
    return fmt::format("{}: {}", kind_to_string(kind), message);
}

const char* mdnspub::dnssd::ResponderError::kind_to_string(const Kind kind) {
    switch (kind) {
        case Kind::failed:
            return "failed";
        case Kind::timeout:
            return "timeout";
        case Kind::conflict:
            return "conflict";
        case Kind::unavailable:
            return "unavailable";
        default:
            return "unknown";
    }
}

std::unique_ptr<mdnspub::dnssd::Responder> mdnspub::dnssd::Responder::create(
    [[maybe_unused]] boost::asio::io_context& io_context, [[maybe_unused]] const std::vector<AdapterBinding>& bindings
) {
#if MDNSPUB_HAS_DNSSD
    return std::make_unique<BonjourResponder>(io_context, bindings);
#else
    return {};
#endif
}
