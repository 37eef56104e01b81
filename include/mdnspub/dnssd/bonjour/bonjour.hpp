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

#include "mdnspub/core/platform.hpp"
#include "mdnspub/core/exception.hpp"
#include "mdnspub/core/log.hpp"

// Set by the build when dns_sd.h and its library (mDNSResponder or the avahi compat layer) were found.
#ifndef MDNSPUB_HAS_DNSSD
    #if MDNSPUB_APPLE
        #define MDNSPUB_HAS_DNSSD 1
    #else
        #define MDNSPUB_HAS_DNSSD 0
    #endif
#endif

#if MDNSPUB_HAS_DNSSD

    #include <arpa/inet.h>
    #include <dns_sd.h>

    #include <string>

    #define DNSSD_THROW_IF_ERROR(result, msg)                                                                         \
        if ((result) != kDNSServiceErr_NoError) {                                                                     \
            throw mdnspub::Exception(                                                                                 \
                std::string(msg) + ": " + mdnspub::dnssd::dns_service_error_to_string(result), __FILE__, __LINE__,    \
                MDNSPUB_FUNCTION                                                                                      \
            );                                                                                                        \
        }

    #define DNSSD_LOG_IF_ERROR(error)                                                                                 \
        if ((error) != kDNSServiceErr_NoError) {                                                                      \
            MDNSPUB_ERROR("DNSServiceError: {}", mdnspub::dnssd::dns_service_error_to_string(error));                 \
        }

namespace mdnspub::dnssd {

const char* dns_service_error_to_string(DNSServiceErrorType error) noexcept;

}  // namespace mdnspub::dnssd

#endif
