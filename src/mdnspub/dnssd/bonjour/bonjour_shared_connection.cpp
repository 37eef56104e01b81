/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnspub/dnssd/bonjour/bonjour.hpp"

#if MDNSPUB_HAS_DNSSD

    #include "mdnspub/dnssd/bonjour/bonjour_shared_connection.hpp"

mdnspub::dnssd::BonjourSharedConnection::BonjourSharedConnection() {
    DNSServiceRef ref = nullptr;
    DNSSD_THROW_IF_ERROR(DNSServiceCreateConnection(&ref), "Failed to create shared connection");
    service_ref_ = ref;  // From here on the ref is under RAII inside a BonjourScopedDnsServiceRef
}

#endif
