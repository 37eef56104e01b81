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

#include "bonjour.hpp"

#if MDNSPUB_HAS_DNSSD

    #include "bonjour_scoped_dns_service_ref.hpp"

namespace mdnspub::dnssd {

/**
 * Represents a shared connection to the mdns responder. Registrations made with kDNSServiceFlagsShareConnection
 * deliver their results through this connection's socket.
 */
class BonjourSharedConnection {
  public:
    /**
     * Constructor which will create a connection and store the DNSServiceRef under RAII fashion.
     * @throws mdnspub::Exception when the mdns responder cannot be reached.
     */
    BonjourSharedConnection();

    /**
     * @return Returns the DNSServiceRef held by this instance. The DNSServiceRef will still be owned by this class.
     */
    [[nodiscard]] DNSServiceRef service_ref() const noexcept {
        return service_ref_.service_ref();
    }

    /**
     * Resets the DNSServiceRef to nullptr.
     */
    void reset() noexcept {
        service_ref_.reset();
    }

  private:
    BonjourScopedDnsServiceRef service_ref_;
};

}  // namespace mdnspub::dnssd

#endif
