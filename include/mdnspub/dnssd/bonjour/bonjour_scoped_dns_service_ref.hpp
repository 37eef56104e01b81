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

namespace mdnspub::dnssd {

/**
 * RAII wrapper around DNSServiceRef. Deallocating a ref which was created by DNSServiceRegister removes the
 * registration from the network.
 */
class BonjourScopedDnsServiceRef {
  public:
    BonjourScopedDnsServiceRef() = default;
    ~BonjourScopedDnsServiceRef();

    explicit BonjourScopedDnsServiceRef(const DNSServiceRef& service_ref) noexcept;

    BonjourScopedDnsServiceRef(const BonjourScopedDnsServiceRef&) = delete;
    BonjourScopedDnsServiceRef& operator=(const BonjourScopedDnsServiceRef& other) = delete;

    BonjourScopedDnsServiceRef(BonjourScopedDnsServiceRef&& other) noexcept;
    BonjourScopedDnsServiceRef& operator=(BonjourScopedDnsServiceRef&& other) noexcept;

    /**
     * Assigns an existing DNSServiceRef to this instance. An existing DNSServiceRef will be deallocated, and this
     * object will take ownership over the given DNSServiceRef.
     * @param service_ref The DNSServiceRef to assign to this instance.
     * @return A reference to this instance.
     */
    BonjourScopedDnsServiceRef& operator=(DNSServiceRef service_ref);

    /**
     * @return Returns the contained DNSServiceRef.
     */
    [[nodiscard]] DNSServiceRef service_ref() const noexcept;

    /**
     * Deallocates the contained DNSServiceRef and resets it to nullptr.
     */
    void reset() noexcept;

  private:
    DNSServiceRef service_ref_ = nullptr;
};

}  // namespace mdnspub::dnssd

#endif
