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

    #include "mdnspub/dnssd/bonjour/bonjour_scoped_dns_service_ref.hpp"

    #include <utility>

mdnspub::dnssd::BonjourScopedDnsServiceRef::~BonjourScopedDnsServiceRef() {
    reset();
}

mdnspub::dnssd::BonjourScopedDnsServiceRef::BonjourScopedDnsServiceRef(BonjourScopedDnsServiceRef&& other) noexcept {
    *this = std::move(other);
}

mdnspub::dnssd::BonjourScopedDnsServiceRef::BonjourScopedDnsServiceRef(const DNSServiceRef& service_ref) noexcept :
    service_ref_(service_ref) {}

mdnspub::dnssd::BonjourScopedDnsServiceRef&
mdnspub::dnssd::BonjourScopedDnsServiceRef::operator=(BonjourScopedDnsServiceRef&& other) noexcept {
    if (this != &other) {
        reset();
        service_ref_ = other.service_ref_;
        other.service_ref_ = nullptr;
    }
    return *this;
}

mdnspub::dnssd::BonjourScopedDnsServiceRef&
mdnspub::dnssd::BonjourScopedDnsServiceRef::operator=(DNSServiceRef service_ref) {
    reset();
    service_ref_ = service_ref;
    return *this;
}

DNSServiceRef mdnspub::dnssd::BonjourScopedDnsServiceRef::service_ref() const noexcept {
    return service_ref_;
}

void mdnspub::dnssd::BonjourScopedDnsServiceRef::reset() noexcept {
    if (service_ref_ != nullptr) {
        DNSServiceRefDeallocate(service_ref_);
        service_ref_ = nullptr;
    }
}

#endif
