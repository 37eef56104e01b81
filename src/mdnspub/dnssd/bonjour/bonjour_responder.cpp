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

    #include "mdnspub/dnssd/bonjour/bonjour_responder.hpp"
    #include "mdnspub/dnssd/txt_rdata.hpp"
    #include "mdnspub/core/assert.hpp"

    #include <boost/asio/post.hpp>

    #include <fmt/format.h>

    #include <algorithm>
    #include <set>

mdnspub::dnssd::BonjourResponder::BonjourResponder(
    boost::asio::io_context& io_context, std::vector<AdapterBinding> bindings
) :
    io_context_(io_context), bindings_(std::move(bindings)), service_descriptor_(io_context) {
    const int service_fd = DNSServiceRefSockFD(shared_connection_.service_ref());

    if (service_fd < 0) {
        MDNSPUB_THROW_EXCEPTION("Invalid file descriptor");
    }

    service_descriptor_.assign(service_fd);
    async_process_results();
}

mdnspub::dnssd::BonjourResponder::~BonjourResponder() {
    // The descriptor belongs to the shared connection, which closes it when deallocated.
    service_descriptor_.release();

    for (auto& [key, registration] : registrations_) {
        registration->service_refs.clear();
    }
    registrations_.clear();

    for (auto& [host, records] : host_records_) {
        for (auto* record_ref : records->record_refs) {
            DNSSD_LOG_IF_ERROR(DNSServiceRemoveRecord(shared_connection_.service_ref(), record_ref, 0));
        }
    }
    host_records_.clear();
}

void mdnspub::dnssd::BonjourResponder::register_record(const ServiceRecord& record, CompletionHandler handler) {
    MDNSPUB_ASSERT(!record.service_type.empty(), "Service type must not be empty");
    MDNSPUB_ASSERT(record.port != 0, "Port must not be 0");

    const auto key = record.key();
    erase(key);  // Registering again replaces the existing registration.

    const auto txt = TxtRdata::encode(record.wire_txt());
    if (!txt) {
        post_result(std::move(handler), tl::unexpected(ResponderError {ResponderError::Kind::failed, txt.error()}));
        return;
    }

    if (const auto host = acquire_host(record.target_host, record.ttl_seconds); !host) {
        post_result(std::move(handler), tl::unexpected(ResponderError {ResponderError::Kind::failed, host.error()}));
        return;
    }

    auto registration = std::make_unique<Registration>();
    registration->owner = this;
    registration->record = record;
    registration->handler = std::move(handler);
    auto& r = *registration;
    registrations_.emplace(key, std::move(registration));

    const auto host_fullname = record.target_host + ".";
    DNSServiceFlags flags = kDNSServiceFlagsShareConnection | kDNSServiceFlagsNoAutoRename;

    for (const auto interface_index : interface_indexes()) {
        DNSServiceRef service_ref = shared_connection_.service_ref();

        const auto result = DNSServiceRegister(
            &service_ref, flags, interface_index, record.instance_name.c_str(), record.service_type.c_str(), nullptr,
            bindings_.empty() ? nullptr : host_fullname.c_str(), htons(record.port), txt->length(), txt->bytes_ptr(),
            register_service_callback, &r
        );

        if (result != kDNSServiceErr_NoError) {
            fail(
                key,
                ResponderError {
                    ResponderError::Kind::failed,
                    fmt::format("Failed to register service: {}", dns_service_error_to_string(result)),
                }
            );
            return;
        }

        r.service_refs.emplace_back(service_ref);
        ++r.pending_callbacks;
    }

    MDNSPUB_DEBUG("Registering {}", record.description());
}

void mdnspub::dnssd::BonjourResponder::update_record(const ServiceRecord& record, CompletionHandler handler) {
    const auto it = registrations_.find(record.key());
    if (it == registrations_.end()) {
        post_result(
            std::move(handler),
            tl::unexpected(ResponderError {
                ResponderError::Kind::failed,
                fmt::format("Record {} {} is not registered", record.instance_name, record.service_type),
            })
        );
        return;
    }

    const auto txt = TxtRdata::encode(record.wire_txt());
    if (!txt) {
        post_result(std::move(handler), tl::unexpected(ResponderError {ResponderError::Kind::failed, txt.error()}));
        return;
    }

    for (const auto& service_ref : it->second->service_refs) {
        // Second argument's nullptr tells us that we are updating the primary (TXT) record.
        const auto result = DNSServiceUpdateRecord(
            service_ref.service_ref(), nullptr, 0, txt->length(), txt->bytes_ptr(), record.ttl_seconds
        );

        if (result != kDNSServiceErr_NoError) {
            post_result(
                std::move(handler),
                tl::unexpected(ResponderError {
                    ResponderError::Kind::failed,
                    fmt::format("Failed to update TXT record: {}", dns_service_error_to_string(result)),
                })
            );
            return;
        }
    }

    it->second->record.txt = record.txt;
    it->second->record.provenance = record.provenance;
    post_result(std::move(handler), {});
}

void mdnspub::dnssd::BonjourResponder::unregister_record(
    const std::string& instance_name, const std::string& service_type, CompletionHandler handler
) {
    erase({instance_name, service_type});
    post_result(std::move(handler), {});
}

void mdnspub::dnssd::BonjourResponder::async_process_results() {
    service_descriptor_.async_wait(
        boost::asio::posix::stream_descriptor::wait_read,
        [this](const boost::system::error_code& ec) {
            if (ec) {
                if (ec != boost::asio::error::operation_aborted) {
                    MDNSPUB_ERROR("Error in async_wait for results: {}", ec.message());
                }
                return;
            }

            const auto result = DNSServiceProcessResult(shared_connection_.service_ref());

            if (result != kDNSServiceErr_NoError) {
                MDNSPUB_ERROR("DNSServiceError: {}", dns_service_error_to_string(result));
                if (++process_results_failed_attempts_ > 10) {
                    MDNSPUB_ERROR("Too many failed attempts to process results, stopping");
                    return;
                }
            } else {
                process_results_failed_attempts_ = 0;
            }

            async_process_results();
        }
    );
}

tl::expected<void, std::string>
mdnspub::dnssd::BonjourResponder::acquire_host(const std::string& target_host, const uint32_t ttl_seconds) {
    if (bindings_.empty()) {
        return {};
    }

    if (const auto it = host_records_.find(target_host); it != host_records_.end()) {
        ++it->second->users;
        return {};
    }

    auto host = std::make_unique<HostRecords>();
    host->owner = this;
    host->fullname = target_host + ".";
    host->users = 1;

    for (const auto& binding : bindings_) {
        const auto bytes = binding.address.to_bytes();
        DNSRecordRef record_ref = nullptr;

        const auto result = DNSServiceRegisterRecord(
            shared_connection_.service_ref(), &record_ref, kDNSServiceFlagsUnique, binding.interface_index,
            host->fullname.c_str(), kDNSServiceType_A, kDNSServiceClass_IN, static_cast<uint16_t>(bytes.size()),
            bytes.data(), ttl_seconds, register_record_callback, host.get()
        );

        if (result != kDNSServiceErr_NoError) {
            for (auto* registered : host->record_refs) {
                DNSSD_LOG_IF_ERROR(DNSServiceRemoveRecord(shared_connection_.service_ref(), registered, 0));
            }
            return tl::unexpected(fmt::format(
                "Failed to register address {} for {}: {}", binding.address.to_string(), host->fullname,
                dns_service_error_to_string(result)
            ));
        }

        host->record_refs.push_back(record_ref);
    }

    host_records_.emplace(target_host, std::move(host));
    return {};
}

void mdnspub::dnssd::BonjourResponder::release_host(const std::string& target_host) noexcept {
    const auto it = host_records_.find(target_host);
    if (it == host_records_.end()) {
        return;
    }

    if (--it->second->users > 0) {
        return;
    }

    for (auto* record_ref : it->second->record_refs) {
        DNSSD_LOG_IF_ERROR(DNSServiceRemoveRecord(shared_connection_.service_ref(), record_ref, 0));
    }
    host_records_.erase(it);
}

void mdnspub::dnssd::BonjourResponder::complete(Registration& registration, Result result) {
    if (registration.handler) {
        post_result(std::move(registration.handler), std::move(result));
        registration.handler = nullptr;
    }
}

void mdnspub::dnssd::BonjourResponder::erase(const ServiceRecord::Key& key) {
    const auto it = registrations_.find(key);
    if (it == registrations_.end()) {
        return;
    }

    complete(
        *it->second,
        tl::unexpected(ResponderError {ResponderError::Kind::failed, "Registration was replaced or withdrawn"})
    );

    const auto target_host = it->second->record.target_host;
    registrations_.erase(it);  // Deallocating the service refs removes the services from the network.
    release_host(target_host);
}

void mdnspub::dnssd::BonjourResponder::fail(const ServiceRecord::Key& key, ResponderError error) {
    const auto it = registrations_.find(key);
    if (it == registrations_.end()) {
        return;
    }

    if (it->second->handler) {
        complete(*it->second, tl::unexpected(std::move(error)));
    } else {
        MDNSPUB_WARNING("Registered record {} {} failed: {}", key.first, key.second, error.message);
        event_emitter_.emit(NameConflict {key.first, key.second});
    }

    erase(key);
}

void mdnspub::dnssd::BonjourResponder::post_result(CompletionHandler handler, Result result) {
    if (!handler) {
        return;
    }
    boost::asio::post(io_context_, [h = std::move(handler), r = std::move(result)]() mutable {
        h(std::move(r));
    });
}

std::vector<uint32_t> mdnspub::dnssd::BonjourResponder::interface_indexes() const {
    std::set<uint32_t> indexes;
    for (const auto& binding : bindings_) {
        indexes.insert(binding.interface_index);
    }
    if (indexes.empty() || indexes.count(0) > 0) {
        return {kDNSServiceInterfaceIndexAny};
    }
    return {indexes.begin(), indexes.end()};
}

void mdnspub::dnssd::BonjourResponder::register_service_callback(
    [[maybe_unused]] DNSServiceRef service_ref, [[maybe_unused]] const DNSServiceFlags flags,
    const DNSServiceErrorType error_code, [[maybe_unused]] const char* service_name,
    [[maybe_unused]] const char* reg_type, [[maybe_unused]] const char* reply_domain, void* context
) {
    MDNSPUB_ASSERT_RETURN(context != nullptr, "Expected non-null context");

    auto* registration = static_cast<Registration*>(context);
    auto* owner = registration->owner;
    const auto key = registration->record.key();

    if (error_code != kDNSServiceErr_NoError) {
        owner->fail(
            key,
            ResponderError {
                error_code == kDNSServiceErr_NameConflict ? ResponderError::Kind::conflict
                                                          : ResponderError::Kind::failed,
                fmt::format("Failed to register service: {}", dns_service_error_to_string(error_code)),
            }
        );
        return;
    }

    if (registration->pending_callbacks > 0 && --registration->pending_callbacks == 0) {
        MDNSPUB_INFO("Registered {} {} on {}", key.first, key.second, registration->record.target_host);
        owner->complete(*registration, {});
    }
}

void mdnspub::dnssd::BonjourResponder::register_record_callback(
    [[maybe_unused]] DNSServiceRef service_ref, [[maybe_unused]] DNSRecordRef record_ref,
    [[maybe_unused]] const DNSServiceFlags flags, const DNSServiceErrorType error_code, void* context
) {
    MDNSPUB_ASSERT_RETURN(context != nullptr, "Expected non-null context");

    if (error_code == kDNSServiceErr_NoError) {
        return;
    }

    auto* host = static_cast<HostRecords*>(context);
    auto* owner = host->owner;
    const auto target_host = host->fullname.substr(0, host->fullname.size() - 1);

    MDNSPUB_ERROR("Address record for {} failed: {}", host->fullname, dns_service_error_to_string(error_code));

    // Every record pointing to this host is unusable.
    std::vector<ServiceRecord::Key> affected;
    for (const auto& [key, registration] : owner->registrations_) {
        if (registration->record.target_host == target_host) {
            affected.push_back(key);
        }
    }

    for (const auto& key : affected) {
        owner->fail(
            key,
            ResponderError {
                error_code == kDNSServiceErr_NameConflict ? ResponderError::Kind::conflict
                                                          : ResponderError::Kind::failed,
                fmt::format("Address record failed: {}", dns_service_error_to_string(error_code)),
            }
        );
    }
}

#endif
