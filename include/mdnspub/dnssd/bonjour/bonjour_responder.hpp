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
    #include "bonjour_shared_connection.hpp"
    #include "mdnspub/dnssd/responder.hpp"

    #include <boost/asio/io_context.hpp>
    #include <boost/asio/posix/stream_descriptor.hpp>

    #include <map>
    #include <memory>
    #include <string>
    #include <vector>

namespace mdnspub::dnssd {

/**
 * Responder which talks to the mdns responder daemon through dns_sd.h.
 *
 * The target host of a record gets an A record per bound address (DNSServiceRegisterRecord), shared by all records
 * with the same target host. The service itself is registered once per bound interface (DNSServiceRegister). All
 * registrations use one shared connection whose results are processed on the io_context, which is assumed to be run
 * by a single thread.
 */
class BonjourResponder: public Responder {
  public:
    /**
     * Constructs a Bonjour responder.
     * @param io_context The context to use for processing results.
     * @param bindings The addresses to publish host records for. When empty, services are registered on all
     * interfaces and point to the host name of the machine.
     * @throws mdnspub::Exception when the mdns responder cannot be reached.
     */
    BonjourResponder(boost::asio::io_context& io_context, std::vector<AdapterBinding> bindings);
    ~BonjourResponder() override;

    void register_record(const ServiceRecord& record, CompletionHandler handler) override;
    void update_record(const ServiceRecord& record, CompletionHandler handler) override;
    void unregister_record(
        const std::string& instance_name, const std::string& service_type, CompletionHandler handler
    ) override;

  private:
    struct Registration {
        BonjourResponder* owner {nullptr};
        ServiceRecord record;
        std::vector<BonjourScopedDnsServiceRef> service_refs;
        size_t pending_callbacks {0};
        CompletionHandler handler;  // Empty once the registration completed.
    };

    struct HostRecords {
        BonjourResponder* owner {nullptr};
        std::string fullname;
        std::vector<DNSRecordRef> record_refs;
        size_t users {0};
    };

    boost::asio::io_context& io_context_;
    std::vector<AdapterBinding> bindings_;
    BonjourSharedConnection shared_connection_;
    boost::asio::posix::stream_descriptor service_descriptor_;
    std::map<ServiceRecord::Key, std::unique_ptr<Registration>> registrations_;
    std::map<std::string, std::unique_ptr<HostRecords>> host_records_;
    size_t process_results_failed_attempts_ = 0;

    void async_process_results();
    tl::expected<void, std::string> acquire_host(const std::string& target_host, uint32_t ttl_seconds);
    void release_host(const std::string& target_host) noexcept;
    void complete(Registration& registration, Result result);
    void erase(const ServiceRecord::Key& key);
    void fail(const ServiceRecord::Key& key, ResponderError error);
    void post_result(CompletionHandler handler, Result result);
    [[nodiscard]] std::vector<uint32_t> interface_indexes() const;

    static void DNSSD_API register_service_callback(
        DNSServiceRef service_ref, DNSServiceFlags flags, DNSServiceErrorType error_code, const char* service_name,
        const char* reg_type, const char* reply_domain, void* context
    );

    static void DNSSD_API register_record_callback(
        DNSServiceRef service_ref, DNSRecordRef record_ref, DNSServiceFlags flags, DNSServiceErrorType error_code,
        void* context
    );
};

}  // namespace mdnspub::dnssd

#endif
