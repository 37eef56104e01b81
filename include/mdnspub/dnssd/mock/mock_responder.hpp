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

#include "mdnspub/dnssd/responder.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace mdnspub::dnssd {

/**
 * Responder which records every call and completes them through the io_context, without touching the network.
 */
class MockResponder: public Responder {
  public:
    /**
     * A call made to the responder.
     */
    struct Call {
        enum class Type {
            register_record,
            update_record,
            unregister_record,
        };

        Type type {Type::register_record};
        ServiceRecord::Key key;
        ServiceRecord record;  // Empty for unregister calls.
    };

    explicit MockResponder(boost::asio::io_context& io_context);
    ~MockResponder() override = default;

    /**
     * Makes all following calls for given key fail with given error, until mock_success is called for the key.
     * @param key The key of the record.
     * @param error The error to complete the calls with.
     */
    void mock_failure(const ServiceRecord::Key& key, ResponderError error);

    /**
     * Makes calls for given key succeed again.
     * @param key The key of the record.
     */
    void mock_success(const ServiceRecord::Key& key);

    /**
     * Makes all following calls for given instance name never complete.
     * @param instance_name The instance name of the record.
     */
    void mock_hanging(const std::string& instance_name);

    /**
     * Makes following registrations for given instance name succeed only after given delay. Unregistering the record
     * before that withdraws the registration, which then fails.
     * @param instance_name The instance name of the record.
     * @param delay The time until the registration completes.
     */
    void mock_delayed(const std::string& instance_name, std::chrono::milliseconds delay);

    /**
     * Mocks the network reporting a conflict for a registered record. The registered record is dropped.
     * @param key The key of the record.
     */
    void mock_name_conflict(const ServiceRecord::Key& key);

    /**
     * @return All calls in the order they were made.
     */
    [[nodiscard]] const std::vector<Call>& get_calls() const {
        return calls_;
    }

    /**
     * @param type The type of call to count.
     * @return The number of calls of given type.
     */
    [[nodiscard]] size_t count_calls(Call::Type type) const;

    /**
     * @return The records which are currently registered.
     */
    [[nodiscard]] const std::map<ServiceRecord::Key, ServiceRecord>& get_registered() const {
        return registered_;
    }

    /**
     * Forgets all recorded calls.
     */
    void clear_calls() {
        calls_.clear();
    }

    // Responder overrides
    void register_record(const ServiceRecord& record, CompletionHandler handler) override;
    void update_record(const ServiceRecord& record, CompletionHandler handler) override;
    void unregister_record(
        const std::string& instance_name, const std::string& service_type, CompletionHandler handler
    ) override;

  private:
    boost::asio::io_context& io_context_;
    std::vector<Call> calls_;
    std::map<ServiceRecord::Key, ServiceRecord> registered_;
    std::map<ServiceRecord::Key, ResponderError> failures_;
    std::set<std::string> hanging_;
    std::map<std::string, std::chrono::milliseconds> delays_;
    std::map<ServiceRecord::Key, std::pair<std::shared_ptr<boost::asio::steady_timer>, CompletionHandler>> delayed_;

    void withdraw_delayed(const ServiceRecord::Key& key);

    void complete(const ServiceRecord::Key& key, CompletionHandler handler, const std::function<void()>& on_success);
};

}  // namespace mdnspub::dnssd
