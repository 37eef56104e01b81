/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnspub/dnssd/mock/mock_responder.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>

#include <algorithm>

mdnspub::dnssd::MockResponder::MockResponder(boost::asio::io_context& io_context) : io_context_(io_context) {}

void mdnspub::dnssd::MockResponder::mock_failure(const ServiceRecord::Key& key, ResponderError error) {
    failures_[key] = std::move(error);
}

void mdnspub::dnssd::MockResponder::mock_success(const ServiceRecord::Key& key) {
    failures_.erase(key);
}

void mdnspub::dnssd::MockResponder::mock_hanging(const std::string& instance_name) {
    hanging_.insert(instance_name);
}

void mdnspub::dnssd::MockResponder::mock_delayed(
    const std::string& instance_name, const std::chrono::milliseconds delay
) {
    delays_[instance_name] = delay;
}

void mdnspub::dnssd::MockResponder::mock_name_conflict(const ServiceRecord::Key& key) {
    boost::asio::dispatch(io_context_, [this, key] {
        registered_.erase(key);
        event_emitter_.emit(NameConflict {key.first, key.second});
    });
}

size_t mdnspub::dnssd::MockResponder::count_calls(const Call::Type type) const {
    return static_cast<size_t>(std::count_if(calls_.begin(), calls_.end(), [type](const Call& call) {
        return call.type == type;
    }));
}

void mdnspub::dnssd::MockResponder::register_record(const ServiceRecord& record, CompletionHandler handler) {
    calls_.push_back({Call::Type::register_record, record.key(), record});

    if (const auto it = delays_.find(record.instance_name); it != delays_.end()) {
        const auto key = record.key();
        withdraw_delayed(key);

        auto timer = std::make_shared<boost::asio::steady_timer>(io_context_, it->second);
        delayed_[key] = {timer, std::move(handler)};
        timer->async_wait([this, timer, key, record](const boost::system::error_code& ec) {
            if (ec) {
                return;
            }
            const auto delayed = delayed_.find(key);
            if (delayed == delayed_.end() || delayed->second.first != timer) {
                return;
            }
            auto h = std::move(delayed->second.second);
            delayed_.erase(delayed);
            registered_[key] = record;
            h({});
        });
        return;
    }

    complete(record.key(), std::move(handler), [this, record] {
        registered_[record.key()] = record;
    });
}

void mdnspub::dnssd::MockResponder::update_record(const ServiceRecord& record, CompletionHandler handler) {
    calls_.push_back({Call::Type::update_record, record.key(), record});

    if (registered_.find(record.key()) == registered_.end()) {
        boost::asio::post(io_context_, [h = std::move(handler)] {
            h(tl::unexpected(ResponderError {ResponderError::Kind::failed, "Record is not registered"}));
        });
        return;
    }

    complete(record.key(), std::move(handler), [this, record] {
        registered_[record.key()] = record;
    });
}

void mdnspub::dnssd::MockResponder::unregister_record(
    const std::string& instance_name, const std::string& service_type, CompletionHandler handler
) {
    const ServiceRecord::Key key {instance_name, service_type};
    calls_.push_back({Call::Type::unregister_record, key, {}});
    withdraw_delayed(key);
    complete(key, std::move(handler), [this, key] {
        registered_.erase(key);
    });
}

void mdnspub::dnssd::MockResponder::complete(
    const ServiceRecord::Key& key, CompletionHandler handler, const std::function<void()>& on_success
) {
    if (hanging_.count(key.first) > 0) {
        return;  // Never completes.
    }

    if (const auto it = failures_.find(key); it != failures_.end()) {
        boost::asio::post(io_context_, [h = std::move(handler), error = it->second] {
            h(tl::unexpected(error));
        });
        return;
    }

    boost::asio::post(io_context_, [h = std::move(handler), on_success] {
        on_success();
        h({});
    });
}

void mdnspub::dnssd::MockResponder::withdraw_delayed(const ServiceRecord::Key& key) {
    const auto it = delayed_.find(key);
    if (it == delayed_.end()) {
        return;
    }
    it->second.first->cancel();
    boost::asio::post(io_context_, [h = std::move(it->second.second)] {
        h(tl::unexpected(ResponderError {ResponderError::Kind::failed, "Registration was withdrawn"}));
    });
    delayed_.erase(it);
}
