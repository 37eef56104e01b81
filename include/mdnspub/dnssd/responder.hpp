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

#include "service_record.hpp"
#include "mdnspub/core/events/event_emitter.hpp"
#include "mdnspub/core/expected.hpp"
#include "mdnspub/core/net/interfaces/adapter_selector.hpp"

#include <boost/asio/io_context.hpp>

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace mdnspub::dnssd {

/**
 * Error reported by a responder call.
 */
struct ResponderError {
    enum class Kind {
        /// The responder rejected or failed the call.
        failed,
        /// The call did not complete in time.
        timeout,
        /// The name is already in use on the network.
        conflict,
        /// The responder (daemon) cannot be reached.
        unavailable,
    };

    Kind kind {Kind::failed};
    std::string message;

    [[nodiscard]] std::string to_string() const;

    static const char* kind_to_string(Kind kind);
};

/**
 * Base class for all responder implementations. A responder publishes service records on the local network.
 *
 * All calls are asynchronous. The completion handler is always invoked through the io_context, never from inside the
 * call itself.
 */
class Responder {
  public:
    /**
     * Event for when the network reports a conflict on a registered record after its registration completed.
     */
    struct NameConflict {
        std::string instance_name;
        std::string service_type;
    };

    using EventEmitterType = EventEmitter<NameConflict>;
    using Result = tl::expected<void, ResponderError>;
    using CompletionHandler = std::function<void(Result result)>;

    Responder() = default;
    virtual ~Responder() = default;

    Responder(const Responder&) = delete;
    Responder& operator=(const Responder&) = delete;

    /**
     * Registers given record. Registering a record whose key is already registered replaces the existing
     * registration.
     * @param record The record to register.
     * @param handler Called with the outcome.
     */
    virtual void register_record(const ServiceRecord& record, CompletionHandler handler) = 0;

    /**
     * Replaces the TXT data of an already registered record.
     * @param record The record with the new TXT data.
     * @param handler Called with the outcome, fails when the record is not registered.
     */
    virtual void update_record(const ServiceRecord& record, CompletionHandler handler) = 0;

    /**
     * Unregisters the record with given key. Unregistering an unknown record succeeds.
     * @param instance_name The instance name of the record.
     * @param service_type The service type of the record.
     * @param handler Called with the outcome.
     */
    virtual void
    unregister_record(const std::string& instance_name, const std::string& service_type, CompletionHandler handler) = 0;

    /**
     * Creates the most appropriate responder implementation for the platform.
     * @param io_context The io_context to process results and invoke handlers on.
     * @param bindings The adapters and addresses to publish on. When empty, records are published on all interfaces.
     * @return The created responder instance, or nullptr if no implementation is available.
     */
    static std::unique_ptr<Responder>
    create(boost::asio::io_context& io_context, const std::vector<AdapterBinding>& bindings);

    /**
     * Sets given function as callback for the given event.
     * @tparam Type The type of the event.
     * @param f The function to be called when the event occurs.
     */
    template<typename Type>
    void on(EventEmitterType::handler<Type> f) {
        event_emitter_.on<Type>(std::move(f));
    }

    /**
     * Removes the callback for the given event.
     * @tparam Type The type of the event.
     */
    template<typename Type>
    void reset() {
        event_emitter_.reset<Type>();
    }

  protected:
    EventEmitterType event_emitter_;
};

}  // namespace mdnspub::dnssd
