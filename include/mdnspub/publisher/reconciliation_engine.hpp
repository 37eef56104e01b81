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

#include "label_parser.hpp"
#include "publication_table.hpp"
#include "mdnspub/container/event_source.hpp"
#include "mdnspub/core/events/event_emitter.hpp"
#include "mdnspub/core/net/timer/asio_timer.hpp"
#include "mdnspub/dnssd/responder.hpp"

#include <boost/asio/io_context.hpp>

#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <vector>

namespace mdnspub {

/**
 * Keeps the records published by the responder in line with the running containers.
 *
 * Live events, resyncs and responder conflicts are fed into a single FIFO queue which is processed one item at a
 * time on the io_context. An item is done when all its responder calls completed or timed out.
 */
class ReconciliationEngine {
  public:
    struct Configuration {
        LabelParser::Configuration label_parser;
        uint32_t ttl_seconds {3600};
        /// Adds provenance TXT entries to every record.
        bool debug {false};
        /// Interval of the periodic resync, zero disables it.
        std::chrono::milliseconds resync_interval {std::chrono::seconds(300)};
        /// Bound of every single responder call.
        std::chrono::milliseconds responder_timeout {std::chrono::seconds(5)};
        /// Bound of both draining the in-flight item and the final unregister sweep.
        std::chrono::milliseconds shutdown_grace {std::chrono::seconds(5)};
    };

    using EventEmitterType = EventEmitter<container::SourceError>;

    ReconciliationEngine(
        boost::asio::io_context& io_context, container::EventSource& source, dnssd::Responder& responder,
        PublicationTable& table, Configuration config
    );
    ~ReconciliationEngine();

    ReconciliationEngine(const ReconciliationEngine&) = delete;
    ReconciliationEngine& operator=(const ReconciliationEngine&) = delete;

    /**
     * Subscribes to the event source. The startup resync is queued once the source acknowledged the subscription,
     * events arriving while listing are queued behind it.
     */
    void start();

    /**
     * Queues a resync, unless one is queued already.
     */
    void request_resync();

    /**
     * Stops admitting work, lets the in-flight item finish and unregisters everything that is published. The
     * handler is called once all unregisters completed, or when the grace period expires, whichever comes first.
     * @param handler The handler to call when done.
     */
    void async_shutdown(std::function<void()> handler);

    /**
     * @return True when running with nothing queued or in flight.
     */
    [[nodiscard]] bool is_idle() const;

    /**
     * @return True once shutdown completed.
     */
    [[nodiscard]] bool is_shut_down() const;

    [[nodiscard]] size_t get_queue_size() const {
        return queue_.size();
    }

    /**
     * Sets given function as callback for the given event.
     * @tparam Type The type of the event.
     * @param f The function to be called when the event occurs.
     */
    template<typename Type>
    void on(EventEmitterType::handler<Type> f) {
        event_emitter_.on<Type>(std::move(f));
    }

  private:
    enum class State {
        idle,
        running,
        draining,
        sweeping,
        stopped,
    };

    struct WorkItem {
        enum class Kind {
            event,
            startup_resync,
            periodic_resync,
            name_conflict,
        };

        Kind kind {Kind::event};
        container::ContainerEvent event;
        dnssd::ServiceRecord::Key key;
    };

    using Done = std::function<void()>;

    boost::asio::io_context& io_context_;
    container::EventSource& source_;
    dnssd::Responder& responder_;
    PublicationTable& table_;
    Configuration config_;
    LabelParser parser_;
    AsioTimer resync_timer_;
    AsioTimer grace_timer_;
    EventEmitterType event_emitter_;

    State state_ {State::idle};
    std::deque<WorkItem> queue_;
    bool in_flight_ = false;
    uint64_t item_sequence_ = 0;
    bool next_scheduled_ = false;
    bool resync_queued_ = false;
    std::vector<std::function<void()>> shutdown_handlers_;

    // Callbacks check this before touching the engine.
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);

    void on_subscribed();
    void enqueue(WorkItem item);
    void schedule_next();
    void process_next();
    void finish_item(uint64_t sequence);
    void dispatch(const WorkItem& item, const Done& done);

    void handle_event(const container::ContainerEvent& event, const Done& done);
    void handle_start(const container::ContainerId& id, const container::Labels& labels, const Done& done);
    void handle_stop(const container::ContainerId& id, const Done& done);
    void handle_resync(bool startup, const Done& done);
    void handle_name_conflict(const dnssd::ServiceRecord::Key& key, const Done& done);

    void publish(const container::ContainerId& id, const dnssd::ServiceRecord& record, const Done& done);
    void unpublish(const container::ContainerId& id, const dnssd::ServiceRecord& record, const Done& done);
    void withdraw(const dnssd::ServiceRecord& record, const Done& done);

    void call_with_timeout(
        const std::function<void(dnssd::Responder::CompletionHandler)>& call,
        dnssd::Responder::CompletionHandler handler
    );

    void on_grace_expired();
    void begin_sweep();
    void complete_shutdown();
};

}  // namespace mdnspub
