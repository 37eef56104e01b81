/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnspub/publisher/reconciliation_engine.hpp"

#include "mdnspub/core/assert.hpp"
#include "mdnspub/core/log.hpp"
#include "mdnspub/publisher/errors.hpp"
#include "mdnspub/publisher/record_builder.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

#include <set>

namespace {

std::string short_id(const mdnspub::container::ContainerId& id) {
    return id.substr(0, 12);
}

}  // namespace

mdnspub::ReconciliationEngine::ReconciliationEngine(
    boost::asio::io_context& io_context, container::EventSource& source, dnssd::Responder& responder,
    PublicationTable& table, Configuration config
) :
    io_context_(io_context),
    source_(source),
    responder_(responder),
    table_(table),
    config_(std::move(config)),
    parser_(config_.label_parser),
    resync_timer_(io_context),
    grace_timer_(io_context) {
    responder_.on<dnssd::Responder::NameConflict>([this](const dnssd::Responder::NameConflict& event) {
        if (state_ != State::running) {
            return;
        }
        MDNSPUB_WARNING("Responder reported a name conflict for {}.{}", event.instance_name, event.service_type);
        WorkItem item;
        item.kind = WorkItem::Kind::name_conflict;
        item.key = {event.instance_name, event.service_type};
        enqueue(std::move(item));
    });
}

mdnspub::ReconciliationEngine::~ReconciliationEngine() {
    alive_.reset();
    resync_timer_.stop();
    grace_timer_.stop();
    responder_.reset<dnssd::Responder::NameConflict>();
    if (state_ == State::running) {
        source_.cancel();
    }
}

void mdnspub::ReconciliationEngine::start() {
    MDNSPUB_ASSERT_RETURN(state_ == State::idle, "Engine already started");

    state_ = State::running;

    source_.subscribe(
        [this, alive = std::weak_ptr<bool>(alive_)](const container::ContainerEvent& event) {
            if (alive.expired() || state_ != State::running) {
                return;
            }
            MDNSPUB_DEBUG("Container {} event for {}", container::to_string(event.type), short_id(event.id));
            WorkItem item;
            item.kind = WorkItem::Kind::event;
            item.event = event;
            enqueue(std::move(item));
        },
        [this, alive = std::weak_ptr<bool>(alive_)](const container::SourceError& error) {
            if (alive.expired()) {
                return;
            }
            MDNSPUB_CRITICAL("Container event source failed: {}", error.message);
            event_emitter_.emit(error);
        },
        [this, alive = std::weak_ptr<bool>(alive_)] {
            if (alive.expired() || state_ != State::running) {
                return;
            }
            on_subscribed();
        }
    );
}

void mdnspub::ReconciliationEngine::on_subscribed() {
    // Listing only now, a container changing while the subscription was set up shows in the list.
    WorkItem startup;
    startup.kind = WorkItem::Kind::startup_resync;
    queue_.push_front(std::move(startup));
    schedule_next();

    if (config_.resync_interval.count() > 0) {
        resync_timer_.start(config_.resync_interval, [this] {
            request_resync();
        });
    }
}

void mdnspub::ReconciliationEngine::request_resync() {
    if (state_ != State::running || resync_queued_) {
        return;
    }
    resync_queued_ = true;
    WorkItem item;
    item.kind = WorkItem::Kind::periodic_resync;
    enqueue(std::move(item));
}

void mdnspub::ReconciliationEngine::async_shutdown(std::function<void()> handler) {
    if (handler) {
        shutdown_handlers_.push_back(std::move(handler));
    }

    switch (state_) {
        case State::idle:
        case State::stopped:
            complete_shutdown();
            return;
        case State::draining:
        case State::sweeping:
            return;
        case State::running:
            break;
    }

    MDNSPUB_INFO("Shutting down, {} record(s) to unpublish", table_.size());

    state_ = State::draining;
    source_.cancel();
    resync_timer_.stop();
    queue_.clear();
    resync_queued_ = false;

    grace_timer_.once(config_.shutdown_grace, [this] {
        on_grace_expired();
    });

    if (!in_flight_) {
        begin_sweep();
    }
}

bool mdnspub::ReconciliationEngine::is_idle() const {
    return state_ == State::running && !in_flight_ && queue_.empty();
}

bool mdnspub::ReconciliationEngine::is_shut_down() const {
    return state_ == State::stopped;
}

void mdnspub::ReconciliationEngine::enqueue(WorkItem item) {
    queue_.push_back(std::move(item));
    schedule_next();
}

void mdnspub::ReconciliationEngine::schedule_next() {
    if (next_scheduled_ || in_flight_ || queue_.empty()) {
        return;
    }
    next_scheduled_ = true;
    boost::asio::post(io_context_, [this, alive = std::weak_ptr<bool>(alive_)] {
        if (alive.expired()) {
            return;
        }
        next_scheduled_ = false;
        process_next();
    });
}

void mdnspub::ReconciliationEngine::process_next() {
    if (state_ != State::running || in_flight_ || queue_.empty()) {
        return;
    }

    auto item = std::move(queue_.front());
    queue_.pop_front();

    if (item.kind == WorkItem::Kind::periodic_resync) {
        resync_queued_ = false;
    }

    in_flight_ = true;
    const auto sequence = ++item_sequence_;

    Done done = [this, sequence, alive = std::weak_ptr<bool>(alive_)] {
        if (alive.expired()) {
            return;
        }
        finish_item(sequence);
    };

    try {
        dispatch(item, done);
    } catch (const std::exception& e) {
        MDNSPUB_ERROR("Exception while processing work item: {}", e.what());
        finish_item(sequence);
    }
}

void mdnspub::ReconciliationEngine::finish_item(const uint64_t sequence) {
    if (!in_flight_ || sequence != item_sequence_) {
        return;  // Stale
    }

    in_flight_ = false;

    if (state_ == State::draining) {
        begin_sweep();
        return;
    }

    schedule_next();
}

void mdnspub::ReconciliationEngine::dispatch(const WorkItem& item, const Done& done) {
    switch (item.kind) {
        case WorkItem::Kind::event:
            handle_event(item.event, done);
            return;
        case WorkItem::Kind::startup_resync:
            handle_resync(true, done);
            return;
        case WorkItem::Kind::periodic_resync:
            handle_resync(false, done);
            return;
        case WorkItem::Kind::name_conflict:
            handle_name_conflict(item.key, done);
            return;
    }
    done();
}

void mdnspub::ReconciliationEngine::handle_event(const container::ContainerEvent& event, const Done& done) {
    switch (event.type) {
        case container::EventType::start:
            handle_start(event.id, event.labels.value_or(container::Labels {}), done);
            return;
        case container::EventType::stop:
        case container::EventType::die:
        case container::EventType::destroy:
            handle_stop(event.id, done);
            return;
    }
    done();
}

void mdnspub::ReconciliationEngine::handle_start(
    const container::ContainerId& id, const container::Labels& labels, const Done& done
) {
    auto intent = parser_.parse(labels);

    if (!intent) {
        MDNSPUB_WARNING("Not publishing container {}: {}", short_id(id), intent.error().to_string());
        done();
        return;
    }

    if (!intent->has_value()) {
        MDNSPUB_TRACE("Container {} has no publish label", short_id(id));
        done();
        return;
    }

    ProcessContext context;
    context.ttl_seconds = config_.ttl_seconds;
    context.debug = config_.debug;
    context.container_id = id;
    context.timestamp = std::chrono::system_clock::now();
    context.local_domain = parser_.get_configuration().local_domain;

    auto record = RecordBuilder::build(**intent, context);

    if (const auto* current = table_.get(id); current != nullptr && current->record.has_value()) {
        if (current->record == record) {
            if (current->phase == PublicationState::Phase::published) {
                MDNSPUB_TRACE("Record of container {} is unchanged", short_id(id));
                done();
                return;
            }
        } else {
            MDNSPUB_INFO(
                "Record of container {} changed from {} to {}", short_id(id), current->record->description(),
                record.description()
            );
            const auto previous = *current->record;
            unpublish(id, previous, [this, id, record, done] {
                publish(id, record, done);
            });
            return;
        }
    }

    publish(id, record, done);
}

void mdnspub::ReconciliationEngine::handle_stop(const container::ContainerId& id, const Done& done) {
    const auto* current = table_.get(id);
    if (current == nullptr || !current->claims()) {
        MDNSPUB_TRACE("Container {} has nothing published", short_id(id));
        done();
        return;
    }

    const auto record = *current->record;
    unpublish(id, record, done);
}

void mdnspub::ReconciliationEngine::handle_resync(const bool startup, const Done& done) {
    MDNSPUB_DEBUG("{} resync", startup ? "Startup" : "Periodic");

    source_.async_list_running([this, startup, done, alive = std::weak_ptr<bool>(alive_)](
                                   tl::expected<std::vector<container::ContainerInfo>, container::SourceError> result
                               ) {
        if (alive.expired()) {
            return;
        }

        if (!result) {
            if (startup) {
                MDNSPUB_CRITICAL("Failed to list running containers: {}", result.error().message);
                done();
                event_emitter_.emit(result.error());
            } else {
                MDNSPUB_ERROR("Failed to list running containers, skipping resync: {}", result.error().message);
                done();
            }
            return;
        }

        if (state_ != State::running) {
            done();
            return;
        }

        std::vector<WorkItem> items;
        std::set<container::ContainerId> running;

        for (auto& info : *result) {
            running.insert(info.id);
            WorkItem item;
            item.event = {container::EventType::start, info.id, std::move(info.labels)};
            items.push_back(std::move(item));
        }

        for (const auto& [id, state] : table_.all_entries()) {
            if (running.count(id) == 0) {
                MDNSPUB_DEBUG("Container {} is no longer running", short_id(id));
                WorkItem item;
                item.event = {container::EventType::stop, id, std::nullopt};
                items.push_back(std::move(item));
            }
        }

        // Resync results go before anything that arrived while listing.
        queue_.insert(queue_.begin(), items.begin(), items.end());
        done();
    });
}

void mdnspub::ReconciliationEngine::handle_name_conflict(const dnssd::ServiceRecord::Key& key, const Done& done) {
    const auto holder = table_.find_claim(key);
    if (!holder) {
        done();
        return;
    }

    const auto* state = table_.get(*holder);
    if (state == nullptr || !state->record.has_value()) {
        done();
        return;
    }

    MDNSPUB_WARNING("Unpublishing {}.{} of container {} after name conflict", key.first, key.second, short_id(*holder));
    const auto record = *state->record;
    unpublish(*holder, record, done);
}

void mdnspub::ReconciliationEngine::publish(
    const container::ContainerId& id, const dnssd::ServiceRecord& record, const Done& done
) {
    if (state_ != State::running) {
        done();
        return;
    }

    if (const auto holder = table_.find_claim(record.key(), id)) {
        const ConflictError error {record.key(), *holder, id};
        MDNSPUB_WARNING("{}", error.to_string());
        done();
        return;
    }

    if (!table_.put(id, PublicationState::publishing(record))) {
        done();
        return;
    }

    call_with_timeout(
        [this, record](dnssd::Responder::CompletionHandler handler) {
            responder_.register_record(record, std::move(handler));
        },
        [this, id, record, done](const dnssd::Responder::Result& result) {
            if (result) {
                if (table_.compare_and_transition(
                        id, PublicationState::publishing(record), PublicationState::published(record)
                    )) {
                    MDNSPUB_INFO("Published {} for container {}", record.description(), short_id(id));
                }
            } else {
                table_.compare_and_transition(
                    id, PublicationState::publishing(record), PublicationState::unpublished()
                );
                MDNSPUB_ERROR(
                    "Failed to publish {} for container {}: {}", record.description(), short_id(id),
                    result.error().to_string()
                );
                if (result.error().kind == dnssd::ResponderError::Kind::timeout) {
                    withdraw(record, done);
                    return;
                }
            }
            done();
        }
    );
}

void mdnspub::ReconciliationEngine::withdraw(const dnssd::ServiceRecord& record, const Done& done) {
    if (state_ == State::stopped) {
        done();
        return;
    }

    // A registration which timed out may still complete on the wire, and nothing in the table tracks it anymore.
    call_with_timeout(
        [this, record](dnssd::Responder::CompletionHandler handler) {
            responder_.unregister_record(record.instance_name, record.service_type, std::move(handler));
        },
        [record, done](const dnssd::Responder::Result& result) {
            if (result) {
                MDNSPUB_DEBUG("Withdrew {} after its registration timed out", record.description());
            } else {
                MDNSPUB_ERROR("Failed to withdraw {}: {}", record.description(), result.error().to_string());
            }
            done();
        }
    );
}

void mdnspub::ReconciliationEngine::unpublish(
    const container::ContainerId& id, const dnssd::ServiceRecord& record, const Done& done
) {
    table_.put(id, PublicationState::unpublishing(record));

    call_with_timeout(
        [this, record](dnssd::Responder::CompletionHandler handler) {
            responder_.unregister_record(record.instance_name, record.service_type, std::move(handler));
        },
        [this, id, record, done](const dnssd::Responder::Result& result) {
            if (result) {
                MDNSPUB_INFO("Unpublished {} for container {}", record.description(), short_id(id));
            } else {
                MDNSPUB_ERROR(
                    "Failed to unpublish {} for container {}: {}", record.description(), short_id(id),
                    result.error().to_string()
                );
            }
            table_.compare_and_transition(id, PublicationState::unpublishing(record), PublicationState::unpublished());
            done();
        }
    );
}

void mdnspub::ReconciliationEngine::call_with_timeout(
    const std::function<void(dnssd::Responder::CompletionHandler)>& call, dnssd::Responder::CompletionHandler handler
) {
    struct PendingCall {
        boost::asio::steady_timer timer;
        dnssd::Responder::CompletionHandler handler;
        bool completed {false};

        PendingCall(boost::asio::io_context& io_context, dnssd::Responder::CompletionHandler h) :
            timer(io_context), handler(std::move(h)) {}
    };

    auto pending = std::make_shared<PendingCall>(io_context_, std::move(handler));

    auto complete = [this, pending, alive = std::weak_ptr<bool>(alive_)](const dnssd::Responder::Result& result) {
        if (pending->completed) {
            return;  // Timed out before, or completed twice.
        }
        pending->completed = true;
        pending->timer.cancel();

        if (alive.expired()) {
            return;
        }

        auto h = std::move(pending->handler);
        try {
            h(result);
        } catch (const std::exception& e) {
            MDNSPUB_ERROR("Exception in responder completion: {}", e.what());
            if (in_flight_) {
                finish_item(item_sequence_);
            }
        }
    };

    pending->timer.expires_after(config_.responder_timeout);
    pending->timer.async_wait([complete](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) {
            return;
        }
        complete(tl::unexpected(dnssd::ResponderError {dnssd::ResponderError::Kind::timeout, "Responder call timed out"}
        ));
    });

    call(complete);
}

void mdnspub::ReconciliationEngine::on_grace_expired() {
    if (state_ == State::draining) {
        MDNSPUB_WARNING("In-flight work did not finish within the grace period");
        // Invalidate the in-flight item, its completions are ignored from here.
        in_flight_ = false;
        ++item_sequence_;

        for (const auto& [id, state] : table_.all_entries()) {
            if (!state.record) {
                continue;
            }
            responder_.unregister_record(
                state.record->instance_name, state.record->service_type,
                [instance = state.record->instance_name](const dnssd::Responder::Result& result) {
                    if (!result) {
                        MDNSPUB_ERROR("Failed to unpublish {}: {}", instance, result.error().to_string());
                    }
                }
            );
        }
    } else if (state_ == State::sweeping) {
        MDNSPUB_WARNING("Unpublishing did not finish within the grace period");
    }

    complete_shutdown();
}

void mdnspub::ReconciliationEngine::begin_sweep() {
    state_ = State::sweeping;

    std::vector<std::pair<container::ContainerId, dnssd::ServiceRecord>> records;
    for (const auto& [id, state] : table_.all_entries()) {
        if (state.record) {
            records.emplace_back(id, *state.record);
        }
    }

    if (records.empty()) {
        complete_shutdown();
        return;
    }

    auto remaining = std::make_shared<size_t>(records.size());

    for (const auto& [id, record] : records) {
        call_with_timeout(
            [this, record = record](dnssd::Responder::CompletionHandler handler) {
                responder_.unregister_record(record.instance_name, record.service_type, std::move(handler));
            },
            [this, remaining, id = id, record = record](const dnssd::Responder::Result& result) {
                if (state_ != State::sweeping) {
                    return;
                }
                if (result) {
                    MDNSPUB_INFO("Unpublished {} for container {}", record.description(), short_id(id));
                } else {
                    MDNSPUB_ERROR("Failed to unpublish {}: {}", record.description(), result.error().to_string());
                }
                table_.remove(id);
                if (--*remaining == 0) {
                    complete_shutdown();
                }
            }
        );
    }
}

void mdnspub::ReconciliationEngine::complete_shutdown() {
    if (state_ != State::stopped) {
        state_ = State::stopped;
        grace_timer_.stop();
        resync_timer_.stop();
        queue_.clear();
        table_.clear();
        MDNSPUB_INFO("Shutdown complete");
    }

    auto handlers = std::move(shutdown_handlers_);
    shutdown_handlers_.clear();

    for (auto& handler : handlers) {
        boost::asio::post(io_context_, std::move(handler));
    }
}
