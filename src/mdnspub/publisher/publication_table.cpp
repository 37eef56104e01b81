/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnspub/publisher/publication_table.hpp"

#include "mdnspub/core/assert.hpp"
#include "mdnspub/core/log.hpp"

#include <fmt/format.h>

mdnspub::PublicationState mdnspub::PublicationState::unpublished() {
    return {};
}

mdnspub::PublicationState mdnspub::PublicationState::publishing(dnssd::ServiceRecord record) {
    return {Phase::publishing, std::move(record)};
}

mdnspub::PublicationState mdnspub::PublicationState::published(dnssd::ServiceRecord record) {
    return {Phase::published, std::move(record)};
}

mdnspub::PublicationState mdnspub::PublicationState::unpublishing(dnssd::ServiceRecord record) {
    return {Phase::unpublishing, std::move(record)};
}

bool mdnspub::PublicationState::claims() const {
    return record.has_value() && (phase == Phase::publishing || phase == Phase::published);
}

std::string mdnspub::PublicationState::to_string() const {
    if (!record) {
        return phase_to_string(phase);
    }
    return fmt::format("{} {}.{}", phase_to_string(phase), record->instance_name, record->service_type);
}

const char* mdnspub::PublicationState::phase_to_string(const Phase phase) {
    switch (phase) {
        case Phase::unpublished:
            return "unpublished";
        case Phase::publishing:
            return "publishing";
        case Phase::published:
            return "published";
        case Phase::unpublishing:
            return "unpublishing";
        default:
            return "unknown";
    }
}

const mdnspub::PublicationState* mdnspub::PublicationTable::get(const container::ContainerId& id) const {
    const auto it = entries_.find(id);
    if (it == entries_.end()) {
        return nullptr;
    }
    return &it->second;
}

bool mdnspub::PublicationTable::put(const container::ContainerId& id, PublicationState state) {
    if (state.phase == PublicationState::Phase::unpublished) {
        entries_.erase(id);
        return true;
    }

    MDNSPUB_ASSERT_RETURN_WITH(state.record.has_value(), "State without record", false);

    if (state.claims()) {
        if (const auto holder = find_claim(state.record->key(), id)) {
            MDNSPUB_WARNING("{} is already claimed by container {}", state.to_string(), *holder);
            return false;
        }
    }

    entries_.insert_or_assign(id, std::move(state));
    return true;
}

bool mdnspub::PublicationTable::remove(const container::ContainerId& id) {
    return entries_.erase(id) > 0;
}

bool mdnspub::PublicationTable::compare_and_transition(
    const container::ContainerId& id, const PublicationState& expected, PublicationState new_state
) {
    const auto* current = get(id);
    const auto& actual = current != nullptr ? *current : PublicationState::unpublished();
    if (actual != expected) {
        MDNSPUB_TRACE(
            "Not transitioning {} to {}, expected {} but is {}", id, new_state.to_string(), expected.to_string(),
            actual.to_string()
        );
        return false;
    }
    return put(id, std::move(new_state));
}

std::optional<mdnspub::container::ContainerId>
mdnspub::PublicationTable::find_claim(const dnssd::ServiceRecord::Key& key, const container::ContainerId& excluding)
    const {
    for (const auto& [id, state] : entries_) {
        if (id == excluding || !state.claims()) {
            continue;
        }
        if (state.record->key() == key) {
            return id;
        }
    }
    return std::nullopt;
}

const mdnspub::PublicationTable::Entries& mdnspub::PublicationTable::all_entries() const {
    return entries_;
}

size_t mdnspub::PublicationTable::size() const {
    return entries_.size();
}

bool mdnspub::PublicationTable::empty() const {
    return entries_.empty();
}

void mdnspub::PublicationTable::clear() {
    entries_.clear();
}
