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

#include "mdnspub/container/container_event.hpp"
#include "mdnspub/dnssd/service_record.hpp"

#include <map>
#include <optional>

namespace mdnspub {

/**
 * The publication state of a single container.
 */
struct PublicationState {
    enum class Phase {
        unpublished,
        publishing,
        published,
        unpublishing,
    };

    Phase phase {Phase::unpublished};

    /// Present for every phase except unpublished.
    std::optional<dnssd::ServiceRecord> record;

    static PublicationState unpublished();
    static PublicationState publishing(dnssd::ServiceRecord record);
    static PublicationState published(dnssd::ServiceRecord record);
    static PublicationState unpublishing(dnssd::ServiceRecord record);

    /**
     * @return True if the state holds the key of its record, which is the case while publishing or published.
     */
    [[nodiscard]] bool claims() const;

    [[nodiscard]] std::string to_string() const;

    static const char* phase_to_string(Phase phase);

    /**
     * Compares the phase, and the record unless both are unpublished.
     */
    friend bool operator==(const PublicationState& lhs, const PublicationState& rhs) {
        if (lhs.phase != rhs.phase) {
            return false;
        }
        if (lhs.phase == Phase::unpublished) {
            return true;
        }
        return lhs.record == rhs.record;
    }

    friend bool operator!=(const PublicationState& lhs, const PublicationState& rhs) {
        return !(lhs == rhs);
    }
};

/**
 * Maps containers to their publication state. Absent entries are unpublished.
 *
 * The table holds at most one claiming (publishing or published) entry per record key. It has no synchronisation of
 * its own and must only be used from a single thread.
 */
class PublicationTable {
  public:
    using Entries = std::map<container::ContainerId, PublicationState>;

    /**
     * @param id The container.
     * @return The state of the container, or nullptr when unpublished.
     */
    [[nodiscard]] const PublicationState* get(const container::ContainerId& id) const;

    /**
     * Sets the state of a container. Setting unpublished removes the entry.
     * @param id The container.
     * @param state The new state.
     * @return False if the state was rejected because another container already claims its key.
     */
    bool put(const container::ContainerId& id, PublicationState state);

    /**
     * Removes the entry of a container.
     * @return True if there was an entry.
     */
    bool remove(const container::ContainerId& id);

    /**
     * Sets the state of a container only when its current state equals expected.
     * @param id The container.
     * @param expected The state the container is expected to be in. Absent entries count as unpublished.
     * @param new_state The new state.
     * @return True if the transition was made.
     */
    bool compare_and_transition(
        const container::ContainerId& id, const PublicationState& expected, PublicationState new_state
    );

    /**
     * Finds the container which claims given key.
     * @param key The record key.
     * @param excluding A container to ignore, normally the one asking.
     * @return The claiming container, if any.
     */
    [[nodiscard]] std::optional<container::ContainerId>
    find_claim(const dnssd::ServiceRecord::Key& key, const container::ContainerId& excluding = {}) const;

    [[nodiscard]] const Entries& all_entries() const;

    [[nodiscard]] size_t size() const;

    [[nodiscard]] bool empty() const;

    void clear();

  private:
    Entries entries_;
};

}  // namespace mdnspub
