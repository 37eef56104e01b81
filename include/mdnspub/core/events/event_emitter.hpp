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

#include <functional>
#include <tuple>

namespace mdnspub {

/**
 * Holds one handler per event type and calls it when the event is emitted.
 * @tparam Events The events which can be emitted.
 */
template<class... Events>
class EventEmitter {
  public:
    template<class Type>
    using handler = std::function<void(const Type&)>;

    EventEmitter() = default;

    EventEmitter(const EventEmitter&) = delete;
    EventEmitter& operator=(const EventEmitter&) = delete;

    EventEmitter(EventEmitter&&) = default;
    EventEmitter& operator=(EventEmitter&&) = default;

    /**
     * Registers a handler for given event type, replacing an existing one.
     * @tparam Type The type of the event.
     * @param f A valid handler to be registered.
     */
    template<class Type>
    void on(handler<Type> f) {
        get<Type>() = std::move(f);
    }

    /**
     * Deletes the handler for the given event type.
     * @tparam Type The type of the event.
     */
    template<class Type>
    void reset() noexcept {
        get<Type>() = nullptr;
    }

    /**
     * Deletes all handlers.
     */
    void reset() noexcept {
        (reset<Events>(), ...);
    }

    /**
     * @tparam Type The type of the event.
     * @return True if there is a handler registered for the event type.
     */
    template<class Type>
    [[nodiscard]] bool has_handler() const noexcept {
        return get<Type>() != nullptr;
    }

    /**
     * Calls the handler for given event type, if there is one.
     * @tparam Type The type of the event.
     * @param event The event to emit.
     */
    template<class Type>
    void emit(const Type& event) {
        if (auto& h = get<Type>(); h) {
            h(event);
        }
    }

  private:
    std::tuple<handler<Events>...> handlers_ {};

    template<class Type>
    const auto& get() const noexcept {
        return std::get<handler<Type>>(handlers_);
    }

    template<class Type>
    auto& get() noexcept {
        return std::get<handler<Type>>(handlers_);
    }
};

}  // namespace mdnspub
