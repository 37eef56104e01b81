/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnspub/core/net/timer/asio_timer.hpp"

#include "mdnspub/core/log.hpp"

mdnspub::AsioTimer::AsioTimer(boost::asio::io_context& io_context) : timer_(io_context) {}

mdnspub::AsioTimer::~AsioTimer() {
    stop();
}

void mdnspub::AsioTimer::once(const std::chrono::milliseconds duration, TimerCallback cb) {
    start(duration, std::move(cb), false);
}

void mdnspub::AsioTimer::start(const std::chrono::milliseconds duration, TimerCallback cb, const bool repeating) {
    std::lock_guard lock(mutex_);
    timer_.cancel();
    ++generation_;
    callback_ = std::move(cb);
    duration_ = duration;
    repeating_ = repeating;
    wait();
}

void mdnspub::AsioTimer::stop() {
    std::lock_guard lock(mutex_);
    timer_.cancel();
    ++generation_;
    callback_ = nullptr;
    repeating_ = false;
}

bool mdnspub::AsioTimer::is_running() const {
    std::lock_guard lock(mutex_);
    return callback_ != nullptr;
}

void mdnspub::AsioTimer::wait() {
    timer_.expires_after(duration_);
    timer_.async_wait([this, generation = generation_](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) {
            return;
        }

        if (ec) {
            MDNSPUB_ERROR("Timer error: {}", ec.message());
            return;
        }

        std::lock_guard lock(mutex_);
        if (generation != generation_ || !callback_) {
            return;  // Stopped or restarted after this wait was scheduled.
        }

        auto callback = callback_;
        callback();

        if (generation != generation_) {
            return;  // The callback restarted or stopped the timer.
        }

        if (repeating_) {
            wait();
            return;
        }
        callback_ = nullptr;
    });
}
