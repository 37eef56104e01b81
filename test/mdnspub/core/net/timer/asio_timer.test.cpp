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

#include <catch2/catch_all.hpp>

TEST_CASE("mdnspub::AsioTimer") {
    boost::asio::io_context io_context;

    SECTION("Once") {
        mdnspub::AsioTimer timer(io_context);

        int callback_count = 0;
        timer.once(std::chrono::milliseconds(20), [&] {
            ++callback_count;
        });
        REQUIRE(timer.is_running());

        io_context.run();
        CHECK(callback_count == 1);
        CHECK_FALSE(timer.is_running());
    }

    SECTION("Repeatedly until stopped from the callback") {
        mdnspub::AsioTimer timer(io_context);

        int callback_count = 0;
        timer.start(std::chrono::milliseconds(10), [&] {
            if (++callback_count == 3) {
                timer.stop();
            }
        });

        io_context.run();
        CHECK(callback_count == 3);
    }

    SECTION("Restarting replaces the pending callback") {
        mdnspub::AsioTimer timer(io_context);

        int first = 0;
        int second = 0;
        timer.once(std::chrono::milliseconds(10), [&] {
            ++first;
        });
        timer.once(std::chrono::milliseconds(20), [&] {
            ++second;
        });

        io_context.run();
        CHECK(first == 0);
        CHECK(second == 1);
    }

    SECTION("Stop and destroy prevent callbacks") {
        int callback_count = 0;
        {
            mdnspub::AsioTimer stopped(io_context);
            stopped.once(std::chrono::milliseconds(10), [&] {
                ++callback_count;
            });
            stopped.stop();

            mdnspub::AsioTimer destroyed(io_context);
            destroyed.start(std::chrono::milliseconds(10), [&] {
                ++callback_count;
            });
        }

        io_context.run();
        CHECK(callback_count == 0);
    }
}
