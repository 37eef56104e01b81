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

#include "exception.hpp"
#include "log.hpp"

#include <cstdlib>
#include <iostream>

/**
 * When MDNSPUB_LOG_ON_ASSERT is defined as true (1), a log message will be emitted when an assertion is hit. Default
 * is on.
 */
#ifndef MDNSPUB_LOG_ON_ASSERT
    #define MDNSPUB_LOG_ON_ASSERT 1
#endif

/**
 * When MDNSPUB_THROW_EXCEPTION_ON_ASSERT is defined as true (1), an exception will be thrown when an assertion is
 * hit. Default is off.
 */
#ifndef MDNSPUB_THROW_EXCEPTION_ON_ASSERT
    #define MDNSPUB_THROW_EXCEPTION_ON_ASSERT 0
#endif

/**
 * When MDNSPUB_ABORT_ON_ASSERT is defined as true (1), program execution will abort when an assertion is hit.
 * Default is off.
 */
#ifndef MDNSPUB_ABORT_ON_ASSERT
    #define MDNSPUB_ABORT_ON_ASSERT 0
#endif

#define MDNSPUB_LOG_IF_ENABLED(msg) \
    if (MDNSPUB_LOG_ON_ASSERT) {    \
        MDNSPUB_CRITICAL(msg);      \
    }

#define MDNSPUB_THROW_EXCEPTION_IF_ENABLED(msg) \
    if (MDNSPUB_THROW_EXCEPTION_ON_ASSERT) {    \
        MDNSPUB_THROW_EXCEPTION(msg);           \
    }

#define MDNSPUB_ABORT_IF_ENABLED(msg)                              \
    if (MDNSPUB_ABORT_ON_ASSERT) {                                 \
        std::cerr << "Abort on assertion: " << (msg) << std::endl; \
        std::abort();                                              \
    }

/**
 * Assert condition to be true, otherwise:
 *  - Logs if enabled
 *  - Throws if enabled
 *  - Aborts if enabled
 * @param condition The condition to test.
 * @param message The message for logging, throwing and/or aborting.
 */
#define MDNSPUB_ASSERT(condition, message)                                    \
    do {                                                                      \
        if (!(condition)) {                                                   \
            MDNSPUB_LOG_IF_ENABLED("Assertion failure: " message)             \
            MDNSPUB_THROW_EXCEPTION_IF_ENABLED("Assertion failure: " message) \
            MDNSPUB_ABORT_IF_ENABLED(message)                                 \
        }                                                                     \
    } while (false)

/**
 * Same as MDNSPUB_ASSERT, but returns from the calling (void) function when the condition is false.
 */
#define MDNSPUB_ASSERT_RETURN(condition, message)                             \
    do {                                                                      \
        if (!(condition)) {                                                   \
            MDNSPUB_LOG_IF_ENABLED("Assertion failure: " message)             \
            MDNSPUB_THROW_EXCEPTION_IF_ENABLED("Assertion failure: " message) \
            MDNSPUB_ABORT_IF_ENABLED(message)                                 \
            return;                                                           \
        }                                                                     \
    } while (false)

/**
 * Same as MDNSPUB_ASSERT, but returns given `return_value` when the condition is false.
 */
#define MDNSPUB_ASSERT_RETURN_WITH(condition, message, return_value)          \
    do {                                                                      \
        if (!(condition)) {                                                   \
            MDNSPUB_LOG_IF_ENABLED("Assertion failure: " message)             \
            MDNSPUB_THROW_EXCEPTION_IF_ENABLED("Assertion failure: " message) \
            MDNSPUB_ABORT_IF_ENABLED(message)                                 \
            return return_value;                                              \
        }                                                                     \
    } while (false)

/**
 * Asserts given condition, but never throws. Useful for places where an exception cannot be thrown like destructors.
 */
#define MDNSPUB_ASSERT_NO_THROW(condition, message)               \
    do {                                                          \
        if (!(condition)) {                                       \
            MDNSPUB_LOG_IF_ENABLED("Assertion failure: " message) \
            MDNSPUB_ABORT_IF_ENABLED(message)                     \
        }                                                         \
    } while (false)

#define MDNSPUB_ASSERT_FALSE(message) MDNSPUB_ASSERT(false, message)
