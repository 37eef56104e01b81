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

// Note: these constants are treated as tri-state variables, so they can be 0, 1, or undefined.

// Apple
#if defined(__APPLE__)
    #define MDNSPUB_APPLE 1
    #define MDNSPUB_POSIX 1
#else
    #define MDNSPUB_APPLE 0
#endif

// Linux
#if defined(__linux__)
    #define MDNSPUB_LINUX 1
    #define MDNSPUB_POSIX 1  // Most distributions are mostly POSIX compliant.
#else
    #define MDNSPUB_LINUX 0
#endif

// BSD
#if defined(__FreeBSD__) || defined(__OpenBSD__)
    #define MDNSPUB_BSD 1
    #define MDNSPUB_POSIX 1  // Mostly POSIX compliant.
#else
    #define MDNSPUB_BSD 0
#endif

// Posix
#ifndef MDNSPUB_POSIX
    #if defined(_POSIX_VERSION)
        #define MDNSPUB_POSIX 1
    #else
        #define MDNSPUB_POSIX 0
    #endif
#endif

#if !MDNSPUB_POSIX
    #error "mdnspub requires a POSIX platform (unix domain sockets, getifaddrs)."
#endif

#if defined(__GNUC__) || defined(__clang__)
    #define MDNSPUB_FUNCTION __PRETTY_FUNCTION__
#else
    #define MDNSPUB_FUNCTION __func__
#endif
