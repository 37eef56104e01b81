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

#include "platform.hpp"
#include "env.hpp"
#include "exception.hpp"
#include "string.hpp"

#ifndef SPDLOG_ACTIVE_LEVEL
    #define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif

#include <spdlog/spdlog.h>

#ifndef MDNSPUB_TRACE
    #define MDNSPUB_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
#endif

#ifndef MDNSPUB_DEBUG
    #define MDNSPUB_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
#endif

#ifndef MDNSPUB_CRITICAL
    #define MDNSPUB_CRITICAL(...) SPDLOG_CRITICAL(__VA_ARGS__)
#endif

#ifndef MDNSPUB_ERROR
    #define MDNSPUB_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)
#endif

#ifndef MDNSPUB_WARNING
    #define MDNSPUB_WARNING(...) SPDLOG_WARN(__VA_ARGS__)
#endif

#ifndef MDNSPUB_INFO
    #define MDNSPUB_INFO(...) SPDLOG_INFO(__VA_ARGS__)
#endif

#define CATCH_LOG_UNCAUGHT_EXCEPTIONS                                                                                 \
    catch (const mdnspub::Exception& e) {                                                                             \
        MDNSPUB_CRITICAL(                                                                                             \
            "mdnspub::Exception caught: {} - please handle your exceptions before reaching this point.", e.what()     \
        );                                                                                                            \
    }                                                                                                                 \
    catch (const std::exception& e) {                                                                                 \
        MDNSPUB_CRITICAL(                                                                                             \
            "std::exception caught: {} - please handle your exceptions before reaching this point.", e.what()         \
        );                                                                                                            \
    }

namespace mdnspub {

/**
 * Sets the log level for the application based on the given string.
 * The following are valid values:
 *  - TRACE
 *  - DEBUG
 *  - INFO (default)
 *  - WARN or WARNING
 *  - ERROR
 *  - CRITICAL
 *  - OFF
 * @param level The log level as string, case-insensitive.
 * @return True if the level was recognised, false if the level was reset to INFO.
 */
inline bool set_log_level(const std::string_view level) {
    if (string_compare_case_insensitive(level, "TRACE")) {
        spdlog::set_level(spdlog::level::trace);
    } else if (string_compare_case_insensitive(level, "DEBUG")) {
        spdlog::set_level(spdlog::level::debug);
    } else if (string_compare_case_insensitive(level, "INFO")) {
        spdlog::set_level(spdlog::level::info);
    } else if (string_compare_case_insensitive(level, "WARN") || string_compare_case_insensitive(level, "WARNING")) {
        spdlog::set_level(spdlog::level::warn);
    } else if (string_compare_case_insensitive(level, "ERROR")) {
        spdlog::set_level(spdlog::level::err);
    } else if (string_compare_case_insensitive(level, "CRITICAL")) {
        spdlog::set_level(spdlog::level::critical);
    } else if (string_compare_case_insensitive(level, "OFF")) {
        spdlog::set_level(spdlog::level::off);
    } else {
        spdlog::set_level(spdlog::level::info);
        SPDLOG_WARN("Invalid log level: {}. Setting log level to info.", level);
        return false;
    }
    return true;
}

/**
 * Tries to find given environment variable and set the log level accordingly. See set_log_level for valid values.
 * By default the log level is set to INFO.
 * @param env_var The environment variable to read the log level from.
 */
inline void set_log_level_from_env(const char* env_var = "LOG_LEVEL") {
    if (const auto env_value = get_env(env_var)) {
        set_log_level(*env_value);
    } else {
        set_log_level("INFO");
    }
}

}  // namespace mdnspub
