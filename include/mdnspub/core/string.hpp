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

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace mdnspub {

/**
 * Tests whether given text starts with a certain string.
 * @param text The text to test.
 * @param starts_with The string to test for.
 * @return True if text starts with starts_with, false otherwise.
 */
inline bool string_starts_with(const std::string_view text, const std::string_view starts_with) {
    return text.rfind(starts_with, 0) == 0;
}

/**
 * Tests whether given text ends with a certain string.
 * @param text The text to test.
 * @param ends_with The string to test for.
 * @return True if text ends with ends_with, false otherwise.
 */
inline bool string_ends_with(const std::string_view text, const std::string_view ends_with) {
    if (ends_with.length() > text.length()) {
        return false;
    }
    return text.compare(text.length() - ends_with.length(), ends_with.length(), ends_with) == 0;
}

/**
 * Compares 2 strings case-insensitively.
 * @param lhs Left hand side
 * @param rhs Right hand side
 * @return True if strings are equal, false otherwise.
 */
inline bool string_compare_case_insensitive(const std::string_view lhs, const std::string_view rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }

    for (size_t i = 0; i < lhs.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(lhs[i])) != std::tolower(static_cast<unsigned char>(rhs[i]))) {
            return false;
        }
    }

    return true;
}

/**
 * Tests whether given text ends with a certain string, ignoring case.
 */
inline bool string_ends_with_case_insensitive(const std::string_view text, const std::string_view ends_with) {
    if (ends_with.length() > text.length()) {
        return false;
    }
    return string_compare_case_insensitive(text.substr(text.length() - ends_with.length()), ends_with);
}

/**
 * Returns a view of given string without leading and trailing whitespace.
 * @param string The string to trim.
 * @return The trimmed view, which points into the original string.
 */
inline std::string_view string_trim(const std::string_view string) {
    const auto is_space = [](const char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    };
    const auto begin = std::find_if_not(string.begin(), string.end(), is_space);
    const auto end = std::find_if_not(string.rbegin(), string.rend(), is_space).base();
    if (begin >= end) {
        return {};
    }
    return string.substr(static_cast<size_t>(begin - string.begin()), static_cast<size_t>(end - begin));
}

/**
 * String to number - a small convenience function around std::from_chars.
 * @tparam Type Type of the value to convert from a string.
 * @param string String to convert to a value.
 * @param strict If true, the whole string must be a number, otherwise only the beginning of the string must be a
 * number.
 * @return The converted value as optional, which will contain a value on success or will be empty on failure.
 */
template<typename Type>
std::enable_if_t<std::is_integral_v<Type>, std::optional<Type>>
string_to_int(const std::string_view string, const bool strict = false) {
    Type result {};
    auto [p, ec] = std::from_chars(string.data(), string.data() + string.size(), result, 10);
    if (ec == std::errc() && (!strict || p >= string.data() + string.size()))
        return result;
    return {};
}

/**
 * Converts a string to lower case.
 * @param str The string to convert.
 * @return A new string with all characters converted to lower case.
 */
inline std::string string_to_lower(std::string str) {
    for (auto& c : str) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return str;
}

}  // namespace mdnspub
