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

#include "expected.hpp"

#include <boost/json.hpp>
#include <boost/json/value_to.hpp>    // Don't remove or suffer the errors
#include <boost/json/value_from.hpp>  // Don't remove or suffer the errors

#include <exception>
#include <string>
#include <string_view>

namespace mdnspub {

/**
 * Parses given JSON text and converts it to T through boost::json::value_to.
 * @tparam T The type to convert to. Requires a tag_invoke overload for boost::json::value_to_tag<T>.
 * @param json_str The JSON text.
 * @return The converted value, or a message describing why parsing or conversion failed.
 */
template<typename T>
tl::expected<T, std::string> parse_json(const std::string_view json_str) {
    boost::system::error_code ec;
    const auto jv = boost::json::parse(json_str, ec);
    if (ec) {
        return tl::unexpected(ec.message());
    }
    try {
        return boost::json::value_to<T>(jv);
    } catch (const std::exception& e) {
        return tl::unexpected(std::string(e.what()));
    }
}

}  // namespace mdnspub
