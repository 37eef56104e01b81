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

#include "mdnspub/core/assert.hpp"
#include "mdnspub/core/expected.hpp"

#include <boost/asio/ip/address.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace mdnspub {

/**
 * Represents a network interface in the system.
 */
class NetworkInterface {
  public:
    /// The identifier of a network interface (e.g. "en0", "eth0").
    using Identifier = std::string;

    /// The type of the network interface.
    enum class Type {
        undefined,
        loopback,
        other,
    };

    /**
     * Constructs a network interface with the given identifier.
     * @param identifier The BSD name of the network interface.
     */
    explicit NetworkInterface(Identifier identifier) : identifier_(std::move(identifier)) {
        MDNSPUB_ASSERT(!identifier_.empty(), "Identifier cannot be empty");
    }

    /**
     * Constructs a network interface with all its properties. Mostly useful for testing.
     */
    NetworkInterface(
        Identifier identifier, std::vector<boost::asio::ip::address> addresses, Type type,
        std::optional<uint32_t> index = std::nullopt
    ) :
        identifier_(std::move(identifier)), addresses_(std::move(addresses)), type_(type), index_(index) {
        MDNSPUB_ASSERT(!identifier_.empty(), "Identifier cannot be empty");
    }

    /**
     * @return The name of the network interface.
     */
    [[nodiscard]] const Identifier& get_identifier() const {
        return identifier_;
    }

    /**
     * @return The addresses of the interface.
     */
    [[nodiscard]] const std::vector<boost::asio::ip::address>& get_addresses() const {
        return addresses_;
    }

    /**
     * @return The IPv4 addresses of the interface, in the order reported by the system.
     */
    [[nodiscard]] std::vector<boost::asio::ip::address_v4> get_ipv4_addresses() const;

    /**
     * @return The type of the interface.
     */
    [[nodiscard]] Type get_type() const {
        return type_;
    }

    /**
     * @returns The index of the network interface as defined by the operating system, or nullopt if unknown.
     */
    [[nodiscard]] std::optional<uint32_t> get_interface_index() const {
        return index_;
    }

    /**
     * @returns A description of the network interface as string.
     */
    [[nodiscard]] std::string to_string() const;

    /**
     * Converts the given type to a string.
     * @param type The type to convert.
     * @returns The string representation of the type.
     */
    static const char* type_to_string(Type type);

    /**
     * @returns A list of all network interfaces on the system, or errno when the list could not be retrieved.
     */
    static tl::expected<std::vector<NetworkInterface>, int> get_all();

    [[nodiscard]] auto tie() const {
        return std::tie(identifier_, addresses_, type_, index_);
    }

    friend bool operator==(const NetworkInterface& lhs, const NetworkInterface& rhs) {
        return lhs.tie() == rhs.tie();
    }

    friend bool operator!=(const NetworkInterface& lhs, const NetworkInterface& rhs) {
        return lhs.tie() != rhs.tie();
    }

  private:
    Identifier identifier_;
    std::vector<boost::asio::ip::address> addresses_;
    Type type_ {Type::undefined};
    std::optional<uint32_t> index_;
};

}  // namespace mdnspub
