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

#include "service_record.hpp"
#include "mdnspub/core/expected.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace mdnspub::dnssd {

/**
 * Holds the wire format (RFC 6763 section 6) of a TXT record: a sequence of length prefixed key=value strings.
 * Unlike TXTRecordSetValue, duplicate keys are kept in order.
 */
class TxtRdata {
  public:
    /// A single TXT string holds at most this many bytes.
    static constexpr size_t k_max_string_length = 255;

    /**
     * Encodes the given entries.
     * @param txt The entries to encode.
     * @return The encoded rdata, or an error message when an entry is too long or the total size exceeds 65535 bytes.
     */
    static tl::expected<TxtRdata, std::string> encode(const TxtRecord& txt);

    /**
     * @return Returns the length of the rdata.
     */
    [[nodiscard]] uint16_t length() const noexcept {
        return static_cast<uint16_t>(bytes_.size());
    }

    /**
     * @return Returns a pointer to the rdata. This pointer will be valid for as long as this instance lives.
     */
    [[nodiscard]] const void* bytes_ptr() const noexcept {
        return bytes_.data();
    }

    [[nodiscard]] const std::vector<uint8_t>& bytes() const noexcept {
        return bytes_;
    }

  private:
    std::vector<uint8_t> bytes_;
};

}  // namespace mdnspub::dnssd
