#pragma once

#include "types.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace chainlog::crypto
{

    using SHA256Hash = std::array<uint8_t, 32>;

    /**
     * SHA-256 hashing (libsodium crypto_hash_sha256)
     */
    class SHA256
    {
    public:
        /** Length of a full digest rendered as lowercase hex */
        static constexpr std::size_t kHexLength = 64;

        /**
         * Compute SHA-256 hash of string
         */
        static SHA256Hash hash(std::string_view data);

        /**
         * Convert hash to lowercase hex string
         */
        static std::string to_hex(const SHA256Hash &hash);

        /**
         * Hash a string and return the lowercase hex digest
         */
        static std::string hex_digest(std::string_view data);

        /**
         * True if text is exactly `length` lowercase hex characters
         */
        static bool is_hex_digest(std::string_view text, std::size_t length = kHexLength);
    };

} // namespace chainlog::crypto
