#include "chainlog/crypto.hpp"
#include <sodium.h>
#include <algorithm>
#include <format>

namespace chainlog::crypto
{

    // Initialize libsodium on library load
    static struct SodiumInitializer
    {
        SodiumInitializer()
        {
            if (sodium_init() < 0)
            {
                throw std::runtime_error("Failed to initialize libsodium");
            }
        }
    } sodium_initializer;

    SHA256Hash SHA256::hash(std::string_view data)
    {
        SHA256Hash output;
        crypto_hash_sha256(output.data(),
                           reinterpret_cast<const uint8_t *>(data.data()),
                           data.size());
        return output;
    }

    std::string SHA256::to_hex(const SHA256Hash &hash)
    {
        std::string hex;
        hex.reserve(kHexLength);
        for (uint8_t byte : hash)
        {
            hex += std::format("{:02x}", byte);
        }
        return hex;
    }

    std::string SHA256::hex_digest(std::string_view data)
    {
        return to_hex(hash(data));
    }

    bool SHA256::is_hex_digest(std::string_view text, std::size_t length)
    {
        if (text.size() != length)
            return false;
        return std::all_of(text.begin(), text.end(), [](char c) {
            return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
        });
    }

} // namespace chainlog::crypto
