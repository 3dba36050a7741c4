#pragma once

#include "types.hpp"
#include "crypto.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace chainlog
{

    inline constexpr std::string_view kSchemaVersion = "1.0";

    /** prev_chain_hash of the first record in every chain */
    inline const std::string kGenesisHash(crypto::SHA256::kHexLength, '0');

    /** Hex characters kept from the SHA-256 of a result payload */
    inline constexpr std::size_t kResultHashLength = 16;

    /**
     * One link of the audit chain.
     *
     * Wire field names are fixed; chain_hash covers every other field of the
     * mapping, so renaming or dropping a field breaks verification of existing
     * chains. An absent task_id is written as null and is part of the hash.
     */
    struct AuditRecord
    {
        std::string schema_version;
        std::string engagement_id;
        std::string operator_id;
        uint64_t sequence{0};
        std::string timestamp;             // UTC, YYYY-MM-DDTHH:MM:SSZ
        std::string action;
        std::optional<std::string> task_id;
        std::string authorization;
        std::string result_hash;           // truncated SHA-256 of {"result": payload}
        std::string prev_chain_hash;
        std::string chain_hash;

        /**
         * Convert to the wire mapping (all fields)
         */
        nlohmann::json to_json() const;

        /**
         * Wire mapping without chain_hash, the input of the chain hash
         */
        nlohmann::json to_unchained_json() const;

        /**
         * Parse from the wire mapping. Every field is required; unknown
         * fields are ignored.
         */
        static Result<AuditRecord> from_json(const nlohmann::json &j);

        /**
         * chain_hash_of(to_json())
         */
        Result<std::string> compute_chain_hash() const;
    };

    /**
     * Result commitment: first kResultHashLength hex characters of the
     * SHA-256 of the canonical encoding of {"result": result}.
     */
    Result<std::string> commit_result(const nlohmann::json &result);

    /**
     * Canonical encoding of a record-shaped mapping without its chain_hash
     * member, the preimage of the chain hash.
     */
    Result<std::string> canonical_unchained(const nlohmann::json &record);

    /**
     * Chain hash of a record-shaped mapping: SHA-256 hex of
     * canonical_unchained(record). Used both when records are created and
     * when they are verified.
     */
    Result<std::string> chain_hash_of(const nlohmann::json &record);

} // namespace chainlog
