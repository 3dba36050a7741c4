#pragma once

#include "types.hpp"
#include "audit_record.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace chainlog
{

    enum class ChainFault
    {
        None,
        MissingLinkField,  // not an object, or no chain_hash / prev_chain_hash
        PrevHashMismatch,  // deletion, insertion or reordering
        ChainHashMismatch  // a field was modified
    };

    std::string chain_fault_to_string(ChainFault fault);

    /**
     * Outcome of walking a chain. When valid is false, first_invalid_index is
     * the position of the first record that failed and checked is the number
     * of records before it.
     */
    struct ChainReport
    {
        bool valid{true};
        std::size_t checked{0};
        std::optional<std::size_t> first_invalid_index;
        ChainFault fault{ChainFault::None};
        std::string message;

        nlohmann::json to_json() const;
    };

    /**
     * Stateless chain verification over records in chain order.
     *
     * Each record's chain_hash is recomputed from the record as stored
     * (every member except chain_hash, unknown members included) and each
     * prev_chain_hash must equal the preceding record's chain_hash, starting
     * from kGenesisHash. An empty sequence is valid.
     *
     * Integrity failures are reported as results, never as errors. Only a
     * record that cannot be encoded canonically yields EncodingError.
     */
    class ChainVerifier
    {
    public:
        static Result<bool> verify(const std::vector<nlohmann::json> &records);

        static Result<bool> verify(const std::vector<AuditRecord> &records);

        static Result<ChainReport> inspect(const std::vector<nlohmann::json> &records);

        static Result<ChainReport> inspect(const std::vector<AuditRecord> &records);
    };

} // namespace chainlog
