#pragma once

#include "types.hpp"
#include "audit_record.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace chainlog
{
    /** Wall-clock source; defaults to std::chrono::system_clock::now */
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    /** Format as YYYY-MM-DDTHH:MM:SSZ (UTC, second precision) */
    std::string format_utc_timestamp(std::chrono::system_clock::time_point tp);

    /** Position of a logger in its chain */
    struct ChainState
    {
        std::string chain_tip{kGenesisHash};
        uint64_t sequence{0};
    };

    /**
     * AuditLogger appends events to a hash chain for one engagement/operator
     * session. Each record commits to the result payload and links to the
     * previous record through prev_chain_hash.
     *
     * Not thread-safe: log_event reads and advances the tip and sequence as
     * one unit, so concurrent callers must serialize access.
     */
    class AuditLogger
    {
    public:
        AuditLogger(std::string engagement_id, std::string operator_id, Clock clock = {});

        /**
         * Continue an existing chain from an explicit tip and sequence.
         * Sequence 0 requires the genesis tip.
         */
        static Result<AuditLogger> resume(std::string engagement_id,
                                          std::string operator_id,
                                          const ChainState &state,
                                          Clock clock = {});

        /** Continue an existing chain after its last record */
        static Result<AuditLogger> resume(std::string engagement_id,
                                          std::string operator_id,
                                          const AuditRecord &last,
                                          Clock clock = {});

        /**
         * Record an event and advance the chain.
         *
         * On EncodingError (result cannot be encoded canonically) the logger
         * state is left unchanged and no sequence number is consumed.
         */
        Result<AuditRecord> log_event(const std::string &action,
                                      const nlohmann::json &result,
                                      const std::string &authorization,
                                      const std::optional<std::string> &task_id = std::nullopt);

        const std::string &engagement_id() const { return engagement_id_; }
        const std::string &operator_id() const { return operator_id_; }
        const std::string &chain_tip() const { return state_.chain_tip; }
        uint64_t sequence() const { return state_.sequence; }
        const ChainState &state() const { return state_; }

    private:
        std::string engagement_id_;
        std::string operator_id_;
        Clock clock_;
        ChainState state_;
    };

} // namespace chainlog
