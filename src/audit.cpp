#include "chainlog/audit.hpp"
#include "chainlog/crypto.hpp"
#include <ctime>
#include <format>
#include <utility>
#include <spdlog/spdlog.h>

namespace chainlog
{

    std::string format_utc_timestamp(std::chrono::system_clock::time_point tp)
    {
        auto t = std::chrono::system_clock::to_time_t(tp);
        std::tm tm_buf;
        gmtime_r(&t, &tm_buf);
        return std::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}Z",
                           tm_buf.tm_year + 1900,
                           tm_buf.tm_mon + 1,
                           tm_buf.tm_mday,
                           tm_buf.tm_hour,
                           tm_buf.tm_min,
                           tm_buf.tm_sec);
    }

    AuditLogger::AuditLogger(std::string engagement_id, std::string operator_id, Clock clock)
        : engagement_id_(std::move(engagement_id)),
          operator_id_(std::move(operator_id)),
          clock_(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); }))
    {
    }

    Result<AuditLogger> AuditLogger::resume(std::string engagement_id,
                                            std::string operator_id,
                                            const ChainState &state,
                                            Clock clock)
    {
        if (!crypto::SHA256::is_hex_digest(state.chain_tip))
        {
            return std::unexpected(ChainlogError::validation("Chain tip must be 64 lowercase hex characters"));
        }
        if ((state.sequence == 0) != (state.chain_tip == kGenesisHash))
        {
            return std::unexpected(ChainlogError::validation(
                "Sequence 0 and the genesis tip must go together"));
        }

        AuditLogger logger(std::move(engagement_id), std::move(operator_id), std::move(clock));
        logger.state_ = state;
        return logger;
    }

    Result<AuditLogger> AuditLogger::resume(std::string engagement_id,
                                            std::string operator_id,
                                            const AuditRecord &last,
                                            Clock clock)
    {
        return resume(std::move(engagement_id),
                      std::move(operator_id),
                      ChainState{last.chain_hash, last.sequence},
                      std::move(clock));
    }

    Result<AuditRecord> AuditLogger::log_event(const std::string &action,
                                               const nlohmann::json &result,
                                               const std::string &authorization,
                                               const std::optional<std::string> &task_id)
    {
        auto result_hash = commit_result(result);
        if (!result_hash)
            return std::unexpected(result_hash.error());

        AuditRecord record;
        record.schema_version = std::string(kSchemaVersion);
        record.engagement_id = engagement_id_;
        record.operator_id = operator_id_;
        record.sequence = state_.sequence + 1;
        record.timestamp = format_utc_timestamp(clock_());
        record.action = action;
        record.task_id = task_id;
        record.authorization = authorization;
        record.result_hash = std::move(*result_hash);
        record.prev_chain_hash = state_.chain_tip;

        auto chain_hash = record.compute_chain_hash();
        if (!chain_hash)
            return std::unexpected(chain_hash.error());
        record.chain_hash = std::move(*chain_hash);

        state_.sequence = record.sequence;
        state_.chain_tip = record.chain_hash;

        spdlog::debug("audit record appended: engagement={} seq={} chain_hash={}",
                      engagement_id_, record.sequence, record.chain_hash.substr(0, 12));
        return record;
    }

} // namespace chainlog
