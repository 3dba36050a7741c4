#include "chainlog/audit_record.hpp"
#include "chainlog/canonical_json.hpp"
#include <format>

namespace chainlog
{

    using Json = nlohmann::json;

    Json AuditRecord::to_unchained_json() const
    {
        return Json{
            {"schema_version", schema_version},
            {"engagement_id", engagement_id},
            {"operator_id", operator_id},
            {"sequence", sequence},
            {"timestamp", timestamp},
            {"action", action},
            {"task_id", task_id ? Json(*task_id) : Json(nullptr)},
            {"authorization", authorization},
            {"result_hash", result_hash},
            {"prev_chain_hash", prev_chain_hash}};
    }

    Json AuditRecord::to_json() const
    {
        Json j = to_unchained_json();
        j["chain_hash"] = chain_hash;
        return j;
    }

    Result<AuditRecord> AuditRecord::from_json(const Json &j)
    {
        if (!j.is_object())
        {
            return std::unexpected(ChainlogError::invalid_input("AuditRecord must be a JSON object"));
        }

        try
        {
            AuditRecord record;

            record.schema_version = j.at("schema_version").get<std::string>();
            record.engagement_id = j.at("engagement_id").get<std::string>();
            record.operator_id = j.at("operator_id").get<std::string>();

            const auto &seq = j.at("sequence");
            if (!seq.is_number_integer() ||
                (!seq.is_number_unsigned() && seq.get<int64_t>() < 1) ||
                (seq.is_number_unsigned() && seq.get<uint64_t>() == 0))
            {
                return std::unexpected(ChainlogError::invalid_input("sequence must be a positive integer"));
            }
            record.sequence = seq.get<uint64_t>();

            record.timestamp = j.at("timestamp").get<std::string>();
            record.action = j.at("action").get<std::string>();

            const auto &task = j.at("task_id");
            if (!task.is_null())
            {
                record.task_id = task.get<std::string>();
            }

            record.authorization = j.at("authorization").get<std::string>();
            record.result_hash = j.at("result_hash").get<std::string>();
            record.prev_chain_hash = j.at("prev_chain_hash").get<std::string>();
            record.chain_hash = j.at("chain_hash").get<std::string>();

            return record;
        }
        catch (const Json::exception &e)
        {
            return std::unexpected(ChainlogError::invalid_input(
                std::format("Failed to parse AuditRecord: {}", e.what())));
        }
    }

    Result<std::string> AuditRecord::compute_chain_hash() const
    {
        return chain_hash_of(to_json());
    }

    Result<std::string> commit_result(const Json &result)
    {
        // Wrapping keeps scalar and array payloads distinct from object payloads
        auto canonical = json::CanonicalEncoder::encode(Json{{"result", result}});
        if (!canonical)
            return std::unexpected(canonical.error());
        return crypto::SHA256::hex_digest(*canonical).substr(0, kResultHashLength);
    }

    Result<std::string> canonical_unchained(const Json &record)
    {
        if (!record.is_object())
        {
            return std::unexpected(ChainlogError::invalid_input("Chain hash input must be a JSON object"));
        }

        Json unchained = record;
        unchained.erase("chain_hash");
        return json::CanonicalEncoder::encode(unchained);
    }

    Result<std::string> chain_hash_of(const Json &record)
    {
        auto canonical = canonical_unchained(record);
        if (!canonical)
            return std::unexpected(canonical.error());
        return crypto::SHA256::hex_digest(*canonical);
    }

} // namespace chainlog
