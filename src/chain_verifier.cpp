#include "chainlog/chain_verifier.hpp"
#include <format>
#include <utility>
#include <spdlog/spdlog.h>

namespace chainlog
{

    namespace
    {
        ChainReport broken(std::size_t index, ChainFault fault, std::string message)
        {
            spdlog::warn("audit chain broken at index {}: {}", index, message);
            ChainReport report;
            report.valid = false;
            report.checked = index;
            report.first_invalid_index = index;
            report.fault = fault;
            report.message = std::move(message);
            return report;
        }
    } // namespace

    std::string chain_fault_to_string(ChainFault fault)
    {
        switch (fault)
        {
        case ChainFault::None:
            return "none";
        case ChainFault::MissingLinkField:
            return "missing_link_field";
        case ChainFault::PrevHashMismatch:
            return "prev_hash_mismatch";
        case ChainFault::ChainHashMismatch:
            return "chain_hash_mismatch";
        }
        return "unknown";
    }

    nlohmann::json ChainReport::to_json() const
    {
        nlohmann::json j = {
            {"valid", valid},
            {"checked", checked},
            {"fault", chain_fault_to_string(fault)}};
        if (first_invalid_index)
            j["first_invalid_index"] = *first_invalid_index;
        if (!message.empty())
            j["message"] = message;
        return j;
    }

    Result<ChainReport> ChainVerifier::inspect(const std::vector<nlohmann::json> &records)
    {
        std::string expected_prev = kGenesisHash;

        for (std::size_t i = 0; i < records.size(); ++i)
        {
            const auto &rec = records[i];

            if (!rec.is_object() || !rec.contains("chain_hash") || !rec.contains("prev_chain_hash"))
            {
                return broken(i, ChainFault::MissingLinkField,
                              std::format("record {} lacks chain_hash or prev_chain_hash", i));
            }

            const auto &prev = rec.at("prev_chain_hash");
            if (!prev.is_string() || prev.get_ref<const std::string &>() != expected_prev)
            {
                return broken(i, ChainFault::PrevHashMismatch,
                              std::format("prev_chain_hash mismatch at index {}", i));
            }

            auto expected = chain_hash_of(rec);
            if (!expected)
                return std::unexpected(expected.error());

            const auto &stored = rec.at("chain_hash");
            if (!stored.is_string() || stored.get_ref<const std::string &>() != *expected)
            {
                return broken(i, ChainFault::ChainHashMismatch,
                              std::format("chain_hash mismatch at index {}", i));
            }

            expected_prev = *expected;
        }

        ChainReport report;
        report.checked = records.size();
        return report;
    }

    Result<ChainReport> ChainVerifier::inspect(const std::vector<AuditRecord> &records)
    {
        std::vector<nlohmann::json> mapped;
        mapped.reserve(records.size());
        for (const auto &record : records)
        {
            mapped.push_back(record.to_json());
        }
        return inspect(mapped);
    }

    Result<bool> ChainVerifier::verify(const std::vector<nlohmann::json> &records)
    {
        auto report = inspect(records);
        if (!report)
            return std::unexpected(report.error());
        return report->valid;
    }

    Result<bool> ChainVerifier::verify(const std::vector<AuditRecord> &records)
    {
        auto report = inspect(records);
        if (!report)
            return std::unexpected(report.error());
        return report->valid;
    }

} // namespace chainlog
