#include "chainlog/journal.hpp"
#include <filesystem>
#include <format>
#include <fstream>
#include <utility>

namespace chainlog
{

    namespace fs = std::filesystem;

    Journal::Journal(std::string path)
        : path_(std::move(path))
    {
    }

    Result<void> Journal::append(const AuditRecord &record) const
    {
        std::string line;
        try
        {
            line = record.to_json().dump();
        }
        catch (const nlohmann::json::exception &e)
        {
            return std::unexpected(ChainlogError::encoding(
                std::format("Unable to serialize record {}: {}", record.sequence, e.what())));
        }

        std::error_code ec;
        auto parent = fs::path(path_).parent_path();
        if (!parent.empty())
        {
            fs::create_directories(parent, ec);
            if (ec)
            {
                return std::unexpected(ChainlogError::io(
                    std::format("Unable to create journal directory {}: {}", parent.string(), ec.message())));
            }
        }

        std::ofstream out(path_, std::ios::app);
        if (!out.is_open())
        {
            return std::unexpected(ChainlogError::io("Unable to open journal: " + path_));
        }
        out << line << '\n';
        out.flush();
        if (!out)
        {
            return std::unexpected(ChainlogError::io("Failed to write journal: " + path_));
        }
        return {};
    }

    Result<std::vector<nlohmann::json>> Journal::read_all() const
    {
        std::vector<nlohmann::json> records;

        std::error_code ec;
        if (!fs::exists(path_, ec))
        {
            return records;
        }

        std::ifstream in(path_);
        if (!in.is_open())
        {
            return std::unexpected(ChainlogError::io("Unable to open journal: " + path_));
        }

        std::string line;
        std::size_t line_no = 0;
        while (std::getline(in, line))
        {
            ++line_no;
            if (line.find_first_not_of(" \t\r") == std::string::npos)
                continue;

            try
            {
                records.push_back(nlohmann::json::parse(line));
            }
            catch (const nlohmann::json::parse_error &e)
            {
                return std::unexpected(ChainlogError::parsing(
                    std::format("{}:{}: {}", path_, line_no, e.what())));
            }
        }

        if (in.bad())
        {
            return std::unexpected(ChainlogError::io("Failed to read journal: " + path_));
        }
        return records;
    }

    Result<std::vector<AuditRecord>> Journal::read_records() const
    {
        auto lines = read_all();
        if (!lines)
            return std::unexpected(lines.error());

        std::vector<AuditRecord> records;
        records.reserve(lines->size());
        for (const auto &j : *lines)
        {
            auto record = AuditRecord::from_json(j);
            if (!record)
                return std::unexpected(record.error());
            records.push_back(std::move(*record));
        }
        return records;
    }

} // namespace chainlog
