#pragma once

#include "types.hpp"
#include "audit_record.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace chainlog
{

    /**
     * Journal stores audit records as JSON lines, one record per line, in
     * chain order. It does no verification of its own; callers run
     * ChainVerifier over read_all() before trusting or extending a journal.
     */
    class Journal
    {
    public:
        explicit Journal(std::string path);

        /** Append one record and flush. Creates parent directories. */
        Result<void> append(const AuditRecord &record) const;

        /**
         * Every non-blank line parsed as JSON, in file order. A missing file
         * is an empty chain.
         */
        Result<std::vector<nlohmann::json>> read_all() const;

        /** read_all() converted to typed records */
        Result<std::vector<AuditRecord>> read_records() const;

        const std::string &path() const { return path_; }

    private:
        std::string path_;
    };

} // namespace chainlog
