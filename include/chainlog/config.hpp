#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/common.h>
#include <string>

namespace chainlog
{

    struct IdentityConfig
    {
        std::string engagement_id;
        std::string operator_id;
    };

    struct JournalConfig
    {
        std::string path{"./audit/chain.jsonl"};
    };

    struct LoggingConfig
    {
        std::string level{"info"};
    };

    struct ChainlogConfig
    {
        IdentityConfig identity{};
        JournalConfig journal{};
        LoggingConfig logging{};
    };

    /**
     * ConfigLoader loads TOML configs; environment overrides take precedence:
     * CHAINLOG_ENGAGEMENT_ID, CHAINLOG_OPERATOR_ID, CHAINLOG_JOURNAL,
     * CHAINLOG_LOG_LEVEL.
     */
    class ConfigLoader
    {
    public:
        /** Load config from a TOML file path. */
        static Result<ChainlogConfig> load(const std::string &path);

        /** Parse config from TOML string content. */
        static Result<ChainlogConfig> from_string(const std::string &toml_content);

        /** Built-in defaults with environment overrides applied. */
        static Result<ChainlogConfig> defaults();

        /** Serialize config to JSON for inspection. */
        static nlohmann::json to_json(const ChainlogConfig &cfg);

        /** Map a level name ("trace" .. "off") to spdlog's level */
        static Result<spdlog::level::level_enum> parse_log_level(const std::string &level);

    private:
        static void apply_env_overrides(ChainlogConfig &cfg);
        static Result<ChainlogConfig> validate(ChainlogConfig cfg);
    };

} // namespace chainlog
