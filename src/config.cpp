#include "chainlog/config.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>
#include <toml++/toml.h>

namespace chainlog
{
    namespace
    {
        ChainlogConfig parse_toml(const toml::table &tbl, ChainlogConfig cfg)
        {
            if (auto identity = tbl["identity"].as_table())
            {
                if (auto engagement = (*identity)["engagement_id"].value<std::string>())
                    cfg.identity.engagement_id = *engagement;
                if (auto op = (*identity)["operator_id"].value<std::string>())
                    cfg.identity.operator_id = *op;
            }

            if (auto journal = tbl["journal"].as_table())
            {
                if (auto path = (*journal)["path"].value<std::string>())
                    cfg.journal.path = *path;
            }

            if (auto logging = tbl["logging"].as_table())
            {
                if (auto level = (*logging)["level"].value<std::string>())
                    cfg.logging.level = *level;
            }

            return cfg;
        }
    } // namespace

    Result<ChainlogConfig> ConfigLoader::load(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            return std::unexpected(ChainlogError::config("Unable to open config file: " + path));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return from_string(buffer.str());
    }

    Result<ChainlogConfig> ConfigLoader::from_string(const std::string &toml_content)
    {
        ChainlogConfig cfg{};

        try
        {
            auto tbl = toml::parse(toml_content);
            cfg = parse_toml(tbl, cfg);
        }
        catch (const toml::parse_error &e)
        {
            return std::unexpected(ChainlogError::config(std::string("Failed to parse TOML: ") + e.what()));
        }

        apply_env_overrides(cfg);
        return validate(std::move(cfg));
    }

    Result<ChainlogConfig> ConfigLoader::defaults()
    {
        ChainlogConfig cfg{};
        apply_env_overrides(cfg);
        return validate(std::move(cfg));
    }

    void ConfigLoader::apply_env_overrides(ChainlogConfig &cfg)
    {
        if (const char *engagement = std::getenv("CHAINLOG_ENGAGEMENT_ID"))
            cfg.identity.engagement_id = engagement;
        if (const char *op = std::getenv("CHAINLOG_OPERATOR_ID"))
            cfg.identity.operator_id = op;
        if (const char *journal = std::getenv("CHAINLOG_JOURNAL"))
            cfg.journal.path = journal;
        if (const char *level = std::getenv("CHAINLOG_LOG_LEVEL"))
            cfg.logging.level = level;
    }

    Result<ChainlogConfig> ConfigLoader::validate(ChainlogConfig cfg)
    {
        if (auto level = parse_log_level(cfg.logging.level); !level)
            return std::unexpected(level.error());
        if (cfg.journal.path.empty())
            return std::unexpected(ChainlogError::config("journal.path must not be empty"));
        return cfg;
    }

    Result<spdlog::level::level_enum> ConfigLoader::parse_log_level(const std::string &level)
    {
        // from_str maps unknown names to off
        auto parsed = spdlog::level::from_str(level);
        if (parsed == spdlog::level::off && level != "off")
        {
            return std::unexpected(ChainlogError::config("Unknown log level: " + level));
        }
        return parsed;
    }

    nlohmann::json ConfigLoader::to_json(const ChainlogConfig &cfg)
    {
        nlohmann::json j;
        j["identity"] = {
            {"engagement_id", cfg.identity.engagement_id},
            {"operator_id", cfg.identity.operator_id}};
        j["journal"] = {{"path", cfg.journal.path}};
        j["logging"] = {{"level", cfg.logging.level}};
        return j;
    }

} // namespace chainlog
