#include "chainlog/cli.hpp"
#include "chainlog/audit.hpp"
#include "chainlog/canonical_json.hpp"
#include "chainlog/chain_verifier.hpp"
#include "chainlog/config.hpp"
#include "chainlog/journal.hpp"
#include <format>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <utility>
#include <nlohmann/json.hpp>
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace chainlog::cli
{

	namespace
	{
		constexpr int kExitOk = 0;
		constexpr int kExitError = 1;
		constexpr int kExitBroken = 2;

		int fail(const ChainlogError &error)
		{
			std::cerr << "[" << error_code_to_string(error.code) << "] " << error.what() << std::endl;
			return kExitError;
		}

		// Logs go to stderr; stdout carries records and reports.
		void configure_logging(const LoggingConfig &logging)
		{
			auto logger = spdlog::get("chainlog");
			if (!logger)
				logger = spdlog::stderr_color_mt("chainlog");
			spdlog::set_default_logger(logger);
			auto level = ConfigLoader::parse_log_level(logging.level);
			spdlog::set_level(level ? *level : spdlog::level::info);
		}

		Result<std::string> read_file(const std::string &path)
		{
			std::ifstream f(path);
			if (!f.is_open())
			{
				return std::unexpected(ChainlogError::io("Unable to open file: " + path));
			}
			std::stringstream buf;
			buf << f.rdbuf();
			return buf.str();
		}

		Result<nlohmann::json> read_result(const std::string &inline_json, const std::string &file)
		{
			std::string text;
			if (!file.empty())
			{
				auto contents = read_file(file);
				if (!contents)
					return std::unexpected(contents.error());
				text = std::move(*contents);
			}
			else
			{
				text = inline_json;
			}

			try
			{
				return nlohmann::json::parse(text);
			}
			catch (const nlohmann::json::parse_error &e)
			{
				return std::unexpected(ChainlogError::parsing(std::string("Invalid result JSON: ") + e.what()));
			}
		}
	} // namespace

	int run(int argc, char *argv[])
	{
		CLI::App app{"chainlog - tamper-evident audit chain"};
		app.require_subcommand(0, 1);

		std::string config_path;
		app.add_option("--config", config_path, "Path to config TOML");

		auto cfg_cmd = app.add_subcommand("config-print", "Load and print config as JSON");
		cfg_cmd->add_option("--file", config_path, "Path to config TOML");

		std::string journal_path;
		std::string engagement_id;
		std::string operator_id;
		std::string action;
		std::string authorization;
		std::string task_id;
		std::string result_json;
		std::string result_file;
		auto log_cmd = app.add_subcommand("log", "Append an event to the journal");
		log_cmd->add_option("--action", action, "Action identifier")->required();
		log_cmd->add_option("--authorization", authorization, "Approval or task reference")->required();
		log_cmd->add_option("--task-id", task_id, "Task identifier (optional)");
		auto log_result_opt = log_cmd->add_option("--result", result_json, "Result payload as JSON text");
		auto log_result_file_opt = log_cmd->add_option("--result-file", result_file, "Path to result payload JSON");
		log_result_opt->excludes(log_result_file_opt);
		log_cmd->add_option("--journal", journal_path, "Journal path (overrides config)");
		log_cmd->add_option("--engagement", engagement_id, "Engagement id (overrides config)");
		log_cmd->add_option("--operator", operator_id, "Operator id (overrides config)");

		auto verify_cmd = app.add_subcommand("verify", "Verify the journal's hash chain");
		verify_cmd->add_option("--journal", journal_path, "Journal path (overrides config)");

		auto hash_cmd = app.add_subcommand("result-hash", "Print the commitment of a result payload");
		auto hash_result_opt = hash_cmd->add_option("--result", result_json, "Result payload as JSON text");
		auto hash_result_file_opt = hash_cmd->add_option("--result-file", result_file, "Path to result payload JSON");
		hash_result_opt->excludes(hash_result_file_opt);

		std::string canon_path;
		auto canon_cmd = app.add_subcommand("canonicalize", "Print the canonical encoding of a JSON file");
		canon_cmd->add_option("--file", canon_path, "Path to JSON document")->required();

		try
		{
			app.parse(argc, argv);
		}
		catch (const CLI::ParseError &e)
		{
			// --help and --version also arrive here with exit code 0
			return app.exit(e) == 0 ? kExitOk : kExitError;
		}

		auto cfg = config_path.empty() ? ConfigLoader::defaults() : ConfigLoader::load(config_path);
		if (!cfg)
		{
			return fail(cfg.error());
		}
		configure_logging(cfg->logging);

		if (!journal_path.empty())
			cfg->journal.path = journal_path;
		if (!engagement_id.empty())
			cfg->identity.engagement_id = engagement_id;
		if (!operator_id.empty())
			cfg->identity.operator_id = operator_id;

		if (*cfg_cmd)
		{
			std::cout << ConfigLoader::to_json(*cfg).dump(2) << std::endl;
			return kExitOk;
		}

		if (*log_cmd)
		{
			if (cfg->identity.engagement_id.empty() || cfg->identity.operator_id.empty())
			{
				return fail(ChainlogError::invalid_input(
					"engagement and operator ids are required (config [identity] or --engagement/--operator)"));
			}
			if (result_json.empty() && result_file.empty())
			{
				return fail(ChainlogError::invalid_input("one of --result or --result-file is required"));
			}

			auto result = read_result(result_json, result_file);
			if (!result)
			{
				return fail(result.error());
			}

			Journal journal(cfg->journal.path);
			auto existing = journal.read_all();
			if (!existing)
			{
				return fail(existing.error());
			}

			auto report = ChainVerifier::inspect(*existing);
			if (!report)
			{
				return fail(report.error());
			}
			if (!report->valid)
			{
				std::cerr << "Refusing to append to a broken chain: " << report->message << std::endl;
				return kExitBroken;
			}

			std::optional<AuditLogger> logger;
			if (existing->empty())
			{
				logger.emplace(cfg->identity.engagement_id, cfg->identity.operator_id);
			}
			else
			{
				auto last = AuditRecord::from_json(existing->back());
				if (!last)
				{
					return fail(last.error());
				}
				if (last->engagement_id != cfg->identity.engagement_id || last->operator_id != cfg->identity.operator_id)
				{
					return fail(ChainlogError::validation(std::format(
						"journal belongs to engagement '{}' operator '{}', not '{}' / '{}'",
						last->engagement_id, last->operator_id,
						cfg->identity.engagement_id, cfg->identity.operator_id)));
				}
				auto resumed = AuditLogger::resume(cfg->identity.engagement_id, cfg->identity.operator_id, *last);
				if (!resumed)
				{
					return fail(resumed.error());
				}
				logger.emplace(std::move(*resumed));
			}

			std::optional<std::string> task;
			if (!task_id.empty())
				task = task_id;

			auto record = logger->log_event(action, *result, authorization, task);
			if (!record)
			{
				return fail(record.error());
			}
			if (auto res = journal.append(*record); !res)
			{
				return fail(res.error());
			}

			spdlog::info("appended record {} to {}", record->sequence, journal.path());
			std::cout << record->to_json().dump() << std::endl;
			return kExitOk;
		}

		if (*verify_cmd)
		{
			Journal journal(cfg->journal.path);
			auto records = journal.read_all();
			if (!records)
			{
				return fail(records.error());
			}

			auto report = ChainVerifier::inspect(*records);
			if (!report)
			{
				return fail(report.error());
			}

			std::cout << report->to_json().dump(2) << std::endl;
			return report->valid ? kExitOk : kExitBroken;
		}

		if (*hash_cmd)
		{
			if (result_json.empty() && result_file.empty())
			{
				return fail(ChainlogError::invalid_input("one of --result or --result-file is required"));
			}
			auto result = read_result(result_json, result_file);
			if (!result)
			{
				return fail(result.error());
			}
			auto commitment = commit_result(*result);
			if (!commitment)
			{
				return fail(commitment.error());
			}
			std::cout << *commitment << std::endl;
			return kExitOk;
		}

		if (*canon_cmd)
		{
			auto text = read_file(canon_path);
			if (!text)
			{
				return fail(text.error());
			}
			auto canonical = json::CanonicalEncoder::encode_text(*text);
			if (!canonical)
			{
				return fail(canonical.error());
			}
			std::cout << *canonical << std::endl;
			return kExitOk;
		}

		std::cout << app.help() << std::endl;
		return kExitOk;
	}

} // namespace chainlog::cli
