#include "apimgr/cli.hpp"
#include "apimgr/api_manager.hpp"
#include "apimgr/config.hpp"
#include "apimgr/fingerprint.hpp"
#include "apimgr/http_client.hpp"
#include "apimgr/quota_sync.hpp"
#include "apimgr/rocksdb_cache.hpp"
#include "apimgr/waiting_requester.hpp"
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <format>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace apimgr::cli
{
	namespace
	{
		Result<std::optional<nlohmann::json>> parse_json_arg(const std::string &name, const std::string &text)
		{
			if (text.empty())
				return std::optional<nlohmann::json>();
			try
			{
				return std::optional<nlohmann::json>(nlohmann::json::parse(text));
			}
			catch (const nlohmann::json::exception &e)
			{
				return std::unexpected(ApiError::parsing(std::format("--{} is not valid JSON: {}", name, e.what())));
			}
		}

		Result<Headers> parse_headers(const std::vector<std::string> &raw)
		{
			Headers headers;
			for (const auto &h : raw)
			{
				auto colon = h.find(':');
				if (colon == std::string::npos || colon == 0)
					return std::unexpected(ApiError::invalid_input("Header must look like 'Name: value': " + h));
				auto value = h.substr(colon + 1);
				value.erase(0, value.find_first_not_of(' '));
				headers[h.substr(0, colon)] = value;
			}
			return headers;
		}

		Result<std::shared_ptr<Cache>> make_cache(const CacheConfig &cfg)
		{
			if (cfg.backend == "rocksdb")
			{
				try
				{
					RocksDbCacheConfig rc;
					rc.path = cfg.path;
					rc.encrypt_at_rest = cfg.encrypt_at_rest;
					return std::shared_ptr<Cache>(std::make_shared<RocksDbCache>(rc));
				}
				catch (const ApiError &e)
				{
					return std::unexpected(e);
				}
			}
			return std::shared_ptr<Cache>(std::make_shared<MemoryCache>(cfg.max_entries));
		}

		std::shared_ptr<QuotaSync> make_sync(const AppConfig &cfg, std::shared_ptr<ApiClient> client)
		{
			if (cfg.sync.endpoint.empty())
				return nullptr;
			EndpointQuotaSyncConfig sc;
			sc.endpoint = cfg.sync.endpoint;
			sc.remaining_pointer = cfg.sync.remaining_pointer;
			sc.used_pointer = cfg.sync.used_pointer;
			sc.reset_pointer = cfg.sync.reset_pointer;
			sc.threshold = static_cast<std::size_t>(cfg.quota.threshold);
			sc.window_duration = std::chrono::seconds(cfg.quota.window_seconds + cfg.quota.window_buffer_seconds);
			return std::make_shared<EndpointQuotaSync>(std::move(client), sc);
		}

		void print_quota(const QuotaWindow &quota)
		{
			nlohmann::json j{
				{"count", quota.count()},
				{"threshold", quota.threshold()},
				{"remaining_requests", quota.remaining_requests()},
				{"window_seconds", quota.window_duration().count()},
				{"remaining_ms", quota.remaining_time().count()}};
			std::cout << j.dump(2) << std::endl;
		}
	} // namespace

	int run(int argc, char *argv[])
	{
		CLI::App app{"apimgr - rate-limited, cached API requests"};

		std::string log_level;
		app.add_option("--log-level", log_level, "trace, debug, info, warn, error, critical or off");

		std::string config_path;
		auto cfg_cmd = app.add_subcommand("config-print", "Load and print config as JSON");
		cfg_cmd->add_option("--file", config_path, "Config path")->required();

		std::string method{"GET"};
		std::string endpoint;
		std::string params_text;
		std::string body_text;
		std::vector<std::string> header_args;

		std::vector<std::string> fp_include;
		auto fp_cmd = app.add_subcommand("fingerprint", "Print the cache key of a request");
		fp_cmd->add_option("--method", method, "HTTP method (default GET)");
		fp_cmd->add_option("--endpoint", endpoint, "Endpoint path")->required();
		fp_cmd->add_option("--params", params_text, "Query parameters as a JSON object");
		fp_cmd->add_option("--body", body_text, "Request body as JSON");
		fp_cmd->add_option("--header", header_args, "Request header 'Name: value' (repeatable)");
		fp_cmd->add_option("--include-header", fp_include, "Header name that takes part in the key (repeatable)");
		bool show_canonical{false};
		fp_cmd->add_flag("--canonical", show_canonical, "Also print the canonical form");

		std::size_t repeat{1};
		bool wait{false};
		auto req_cmd = app.add_subcommand("request", "Issue a request through the manager");
		req_cmd->add_option("--config", config_path, "Config path")->required();
		req_cmd->add_option("--method", method, "HTTP method (default GET)");
		req_cmd->add_option("--endpoint", endpoint, "Endpoint path")->required();
		req_cmd->add_option("--params", params_text, "Query parameters as a JSON object");
		req_cmd->add_option("--body", body_text, "Request body as JSON");
		req_cmd->add_option("--header", header_args, "Request header 'Name: value' (repeatable)");
		req_cmd->add_option("--repeat", repeat, "Issue the request N times")->check(CLI::PositiveNumber);
		req_cmd->add_flag("--wait", wait, "Wait for the window to reset instead of failing");

		CLI11_PARSE(app, argc, argv);

		if (!log_level.empty())
			spdlog::set_level(spdlog::level::from_str(log_level));

		if (*cfg_cmd)
		{
			auto cfg = ConfigLoader::load(config_path);
			if (!cfg)
			{
				std::cerr << cfg.error().what() << std::endl;
				return 1;
			}
			std::cout << ConfigLoader::to_json(*cfg).dump(2) << std::endl;
			return 0;
		}

		auto params = parse_json_arg("params", params_text);
		auto body = parse_json_arg("body", body_text);
		auto headers = parse_headers(header_args);
		for (const auto *res : {&params, &body})
		{
			if (!*res)
			{
				std::cerr << res->error().what() << std::endl;
				return 1;
			}
		}
		if (!headers)
		{
			std::cerr << headers.error().what() << std::endl;
			return 1;
		}

		ApiRequest request;
		request.method = method;
		request.endpoint = endpoint;
		request.params = *params;
		request.body = *body;
		request.headers = *headers;

		if (*fp_cmd)
		{
			Fingerprinter fp(fp_include);
			if (show_canonical)
				std::cout << fp.canonical_form(request) << std::endl;
			std::cout << fp.fingerprint(request) << std::endl;
			return 0;
		}

		if (*req_cmd)
		{
			auto cfg = ConfigLoader::load(config_path);
			if (!cfg)
			{
				std::cerr << cfg.error().what() << std::endl;
				return 1;
			}
			if (log_level.empty())
				spdlog::set_level(spdlog::level::from_str(cfg->logging.level));

			auto cache = make_cache(cfg->cache);
			if (!cache)
			{
				std::cerr << cache.error().what() << std::endl;
				return 1;
			}

			try
			{
				auto client = std::make_shared<HttpApiClient>(cfg->client);
				ApiManager manager(cfg->manager_options(), client, *cache, make_sync(*cfg, client),
								   Fingerprinter(cfg->fingerprint.headers));
				WaitingRequester waiter(manager, WaitingRequester::Config{});

				int exit_code = 0;
				for (std::size_t i = 0; i < repeat; ++i)
				{
					auto res = wait ? waiter.request(request) : manager.request(request);
					if (!res)
					{
						std::cerr << error_code_to_string(res.error().code) << ": " << res.error().what() << std::endl;
						exit_code = 2;
						continue;
					}
					nlohmann::json out{{"status", res->status}, {"from_cache", res->from_cache}};
					std::cout << out.dump() << std::endl;
					if (repeat == 1)
						std::cout << res->body << std::endl;
				}
				print_quota(manager.quota());
				return exit_code;
			}
			catch (const ApiError &e)
			{
				std::cerr << e.what() << std::endl;
				return 1;
			}
		}

		std::cout << app.help() << std::endl;
		return 0;
	}

} // namespace apimgr::cli
