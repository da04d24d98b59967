#include "apimgr/config.hpp"
#include <toml++/toml.h>
#include <algorithm>
#include <cstdlib>
#include <format>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace apimgr
{
    namespace
    {
        Result<int64_t> env_integer(const char *name, const char *value)
        {
            try
            {
                std::size_t pos = 0;
                auto parsed = std::stoll(value, &pos);
                if (pos != std::string(value).size())
                    throw std::invalid_argument(name);
                return static_cast<int64_t>(parsed);
            }
            catch (const std::logic_error &)
            {
                return std::unexpected(ApiError::config(std::format("Invalid integer in {}: {}", name, value)));
            }
        }

        bool env_flag(const char *value)
        {
            std::string v(value);
            return v != "0" && v != "false" && v != "no" && !v.empty();
        }

        void parse_toml(const toml::table &tbl, AppConfig &cfg)
        {
            if (auto quota = tbl["quota"].as_table())
            {
                if (auto v = (*quota)["window_seconds"].value<int64_t>())
                    cfg.quota.window_seconds = *v;
                if (auto v = (*quota)["window_buffer_seconds"].value<int64_t>())
                    cfg.quota.window_buffer_seconds = *v;
                if (auto v = (*quota)["threshold"].value<int64_t>())
                    cfg.quota.threshold = *v;
                if (auto v = (*quota)["resync_before_request"].value<bool>())
                    cfg.quota.resync_before_request = *v;
                if (auto v = (*quota)["cache_on_failure"].value<bool>())
                    cfg.quota.cache_on_failure = *v;
            }

            if (auto cache = tbl["cache"].as_table())
            {
                if (auto v = (*cache)["backend"].value<std::string>())
                    cfg.cache.backend = *v;
                if (auto v = (*cache)["path"].value<std::string>())
                    cfg.cache.path = *v;
                if (auto v = (*cache)["max_entries"].value<int64_t>())
                    cfg.cache.max_entries = static_cast<std::size_t>(std::max<int64_t>(0, *v));
                if (auto v = (*cache)["encrypt_at_rest"].value<bool>())
                    cfg.cache.encrypt_at_rest = *v;
            }

            if (auto client = tbl["client"].as_table())
            {
                if (auto v = (*client)["host"].value<std::string>())
                    cfg.client.host = *v;
                if (auto v = (*client)["port"].value<int64_t>())
                    cfg.client.port = std::to_string(*v);
                else if (auto s = (*client)["port"].value<std::string>())
                    cfg.client.port = *s;
                if (auto v = (*client)["base_path"].value<std::string>())
                    cfg.client.base_path = *v;
                if (auto v = (*client)["user_agent"].value<std::string>())
                    cfg.client.user_agent = *v;
                if (auto v = (*client)["timeout_ms"].value<int64_t>())
                    cfg.client.timeout = std::chrono::milliseconds(*v);
                if (auto headers = (*client)["headers"].as_table())
                {
                    for (auto &&[name, value] : *headers)
                    {
                        if (auto s = value.value<std::string>())
                            cfg.client.default_headers[std::string(name.str())] = *s;
                    }
                }
            }

            if (auto fp = tbl["fingerprint"].as_table())
            {
                if (auto headers = (*fp)["headers"].as_array())
                {
                    for (auto &&el : *headers)
                    {
                        if (auto s = el.value<std::string>())
                            cfg.fingerprint.headers.push_back(*s);
                    }
                }
            }

            if (auto sync = tbl["sync"].as_table())
            {
                if (auto v = (*sync)["endpoint"].value<std::string>())
                    cfg.sync.endpoint = *v;
                if (auto v = (*sync)["remaining_pointer"].value<std::string>())
                    cfg.sync.remaining_pointer = *v;
                if (auto v = (*sync)["used_pointer"].value<std::string>())
                    cfg.sync.used_pointer = *v;
                if (auto v = (*sync)["reset_pointer"].value<std::string>())
                    cfg.sync.reset_pointer = *v;
            }

            if (auto logging = tbl["logging"].as_table())
            {
                if (auto v = (*logging)["level"].value<std::string>())
                    cfg.logging.level = *v;
            }
        }

    } // namespace

    ManagerOptions AppConfig::manager_options() const
    {
        ManagerOptions opts;
        opts.window = std::chrono::seconds(quota.window_seconds);
        opts.window_buffer = std::chrono::seconds(quota.window_buffer_seconds);
        opts.threshold = static_cast<std::size_t>(std::max<int64_t>(0, quota.threshold));
        opts.resync_before_request = quota.resync_before_request;
        opts.cache_on_failure = quota.cache_on_failure;
        return opts;
    }

    Result<AppConfig> ConfigLoader::load(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            return std::unexpected(ApiError::config("Unable to open config file: " + path));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return from_string(buffer.str());
    }

    Result<AppConfig> ConfigLoader::from_string(const std::string &toml_content)
    {
        AppConfig cfg{};

        try
        {
            auto tbl = toml::parse(toml_content);
            parse_toml(tbl, cfg);
        }
        catch (const toml::parse_error &e)
        {
            return std::unexpected(ApiError::config(std::string("Failed to parse TOML: ") + e.what()));
        }

        if (auto env = apply_env_overrides(cfg); !env)
            return std::unexpected(env.error());
        if (auto valid = validate(cfg); !valid)
            return std::unexpected(valid.error());
        return cfg;
    }

    Result<void> ConfigLoader::apply_env_overrides(AppConfig &cfg)
    {
        if (const char *v = std::getenv("APIMGR_WINDOW_SECONDS"))
        {
            auto n = env_integer("APIMGR_WINDOW_SECONDS", v);
            if (!n)
                return std::unexpected(n.error());
            cfg.quota.window_seconds = *n;
        }
        if (const char *v = std::getenv("APIMGR_THRESHOLD"))
        {
            auto n = env_integer("APIMGR_THRESHOLD", v);
            if (!n)
                return std::unexpected(n.error());
            cfg.quota.threshold = *n;
        }
        if (const char *v = std::getenv("APIMGR_RESYNC"))
            cfg.quota.resync_before_request = env_flag(v);
        if (const char *v = std::getenv("APIMGR_CACHE_BACKEND"))
            cfg.cache.backend = v;
        if (const char *v = std::getenv("APIMGR_CACHE_PATH"))
            cfg.cache.path = v;
        if (const char *v = std::getenv("APIMGR_CLIENT_HOST"))
            cfg.client.host = v;
        if (const char *v = std::getenv("APIMGR_CLIENT_PORT"))
            cfg.client.port = v;
        if (const char *v = std::getenv("APIMGR_LOG_LEVEL"))
            cfg.logging.level = v;
        return {};
    }

    Result<void> ConfigLoader::validate(const AppConfig &cfg)
    {
        if (cfg.quota.window_seconds <= 0)
            return std::unexpected(ApiError::config("quota.window_seconds must be greater than 0"));
        if (cfg.quota.window_buffer_seconds < 0)
            return std::unexpected(ApiError::config("quota.window_buffer_seconds must be greater than or equal to 0"));
        if (cfg.quota.threshold <= 0)
            return std::unexpected(ApiError::config("quota.threshold must be greater than 0"));
        if (cfg.cache.backend != "memory" && cfg.cache.backend != "rocksdb")
            return std::unexpected(ApiError::config("cache.backend must be \"memory\" or \"rocksdb\""));
        if (cfg.client.timeout.count() <= 0)
            return std::unexpected(ApiError::config("client.timeout_ms must be greater than 0"));
        if (!cfg.sync.endpoint.empty() && cfg.sync.remaining_pointer.empty() && cfg.sync.used_pointer.empty())
            return std::unexpected(ApiError::config("sync needs remaining_pointer or used_pointer"));
        return {};
    }

    nlohmann::json ConfigLoader::to_json(const AppConfig &cfg)
    {
        nlohmann::json headers = nlohmann::json::object();
        for (const auto &[name, value] : cfg.client.default_headers)
            headers[name] = value.empty() ? "" : "<redacted>";

        nlohmann::json j;
        j["quota"] = {
            {"window_seconds", cfg.quota.window_seconds},
            {"window_buffer_seconds", cfg.quota.window_buffer_seconds},
            {"threshold", cfg.quota.threshold},
            {"resync_before_request", cfg.quota.resync_before_request},
            {"cache_on_failure", cfg.quota.cache_on_failure}};
        j["cache"] = {
            {"backend", cfg.cache.backend},
            {"path", cfg.cache.path},
            {"max_entries", cfg.cache.max_entries},
            {"encrypt_at_rest", cfg.cache.encrypt_at_rest}};
        j["client"] = {
            {"host", cfg.client.host},
            {"port", cfg.client.port},
            {"base_path", cfg.client.base_path},
            {"user_agent", cfg.client.user_agent},
            {"timeout_ms", cfg.client.timeout.count()},
            {"headers", headers}};
        j["fingerprint"] = {{"headers", cfg.fingerprint.headers}};
        j["sync"] = {
            {"endpoint", cfg.sync.endpoint},
            {"remaining_pointer", cfg.sync.remaining_pointer},
            {"used_pointer", cfg.sync.used_pointer},
            {"reset_pointer", cfg.sync.reset_pointer}};
        j["logging"] = {{"level", cfg.logging.level}};
        return j;
    }

} // namespace apimgr
