#include <catch2/catch_test_macros.hpp>
#include "apimgr/config.hpp"
#include <cstdlib>

using namespace apimgr;
using namespace std::chrono_literals;

namespace
{
    void clear_env()
    {
        for (const char *name : {"APIMGR_WINDOW_SECONDS", "APIMGR_THRESHOLD", "APIMGR_RESYNC",
                                 "APIMGR_CACHE_BACKEND", "APIMGR_CACHE_PATH", "APIMGR_CLIENT_HOST",
                                 "APIMGR_CLIENT_PORT", "APIMGR_LOG_LEVEL"})
            ::unsetenv(name);
    }
}

TEST_CASE("Empty config yields defaults", "[config]")
{
    clear_env();
    auto cfg = ConfigLoader::from_string("");
    REQUIRE(cfg.has_value());

    auto opts = cfg->manager_options();
    REQUIRE(opts.window == 3600s);
    REQUIRE(opts.window_buffer == 0s);
    REQUIRE(opts.threshold == 60);
    REQUIRE_FALSE(opts.resync_before_request);
    REQUIRE_FALSE(opts.cache_on_failure);
    REQUIRE(cfg->cache.backend == "memory");
    REQUIRE(cfg->logging.level == "info");
    REQUIRE(cfg->sync.endpoint.empty());
}

TEST_CASE("TOML sections populate the config", "[config]")
{
    clear_env();
    auto cfg = ConfigLoader::from_string(R"(
[quota]
window_seconds = 60
window_buffer_seconds = 3
threshold = 30
resync_before_request = true
cache_on_failure = true

[cache]
backend = "rocksdb"
path = "/var/cache/apimgr"
max_entries = 500
encrypt_at_rest = true

[client]
host = "api.github.com"
port = 443
base_path = "/v3"
timeout_ms = 2500

[client.headers]
Authorization = "token abc"

[fingerprint]
headers = ["Accept"]

[sync]
endpoint = "/rate_limit"
remaining_pointer = "/resources/core/remaining"
reset_pointer = "/resources/core/reset"

[logging]
level = "debug"
)");
    REQUIRE(cfg.has_value());

    auto opts = cfg->manager_options();
    REQUIRE(opts.window == 60s);
    REQUIRE(opts.window_buffer == 3s);
    REQUIRE(opts.threshold == 30);
    REQUIRE(opts.resync_before_request);
    REQUIRE(opts.cache_on_failure);

    REQUIRE(cfg->cache.backend == "rocksdb");
    REQUIRE(cfg->cache.path == "/var/cache/apimgr");
    REQUIRE(cfg->cache.max_entries == 500);
    REQUIRE(cfg->cache.encrypt_at_rest);

    REQUIRE(cfg->client.host == "api.github.com");
    REQUIRE(cfg->client.port == "443");
    REQUIRE(cfg->client.base_path == "/v3");
    REQUIRE(cfg->client.timeout == 2500ms);
    REQUIRE(cfg->client.default_headers.at("Authorization") == "token abc");

    REQUIRE(cfg->fingerprint.headers == std::vector<std::string>{"Accept"});
    REQUIRE(cfg->sync.endpoint == "/rate_limit");
    REQUIRE(cfg->sync.remaining_pointer == "/resources/core/remaining");
    REQUIRE(cfg->logging.level == "debug");
}

TEST_CASE("Environment overrides file values", "[config]")
{
    clear_env();
    ::setenv("APIMGR_THRESHOLD", "5", 1);
    ::setenv("APIMGR_CACHE_BACKEND", "rocksdb", 1);
    ::setenv("APIMGR_RESYNC", "true", 1);
    ::setenv("APIMGR_CLIENT_PORT", "8443", 1);

    auto cfg = ConfigLoader::from_string("[quota]\nthreshold = 100\n");
    clear_env();

    REQUIRE(cfg.has_value());
    REQUIRE(cfg->quota.threshold == 5);
    REQUIRE(cfg->cache.backend == "rocksdb");
    REQUIRE(cfg->quota.resync_before_request);
    REQUIRE(cfg->client.port == "8443");
}

TEST_CASE("Malformed environment integers are config errors", "[config]")
{
    clear_env();
    ::setenv("APIMGR_WINDOW_SECONDS", "60s", 1);
    auto cfg = ConfigLoader::from_string("");
    clear_env();

    REQUIRE_FALSE(cfg.has_value());
    REQUIRE(cfg.error().code == ErrorCode::ConfigError);
}

TEST_CASE("Invalid values are rejected", "[config]")
{
    clear_env();
    auto rejected = [](const std::string &toml) {
        auto cfg = ConfigLoader::from_string(toml);
        return !cfg.has_value() && cfg.error().code == ErrorCode::ConfigError;
    };

    REQUIRE(rejected("[quota]\nwindow_seconds = 0\n"));
    REQUIRE(rejected("[quota]\nthreshold = 0\n"));
    REQUIRE(rejected("[quota]\nwindow_buffer_seconds = -1\n"));
    REQUIRE(rejected("[cache]\nbackend = \"redis\"\n"));
    REQUIRE(rejected("[client]\ntimeout_ms = 0\n"));
    REQUIRE(rejected("[sync]\nendpoint = \"/rate_limit\"\n"));
    REQUIRE(rejected("[quota\nthreshold = 1\n"));
}

TEST_CASE("Missing config file is a config error", "[config]")
{
    auto cfg = ConfigLoader::load("/nonexistent/apimgr.toml");
    REQUIRE_FALSE(cfg.has_value());
    REQUIRE(cfg.error().code == ErrorCode::ConfigError);
}

TEST_CASE("to_json redacts header values", "[config]")
{
    clear_env();
    auto cfg = ConfigLoader::from_string("[client.headers]\nAuthorization = \"token abc\"\n");
    REQUIRE(cfg.has_value());

    auto j = ConfigLoader::to_json(*cfg);
    REQUIRE(j["client"]["headers"]["Authorization"] == "<redacted>");
    REQUIRE(j.dump().find("token abc") == std::string::npos);
    REQUIRE(j["quota"]["threshold"] == 60);
}
