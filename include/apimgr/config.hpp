#pragma once

#include "api_manager.hpp"
#include "http_client.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace apimgr
{

    struct QuotaConfig
    {
        int64_t window_seconds{3600};
        int64_t window_buffer_seconds{0};
        int64_t threshold{60};
        bool resync_before_request{false};
        bool cache_on_failure{false};
    };

    struct CacheConfig
    {
        std::string backend{"memory"}; // "memory" or "rocksdb"
        std::string path{"./data/cache"};
        std::size_t max_entries{0};
        bool encrypt_at_rest{false};
    };

    struct FingerprintConfig
    {
        std::vector<std::string> headers;
    };

    struct SyncConfig
    {
        std::string endpoint; // empty disables sync
        std::string remaining_pointer;
        std::string used_pointer;
        std::string reset_pointer;
    };

    struct LoggingConfig
    {
        std::string level{"info"};
    };

    struct AppConfig
    {
        QuotaConfig quota{};
        CacheConfig cache{};
        HttpClientConfig client{};
        FingerprintConfig fingerprint{};
        SyncConfig sync{};
        LoggingConfig logging{};

        ManagerOptions manager_options() const;
    };

    /**
     * ConfigLoader reads TOML configs; APIMGR_* environment variables take
     * precedence over file values. Missing keys keep their defaults.
     */
    class ConfigLoader
    {
    public:
        /** Load config from a TOML file path. Environment overrides take precedence. */
        static Result<AppConfig> load(const std::string &path);

        /** Parse config from TOML string content. */
        static Result<AppConfig> from_string(const std::string &toml_content);

        /** Serialize config to JSON for inspection; header values are redacted. */
        static nlohmann::json to_json(const AppConfig &cfg);

    private:
        static Result<void> apply_env_overrides(AppConfig &cfg);
        static Result<void> validate(const AppConfig &cfg);
    };

} // namespace apimgr
