#pragma once

#include "api_client.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <optional>
#include <string>

namespace apimgr
{
    struct HttpClientConfig
    {
        std::string host{"localhost"};
        std::string port{"80"};
        std::string base_path; // prefixed to every endpoint, e.g. "/api/v1"
        std::string user_agent{"apimgr"};
        std::chrono::milliseconds timeout{10000};
        Headers default_headers;
    };

    /**
     * Plain HTTP/1.1 ApiClient built on Boost.Beast. One connection per call,
     * no state shared between calls.
     *
     * Params become the query string (keys sorted, percent-encoded), a body is
     * sent as JSON. 2xx is success; 429 is RemoteRateLimited; any other status,
     * a network error or a timeout is TransportFailure.
     *
     * Cached form: {"status", "content_type", "body_base64"} as compact JSON;
     * the body is kept as Base64 since it may be any bytes.
     */
    class HttpApiClient : public ApiClient
    {
    public:
        explicit HttpApiClient(HttpClientConfig cfg);

        Result<ApiResponse> request(const ApiRequest &request) override;
        std::optional<CacheValue> process_response_for_cache(const std::optional<ApiResponse> &response) override;
        Result<ApiResponse> restore_cached_response(const CacheValue &value) override;

        /** Request target (path + query) for an endpoint and its params. */
        static std::string build_target(const std::string &base_path,
                                        const std::string &endpoint,
                                        const std::optional<nlohmann::json> &params);

        static std::string url_encode(const std::string &value);

        const HttpClientConfig &config() const { return cfg_; }

    private:
        HttpClientConfig cfg_;
    };

} // namespace apimgr
