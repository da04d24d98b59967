#pragma once

#include "types.hpp"
#include <optional>

namespace apimgr
{

    /**
     * Performs live calls against a remote API and decides how responses are
     * shaped for the cache. Implementations decide what counts as failure
     * (e.g. a non-2xx status) and report it as TransportFailure, or as
     * RemoteRateLimited when the remote itself refused for quota reasons.
     * InvalidInput means the request was rejected before anything was sent;
     * it does not consume quota.
     */
    class ApiClient
    {
    public:
        virtual ~ApiClient() = default;

        virtual Result<ApiResponse> request(const ApiRequest &request) = 0;

        /**
         * Value to cache for a response, or nullopt to skip caching.
         * Called with nullopt after a failed call when failures are cached.
         */
        virtual std::optional<CacheValue> process_response_for_cache(const std::optional<ApiResponse> &response) = 0;

        /** Rebuild a response from a value produced by process_response_for_cache. */
        virtual Result<ApiResponse> restore_cached_response(const CacheValue &value) = 0;
    };

} // namespace apimgr
