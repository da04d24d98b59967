#pragma once

#include "api_manager.hpp"
#include <chrono>
#include <cstddef>
#include <functional>

namespace apimgr
{
    /**
     * Opt-in wrapper around ApiManager that waits out an exhausted window.
     * On RateLimitExceeded or RemoteRateLimited it sleeps until the current
     * window ends (capped at max_wait) and tries again, up to max_attempts
     * calls in total. Every other error is returned unchanged.
     */
    class WaitingRequester
    {
    public:
        using SleepFn = std::function<void(std::chrono::milliseconds)>;

        struct Config
        {
            std::size_t max_attempts{3};
            std::chrono::milliseconds max_wait{std::chrono::hours(1)};
            std::chrono::milliseconds min_wait{std::chrono::seconds(1)};
        };

        WaitingRequester(ApiManager &manager, Config cfg);
        WaitingRequester(ApiManager &manager, Config cfg, SleepFn sleep);

        Result<ApiResponse> request(const ApiRequest &request);

    private:
        ApiManager &manager_;
        Config cfg_;
        SleepFn sleep_;
    };
}
