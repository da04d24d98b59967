#include "apimgr/waiting_requester.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <thread>

namespace apimgr
{
    WaitingRequester::WaitingRequester(ApiManager &manager, Config cfg)
        : WaitingRequester(manager, cfg, [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); })
    {
    }

    WaitingRequester::WaitingRequester(ApiManager &manager, Config cfg, SleepFn sleep)
        : manager_(manager), cfg_(cfg), sleep_(std::move(sleep))
    {
        if (cfg_.max_attempts == 0)
            throw ApiError::config("max_attempts must be at least 1");
        if (cfg_.min_wait > cfg_.max_wait)
            throw ApiError::config("min_wait must not exceed max_wait");
        if (!sleep_)
            throw ApiError::config("WaitingRequester requires a sleep function");
    }

    Result<ApiResponse> WaitingRequester::request(const ApiRequest &request)
    {
        for (std::size_t attempt = 1;; ++attempt)
        {
            auto res = manager_.request(request);
            if (res)
                return res;

            auto code = res.error().code;
            if (code != ErrorCode::RateLimitExceeded && code != ErrorCode::RemoteRateLimited)
                return res;
            if (attempt >= cfg_.max_attempts)
                return res;

            auto wait = std::clamp(manager_.quota().remaining_time(), cfg_.min_wait, cfg_.max_wait);
            spdlog::info("{} {} throttled (attempt {}/{}), waiting {}ms",
                         request.method, request.endpoint, attempt, cfg_.max_attempts, wait.count());
            sleep_(wait);
        }
    }

} // namespace apimgr
