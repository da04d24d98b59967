#include "apimgr/api_manager.hpp"
#include <spdlog/spdlog.h>
#include <format>

namespace apimgr
{
    namespace
    {
        QuotaWindow::Config window_config(const ManagerOptions &opts)
        {
            return QuotaWindow::Config{opts.window, opts.window_buffer, opts.threshold};
        }
    } // namespace

    ApiManager::ApiManager(const ManagerOptions &opts,
                           std::shared_ptr<ApiClient> client,
                           std::shared_ptr<Cache> cache,
                           std::shared_ptr<QuotaSync> sync,
                           Fingerprinter fingerprinter,
                           ClockFn clock)
        : opts_(opts),
          client_(std::move(client)),
          cache_(std::move(cache)),
          sync_(sync ? std::move(sync) : std::make_shared<NoopQuotaSync>()),
          fingerprinter_(std::move(fingerprinter)),
          quota_(window_config(opts), std::move(clock))
    {
        if (!client_)
            throw ApiError::config("ApiManager requires a client");
        if (!cache_)
            throw ApiError::config("ApiManager requires a cache");

        // Best-effort: adopt the remote's view of the window if it has one
        auto initial = sync_->initial_state();
        if (!initial)
        {
            spdlog::warn("quota sync: initial state unavailable: {}", initial.error().what());
        }
        else if (initial->has_value())
        {
            if (auto res = quota_.restore(**initial); !res)
                spdlog::warn("quota sync: rejected initial state: {}", res.error().what());
        }
    }

    Result<void> ApiManager::update_state()
    {
        auto remote = sync_->remote_count();
        if (!remote)
            return std::unexpected(remote.error());
        if (remote->has_value())
        {
            spdlog::debug("quota sync: count {} -> {}", quota_.count(), **remote);
            quota_.set_count(**remote);
        }
        return {};
    }

    Result<ApiResponse> ApiManager::request(const ApiRequest &request)
    {
        if (opts_.resync_before_request)
        {
            if (auto res = update_state(); !res)
                spdlog::warn("quota sync failed, using local state: {}", res.error().what());
        }

        const std::string key = request.cache_key ? *request.cache_key : fingerprinter_.fingerprint(request);

        auto cached = cache_->get(key);
        if (!cached)
        {
            spdlog::error("cache get failed for {} {}: {}", request.method, request.endpoint, cached.error().what());
            return std::unexpected(ApiError::cache(std::format("Cache lookup failed: {}", cached.error().what())));
        }
        if (cached->has_value())
        {
            spdlog::debug("cache hit {} {} [{}]", request.method, request.endpoint, key);
            auto restored = client_->restore_cached_response(**cached);
            if (!restored)
                return std::unexpected(ApiError::cache(std::format("Unusable cache entry: {}", restored.error().what())));
            restored->from_cache = true;
            return restored;
        }

        return call_live(request, key);
    }

    Result<ApiResponse> ApiManager::call_live(const ApiRequest &request, const std::string &key)
    {
        auto reservation = quota_.reserve();
        if (!reservation)
        {
            auto wait = std::chrono::duration_cast<std::chrono::seconds>(quota_.remaining_time());
            spdlog::warn("rate limit reached ({} calls per {}s), {}s until the window resets",
                         quota_.threshold(), quota_.window_duration().count(), wait.count());
            return std::unexpected(ApiError::rate_limited(
                std::format("Rate limit of {} calls per {}s reached; window resets in {}s",
                            quota_.threshold(), quota_.window_duration().count(), wait.count())));
        }

        spdlog::debug("cache miss {} {} [{}], calling remote", request.method, request.endpoint, key);
        auto response = client_->request(request);
        if (!response && response.error().code == ErrorCode::InvalidInput)
        {
            // Rejected before anything was sent; the slot is released uncommitted
            spdlog::warn("{} {} rejected by the client: {}", request.method, request.endpoint, response.error().what());
            return std::unexpected(response.error());
        }
        // Any other outcome means the call reached the remote
        reservation->commit();

        if (!response)
        {
            if (opts_.cache_on_failure)
            {
                if (auto value = client_->process_response_for_cache(std::nullopt))
                {
                    if (auto put = cache_->put(key, *value); !put)
                        spdlog::error("cache put failed for failed call: {}", put.error().what());
                }
            }
            return std::unexpected(response.error());
        }

        if (auto value = client_->process_response_for_cache(*response))
        {
            if (auto put = cache_->put(key, *value); !put)
            {
                spdlog::error("cache put failed for {} {}: {}", request.method, request.endpoint, put.error().what());
                return std::unexpected(ApiError::cache(std::format("Cache store failed: {}", put.error().what())));
            }
        }
        return response;
    }

} // namespace apimgr
