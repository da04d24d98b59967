#pragma once

#include "api_client.hpp"
#include "cache.hpp"
#include "fingerprint.hpp"
#include "quota_sync.hpp"
#include "quota_window.hpp"
#include "types.hpp"
#include <chrono>
#include <cstddef>
#include <memory>

namespace apimgr
{
    struct ManagerOptions
    {
        std::chrono::seconds window{3600};
        std::chrono::seconds window_buffer{0};
        std::size_t threshold{60};
        bool resync_before_request{false};
        bool cache_on_failure{false}; // store the client's failure value, if it provides one
    };

    /**
     * Issues logical requests against a rate-limited API.
     *
     * Each request is fingerprinted and looked up in the cache first; only a
     * miss that fits within the current quota window reaches the client.
     * Live calls consume quota whether they succeed or fail. Cache hits never
     * consume quota.
     *
     * Failures, all per call and never retried here:
     * - CacheFailure: the cache could not be read (no live call is made) or a
     *   fresh response could not be stored.
     * - RateLimitExceeded: local quota exhausted; nothing was sent.
     * - TransportFailure / RemoteRateLimited: propagated from the client.
     *
     * One instance may be shared between threads.
     */
    class ApiManager
    {
    public:
        ApiManager(const ManagerOptions &opts,
                   std::shared_ptr<ApiClient> client,
                   std::shared_ptr<Cache> cache,
                   std::shared_ptr<QuotaSync> sync = nullptr,
                   Fingerprinter fingerprinter = Fingerprinter{},
                   ClockFn clock = &Clock::now);

        ApiManager(const ApiManager &) = delete;
        ApiManager &operator=(const ApiManager &) = delete;

        Result<ApiResponse> request(const ApiRequest &request);

        /** Pull the authoritative count from the sync strategy into the window. */
        Result<void> update_state();

        const QuotaWindow &quota() const { return quota_; }
        QuotaWindow &quota() { return quota_; }
        const Fingerprinter &fingerprinter() const { return fingerprinter_; }
        const ManagerOptions &options() const { return opts_; }

    private:
        Result<ApiResponse> call_live(const ApiRequest &request, const std::string &key);

        ManagerOptions opts_;
        std::shared_ptr<ApiClient> client_;
        std::shared_ptr<Cache> cache_;
        std::shared_ptr<QuotaSync> sync_;
        Fingerprinter fingerprinter_;
        QuotaWindow quota_;
    };

} // namespace apimgr
