#pragma once

#include "api_client.hpp"
#include "quota_window.hpp"
#include "types.hpp"
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace apimgr
{

    /**
     * Source of authoritative quota state, used to keep several independent
     * ApiManager instances (e.g. separate processes) roughly aligned.
     *
     * This is best effort: there is no distributed lock, so two processes can
     * still race between a resync and their own call.
     */
    class QuotaSync
    {
    public:
        virtual ~QuotaSync() = default;

        /** Calls already made in the current window, or nullopt if unknown. */
        virtual Result<std::optional<std::size_t>> remote_count() = 0;

        /** Count and window start to adopt at start-up. */
        virtual Result<std::optional<QuotaSnapshot>> initial_state() { return std::optional<QuotaSnapshot>(); }
    };

    /** Does nothing; the default when no strategy is configured. */
    class NoopQuotaSync : public QuotaSync
    {
    public:
        Result<std::optional<std::size_t>> remote_count() override { return std::optional<std::size_t>(); }
    };

    struct EndpointQuotaSyncConfig
    {
        std::string endpoint{"/rate_limit"};
        std::string remaining_pointer; // JSON pointer to "requests remaining"
        std::string used_pointer;      // JSON pointer to "requests used"; used when remaining is unset
        std::string reset_pointer;     // JSON pointer to window end, epoch seconds (optional)
        std::size_t threshold{0};
        std::chrono::seconds window_duration{0};
    };

    /**
     * Reads quota state from a "rate limit status" endpoint of the remote API,
     * e.g. GET /rate_limit -> {"resources": {"core": {"remaining": 4990}}}.
     * The call goes straight to the client and is not counted locally.
     */
    class EndpointQuotaSync : public QuotaSync
    {
    public:
        EndpointQuotaSync(std::shared_ptr<ApiClient> client, EndpointQuotaSyncConfig cfg,
                          ClockFn clock = &Clock::now);

        Result<std::optional<std::size_t>> remote_count() override;
        Result<std::optional<QuotaSnapshot>> initial_state() override;

    private:
        Result<nlohmann::json> fetch_status();
        Result<std::optional<std::size_t>> count_from(const nlohmann::json &status) const;

        std::shared_ptr<ApiClient> client_;
        EndpointQuotaSyncConfig cfg_;
        ClockFn clock_;
    };

} // namespace apimgr
