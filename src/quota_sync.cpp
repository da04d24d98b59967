#include "apimgr/quota_sync.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <format>

namespace apimgr
{
    namespace
    {
        // Latest reset time accepted: 9999-12-31T23:59:59Z
        constexpr int64_t kMaxResetEpoch = 253402300799;

        Result<int64_t> integer_from_string(const std::string &text, const std::string &pointer)
        {
            std::size_t consumed = 0;
            int64_t parsed = std::stoll(text, &consumed);
            if (consumed != text.size())
                return std::unexpected(ApiError::sync(std::format("Quota status value at {} is not a number", pointer)));
            return parsed;
        }

        Result<std::optional<int64_t>> read_integer(const nlohmann::json &doc, const std::string &pointer)
        {
            if (pointer.empty())
                return std::optional<int64_t>();
            try
            {
                nlohmann::json::json_pointer ptr(pointer);
                if (!doc.contains(ptr))
                    return std::unexpected(ApiError::sync(std::format("Quota status has no value at {}", pointer)));
                const auto &value = doc.at(ptr);
                if (value.is_number_unsigned())
                {
                    auto u = value.get<uint64_t>();
                    if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
                        return std::unexpected(ApiError::sync(std::format("Quota status value at {} is out of range", pointer)));
                    return std::optional<int64_t>(static_cast<int64_t>(u));
                }
                if (value.is_number_integer())
                    return std::optional<int64_t>(value.get<int64_t>());
                if (value.is_number_float())
                {
                    // 2^63 is exact as a double; anything at or past it does not fit
                    double d = value.get<double>();
                    if (!std::isfinite(d) || d >= 9223372036854775808.0 || d < -9223372036854775808.0)
                        return std::unexpected(ApiError::sync(std::format("Quota status value at {} is out of range", pointer)));
                    return std::optional<int64_t>(static_cast<int64_t>(d));
                }
                if (value.is_string())
                {
                    auto parsed = integer_from_string(value.get<std::string>(), pointer);
                    if (!parsed)
                        return std::unexpected(parsed.error());
                    return std::optional<int64_t>(*parsed);
                }
                return std::unexpected(ApiError::sync(std::format("Quota status value at {} is not a number", pointer)));
            }
            catch (const nlohmann::json::exception &e)
            {
                return std::unexpected(ApiError::sync(std::format("Invalid quota pointer: {}", e.what())));
            }
            catch (const std::invalid_argument &)
            {
                return std::unexpected(ApiError::sync(std::format("Quota status value at {} is not a number", pointer)));
            }
            catch (const std::out_of_range &)
            {
                return std::unexpected(ApiError::sync(std::format("Quota status value at {} is out of range", pointer)));
            }
        }
    } // namespace

    EndpointQuotaSync::EndpointQuotaSync(std::shared_ptr<ApiClient> client, EndpointQuotaSyncConfig cfg, ClockFn clock)
        : client_(std::move(client)), cfg_(std::move(cfg)), clock_(std::move(clock))
    {
        if (!client_)
            throw ApiError::config("EndpointQuotaSync requires a client");
        if (cfg_.remaining_pointer.empty() && cfg_.used_pointer.empty())
            throw ApiError::config("EndpointQuotaSync needs a remaining or used pointer");
        if (!cfg_.remaining_pointer.empty() && cfg_.threshold == 0)
            throw ApiError::config("EndpointQuotaSync needs the threshold to convert remaining into used");
    }

    Result<nlohmann::json> EndpointQuotaSync::fetch_status()
    {
        ApiRequest req;
        req.method = "GET";
        req.endpoint = cfg_.endpoint;
        auto res = client_->request(req);
        if (!res)
            return std::unexpected(ApiError::sync(std::format("Quota status request failed: {}", res.error().what())));
        try
        {
            return nlohmann::json::parse(res->body);
        }
        catch (const nlohmann::json::exception &e)
        {
            return std::unexpected(ApiError::sync(std::format("Quota status is not JSON: {}", e.what())));
        }
    }

    Result<std::optional<std::size_t>> EndpointQuotaSync::count_from(const nlohmann::json &status) const
    {
        if (!cfg_.remaining_pointer.empty())
        {
            auto remaining = read_integer(status, cfg_.remaining_pointer);
            if (!remaining)
                return std::unexpected(remaining.error());
            auto left = std::max<int64_t>(0, **remaining);
            auto threshold = static_cast<int64_t>(cfg_.threshold);
            return std::optional<std::size_t>(static_cast<std::size_t>(std::max<int64_t>(0, threshold - left)));
        }

        auto used = read_integer(status, cfg_.used_pointer);
        if (!used)
            return std::unexpected(used.error());
        return std::optional<std::size_t>(static_cast<std::size_t>(std::max<int64_t>(0, **used)));
    }

    Result<std::optional<std::size_t>> EndpointQuotaSync::remote_count()
    {
        auto status = fetch_status();
        if (!status)
            return std::unexpected(status.error());
        return count_from(*status);
    }

    Result<std::optional<QuotaSnapshot>> EndpointQuotaSync::initial_state()
    {
        if (cfg_.reset_pointer.empty() || cfg_.window_duration.count() <= 0)
            return std::optional<QuotaSnapshot>();

        auto status = fetch_status();
        if (!status)
            return std::unexpected(status.error());

        auto count = count_from(*status);
        if (!count)
            return std::unexpected(count.error());
        auto reset = read_integer(*status, cfg_.reset_pointer);
        if (!reset)
            return std::unexpected(reset.error());
        if (**reset < 0 || **reset > kMaxResetEpoch)
            return std::unexpected(ApiError::sync(std::format("Quota reset time {} is out of range", **reset)));

        // Remote reports when the window ends; it began one window earlier
        TimePoint window_end{std::chrono::seconds(**reset)};
        TimePoint start = window_end - cfg_.window_duration;
        auto now = clock_();
        if (start > now)
            start = now;

        spdlog::debug("quota sync: remote count {} window start {}s ago", count->value_or(0),
                      std::chrono::duration_cast<std::chrono::seconds>(now - start).count());
        return std::optional<QuotaSnapshot>(QuotaSnapshot{count->value_or(0), start});
    }

} // namespace apimgr
