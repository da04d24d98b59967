#include <catch2/catch_test_macros.hpp>
#include "apimgr/api_manager.hpp"
#include "fakes.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace apimgr;
using namespace apimgr::testing;
using namespace std::chrono_literals;

namespace
{
    ApiRequest get(const std::string &endpoint, nlohmann::json params = nullptr)
    {
        ApiRequest req;
        req.method = "GET";
        req.endpoint = endpoint;
        if (!params.is_null())
            req.params = std::move(params);
        return req;
    }

    ManagerOptions options(std::size_t threshold, std::chrono::seconds window)
    {
        ManagerOptions opts;
        opts.threshold = threshold;
        opts.window = window;
        return opts;
    }

    /** Reports a settable remote count and counts how often it was asked. */
    class FixedSync : public QuotaSync
    {
    public:
        explicit FixedSync(std::optional<std::size_t> remote) : count(remote) {}

        Result<std::optional<std::size_t>> remote_count() override
        {
            ++calls;
            if (fail)
                return std::unexpected(ApiError::sync("status endpoint down"));
            return count;
        }

        Result<std::optional<QuotaSnapshot>> initial_state() override
        {
            return initial;
        }

        std::optional<std::size_t> count;
        int calls{0};
        bool fail{false};
        std::optional<QuotaSnapshot> initial;
    };
}

TEST_CASE("Identical requests hit the cache after the first live call", "[manager]")
{
    // threshold=60, window=3600s, 60 identical requests
    auto client = std::make_shared<FakeClient>();
    auto cache = std::make_shared<MemoryCache>();
    ApiManager manager(options(60, 3600s), client, cache);

    int live = 0;
    int hits = 0;
    for (int i = 0; i < 60; ++i)
    {
        auto res = manager.request(get("/repos", {{"page", 1}}));
        REQUIRE(res.has_value());
        REQUIRE(res->status == 200);
        REQUIRE(res->body == "GET /repos");
        (res->from_cache ? hits : live)++;
    }

    REQUIRE(live == 1);
    REQUIRE(hits == 59);
    REQUIRE(client->calls == 1);
    REQUIRE(manager.quota().count() == 1);
    REQUIRE(cache->size() == 1);
}

TEST_CASE("Distinct requests beyond the threshold are rate limited", "[manager]")
{
    // threshold=2, window=60s, 3 distinct requests
    auto client = std::make_shared<FakeClient>();
    ApiManager manager(options(2, 60s), client, std::make_shared<MemoryCache>());

    REQUIRE(manager.request(get("/a")).has_value());
    REQUIRE(manager.request(get("/b")).has_value());

    auto third = manager.request(get("/c"));
    REQUIRE_FALSE(third.has_value());
    REQUIRE(third.error().code == ErrorCode::RateLimitExceeded);
    REQUIRE(std::string(third.error().what()).starts_with("Rate limit of 2 calls per 60s reached; window resets in "));
    REQUIRE(client->calls == 2);
    REQUIRE(manager.quota().count() == 2);

    SECTION("cached requests are still served when the quota is exhausted")
    {
        auto again = manager.request(get("/a"));
        REQUIRE(again.has_value());
        REQUIRE(again->from_cache);
        REQUIRE(client->calls == 2);
    }
}

TEST_CASE("threshold + k distinct requests admit exactly threshold", "[manager]")
{
    auto client = std::make_shared<FakeClient>();
    ApiManager manager(options(5, 3600s), client, std::make_shared<MemoryCache>());

    int admitted = 0;
    int denied = 0;
    for (int i = 0; i < 5 + 4; ++i)
    {
        auto res = manager.request(get("/item/" + std::to_string(i)));
        if (res)
            ++admitted;
        else if (res.error().code == ErrorCode::RateLimitExceeded)
            ++denied;
    }
    REQUIRE(admitted == 5);
    REQUIRE(denied == 4);
}

TEST_CASE("Quota frees up once the window elapses", "[manager]")
{
    ManualClock clock;
    auto client = std::make_shared<FakeClient>();
    ApiManager manager(options(1, 60s), client, std::make_shared<MemoryCache>(), nullptr, Fingerprinter{}, clock.fn());

    REQUIRE(manager.request(get("/a")).has_value());
    REQUIRE_FALSE(manager.request(get("/b")).has_value());

    clock.advance(60s);
    auto res = manager.request(get("/b"));
    REQUIRE(res.has_value());
    REQUIRE_FALSE(res->from_cache);
    REQUIRE(manager.quota().count() == 1);
    REQUIRE(manager.quota().window_start() == clock.now());
}

TEST_CASE("Cache read failure fails closed", "[manager]")
{
    auto client = std::make_shared<FakeClient>();
    auto cache = std::make_shared<BrokenCache>();
    ApiManager manager(options(10, 60s), client, cache);

    auto res = manager.request(get("/a"));
    REQUIRE_FALSE(res.has_value());
    REQUIRE(res.error().code == ErrorCode::CacheFailure);
    REQUIRE(client->calls == 0);
    REQUIRE(manager.quota().count() == 0);
}

TEST_CASE("Cache write failure surfaces after the quota is consumed", "[manager]")
{
    auto client = std::make_shared<FakeClient>();
    auto cache = std::make_shared<BrokenCache>();
    cache->fail_get = false;
    ApiManager manager(options(10, 60s), client, cache);

    auto res = manager.request(get("/a"));
    REQUIRE_FALSE(res.has_value());
    REQUIRE(res.error().code == ErrorCode::CacheFailure);
    REQUIRE(client->calls == 1);
    REQUIRE(manager.quota().count() == 1);
}

TEST_CASE("Client failures consume quota and are not cached", "[manager]")
{
    auto client = std::make_shared<FakeClient>();
    client->fail_with = ApiError::transport("HTTP 500", 500u);
    auto cache = std::make_shared<MemoryCache>();
    ApiManager manager(options(10, 60s), client, cache);

    auto res = manager.request(get("/a"));
    REQUIRE_FALSE(res.has_value());
    REQUIRE(res.error().code == ErrorCode::TransportFailure);
    REQUIRE(res.error().http_status == 500u);
    REQUIRE(manager.quota().count() == 1);
    REQUIRE(manager.quota().in_flight() == 0);
    REQUIRE(cache->size() == 0);

    client->fail_with.reset();
    auto retry = manager.request(get("/a"));
    REQUIRE(retry.has_value());
    REQUIRE_FALSE(retry->from_cache);
    REQUIRE(manager.quota().count() == 2);
}

TEST_CASE("Requests the client rejects up front consume no quota", "[manager]")
{
    auto client = std::make_shared<FakeClient>();
    client->fail_with = ApiError::invalid_input("Unsupported HTTP method: FROB");
    client->failure_value = CacheValue("400|bad method");
    auto cache = std::make_shared<MemoryCache>();
    auto opts = options(1, 60s);
    opts.cache_on_failure = true;
    ApiManager manager(opts, client, cache);

    auto res = manager.request(get("/a"));
    REQUIRE_FALSE(res.has_value());
    REQUIRE(res.error().code == ErrorCode::InvalidInput);
    REQUIRE(manager.quota().count() == 0);
    REQUIRE(manager.quota().in_flight() == 0);
    REQUIRE(cache->size() == 0);

    // the single slot is still available
    client->fail_with.reset();
    REQUIRE(manager.request(get("/a")).has_value());
    REQUIRE(manager.quota().count() == 1);
}

TEST_CASE("cache_on_failure stores the client's failure value", "[manager]")
{
    auto client = std::make_shared<FakeClient>();
    client->fail_with = ApiError::transport("HTTP 404", 404u);
    client->failure_value = CacheValue("404|not found");
    auto cache = std::make_shared<MemoryCache>();
    auto opts = options(10, 60s);
    opts.cache_on_failure = true;
    ApiManager manager(opts, client, cache);

    REQUIRE_FALSE(manager.request(get("/missing")).has_value());
    REQUIRE(cache->size() == 1);

    auto cached = manager.request(get("/missing"));
    REQUIRE(cached.has_value());
    REQUIRE(cached->from_cache);
    REQUIRE(cached->status == 404);
    REQUIRE(client->calls == 1);
}

TEST_CASE("Responses the client declines to cache are fetched again", "[manager]")
{
    auto client = std::make_shared<FakeClient>();
    client->skip_caching = true;
    ApiManager manager(options(10, 60s), client, std::make_shared<MemoryCache>());

    REQUIRE(manager.request(get("/live")).has_value());
    REQUIRE(manager.request(get("/live")).has_value());
    REQUIRE(client->calls == 2);
    REQUIRE(manager.quota().count() == 2);
}

TEST_CASE("Unrestorable cache entries are cache failures", "[manager]")
{
    auto client = std::make_shared<FakeClient>();
    auto cache = std::make_shared<MemoryCache>();
    ApiManager manager(options(10, 60s), client, cache);

    auto key = manager.fingerprinter().fingerprint(get("/a"));
    REQUIRE(cache->put(key, "garbage").has_value());

    auto res = manager.request(get("/a"));
    REQUIRE_FALSE(res.has_value());
    REQUIRE(res.error().code == ErrorCode::CacheFailure);
    REQUIRE(client->calls == 0);
}

TEST_CASE("An explicit cache key overrides the fingerprint", "[manager]")
{
    auto client = std::make_shared<FakeClient>();
    ApiManager manager(options(10, 60s), client, std::make_shared<MemoryCache>());

    auto first = get("/search", {{"q", "a"}});
    first.cache_key = "search";
    auto second = get("/search", {{"q", "b"}});
    second.cache_key = "search";

    REQUIRE(manager.request(first).has_value());
    auto res = manager.request(second);
    REQUIRE(res.has_value());
    REQUIRE(res->from_cache);
    REQUIRE(client->calls == 1);
}

TEST_CASE("Resync before request overrides the local count", "[manager][sync]")
{
    ManualClock clock;
    auto client = std::make_shared<FakeClient>();
    auto sync = std::make_shared<FixedSync>(std::size_t{9});
    auto opts = options(10, 3600s);
    opts.resync_before_request = true;
    ApiManager manager(opts, client, std::make_shared<MemoryCache>(), sync, Fingerprinter{}, clock.fn());
    auto start = manager.quota().window_start();

    clock.advance(5s);
    REQUIRE(manager.request(get("/a")).has_value());
    REQUIRE(sync->calls == 1);
    REQUIRE(manager.quota().count() == 10);
    REQUIRE(manager.quota().window_start() == start);

    // remote reports the quota exhausted by other consumers
    sync->count = 10;
    auto denied = manager.request(get("/b"));
    REQUIRE_FALSE(denied.has_value());
    REQUIRE(denied.error().code == ErrorCode::RateLimitExceeded);
    REQUIRE(client->calls == 1);
}

TEST_CASE("Resync is skipped unless enabled", "[manager][sync]")
{
    auto sync = std::make_shared<FixedSync>(std::size_t{9});
    ApiManager manager(options(10, 3600s), std::make_shared<FakeClient>(), std::make_shared<MemoryCache>(), sync);

    REQUIRE(manager.request(get("/a")).has_value());
    REQUIRE(sync->calls == 0);
    REQUIRE(manager.quota().count() == 1);

    REQUIRE(manager.update_state().has_value());
    REQUIRE(manager.quota().count() == 9);
}

TEST_CASE("A failing resync leaves local state in charge", "[manager][sync]")
{
    auto sync = std::make_shared<FixedSync>(std::size_t{9});
    sync->fail = true;
    auto opts = options(10, 3600s);
    opts.resync_before_request = true;
    ApiManager manager(opts, std::make_shared<FakeClient>(), std::make_shared<MemoryCache>(), sync);

    REQUIRE(manager.request(get("/a")).has_value());
    REQUIRE(manager.quota().count() == 1);

    auto res = manager.update_state();
    REQUIRE_FALSE(res.has_value());
    REQUIRE(res.error().code == ErrorCode::SyncFailure);
}

TEST_CASE("Initial state from the sync strategy seeds the window", "[manager][sync]")
{
    ManualClock clock;
    auto sync = std::make_shared<FixedSync>(std::nullopt);
    sync->initial = QuotaSnapshot{4, clock.now() - 30s};

    ApiManager manager(options(5, 60s), std::make_shared<FakeClient>(), std::make_shared<MemoryCache>(), sync,
                       Fingerprinter{}, clock.fn());
    REQUIRE(manager.quota().count() == 4);
    REQUIRE(manager.quota().remaining_time() == std::chrono::milliseconds(30s));

    REQUIRE(manager.request(get("/a")).has_value());
    REQUIRE_FALSE(manager.request(get("/b")).has_value());
}

TEST_CASE("Construction validates options and collaborators", "[manager]")
{
    auto client = std::make_shared<FakeClient>();
    auto cache = std::make_shared<MemoryCache>();

    REQUIRE_THROWS_AS(ApiManager(options(0, 60s), client, cache), ApiError);
    REQUIRE_THROWS_AS(ApiManager(options(1, 0s), client, cache), ApiError);
    REQUIRE_THROWS_AS(ApiManager(options(1, 60s), nullptr, cache), ApiError);
    REQUIRE_THROWS_AS(ApiManager(options(1, 60s), client, nullptr), ApiError);
}

TEST_CASE("Shared manager admits at most threshold live calls across threads", "[manager][threads]")
{
    auto client = std::make_shared<FakeClient>();
    ApiManager manager(options(25, 3600s), client, std::make_shared<MemoryCache>());

    std::atomic<int> ok{0};
    std::atomic<int> limited{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t)
    {
        threads.emplace_back([&, t] {
            for (int i = 0; i < 20; ++i)
            {
                auto res = manager.request(get("/t" + std::to_string(t) + "/" + std::to_string(i)));
                if (res)
                    ++ok;
                else if (res.error().code == ErrorCode::RateLimitExceeded)
                    ++limited;
            }
        });
    }
    for (auto &th : threads)
        th.join();

    REQUIRE(ok.load() == 25);
    REQUIRE(limited.load() == 8 * 20 - 25);
    REQUIRE(client->calls == 25);
    REQUIRE(manager.quota().count() == 25);
}
