#include "apimgr/http_client.hpp"
#include "apimgr/crypto.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <format>
#include <map>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace apimgr
{
    namespace
    {
        // Bytes that are not UTF-8 become U+FFFD instead of throwing
        std::string dump_lossy(const nlohmann::json &v)
        {
            return v.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        }

        std::string query_value(const nlohmann::json &v)
        {
            if (v.is_string())
                return v.get<std::string>();
            if (v.is_null())
                return "";
            return dump_lossy(v);
        }

        std::string join_path(const std::string &base, const std::string &endpoint)
        {
            if (base.empty())
                return endpoint.empty() || endpoint.front() != '/' ? "/" + endpoint : endpoint;
            std::string b = base;
            while (!b.empty() && b.back() == '/')
                b.pop_back();
            if (b.empty() || b.front() != '/')
                b.insert(b.begin(), '/');
            if (endpoint.empty())
                return b;
            return endpoint.front() == '/' ? b + endpoint : b + "/" + endpoint;
        }

        Result<void> step_result(const beast::error_code &ec, const std::string &what)
        {
            if (!ec)
                return {};
            if (ec == beast::error::timeout)
                return std::unexpected(ApiError::transport(std::format("{} timed out", what)));
            return std::unexpected(ApiError::transport(std::format("{} failed: {}", what, ec.message())));
        }
    } // namespace

    HttpApiClient::HttpApiClient(HttpClientConfig cfg) : cfg_(std::move(cfg)) {}

    std::string HttpApiClient::url_encode(const std::string &value)
    {
        std::string out;
        out.reserve(value.size());
        for (unsigned char c : value)
        {
            if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
                out += static_cast<char>(c);
            else
                out += std::format("%{:02X}", c);
        }
        return out;
    }

    std::string HttpApiClient::build_target(const std::string &base_path,
                                            const std::string &endpoint,
                                            const std::optional<nlohmann::json> &params)
    {
        std::string target = join_path(base_path, endpoint);
        if (!params || !params->is_object() || params->empty())
            return target;

        // Sorted so that equal parameter sets always produce equal URLs
        std::map<std::string, const nlohmann::json *> sorted;
        for (auto it = params->begin(); it != params->end(); ++it)
            sorted[it.key()] = &it.value();

        std::string query;
        auto append = [&query](const std::string &k, const std::string &v) {
            if (!query.empty())
                query += '&';
            query += url_encode(k);
            query += '=';
            query += url_encode(v);
        };

        for (const auto &[key, value] : sorted)
        {
            if (value->is_array())
            {
                for (const auto &item : *value)
                    append(key, query_value(item));
            }
            else
            {
                append(key, query_value(*value));
            }
        }

        target += (target.find('?') == std::string::npos) ? '?' : '&';
        target += query;
        return target;
    }

    Result<ApiResponse> HttpApiClient::request(const ApiRequest &request)
    {
        std::string method = request.method;
        std::transform(method.begin(), method.end(), method.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        auto verb = http::string_to_verb(method);
        if (verb == http::verb::unknown)
        {
            return std::unexpected(ApiError::invalid_input(std::format("Unsupported HTTP method: {}", request.method)));
        }

        auto target = build_target(cfg_.base_path, request.endpoint, request.params);
        spdlog::debug("http {} {}:{}{}", method, cfg_.host, cfg_.port, target);

        net::io_context ioc;
        tcp::resolver resolver(ioc);
        beast::tcp_stream stream(ioc);
        beast::error_code ec;

        auto endpoints = resolver.resolve(cfg_.host, cfg_.port, ec);
        if (auto res = step_result(ec, std::format("Resolve {}", cfg_.host)); !res)
            return std::unexpected(res.error());

        // tcp_stream deadlines only apply to async operations, so every step
        // runs asynchronously on the local io_context.
        stream.expires_after(cfg_.timeout);
        stream.async_connect(endpoints, [&ec](beast::error_code e, const tcp::endpoint &) { ec = e; });
        ioc.run();
        if (auto res = step_result(ec, std::format("Connect to {}", cfg_.host)); !res)
            return std::unexpected(res.error());

        http::request<http::string_body> req{verb, target, 11};
        req.set(http::field::host, cfg_.port == "80" ? cfg_.host : std::format("{}:{}", cfg_.host, cfg_.port));
        req.set(http::field::user_agent, cfg_.user_agent);
        for (const auto &[name, value] : cfg_.default_headers)
            req.set(name, value);
        for (const auto &[name, value] : request.headers)
            req.set(name, value);
        if (request.body)
        {
            req.set(http::field::content_type, "application/json");
            req.body() = dump_lossy(*request.body);
        }
        req.prepare_payload();

        ioc.restart();
        stream.expires_after(cfg_.timeout);
        http::async_write(stream, req, [&ec](beast::error_code e, std::size_t) { ec = e; });
        ioc.run();
        if (auto res = step_result(ec, "Write request"); !res)
            return std::unexpected(res.error());

        beast::flat_buffer buffer;
        http::response<http::string_body> res;
        ioc.restart();
        stream.expires_after(cfg_.timeout);
        http::async_read(stream, buffer, res, [&ec](beast::error_code e, std::size_t) { ec = e; });
        ioc.run();
        if (auto r = step_result(ec, "Read response"); !r)
            return std::unexpected(r.error());

        beast::error_code shutdown_ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, shutdown_ec);
        if (shutdown_ec && shutdown_ec != beast::errc::not_connected)
            spdlog::debug("http shutdown: {}", shutdown_ec.message());

        ApiResponse out;
        out.status = res.result_int();
        for (const auto &field : res)
            out.headers[std::string(field.name_string())] = std::string(field.value());
        out.body = std::move(res.body());

        if (out.status == 429)
        {
            return std::unexpected(ApiError::remote_rate_limited(
                std::format("{} {} rejected by remote rate limit", method, target), out.status));
        }
        if (out.status < 200 || out.status >= 300)
        {
            return std::unexpected(ApiError::transport(
                std::format("{} {} returned HTTP {}", method, target, out.status), out.status));
        }
        return out;
    }

    std::optional<CacheValue> HttpApiClient::process_response_for_cache(const std::optional<ApiResponse> &response)
    {
        if (!response)
            return std::nullopt;

        // The body is stored as Base64 since it need not be UTF-8
        nlohmann::json j{{"status", response->status},
                         {"body_base64", crypto::base64_encode(crypto::Bytes(response->body.begin(), response->body.end()))}};
        auto ct = std::find_if(response->headers.begin(), response->headers.end(), [](const auto &h) {
            return beast::iequals(h.first, "content-type");
        });
        if (ct != response->headers.end())
            j["content_type"] = ct->second;
        return dump_lossy(j);
    }

    Result<ApiResponse> HttpApiClient::restore_cached_response(const CacheValue &value)
    {
        try
        {
            auto j = nlohmann::json::parse(value);
            ApiResponse out;
            out.status = j.at("status").get<unsigned>();
            auto body = crypto::base64_decode(j.at("body_base64").get<std::string>());
            if (!body)
                return std::unexpected(ApiError::parsing(std::format("Malformed cached body: {}", body.error().what())));
            out.body.assign(body->begin(), body->end());
            if (j.contains("content_type"))
                out.headers["Content-Type"] = j.at("content_type").get<std::string>();
            out.from_cache = true;
            return out;
        }
        catch (const nlohmann::json::exception &e)
        {
            return std::unexpected(ApiError::parsing(std::format("Malformed cached response: {}", e.what())));
        }
    }

} // namespace apimgr
