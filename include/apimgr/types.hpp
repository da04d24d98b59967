#pragma once

#include <nlohmann/json.hpp>
#include <expected>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

namespace apimgr
{

    /**
     * Error categories surfaced by apimgr operations
     */
    enum class ErrorCode
    {
        ConfigError,
        InvalidInput,
        ParsingError,
        RateLimitExceeded,
        TransportFailure,
        RemoteRateLimited,
        CacheFailure,
        StorageError,
        CryptoError,
        SyncFailure,
        InternalError
    };

    inline std::string error_code_to_string(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::ConfigError:
            return "ConfigError";
        case ErrorCode::InvalidInput:
            return "InvalidInput";
        case ErrorCode::ParsingError:
            return "ParsingError";
        case ErrorCode::RateLimitExceeded:
            return "RateLimitExceeded";
        case ErrorCode::TransportFailure:
            return "TransportFailure";
        case ErrorCode::RemoteRateLimited:
            return "RemoteRateLimited";
        case ErrorCode::CacheFailure:
            return "CacheFailure";
        case ErrorCode::StorageError:
            return "StorageError";
        case ErrorCode::CryptoError:
            return "CryptoError";
        case ErrorCode::SyncFailure:
            return "SyncFailure";
        case ErrorCode::InternalError:
            return "InternalError";
        }
        return "Unknown";
    }

    /**
     * apimgr error with code and message. Transport errors may carry the
     * HTTP status the remote answered with.
     */
    class ApiError : public std::runtime_error
    {
    public:
        ErrorCode code;
        std::optional<unsigned> http_status;

        ApiError(ErrorCode code, const std::string &message, std::optional<unsigned> status = std::nullopt)
            : std::runtime_error(message), code(code), http_status(status) {}

        static ApiError config(const std::string &msg)
        {
            return ApiError(ErrorCode::ConfigError, msg);
        }

        static ApiError invalid_input(const std::string &msg)
        {
            return ApiError(ErrorCode::InvalidInput, msg);
        }

        static ApiError parsing(const std::string &msg)
        {
            return ApiError(ErrorCode::ParsingError, msg);
        }

        static ApiError rate_limited(const std::string &msg)
        {
            return ApiError(ErrorCode::RateLimitExceeded, msg);
        }

        static ApiError transport(const std::string &msg, std::optional<unsigned> status = std::nullopt)
        {
            return ApiError(ErrorCode::TransportFailure, msg, status);
        }

        static ApiError remote_rate_limited(const std::string &msg, std::optional<unsigned> status = std::nullopt)
        {
            return ApiError(ErrorCode::RemoteRateLimited, msg, status);
        }

        static ApiError cache(const std::string &msg)
        {
            return ApiError(ErrorCode::CacheFailure, msg);
        }

        static ApiError storage(const std::string &msg)
        {
            return ApiError(ErrorCode::StorageError, msg);
        }

        static ApiError crypto(const std::string &msg)
        {
            return ApiError(ErrorCode::CryptoError, msg);
        }

        static ApiError sync(const std::string &msg)
        {
            return ApiError(ErrorCode::SyncFailure, msg);
        }

        static ApiError internal(const std::string &msg)
        {
            return ApiError(ErrorCode::InternalError, msg);
        }
    };

    /**
     * Result type using C++23 std::expected
     */
    template <typename T>
    using Result = std::expected<T, ApiError>;

    using Headers = std::map<std::string, std::string>;

    /** Opaque value stored in a Cache; shaped by the ApiClient. */
    using CacheValue = std::string;

    /**
     * A logical request: what the caller wants, independent of whether it
     * turns into a live call.
     */
    struct ApiRequest
    {
        std::string method{"GET"};
        std::string endpoint;
        Headers headers;
        std::optional<nlohmann::json> params;
        std::optional<nlohmann::json> body;
        std::optional<std::string> cache_key; // overrides the computed fingerprint
    };

    struct ApiResponse
    {
        unsigned status{0};
        Headers headers;
        std::string body;
        bool from_cache{false};
    };

} // namespace apimgr
