#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace apimgr
{
    /**
     * Derives cache keys from logical requests.
     *
     * The key is the hex SHA-256 of the RFC 8785 canonical form of
     * {method, endpoint, params, body}, so parameter insertion order never
     * changes the key and no parameter value appears in it verbatim.
     * Headers are ignored unless named in `included_headers`; those are
     * matched case-insensitively.
     */
    class Fingerprinter
    {
    public:
        Fingerprinter() = default;
        explicit Fingerprinter(std::vector<std::string> included_headers);

        std::string fingerprint(const std::string &method,
                                const std::string &endpoint,
                                const std::optional<nlohmann::json> &params,
                                const std::optional<nlohmann::json> &body) const;

        /** Fingerprint of a request, including any opted-in headers it carries. */
        std::string fingerprint(const ApiRequest &request) const;

        /** The canonical string that gets hashed; exposed for inspection. */
        std::string canonical_form(const ApiRequest &request) const;

        const std::vector<std::string> &included_headers() const { return included_headers_; }

    private:
        std::string canonical_form(const std::string &method,
                                   const std::string &endpoint,
                                   const std::optional<nlohmann::json> &params,
                                   const std::optional<nlohmann::json> &body,
                                   const Headers *headers) const;

        std::vector<std::string> included_headers_; // lower-cased
    };

} // namespace apimgr
