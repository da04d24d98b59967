#include "apimgr/fingerprint.hpp"
#include "apimgr/crypto.hpp"
#include "apimgr/json_canonicalization.hpp"
#include <algorithm>
#include <cctype>

namespace apimgr
{
    namespace
    {
        std::string to_lower(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        std::string to_upper(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            return s;
        }
    } // namespace

    Fingerprinter::Fingerprinter(std::vector<std::string> included_headers)
    {
        for (auto &name : included_headers)
        {
            auto lowered = to_lower(std::move(name));
            if (std::find(included_headers_.begin(), included_headers_.end(), lowered) == included_headers_.end())
                included_headers_.push_back(std::move(lowered));
        }
    }

    std::string Fingerprinter::canonical_form(const std::string &method,
                                              const std::string &endpoint,
                                              const std::optional<nlohmann::json> &params,
                                              const std::optional<nlohmann::json> &body,
                                              const Headers *headers) const
    {
        nlohmann::json doc = {
            {"method", to_upper(method)},
            {"endpoint", endpoint},
            {"params", params ? *params : nlohmann::json(nullptr)},
            {"body", body ? *body : nlohmann::json(nullptr)}};

        if (headers && !included_headers_.empty())
        {
            nlohmann::json selected = nlohmann::json::object();
            for (const auto &[name, value] : *headers)
            {
                auto lowered = to_lower(name);
                if (std::find(included_headers_.begin(), included_headers_.end(), lowered) != included_headers_.end())
                    selected[lowered] = value;
            }
            if (!selected.empty())
                doc["headers"] = std::move(selected);
        }

        return json::canonicalize(doc);
    }

    std::string Fingerprinter::fingerprint(const std::string &method,
                                           const std::string &endpoint,
                                           const std::optional<nlohmann::json> &params,
                                           const std::optional<nlohmann::json> &body) const
    {
        auto canonical = canonical_form(method, endpoint, params, body, nullptr);
        return crypto::sha256_hex(canonical);
    }

    std::string Fingerprinter::canonical_form(const ApiRequest &request) const
    {
        return canonical_form(request.method, request.endpoint, request.params, request.body, &request.headers);
    }

    std::string Fingerprinter::fingerprint(const ApiRequest &request) const
    {
        return crypto::sha256_hex(canonical_form(request));
    }

} // namespace apimgr
