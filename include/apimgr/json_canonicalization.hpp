#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace apimgr::json
{

    /**
     * RFC 8785 (JCS) serialization of a JSON value: keys sorted by UTF-16
     * code units, no whitespace, minimal escaping, doubles in the shortest
     * ECMAScript form that round-trips. Used to derive request fingerprints.
     *
     * Values with no JSON form do not fail. NaN and +/-Inf are written as
     * the strings "$float:nan", "$float:inf" and "$float:-inf", binary
     * values as "$binary:<hex>".
     */
    std::string canonicalize(const nlohmann::json &value);

    /** Parse `text` as JSON and canonicalize it; ParsingError if it is not JSON. */
    Result<std::string> canonicalize_text(const std::string &text);

} // namespace apimgr::json
