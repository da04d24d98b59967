#include "apimgr/json_canonicalization.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <format>
#include <string>
#include <vector>

namespace apimgr::json
{
    namespace
    {
        using value_t = nlohmann::json::value_t;

        /**
         * UTF-16 code units of a UTF-8 string; object keys sort by these.
         * Malformed sequences contribute their raw bytes as single units.
         */
        std::u16string utf16_units(const std::string &s)
        {
            std::u16string units;
            units.reserve(s.size());
            std::size_t i = 0;
            while (i < s.size())
            {
                auto c = static_cast<unsigned char>(s[i]);
                std::size_t len = c < 0x80 ? 1 : (c >> 5) == 0x6 ? 2 : (c >> 4) == 0xE ? 3 : (c >> 3) == 0x1E ? 4 : 0;
                bool valid = len > 0 && i + len <= s.size();
                for (std::size_t j = 1; valid && j < len; ++j)
                    valid = (static_cast<unsigned char>(s[i + j]) & 0xC0) == 0x80;
                if (!valid)
                {
                    units.push_back(c);
                    ++i;
                    continue;
                }

                char32_t cp = len == 1 ? c : len == 2 ? (c & 0x1F) : len == 3 ? (c & 0x0F) : (c & 0x07);
                for (std::size_t j = 1; j < len; ++j)
                    cp = (cp << 6) | (static_cast<unsigned char>(s[i + j]) & 0x3F);
                if (cp >= 0x10000)
                {
                    cp -= 0x10000;
                    units.push_back(static_cast<char16_t>(0xD800 + (cp >> 10)));
                    units.push_back(static_cast<char16_t>(0xDC00 + (cp & 0x3FF)));
                }
                else
                {
                    units.push_back(static_cast<char16_t>(cp));
                }
                i += len;
            }
            return units;
        }

        class CanonicalWriter
        {
        public:
            explicit CanonicalWriter(std::string &out) : out_(out) {}

            void write(const nlohmann::json &value)
            {
                switch (value.type())
                {
                case value_t::null:
                case value_t::discarded:
                    out_ += "null";
                    break;
                case value_t::boolean:
                    out_ += value.get<bool>() ? "true" : "false";
                    break;
                case value_t::number_integer:
                    out_ += std::to_string(value.get<int64_t>());
                    break;
                case value_t::number_unsigned:
                    out_ += std::to_string(value.get<uint64_t>());
                    break;
                case value_t::number_float:
                    write_double(value.get<double>());
                    break;
                case value_t::string:
                    write_string(value.get_ref<const std::string &>());
                    break;
                case value_t::binary:
                    write_binary(value.get_binary());
                    break;
                case value_t::array:
                    write_array(value);
                    break;
                case value_t::object:
                    write_object(value);
                    break;
                }
            }

        private:
            // ECMAScript Number::toString over the shortest round-trip digits
            void write_double(double d)
            {
                if (std::isnan(d))
                {
                    write_string("$float:nan");
                    return;
                }
                if (std::isinf(d))
                {
                    write_string(d > 0 ? "$float:inf" : "$float:-inf");
                    return;
                }
                if (d == 0.0)
                {
                    out_ += '0'; // also folds -0
                    return;
                }
                if (d < 0)
                    out_ += '-';

                // std::format("{}") yields the shortest round-trip form, either
                // fixed ("0.30000000000000004") or scientific ("1e-07")
                std::string repr = std::format("{}", std::fabs(d));
                int exponent = 0;
                if (auto e = repr.find('e'); e != std::string::npos)
                {
                    exponent = std::stoi(repr.substr(e + 1));
                    repr.resize(e);
                }
                std::string digits = repr;
                int point = static_cast<int>(repr.size());
                if (auto dot = repr.find('.'); dot != std::string::npos)
                {
                    digits.erase(dot, 1);
                    point = static_cast<int>(dot);
                }
                point += exponent;

                auto lead = digits.find_first_not_of('0');
                digits.erase(0, lead);
                point -= static_cast<int>(lead);
                digits.erase(digits.find_last_not_of('0') + 1);

                const int k = static_cast<int>(digits.size());
                const int n = point;
                if (k <= n && n <= 21)
                {
                    out_ += digits;
                    out_.append(static_cast<std::size_t>(n - k), '0');
                }
                else if (0 < n && n <= 21)
                {
                    out_ += std::format("{}.{}", digits.substr(0, n), digits.substr(n));
                }
                else if (-6 < n && n <= 0)
                {
                    out_ += std::format("0.{}{}", std::string(static_cast<std::size_t>(-n), '0'), digits);
                }
                else
                {
                    out_ += digits.front();
                    if (k > 1)
                        out_ += std::format(".{}", digits.substr(1));
                    out_ += std::format("e{}{}", n - 1 >= 0 ? "+" : "-", std::abs(n - 1));
                }
            }

            void write_string(const std::string &s)
            {
                out_ += '"';
                for (unsigned char c : s)
                {
                    switch (c)
                    {
                    case '"':
                        out_ += "\\\"";
                        break;
                    case '\\':
                        out_ += "\\\\";
                        break;
                    case '\b':
                        out_ += "\\b";
                        break;
                    case '\f':
                        out_ += "\\f";
                        break;
                    case '\n':
                        out_ += "\\n";
                        break;
                    case '\r':
                        out_ += "\\r";
                        break;
                    case '\t':
                        out_ += "\\t";
                        break;
                    default:
                        if (c < 0x20)
                            out_ += std::format("\\u{:04x}", c);
                        else
                            out_ += static_cast<char>(c);
                    }
                }
                out_ += '"';
            }

            void write_binary(const nlohmann::json::binary_t &bin)
            {
                std::string tagged = "$binary:";
                for (auto byte : bin)
                    tagged += std::format("{:02x}", byte);
                write_string(tagged);
            }

            void write_array(const nlohmann::json &arr)
            {
                out_ += '[';
                for (std::size_t i = 0; i < arr.size(); ++i)
                {
                    if (i > 0)
                        out_ += ',';
                    write(arr[i]);
                }
                out_ += ']';
            }

            void write_object(const nlohmann::json &obj)
            {
                struct Member
                {
                    std::u16string order;
                    const std::string *key;
                    const nlohmann::json *value;
                };
                std::vector<Member> members;
                members.reserve(obj.size());
                for (auto it = obj.begin(); it != obj.end(); ++it)
                    members.push_back(Member{utf16_units(it.key()), &it.key(), &it.value()});
                std::sort(members.begin(), members.end(),
                          [](const Member &a, const Member &b) { return a.order < b.order; });

                out_ += '{';
                for (std::size_t i = 0; i < members.size(); ++i)
                {
                    if (i > 0)
                        out_ += ',';
                    write_string(*members[i].key);
                    out_ += ':';
                    write(*members[i].value);
                }
                out_ += '}';
            }

            std::string &out_;
        };
    } // namespace

    std::string canonicalize(const nlohmann::json &value)
    {
        std::string out;
        CanonicalWriter(out).write(value);
        return out;
    }

    Result<std::string> canonicalize_text(const std::string &text)
    {
        try
        {
            return canonicalize(nlohmann::json::parse(text));
        }
        catch (const nlohmann::json::parse_error &e)
        {
            return std::unexpected(ApiError::parsing(std::format("JSON parse error: {}", e.what())));
        }
    }

} // namespace apimgr::json
