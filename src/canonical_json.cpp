#include "chainlog/canonical_json.hpp"
#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <format>
#include <utility>
#include <vector>

namespace chainlog::json
{

    namespace
    {
        void append_unicode_escape(uint32_t unit, std::string &output)
        {
            output += std::format("\\u{:04x}", unit);
        }

        // Decode one UTF-8 sequence starting at str[pos]; advances pos.
        // Rejects overlong forms, surrogate code points and values above U+10FFFF.
        Result<uint32_t> decode_utf8(const std::string &str, std::size_t &pos)
        {
            auto lead = static_cast<unsigned char>(str[pos]);
            std::size_t extra = 0;
            uint32_t cp = 0;
            uint32_t min_cp = 0;

            if (lead < 0x80)
            {
                ++pos;
                return lead;
            }
            else if ((lead & 0xE0) == 0xC0)
            {
                extra = 1;
                cp = lead & 0x1F;
                min_cp = 0x80;
            }
            else if ((lead & 0xF0) == 0xE0)
            {
                extra = 2;
                cp = lead & 0x0F;
                min_cp = 0x800;
            }
            else if ((lead & 0xF8) == 0xF0)
            {
                extra = 3;
                cp = lead & 0x07;
                min_cp = 0x10000;
            }
            else
            {
                return std::unexpected(ChainlogError::encoding(
                    std::format("Invalid UTF-8 lead byte at offset {}", pos)));
            }

            if (pos + extra >= str.size())
            {
                return std::unexpected(ChainlogError::encoding(
                    std::format("Truncated UTF-8 sequence at offset {}", pos)));
            }

            for (std::size_t i = 1; i <= extra; ++i)
            {
                auto cont = static_cast<unsigned char>(str[pos + i]);
                if ((cont & 0xC0) != 0x80)
                {
                    return std::unexpected(ChainlogError::encoding(
                        std::format("Invalid UTF-8 continuation byte at offset {}", pos + i)));
                }
                cp = (cp << 6) | (cont & 0x3F);
            }

            if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
            {
                return std::unexpected(ChainlogError::encoding(
                    std::format("Invalid UTF-8 code point at offset {}", pos)));
            }

            pos += extra + 1;
            return cp;
        }

        std::string format_float(double value)
        {
            // Shortest round-trip digits, e.g. "-1.2345e+17"
            char buf[64];
            auto res = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::scientific);
            std::string sci(buf, res.ptr);

            std::string sign;
            std::size_t i = 0;
            if (sci[0] == '-')
            {
                sign = "-";
                i = 1;
            }

            auto e_pos = sci.find('e');
            std::string digits;
            for (std::size_t k = i; k < e_pos; ++k)
            {
                if (sci[k] != '.')
                    digits += sci[k];
            }
            int exponent = std::atoi(sci.c_str() + e_pos + 1);

            if (exponent >= -4 && exponent < 16)
            {
                std::string out = sign;
                if (exponent >= 0)
                {
                    auto int_len = static_cast<std::size_t>(exponent) + 1;
                    if (digits.size() <= int_len)
                    {
                        out += digits;
                        out.append(int_len - digits.size(), '0');
                        out += ".0";
                    }
                    else
                    {
                        out += digits.substr(0, int_len);
                        out += '.';
                        out += digits.substr(int_len);
                    }
                }
                else
                {
                    out += "0.";
                    out.append(static_cast<std::size_t>(-exponent - 1), '0');
                    out += digits;
                }
                return out;
            }

            std::string out = sign;
            out += digits[0];
            if (digits.size() > 1)
            {
                out += '.';
                out += digits.substr(1);
            }
            out += exponent < 0 ? "e-" : "e+";
            out += std::format("{:02d}", std::abs(exponent));
            return out;
        }
    } // namespace

    Result<std::string> CanonicalEncoder::encode(const nlohmann::json &value)
    {
        std::string output;
        if (auto res = serialize_value(value, output, 0); !res)
            return std::unexpected(res.error());
        return output;
    }

    Result<std::string> CanonicalEncoder::encode_text(const std::string &json_text)
    {
        try
        {
            auto parsed = nlohmann::json::parse(json_text);
            return encode(parsed);
        }
        catch (const nlohmann::json::exception &e)
        {
            return std::unexpected(ChainlogError::parsing(
                std::format("JSON parse error: {}", e.what())));
        }
    }

    Result<void> CanonicalEncoder::serialize_value(const nlohmann::json &value, std::string &output, std::size_t depth)
    {
        switch (value.type())
        {
        case nlohmann::json::value_t::null:
            output += "null";
            return {};

        case nlohmann::json::value_t::boolean:
            output += value.get<bool>() ? "true" : "false";
            return {};

        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned:
        case nlohmann::json::value_t::number_float:
            return serialize_number(value, output);

        case nlohmann::json::value_t::string:
            return serialize_string(value.get_ref<const std::string &>(), output);

        case nlohmann::json::value_t::array:
            return serialize_array(value, output, depth + 1);

        case nlohmann::json::value_t::object:
            return serialize_object(value, output, depth + 1);

        case nlohmann::json::value_t::binary:
            return std::unexpected(ChainlogError::encoding("Binary values have no canonical encoding"));

        case nlohmann::json::value_t::discarded:
            return std::unexpected(ChainlogError::encoding("Discarded value cannot be encoded"));
        }
        return std::unexpected(ChainlogError::encoding("Unsupported JSON value type"));
    }

    Result<void> CanonicalEncoder::serialize_string(const std::string &str, std::string &output)
    {
        output += '"';

        std::size_t pos = 0;
        while (pos < str.size())
        {
            auto cp = decode_utf8(str, pos);
            if (!cp)
                return std::unexpected(cp.error());

            switch (*cp)
            {
            case '"':
                output += "\\\"";
                break;
            case '\\':
                output += "\\\\";
                break;
            case '\b':
                output += "\\b";
                break;
            case '\f':
                output += "\\f";
                break;
            case '\n':
                output += "\\n";
                break;
            case '\r':
                output += "\\r";
                break;
            case '\t':
                output += "\\t";
                break;
            default:
                if (*cp >= 0x20 && *cp <= 0x7E)
                {
                    output += static_cast<char>(*cp);
                }
                else if (*cp > 0xFFFF)
                {
                    uint32_t v = *cp - 0x10000;
                    append_unicode_escape(0xD800 | (v >> 10), output);
                    append_unicode_escape(0xDC00 | (v & 0x3FF), output);
                }
                else
                {
                    append_unicode_escape(*cp, output);
                }
                break;
            }
        }

        output += '"';
        return {};
    }

    Result<void> CanonicalEncoder::serialize_number(const nlohmann::json &num, std::string &output)
    {
        if (num.is_number_unsigned())
        {
            output += std::to_string(num.get<uint64_t>());
        }
        else if (num.is_number_integer())
        {
            output += std::to_string(num.get<int64_t>());
        }
        else
        {
            double value = num.get<double>();
            if (std::isnan(value) || std::isinf(value))
            {
                return std::unexpected(ChainlogError::encoding("Non-finite numbers have no canonical encoding"));
            }
            output += format_float(value);
        }
        return {};
    }

    Result<void> CanonicalEncoder::serialize_object(const nlohmann::json &obj, std::string &output, std::size_t depth)
    {
        if (depth > kMaxDepth)
        {
            return std::unexpected(ChainlogError::encoding(
                std::format("Nesting exceeds maximum depth of {}", kMaxDepth)));
        }

        // Sort keys by UTF-8 byte order, which equals code point order
        std::vector<std::pair<const std::string *, const nlohmann::json *>> members;
        members.reserve(obj.size());
        for (auto it = obj.begin(); it != obj.end(); ++it)
        {
            members.emplace_back(&it.key(), &it.value());
        }
        std::sort(members.begin(), members.end(), [](const auto &a, const auto &b) {
            return *a.first < *b.first;
        });

        output += '{';
        bool first = true;
        for (const auto &[key, value] : members)
        {
            if (!first)
            {
                output += ',';
            }
            first = false;

            if (auto res = serialize_string(*key, output); !res)
                return res;
            output += ':';
            if (auto res = serialize_value(*value, output, depth); !res)
                return res;
        }
        output += '}';
        return {};
    }

    Result<void> CanonicalEncoder::serialize_array(const nlohmann::json &arr, std::string &output, std::size_t depth)
    {
        if (depth > kMaxDepth)
        {
            return std::unexpected(ChainlogError::encoding(
                std::format("Nesting exceeds maximum depth of {}", kMaxDepth)));
        }

        output += '[';
        bool first = true;
        for (const auto &item : arr)
        {
            if (!first)
            {
                output += ',';
            }
            first = false;
            if (auto res = serialize_value(item, output, depth); !res)
                return res;
        }
        output += ']';
        return {};
    }

} // namespace chainlog::json
