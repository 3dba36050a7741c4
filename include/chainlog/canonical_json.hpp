#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <string>

namespace chainlog::json
{

    /**
     * Deterministic JSON encoding used as hash input for audit records.
     *
     * Two structurally equal values always encode to the same bytes, whatever
     * order their object members were inserted in. The output is byte-identical
     * to the encoding used by existing chains (sorted keys, compact separators,
     * ASCII-only strings), so records written elsewhere verify here.
     *
     * Rules:
     * - Object keys sorted by code point at every level
     * - No insignificant whitespace, "," and ":" as separators
     * - Non-ASCII and control characters escaped as \uXXXX (UTF-16 pairs above U+FFFF)
     * - Integers in plain decimal, floats in shortest round-trip form
     *
     * Values that have no deterministic encoding (NaN, infinities, binary
     * values, invalid UTF-8, nesting deeper than kMaxDepth) are rejected with
     * ErrorCode::EncodingError rather than coerced.
     */
    class CanonicalEncoder
    {
    public:
        /** Deepest container nesting accepted */
        static constexpr std::size_t kMaxDepth = 512;

        /**
         * Encode a JSON value canonically
         * @param value JSON value to encode
         * @return Canonical JSON string or EncodingError
         */
        static Result<std::string> encode(const nlohmann::json &value);

        /**
         * Parse JSON text and encode it canonically
         * @param json_text Input JSON document
         * @return Canonical JSON string, ParsingError or EncodingError
         */
        static Result<std::string> encode_text(const std::string &json_text);

    private:
        static Result<void> serialize_value(const nlohmann::json &value, std::string &output, std::size_t depth);

        static Result<void> serialize_string(const std::string &str, std::string &output);

        /**
         * Floats follow the shortest round-trip digits; positional notation for
         * decimal exponents in [-4, 16), otherwise d.ddde+XX
         */
        static Result<void> serialize_number(const nlohmann::json &num, std::string &output);

        static Result<void> serialize_object(const nlohmann::json &obj, std::string &output, std::size_t depth);

        static Result<void> serialize_array(const nlohmann::json &arr, std::string &output, std::size_t depth);
    };

} // namespace chainlog::json
