#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace restjson::json
{

    struct QuoteOptions
    {
        bool escape_html{true}; // '<', '>' and '&' as \u003c, \u003e, \u0026
    };

    /**
     * Validity checks and string encoding for raw JSON text.
     *
     * quote() follows the escaping rules of common HTTP JSON encoders:
     * - '"' and '\\' are backslash escaped
     * - \b \f \n \r \t use their short forms, other control characters \u00XX
     * - U+2028 and U+2029 are always escaped
     * - ill-formed UTF-8 is replaced by \ufffd
     *
     * The result of quote() is therefore valid JSON for every input.
     */
    class JsonText
    {
    public:
        /**
         * Check that text holds exactly one well-formed JSON value
         * @param text Raw bytes, surrounding whitespace allowed
         * @return false for empty input or a leading UTF-8 byte order mark
         */
        static bool is_valid(std::string_view text);

        /**
         * Encode text as a JSON string literal, including the surrounding quotes
         */
        static std::string quote(std::string_view text, const QuoteOptions &options = QuoteOptions{});

        /**
         * Compact serialization of a JSON value
         * @return SerializationError on NaN/Infinity or ill-formed UTF-8 in strings
         */
        static Result<std::string> encode(const nlohmann::json &value);

    private:
        /**
         * Length of the well-formed UTF-8 sequence starting at pos, 0 if ill-formed
         */
        static std::size_t utf8_sequence_length(std::string_view text, std::size_t pos);

        /**
         * Append the \u00XX form of a single byte
         */
        static void append_unicode_escape(unsigned char ch, std::string &output);

        static bool all_numbers_finite(const nlohmann::json &value);
    };

} // namespace restjson::json
