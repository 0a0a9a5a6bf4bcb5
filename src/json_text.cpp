#include "restjson/json_text.hpp"
#include <cmath>

namespace restjson::json
{

    namespace
    {
        constexpr char hex_digits[] = "0123456789abcdef";
        constexpr std::string_view utf8_bom = "\xEF\xBB\xBF";

        bool is_continuation(unsigned char ch)
        {
            return ch >= 0x80 && ch <= 0xBF;
        }
    } // namespace

    bool JsonText::is_valid(std::string_view text)
    {
        // the parser skips a byte order mark, which JSON text must not carry
        if (text.starts_with(utf8_bom))
            return false;
        return nlohmann::json::accept(text.begin(), text.end());
    }

    std::string JsonText::quote(std::string_view text, const QuoteOptions &options)
    {
        std::string output;
        output.reserve(text.size() + 2);
        output += '"';

        std::size_t i = 0;
        while (i < text.size())
        {
            auto ch = static_cast<unsigned char>(text[i]);

            if (ch < 0x80)
            {
                switch (ch)
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
                case '<':
                case '>':
                case '&':
                    if (options.escape_html)
                        append_unicode_escape(ch, output);
                    else
                        output += static_cast<char>(ch);
                    break;
                default:
                    if (ch < 0x20)
                        append_unicode_escape(ch, output);
                    else
                        output += static_cast<char>(ch);
                    break;
                }
                ++i;
                continue;
            }

            auto len = utf8_sequence_length(text, i);
            if (len == 0)
            {
                output += "\\ufffd";
                ++i;
                continue;
            }

            // U+2028 LINE SEPARATOR and U+2029 PARAGRAPH SEPARATOR (E2 80 A8/A9)
            if (len == 3 && ch == 0xE2 && static_cast<unsigned char>(text[i + 1]) == 0x80)
            {
                auto last = static_cast<unsigned char>(text[i + 2]);
                if (last == 0xA8 || last == 0xA9)
                {
                    output += last == 0xA8 ? "\\u2028" : "\\u2029";
                    i += len;
                    continue;
                }
            }

            output.append(text.substr(i, len));
            i += len;
        }

        output += '"';
        return output;
    }

    Result<std::string> JsonText::encode(const nlohmann::json &value)
    {
        if (!all_numbers_finite(value))
        {
            return std::unexpected(RestError::serialization("unsupported value: NaN or Infinity"));
        }
        try
        {
            return value.dump();
        }
        catch (const nlohmann::json::type_error &e)
        {
            return std::unexpected(RestError::serialization(std::string("JSON encode error: ") + e.what()));
        }
    }

    std::size_t JsonText::utf8_sequence_length(std::string_view text, std::size_t pos)
    {
        auto lead = static_cast<unsigned char>(text[pos]);
        std::size_t len = 0;
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;

        if (lead >= 0xC2 && lead <= 0xDF)
        {
            len = 2;
        }
        else if (lead >= 0xE0 && lead <= 0xEF)
        {
            len = 3;
            if (lead == 0xE0)
                lo = 0xA0; // overlong
            else if (lead == 0xED)
                hi = 0x9F; // surrogates
        }
        else if (lead >= 0xF0 && lead <= 0xF4)
        {
            len = 4;
            if (lead == 0xF0)
                lo = 0x90; // overlong
            else if (lead == 0xF4)
                hi = 0x8F; // above U+10FFFF
        }
        else
        {
            return 0;
        }

        if (pos + len > text.size())
            return 0;

        auto second = static_cast<unsigned char>(text[pos + 1]);
        if (second < lo || second > hi)
            return 0;

        for (std::size_t k = 2; k < len; ++k)
        {
            if (!is_continuation(static_cast<unsigned char>(text[pos + k])))
                return 0;
        }
        return len;
    }

    void JsonText::append_unicode_escape(unsigned char ch, std::string &output)
    {
        output += "\\u00";
        output += hex_digits[ch >> 4];
        output += hex_digits[ch & 0x0F];
    }

    bool JsonText::all_numbers_finite(const nlohmann::json &value)
    {
        switch (value.type())
        {
        case nlohmann::json::value_t::number_float:
            return std::isfinite(value.get<double>());

        case nlohmann::json::value_t::array:
        case nlohmann::json::value_t::object:
            for (const auto &item : value)
            {
                if (!all_numbers_finite(item))
                    return false;
            }
            return true;

        default:
            return true;
        }
    }

} // namespace restjson::json
