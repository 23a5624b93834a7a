// yml_chars.hpp - yml YAML 1.2 grammar engine - Character Classifier
// Version 0.3.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef YML_CHARS_HPP
#define YML_CHARS_HPP

#include "yml_core.hpp"

namespace yml
{
    // Sentinel returned when peeking past the end of the input.
    inline constexpr char32_t end_of_input = 0x110000;

//========================================================================
// Character classes
//========================================================================

    namespace chars
    {
        inline constexpr bool is_break(char32_t c) noexcept
        {
            return c == U'\n' || c == U'\r' || c == 0x85;
        }

        inline constexpr bool is_white(char32_t c) noexcept
        {
            return c == U' ' || c == U'\t';
        }

        inline constexpr bool is_blank_or_end(char32_t c) noexcept
        {
            return is_white(c) || is_break(c) || c == end_of_input;
        }

        inline constexpr bool is_bom(char32_t c) noexcept
        {
            return c == 0xFEFF;
        }

        inline constexpr bool is_printable(char32_t c) noexcept
        {
            return c == 0x09 || c == 0x0A || c == 0x0D
                || (c >= 0x20 && c <= 0x7E)
                || c == 0x85
                || (c >= 0xA0 && c <= 0xD7FF)
                || (c >= 0xE000 && c <= 0xFFFD)
                || (c >= 0x10000 && c <= 0x10FFFF);
        }

        inline constexpr bool is_json(char32_t c) noexcept
        {
            return c == 0x09 || (c >= 0x20 && c <= 0x10FFFF);
        }

        inline constexpr bool is_nb_char(char32_t c) noexcept
        {
            return is_printable(c) && !is_break(c) && !is_bom(c);
        }

        inline constexpr bool is_ns_char(char32_t c) noexcept
        {
            return is_nb_char(c) && !is_white(c);
        }

        inline constexpr bool is_flow_indicator(char32_t c) noexcept
        {
            return c == U',' || c == U'[' || c == U']' || c == U'{' || c == U'}';
        }

        inline constexpr bool is_indicator(char32_t c) noexcept
        {
            switch (c)
            {
                case U'-': case U'?': case U':': case U',':
                case U'[': case U']': case U'{': case U'}':
                case U'#': case U'&': case U'*': case U'!':
                case U'|': case U'>': case U'\'': case U'"':
                case U'%': case U'@': case U'`':
                    return true;
                default:
                    return false;
            }
        }

        inline constexpr bool is_dec_digit(char32_t c) noexcept
        {
            return c >= U'0' && c <= U'9';
        }

        inline constexpr bool is_hex_digit(char32_t c) noexcept
        {
            return is_dec_digit(c) || (c >= U'a' && c <= U'f') || (c >= U'A' && c <= U'F');
        }

        inline constexpr bool is_ascii_letter(char32_t c) noexcept
        {
            return (c >= U'a' && c <= U'z') || (c >= U'A' && c <= U'Z');
        }

        inline constexpr bool is_word_char(char32_t c) noexcept
        {
            return is_dec_digit(c) || is_ascii_letter(c) || c == U'-';
        }

        inline constexpr bool is_uri_char(char32_t c) noexcept
        {
            if (is_word_char(c))
                return true;

            switch (c)
            {
                case U'%': case U'#': case U';': case U'/': case U'?':
                case U':': case U'@': case U'&': case U'=': case U'+':
                case U'$': case U',': case U'_': case U'.': case U'!':
                case U'~': case U'*': case U'\'': case U'(': case U')':
                case U'[': case U']':
                    return true;
                default:
                    return false;
            }
        }

        inline constexpr bool is_tag_char(char32_t c) noexcept
        {
            return is_uri_char(c) && c != U'!' && !is_flow_indicator(c);
        }

        inline constexpr bool is_anchor_char(char32_t c) noexcept
        {
            return is_ns_char(c) && !is_flow_indicator(c);
        }

        inline constexpr int hex_value(char32_t c) noexcept
        {
            if (is_dec_digit(c)) return static_cast<int>(c - U'0');
            if (c >= U'a' && c <= U'f') return static_cast<int>(c - U'a' + 10);
            if (c >= U'A' && c <= U'F') return static_cast<int>(c - U'A' + 10);
            return -1;
        }

//========================================================================
// Escape sequences
//========================================================================

        struct escape_sequence
        {
            char32_t value;
            size_t   length;   // characters consumed after the backslash
        };

        // Decodes the escape starting right after a backslash. Escaped line
        // breaks are not code points and are left to the caller.
        inline std::optional<escape_sequence> decode_escape(std::u32string_view seq)
        {
            if (seq.empty())
                return std::nullopt;

            switch (seq[0])
            {
                case U'0':  return escape_sequence{ 0x00, 1 };
                case U'a':  return escape_sequence{ 0x07, 1 };
                case U'b':  return escape_sequence{ 0x08, 1 };
                case U't':
                case U'\t': return escape_sequence{ 0x09, 1 };
                case U'n':  return escape_sequence{ 0x0A, 1 };
                case U'v':  return escape_sequence{ 0x0B, 1 };
                case U'f':  return escape_sequence{ 0x0C, 1 };
                case U'r':  return escape_sequence{ 0x0D, 1 };
                case U'e':  return escape_sequence{ 0x1B, 1 };
                case U' ':  return escape_sequence{ 0x20, 1 };
                case U'"':  return escape_sequence{ 0x22, 1 };
                case U'/':  return escape_sequence{ 0x2F, 1 };
                case U'\\': return escape_sequence{ 0x5C, 1 };
                case U'N':  return escape_sequence{ 0x85, 1 };
                case U'_':  return escape_sequence{ 0xA0, 1 };
                case U'L':  return escape_sequence{ 0x2028, 1 };
                case U'P':  return escape_sequence{ 0x2029, 1 };
                default:    break;
            }

            size_t digits = 0;
            switch (seq[0])
            {
                case U'x': digits = 2; break;
                case U'u': digits = 4; break;
                case U'U': digits = 8; break;
                default:   return std::nullopt;
            }

            if (seq.size() < digits + 1)
                return std::nullopt;

            char32_t value = 0;
            for (size_t i = 1; i <= digits; ++i)
            {
                int h = hex_value(seq[i]);
                if (h < 0)
                    return std::nullopt;
                value = (value << 4) | static_cast<char32_t>(h);
            }

            if ((value >= 0xD800 && value <= 0xDFFF) || value > 0x10FFFF)
                return std::nullopt;

            return escape_sequence{ value, digits + 1 };
        }

//========================================================================
// UTF-8 output
//========================================================================

        inline size_t utf8_length(char32_t c) noexcept
        {
            if (c < 0x80)    return 1;
            if (c < 0x800)   return 2;
            if (c < 0x10000) return 3;
            return 4;
        }

        inline void append_utf8(std::string & out, char32_t c)
        {
            if (c < 0x80)
            {
                out += static_cast<char>(c);
            }
            else if (c < 0x800)
            {
                out += static_cast<char>(0xC0 | (c >> 6));
                out += static_cast<char>(0x80 | (c & 0x3F));
            }
            else if (c < 0x10000)
            {
                out += static_cast<char>(0xE0 | (c >> 12));
                out += static_cast<char>(0x80 | ((c >> 6) & 0x3F));
                out += static_cast<char>(0x80 | (c & 0x3F));
            }
            else
            {
                out += static_cast<char>(0xF0 | (c >> 18));
                out += static_cast<char>(0x80 | ((c >> 12) & 0x3F));
                out += static_cast<char>(0x80 | ((c >> 6) & 0x3F));
                out += static_cast<char>(0x80 | (c & 0x3F));
            }
        }

        inline std::string to_utf8(std::u32string_view text)
        {
            std::string out;
            out.reserve(text.size());
            for (char32_t c : text)
                append_utf8(out, c);
            return out;
        }
    }

//========================================================================
// Stream encoding
//========================================================================

    enum class encoding
    {
        utf8,
        utf16_le,
        utf16_be,
        utf32_le,
        utf32_be
    };

    struct encoding_detection
    {
        encoding enc;
        size_t   bom_length;
    };

    struct decoded_stream
    {
        std::u32string       text;
        encoding             enc = encoding::utf8;
        std::optional<size_t> bad_offset;   // byte offset of the first undecodable unit

        bool ok() const { return !bad_offset.has_value(); }
    };

    // BOM first, then the null-byte pattern of the first characters.
    inline encoding_detection detect_encoding(std::string_view bytes) noexcept
    {
        auto b = [&](size_t i) -> unsigned
        {
            return i < bytes.size() ? static_cast<unsigned char>(bytes[i]) : 0x100u;
        };

        if (b(0) == 0x00 && b(1) == 0x00 && b(2) == 0xFE && b(3) == 0xFF) return { encoding::utf32_be, 4 };
        if (b(0) == 0xFF && b(1) == 0xFE && b(2) == 0x00 && b(3) == 0x00) return { encoding::utf32_le, 4 };
        if (b(0) == 0xFE && b(1) == 0xFF)                                 return { encoding::utf16_be, 2 };
        if (b(0) == 0xFF && b(1) == 0xFE)                                 return { encoding::utf16_le, 2 };
        if (b(0) == 0xEF && b(1) == 0xBB && b(2) == 0xBF)                 return { encoding::utf8, 3 };

        if (bytes.size() >= 4 && b(0) == 0x00 && b(1) == 0x00 && b(2) == 0x00 && b(3) != 0x00) return { encoding::utf32_be, 0 };
        if (bytes.size() >= 4 && b(0) != 0x00 && b(1) == 0x00 && b(2) == 0x00 && b(3) == 0x00) return { encoding::utf32_le, 0 };
        if (bytes.size() >= 2 && b(0) == 0x00 && b(1) != 0x00)                                 return { encoding::utf16_be, 0 };
        if (bytes.size() >= 2 && b(0) != 0x00 && b(1) == 0x00)                                 return { encoding::utf16_le, 0 };

        return { encoding::utf8, 0 };
    }

    namespace detail
    {
        inline void decode_utf8(std::string_view bytes, size_t base, decoded_stream & out)
        {
            size_t i = 0;
            while (i < bytes.size())
            {
                unsigned char lead = static_cast<unsigned char>(bytes[i]);
                char32_t cp   = 0;
                size_t   need = 0;
                char32_t min  = 0;

                if (lead < 0x80)                { cp = lead;        need = 0; min = 0; }
                else if ((lead & 0xE0) == 0xC0) { cp = lead & 0x1F; need = 1; min = 0x80; }
                else if ((lead & 0xF0) == 0xE0) { cp = lead & 0x0F; need = 2; min = 0x800; }
                else if ((lead & 0xF8) == 0xF0) { cp = lead & 0x07; need = 3; min = 0x10000; }
                else
                {
                    out.bad_offset = base + i;
                    return;
                }

                for (size_t k = 1; k <= need; ++k)
                {
                    if (i + k >= bytes.size())
                    {
                        out.bad_offset = base + i;
                        return;
                    }
                    unsigned char cont = static_cast<unsigned char>(bytes[i + k]);
                    if ((cont & 0xC0) != 0x80)
                    {
                        out.bad_offset = base + i;
                        return;
                    }
                    cp = (cp << 6) | (cont & 0x3F);
                }

                if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
                {
                    out.bad_offset = base + i;
                    return;
                }

                out.text += cp;
                i += need + 1;
            }
        }

        inline void decode_utf16(std::string_view bytes, size_t base, bool little, decoded_stream & out)
        {
            auto unit = [&](size_t i) -> char32_t
            {
                auto lo = static_cast<unsigned char>(bytes[i + (little ? 0 : 1)]);
                auto hi = static_cast<unsigned char>(bytes[i + (little ? 1 : 0)]);
                return static_cast<char32_t>((hi << 8) | lo);
            };

            if (bytes.size() % 2 != 0)
            {
                out.bad_offset = base + bytes.size() - 1;
                return;
            }

            size_t i = 0;
            while (i < bytes.size())
            {
                char32_t u = unit(i);
                if (u >= 0xD800 && u <= 0xDBFF)
                {
                    if (i + 2 >= bytes.size())
                    {
                        out.bad_offset = base + i;
                        return;
                    }
                    char32_t low = unit(i + 2);
                    if (low < 0xDC00 || low > 0xDFFF)
                    {
                        out.bad_offset = base + i;
                        return;
                    }
                    out.text += 0x10000 + ((u - 0xD800) << 10) + (low - 0xDC00);
                    i += 4;
                }
                else if (u >= 0xDC00 && u <= 0xDFFF)
                {
                    out.bad_offset = base + i;
                    return;
                }
                else
                {
                    out.text += u;
                    i += 2;
                }
            }
        }

        inline void decode_utf32(std::string_view bytes, size_t base, bool little, decoded_stream & out)
        {
            if (bytes.size() % 4 != 0)
            {
                out.bad_offset = base + bytes.size() - bytes.size() % 4;
                return;
            }

            for (size_t i = 0; i < bytes.size(); i += 4)
            {
                char32_t cp = 0;
                for (size_t k = 0; k < 4; ++k)
                {
                    size_t idx = little ? i + 3 - k : i + k;
                    cp = (cp << 8) | static_cast<unsigned char>(bytes[idx]);
                }
                if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
                {
                    out.bad_offset = base + i;
                    return;
                }
                out.text += cp;
            }
        }
    }

    // Converts raw bytes to code points; the BOM, if any, is dropped.
    inline decoded_stream decode_stream(std::string_view bytes)
    {
        decoded_stream out;
        auto det = detect_encoding(bytes);
        out.enc = det.enc;

        auto body = bytes.substr(det.bom_length);
        switch (det.enc)
        {
            case encoding::utf8:     detail::decode_utf8(body, det.bom_length, out); break;
            case encoding::utf16_le: detail::decode_utf16(body, det.bom_length, true, out); break;
            case encoding::utf16_be: detail::decode_utf16(body, det.bom_length, false, out); break;
            case encoding::utf32_le: detail::decode_utf32(body, det.bom_length, true, out); break;
            case encoding::utf32_be: detail::decode_utf32(body, det.bom_length, false, out); break;
        }

        return out;
    }

} // namespace yml

#endif // YML_CHARS_HPP
