// yml_schema.hpp - yml YAML 1.2 grammar engine - Scalar Resolution
// Version 0.3.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef YML_SCHEMA_HPP
#define YML_SCHEMA_HPP

#include "yml_document.hpp"

#include <charconv>
#include <cmath>
#include <limits>

namespace yml
{
//========================================================================
// Resolved scalar
//========================================================================

    struct resolved_scalar
    {
        node_kind    kind  = node_kind::string;
        scalar_value value;
        std::string  tag;
        bool         mismatch = false;   // explicit tag the text does not satisfy
    };

    namespace schema
    {
        inline std::string core_tag(std::string_view name)
        {
            return std::string(detail::CORE_TAG_PREFIX) + std::string(name);
        }

    //------------------------------------------------------------------------
    // Literal recognisers
    //------------------------------------------------------------------------

        inline bool is_core_null(std::string_view s)
        {
            return s.empty() || s == "~" || s == "null" || s == "Null" || s == "NULL";
        }

        inline std::optional<bool> parse_core_bool(std::string_view s)
        {
            if (s == "true" || s == "True" || s == "TRUE")    return true;
            if (s == "false" || s == "False" || s == "FALSE") return false;
            return std::nullopt;
        }

        inline bool all_of_base(std::string_view s, int base)
        {
            if (s.empty())
                return false;
            for (char ch : s)
            {
                char32_t c = static_cast<unsigned char>(ch);
                bool ok = base == 16 ? chars::is_hex_digit(c)
                        : base == 8  ? (c >= U'0' && c <= U'7')
                        : chars::is_dec_digit(c);
                if (!ok)
                    return false;
            }
            return true;
        }

        // Result of integer recognition: either an int64 or, on overflow,
        // the same value as a double.
        struct integer_literal
        {
            bool    overflow = false;
            int64_t value    = 0;
            double  approx   = 0.0;
        };

        inline std::optional<integer_literal> parse_int_digits(std::string_view digits, int base, bool negative)
        {
            if (!all_of_base(digits, base))
                return std::nullopt;

            integer_literal out;
            uint64_t magnitude = 0;
            auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), magnitude, base);

            if (ec == std::errc::result_out_of_range ||
                magnitude > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) + (negative ? 1u : 0u))
            {
                double d = 0.0;
                for (char ch : digits)
                    d = d * base + chars::hex_value(static_cast<unsigned char>(ch));
                out.overflow = true;
                out.approx   = negative ? -d : d;
                return out;
            }
            if (ec != std::errc{} || ptr != digits.data() + digits.size())
                return std::nullopt;

            out.value = negative ? static_cast<int64_t>(0 - magnitude) : static_cast<int64_t>(magnitude);
            return out;
        }

        inline std::optional<integer_literal> parse_core_int(std::string_view s)
        {
            if (s.size() > 2 && s[0] == '0' && s[1] == 'o')
                return parse_int_digits(s.substr(2), 8, false);
            if (s.size() > 2 && s[0] == '0' && s[1] == 'x')
                return parse_int_digits(s.substr(2), 16, false);

            bool negative = false;
            if (!s.empty() && (s[0] == '-' || s[0] == '+'))
            {
                negative = s[0] == '-';
                s.remove_prefix(1);
            }
            return parse_int_digits(s, 10, negative);
        }

        inline std::optional<integer_literal> parse_json_int(std::string_view s)
        {
            bool negative = !s.empty() && s[0] == '-';
            if (negative)
                s.remove_prefix(1);
            if (s.size() > 1 && s[0] == '0')
                return std::nullopt;
            return parse_int_digits(s, 10, negative);
        }

        // [-+]? ( \. [0-9]+ | [0-9]+ ( \. [0-9]* )? ) ( [eE] [-+]? [0-9]+ )?
        inline bool is_core_float_syntax(std::string_view s)
        {
            size_t i = 0;
            if (i < s.size() && (s[i] == '-' || s[i] == '+'))
                ++i;

            size_t int_digits = 0, frac_digits = 0;
            while (i < s.size() && chars::is_dec_digit(static_cast<unsigned char>(s[i]))) { ++i; ++int_digits; }
            if (i < s.size() && s[i] == '.')
            {
                ++i;
                while (i < s.size() && chars::is_dec_digit(static_cast<unsigned char>(s[i]))) { ++i; ++frac_digits; }
            }
            if (int_digits == 0 && frac_digits == 0)
                return false;

            if (i < s.size() && (s[i] == 'e' || s[i] == 'E'))
            {
                ++i;
                if (i < s.size() && (s[i] == '-' || s[i] == '+'))
                    ++i;
                size_t exp_digits = 0;
                while (i < s.size() && chars::is_dec_digit(static_cast<unsigned char>(s[i]))) { ++i; ++exp_digits; }
                if (exp_digits == 0)
                    return false;
            }
            return i == s.size();
        }

        // -? ( 0 | [1-9] [0-9]* ) ( \. [0-9]* )? ( [eE] [-+]? [0-9]+ )?
        inline bool is_json_float_syntax(std::string_view s)
        {
            if (!s.empty() && s[0] == '-')
                s.remove_prefix(1);
            if (s.empty() || !chars::is_dec_digit(static_cast<unsigned char>(s[0])))
                return false;
            if (s.size() > 1 && s[0] == '0' && chars::is_dec_digit(static_cast<unsigned char>(s[1])))
                return false;
            return s[0] != '+' && is_core_float_syntax(s);
        }

        inline std::optional<double> parse_core_float(std::string_view s)
        {
            if (s == ".inf" || s == ".Inf" || s == ".INF" ||
                s == "+.inf" || s == "+.Inf" || s == "+.INF")
                return std::numeric_limits<double>::infinity();
            if (s == "-.inf" || s == "-.Inf" || s == "-.INF")
                return -std::numeric_limits<double>::infinity();
            if (s == ".nan" || s == ".NaN" || s == ".NAN")
                return std::numeric_limits<double>::quiet_NaN();

            if (!is_core_float_syntax(s))
                return std::nullopt;

            if (s[0] == '+')
                s.remove_prefix(1);

            double d = 0.0;
            auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), d);
            if (ec == std::errc::result_out_of_range)
            {
                bool underflow = s.find("e-") != std::string_view::npos || s.find("E-") != std::string_view::npos;
                double mag = underflow ? 0.0 : std::numeric_limits<double>::infinity();
                return s[0] == '-' ? -mag : mag;
            }
            if (ec != std::errc{} || ptr != s.data() + s.size())
                return std::nullopt;
            return d;
        }

        inline void assign_integer(resolved_scalar & r, integer_literal const & lit)
        {
            if (lit.overflow)
            {
                r.kind  = node_kind::decimal;
                r.value = lit.approx;
                r.tag   = core_tag("float");
            }
            else
            {
                r.kind  = node_kind::integer;
                r.value = lit.value;
                r.tag   = core_tag("int");
            }
        }

    //------------------------------------------------------------------------
    // Implicit resolution of untagged plain scalars
    //------------------------------------------------------------------------

        inline resolved_scalar resolve_plain(std::string_view text, schema_kind kind)
        {
            resolved_scalar r;

            if (kind == schema_kind::core)
            {
                if (is_core_null(text))
                {
                    r.kind = node_kind::null;
                    r.tag  = core_tag("null");
                    return r;
                }
                if (auto b = parse_core_bool(text))
                {
                    r.kind  = node_kind::boolean;
                    r.value = *b;
                    r.tag   = core_tag("bool");
                    return r;
                }
                if (auto i = parse_core_int(text))
                {
                    assign_integer(r, *i);
                    return r;
                }
                if (auto d = parse_core_float(text))
                {
                    r.kind  = node_kind::decimal;
                    r.value = *d;
                    r.tag   = core_tag("float");
                    return r;
                }
            }
            else if (kind == schema_kind::json)
            {
                if (text == "null")
                {
                    r.kind = node_kind::null;
                    r.tag  = core_tag("null");
                    return r;
                }
                if (text == "true" || text == "false")
                {
                    r.kind  = node_kind::boolean;
                    r.value = text == "true";
                    r.tag   = core_tag("bool");
                    return r;
                }
                if (auto i = parse_json_int(text))
                {
                    assign_integer(r, *i);
                    return r;
                }
                if (is_json_float_syntax(text))
                {
                    if (auto d = parse_core_float(text))
                    {
                        r.kind  = node_kind::decimal;
                        r.value = *d;
                        r.tag   = core_tag("float");
                        return r;
                    }
                }
            }

            r.kind  = node_kind::string;
            r.value = std::string(text);
            r.tag   = core_tag("str");
            return r;
        }

    //------------------------------------------------------------------------
    // Explicit core tags
    //------------------------------------------------------------------------

        inline resolved_scalar resolve_tagged(std::string_view text, std::string const & tag)
        {
            resolved_scalar r;
            r.tag = tag;

            auto suffix = std::string_view(tag);
            if (suffix.substr(0, detail::CORE_TAG_PREFIX.size()) != detail::CORE_TAG_PREFIX)
            {
                r.kind  = node_kind::string;
                r.value = std::string(text);
                return r;
            }
            suffix.remove_prefix(detail::CORE_TAG_PREFIX.size());

            if (suffix == "null" && is_core_null(text))
            {
                r.kind = node_kind::null;
                return r;
            }
            if (suffix == "bool")
            {
                if (auto b = parse_core_bool(text))
                {
                    r.kind  = node_kind::boolean;
                    r.value = *b;
                    return r;
                }
            }
            else if (suffix == "int")
            {
                if (auto i = parse_core_int(text); i && !i->overflow)
                {
                    r.kind  = node_kind::integer;
                    r.value = i->value;
                    return r;
                }
            }
            else if (suffix == "float")
            {
                if (auto i = parse_core_int(text))
                {
                    r.kind  = node_kind::decimal;
                    r.value = i->overflow ? i->approx : static_cast<double>(i->value);
                    return r;
                }
                if (auto d = parse_core_float(text))
                {
                    r.kind  = node_kind::decimal;
                    r.value = *d;
                    return r;
                }
            }
            else if (suffix != "null")
            {
                // str and unrecognised core names such as !!binary
                r.kind  = node_kind::string;
                r.value = std::string(text);
                return r;
            }

            r.kind     = node_kind::string;
            r.value    = std::string(text);
            r.mismatch = true;
            return r;
        }
    }

//========================================================================
// Entry point
//========================================================================

    // `tag` is the fully resolved tag, or empty when the node carried none.
    // The non-specific tag "!" forces a string.
    inline resolved_scalar resolve_scalar(std::string_view text, node_style style,
                                          std::string const & tag, schema_kind kind)
    {
        if (tag == "!")
        {
            resolved_scalar r;
            r.kind  = node_kind::string;
            r.value = std::string(text);
            r.tag   = tag;
            return r;
        }

        if (!tag.empty())
            return schema::resolve_tagged(text, tag);

        if (style != node_style::plain || kind == schema_kind::failsafe)
        {
            resolved_scalar r;
            r.kind  = node_kind::string;
            r.value = std::string(text);
            r.tag   = schema::core_tag("str");
            return r;
        }

        return schema::resolve_plain(text, kind);
    }

} // namespace yml

#endif // YML_SCHEMA_HPP
