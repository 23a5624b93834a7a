// yml_stream.hpp - yml YAML 1.2 grammar engine - Document Stream
// Version 0.3.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef YML_STREAM_HPP
#define YML_STREAM_HPP

#include "yml_structure.hpp"

namespace yml
{
//========================================================================
// Directives
//========================================================================

    namespace stream
    {
        namespace detail
        {
            inline std::string read_token(cursor & cur)
            {
                std::string out;
                while (chars::is_ns_char(cur.peek()))
                {
                    chars::append_utf8(out, cur.peek());
                    cur.advance();
                }
                return out;
            }

            inline void require_parameter_separator(cursor & cur, source_location loc, std::string_view name)
            {
                bool white = false;
                while (chars::is_white(cur.peek()))
                {
                    cur.advance();
                    white = true;
                }
                if (!white || chars::is_break(cur.peek()) || cur.at_end() || cur.peek() == U'#')
                    cur.fail_at(loc, scan_error_kind::malformed_directive,
                                "missing parameter for %" + std::string(name) + " directive");
            }

            // Trailing white space and comment, then the line break.
            inline void end_directive_line(cursor & cur, source_location loc)
            {
                bool white = false;
                while (chars::is_white(cur.peek()))
                {
                    cur.advance();
                    white = true;
                }
                if (cur.peek() == U'#' && white)
                    structure::comment_skip(cur);

                if (!cur.at_end() && !cur.consume_break())
                    cur.fail_at(loc, scan_error_kind::malformed_directive, "unexpected characters after directive");
            }

            inline std::optional<int> read_number(cursor & cur)
            {
                int value = 0;
                int digits = 0;
                while (chars::is_dec_digit(cur.peek()))
                {
                    if (++digits > 9)
                        return std::nullopt;
                    value = value * 10 + static_cast<int>(cur.peek() - U'0');
                    cur.advance();
                }
                if (digits == 0)
                    return std::nullopt;
                return value;
            }

            inline bool valid_tag_handle(std::string_view handle)
            {
                if (handle == "!" || handle == "!!")
                    return true;
                if (handle.size() < 3 || handle.front() != '!' || handle.back() != '!')
                    return false;

                for (char ch : handle.substr(1, handle.size() - 2))
                {
                    if (!chars::is_word_char(static_cast<unsigned char>(ch)))
                        return false;
                }
                return true;
            }
        }

    //------------------------------------------------------------------------

        inline version_directive parse_version(scan_state & st, source_location loc)
        {
            auto & cur = st.cur;
            detail::require_parameter_separator(cur, loc, "YAML");

            auto major = detail::read_number(cur);
            if (!major || cur.peek() != U'.')
                cur.fail_at(loc, scan_error_kind::malformed_directive, "expected version number as major.minor");
            cur.advance();

            auto minor = detail::read_number(cur);
            if (!minor)
                cur.fail_at(loc, scan_error_kind::malformed_directive, "expected version number as major.minor");

            detail::end_directive_line(cur, loc);

            if (st.version_declared)
                cur.fail_at(loc, scan_error_kind::malformed_directive, "duplicate %YAML directive");
            st.version_declared = true;

            version_directive v{ *major, *minor };
            bool supported = v.major == 1 && (v.minor == 1 || v.minor == 2);
            if (supported)
            {
                st.version = v;
            }
            else
            {
                st.warn(scan_error_kind::unsupported_version, loc,
                        "unsupported YAML version " + std::to_string(v.major) + "." +
                        std::to_string(v.minor) + ", parsing as 1.2");
                st.version = version_directive{};
            }
            return v;
        }

    //------------------------------------------------------------------------

        inline tag_directive parse_tag_directive(scan_state & st, source_location loc)
        {
            auto & cur = st.cur;
            detail::require_parameter_separator(cur, loc, "TAG");

            std::string handle = detail::read_token(cur);
            if (!detail::valid_tag_handle(handle))
                cur.fail_at(loc, scan_error_kind::malformed_directive, "invalid tag handle '" + handle + "'");

            detail::require_parameter_separator(cur, loc, "TAG");

            char32_t first = cur.peek();
            if (!(first == U'!' || (chars::is_tag_char(first))))
                cur.fail_at(loc, scan_error_kind::malformed_directive, "invalid tag prefix");

            std::string prefix;
            chars::append_utf8(prefix, first);
            cur.advance();
            while (chars::is_uri_char(cur.peek()))
            {
                chars::append_utf8(prefix, cur.peek());
                cur.advance();
            }

            detail::end_directive_line(cur, loc);

            if (!st.tags.declare(handle, prefix))
                st.warn(scan_error_kind::duplicate_tag_handle, loc,
                        "tag handle " + handle + " declared twice; the last declaration wins");

            return { handle, prefix };
        }

    //------------------------------------------------------------------------

        // At a '%' in column 0. Reserved directives are skipped with a
        // warning and yield nothing.
        inline std::optional<directive> parse_directive(scan_state & st)
        {
            auto & cur = st.cur;
            auto loc = cur.location();
            cur.advance();   // '%'

            std::string name = detail::read_token(cur);
            if (name.empty())
                cur.fail_at(loc, scan_error_kind::malformed_directive, "directive name expected after '%'");

            if (name == "YAML")
                return parse_version(st, loc);
            if (name == "TAG")
                return parse_tag_directive(st, loc);

            st.warn(scan_error_kind::unknown_directive, loc, "ignoring unknown directive %" + name);
            while (!cur.at_end() && !chars::is_break(cur.peek()))
                cur.advance();
            cur.consume_break();
            return std::nullopt;
        }

    //------------------------------------------------------------------------

        // Blank lines, comment lines and byte order marks between documents.
        inline void skip_document_prefix(cursor & cur)
        {
            for (;;)
            {
                structure::skip_comment_lines(cur);
                if (!(cur.at_line_start() && chars::is_bom(cur.peek())))
                    return;
                cur.advance();
            }
        }
    }

} // namespace yml

#endif // YML_STREAM_HPP
