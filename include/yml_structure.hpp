// yml_structure.hpp - yml YAML 1.2 grammar engine - Structural Layer
// Version 0.3.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef YML_STRUCTURE_HPP
#define YML_STRUCTURE_HPP

#include "yml_context.hpp"
#include "yml_schema.hpp"

namespace yml
{
//========================================================================
// Node properties
//========================================================================

    struct node_properties
    {
        std::string     tag;        // resolved; "!" for the non-specific tag
        std::string     anchor;
        source_location loc;
        bool            has_tag    = false;
        bool            has_anchor = false;

        bool empty() const noexcept { return !has_tag && !has_anchor; }
    };

//========================================================================
// scan_state
//
// Everything one in-flight parse owns. Tag and anchor tables are reset at
// every document boundary by the driver.
//========================================================================

    struct scan_state
    {
        cursor                                   cur;
        context_stack                            frames;
        document_builder                         builder;
        std::unordered_map<std::string, node_id> anchors;
        tag_prefix_table                         tags;
        version_directive                        version;
        bool                                     version_declared = false;
        parser_options                           opts;
        std::vector<scan_error>                  warnings;

        scan_state(std::u32string text, parser_options const & options)
            : cur(std::move(text))
            , frames(options.max_depth)
            , opts(options)
        {}

        void warn(scan_error_kind kind, source_location loc, std::string message)
        {
            warnings.push_back({ kind, loc, std::move(message) });
        }

        //------------------------------------------------------------------------
        // Node construction shared by the block and flow layers
        //------------------------------------------------------------------------

        void register_anchor(node_id id, node_properties const & props)
        {
            if (!props.has_anchor)
                return;
            builder.set_anchor(id, props.anchor);
            anchors[props.anchor] = id;
        }

        node_id make_scalar(std::string text, node_style style, node_properties const & props,
                            source_location loc, int indent)
        {
            auto r = resolve_scalar(text, style, props.tag, opts.schema);
            if (r.mismatch)
                warn(scan_error_kind::tag_mismatch, loc,
                     "value '" + text + "' does not match tag " + r.tag + "; kept as a string");

            auto id = builder.add_scalar(r.kind, style, std::move(r.tag), std::move(text),
                                         std::move(r.value), loc, indent);
            register_anchor(id, props);
            return id;
        }

        node_id make_empty(node_properties const & props, source_location loc, int indent)
        {
            return make_scalar({}, node_style::plain, props, loc, indent);
        }

        std::string collection_tag(node_properties const & props, std::string_view core_name) const
        {
            if (props.has_tag)
                return props.tag;
            return schema::core_tag(core_name);
        }
    };

//========================================================================
// Structural productions
//
// Non-consuming checks return booleans. Consuming operations that the
// grammar makes mandatory raise through the cursor.
//========================================================================

    namespace structure
    {
        // Spaces starting at lookahead offset k.
        inline size_t count_spaces(cursor const & cur, size_t k = 0) noexcept
        {
            size_t count = 0;
            while (cur.peek(k + count) == U' ')
                ++count;
            return count;
        }

        inline bool validate_indent_exact(cursor const & cur, int n) noexcept
        {
            return n >= 0 && count_spaces(cur) == static_cast<size_t>(n);
        }

        inline bool validate_indent_less_than(cursor const & cur, int n) noexcept
        {
            return n > 0 && count_spaces(cur) < static_cast<size_t>(n);
        }

        inline bool validate_indent_less_or_equal(cursor const & cur, int n) noexcept
        {
            return n >= 0 && count_spaces(cur) <= static_cast<size_t>(n);
        }

        // Consumes up to n indentation spaces. Flow contexts also take the
        // separating white space that may follow the indentation.
        inline size_t line_prefix(cursor & cur, int n, context_kind c)
        {
            size_t taken = 0;
            while (static_cast<int>(taken) < n && cur.peek() == U' ')
            {
                cur.advance();
                ++taken;
            }

            if (is_flow(c))
            {
                while (chars::is_white(cur.peek()))
                {
                    cur.advance();
                    ++taken;
                }
            }
            return taken;
        }

        // Consumes a line that holds nothing but white space. Block contexts
        // only accept spaces up to the indentation.
        inline bool empty_line(cursor & cur, int n, context_kind c)
        {
            size_t k = 0;
            if (is_flow(c))
            {
                while (chars::is_white(cur.peek(k)))
                    ++k;
            }
            else
            {
                k = count_spaces(cur);
                if (n >= 0 && k > static_cast<size_t>(n))
                    return false;
            }

            if (!chars::is_break(cur.peek(k)))
                return false;

            cur.advance(k);
            cur.consume_break();
            return true;
        }

        // Literal: every break is kept. Folded: a lone break becomes a space,
        // otherwise the first break is trimmed and the rest are kept.
        inline std::string line_folding(size_t breaks, bool is_literal)
        {
            if (breaks == 0)
                return {};
            if (is_literal)
                return std::string(breaks, '\n');
            if (breaks == 1)
                return " ";
            return std::string(breaks - 1, '\n');
        }

        // Consumes '#' up to, not including, the line break.
        inline bool comment_skip(cursor & cur)
        {
            if (cur.peek() != U'#')
                return false;

            while (!chars::is_break(cur.peek()) && !cur.at_end())
                cur.advance();
            return true;
        }

        // Returns true when white space was consumed or the cursor already
        // sits at the start of a line.
        inline bool separate_in_line(cursor & cur)
        {
            bool any = cur.at_line_start();
            while (chars::is_white(cur.peek()))
            {
                cur.advance();
                any = true;
            }
            return any;
        }

        inline bool at_line_end(cursor const & cur) noexcept
        {
            size_t k = 0;
            while (chars::is_white(cur.peek(k)))
                ++k;

            char32_t c = cur.peek(k);
            if (c == U'#')
                return k > 0 || cur.at_line_start();
            return chars::is_break(c) || c == end_of_input;
        }

        // Trailing white space, an optional comment and a line break (or the
        // end of input).
        inline void expect_line_end(cursor & cur)
        {
            bool white = separate_in_line(cur);

            if (cur.peek() == U'#')
            {
                if (!white)
                    cur.fail(scan_error_kind::unexpected_character,
                             "comments must be separated from content by white space");
                comment_skip(cur);
            }

            if (cur.at_end())
                return;
            if (cur.consume_break())
                return;

            if (cur.peek() == U':' && chars::is_blank_or_end(cur.peek(1)))
                cur.fail(scan_error_kind::unexpected_character,
                         "mapping values are not allowed in this context");
            cur.fail(scan_error_kind::unexpected_character, "unexpected character after node");
        }

        // From the start of a line: drops lines that are blank or hold only
        // a comment. Leaves the cursor at the start of the next content line.
        inline void skip_comment_lines(cursor & cur)
        {
            while (!cur.at_end())
            {
                size_t k = 0;
                while (chars::is_white(cur.peek(k)))
                    ++k;

                char32_t c = cur.peek(k);
                if (c == U'#')
                {
                    cur.advance(k);
                    comment_skip(cur);
                    if (!cur.consume_break())
                        return;
                }
                else if (chars::is_break(c))
                {
                    cur.advance(k);
                    cur.consume_break();
                }
                else if (c == end_of_input)
                {
                    cur.advance(k);
                }
                else
                {
                    return;
                }
            }
        }

        inline void finish_line(cursor & cur)
        {
            expect_line_end(cur);
            skip_comment_lines(cur);
        }

        //------------------------------------------------------------------------
        // Document markers and directive lines
        //------------------------------------------------------------------------

        // "---" or "..." at offset k, followed by a blank or the end of input.
        inline bool marker_at(cursor const & cur, size_t k) noexcept
        {
            char32_t c = cur.peek(k);
            if (c != U'-' && c != U'.')
                return false;
            return cur.peek(k + 1) == c && cur.peek(k + 2) == c && chars::is_blank_or_end(cur.peek(k + 3));
        }

        inline bool at_document_marker(cursor const & cur) noexcept
        {
            return cur.at_line_start() && marker_at(cur, 0);
        }

        inline bool at_document_start(cursor const & cur) noexcept
        {
            return at_document_marker(cur) && cur.peek() == U'-';
        }

        inline bool at_document_end(cursor const & cur) noexcept
        {
            return at_document_marker(cur) && cur.peek() == U'.';
        }

        inline bool directive_at(cursor const & cur) noexcept
        {
            return cur.at_line_start() && cur.peek() == U'%';
        }

        //------------------------------------------------------------------------
        // Separation
        //------------------------------------------------------------------------

        // Comment lines followed by a line prefix, or in-line white space.
        // Stops in front of a document marker.
        inline bool separate_lines(cursor & cur, int n)
        {
            bool any = separate_in_line(cur);

            for (;;)
            {
                bool white = any || cur.at_line_start();
                if (cur.peek() == U'#' && white)
                    comment_skip(cur);

                if (!cur.consume_break())
                    return any;

                any = true;
                if (at_document_marker(cur))
                    return true;

                line_prefix(cur, n, context_kind::flow_in);
            }
        }

        // Key contexts never span lines.
        inline bool separate(cursor & cur, int n, context_kind c)
        {
            if (is_key_context(c))
                return separate_in_line(cur);
            return separate_lines(cur, n);
        }

        inline void require_separation(cursor & cur, int n, context_kind c, std::string_view what)
        {
            if (!separate(cur, n, c))
                cur.fail(scan_error_kind::expected_separation,
                         "expected white space after " + std::string(what));
        }
    }

} // namespace yml

#endif // YML_STRUCTURE_HPP
