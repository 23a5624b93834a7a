// yml_flow.hpp - yml YAML 1.2 grammar engine - Flow Style
// Version 0.3.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef YML_FLOW_HPP
#define YML_FLOW_HPP

#include "yml_structure.hpp"

namespace yml
{
//========================================================================
// Production selection
//========================================================================

    enum class flow_production
    {
        alias,
        sequence,
        mapping,
        double_quoted,
        single_quoted,
        plain,
        empty,
        invalid
    };

    inline constexpr bool is_plain_safe(char32_t c, context_kind ctx) noexcept
    {
        return chars::is_ns_char(c) && !(is_inside_flow_collection(ctx) && chars::is_flow_indicator(c));
    }

    inline bool can_start_plain(cursor const & cur, context_kind ctx) noexcept
    {
        char32_t c = cur.peek();
        if (!chars::is_ns_char(c))
            return false;
        if (!chars::is_indicator(c))
            return true;
        if (c == U'?' || c == U':' || c == U'-')
            return is_plain_safe(cur.peek(1), ctx);
        return false;
    }

    // What may legally follow node properties when the node itself is empty.
    inline bool at_empty_node(cursor const & cur, context_kind ctx) noexcept
    {
        char32_t c = cur.peek();
        if (chars::is_break(c) || c == end_of_input || c == U'#')
            return true;
        if (c == U':' && (chars::is_blank_or_end(cur.peek(1)) || is_inside_flow_collection(ctx)))
            return true;
        return is_inside_flow_collection(ctx) && (c == U',' || c == U']' || c == U'}');
    }

    inline flow_production decide_flow_production(cursor const & cur, context_kind ctx) noexcept
    {
        switch (cur.peek())
        {
            case U'*':  return flow_production::alias;
            case U'[':  return flow_production::sequence;
            case U'{':  return flow_production::mapping;
            case U'"':  return flow_production::double_quoted;
            case U'\'': return flow_production::single_quoted;
            default:    break;
        }

        if (can_start_plain(cur, ctx))
            return flow_production::plain;
        if (at_empty_node(cur, ctx))
            return flow_production::empty;
        return flow_production::invalid;
    }

//========================================================================
// Implicit key lookahead
//
// Scans the rest of the current line, without consuming it, for the ':'
// that turns the node starting at `offset` into a mapping key.
//========================================================================

    namespace detail
    {
        inline size_t skip_quoted(cursor const & cur, size_t k) noexcept
        {
            char32_t quote = cur.peek(k++);
            for (;;)
            {
                char32_t c = cur.peek(k);
                if (c == end_of_input || chars::is_break(c))
                    return npos();

                if (quote == U'\'' && c == U'\'')
                {
                    if (cur.peek(k + 1) != U'\'')
                        return k + 1;
                    k += 2;
                }
                else if (quote == U'"' && c == U'\\')
                {
                    k += 2;
                }
                else if (quote == U'"' && c == U'"')
                {
                    return k + 1;
                }
                else
                {
                    ++k;
                }
            }
        }

        inline size_t skip_bracketed(cursor const & cur, size_t k) noexcept
        {
            int depth = 0;
            for (;;)
            {
                char32_t c = cur.peek(k);
                if (c == end_of_input || chars::is_break(c))
                    return npos();

                if (c == U'"' || c == U'\'')
                {
                    bool quote_start = k == 0 || !chars::is_ns_char(cur.peek(k - 1)) ||
                                       chars::is_flow_indicator(cur.peek(k - 1));
                    if (quote_start)
                    {
                        k = skip_quoted(cur, k);
                        if (k == npos())
                            return npos();
                        continue;
                    }
                }
                else if (c == U'[' || c == U'{')
                {
                    ++depth;
                }
                else if (c == U']' || c == U'}')
                {
                    if (--depth == 0)
                        return k + 1;
                }
                ++k;
            }
        }
    }

    inline bool implicit_key_ahead(cursor const & cur, size_t offset, bool in_flow, size_t max_length) noexcept
    {
        size_t k = offset;
        auto too_long = [&]() { return k - offset > max_length; };

        // node properties
        while (cur.peek(k) == U'!' || cur.peek(k) == U'&')
        {
            while (!chars::is_blank_or_end(cur.peek(k)) && !(in_flow && chars::is_flow_indicator(cur.peek(k))))
                ++k;
            while (chars::is_white(cur.peek(k)))
                ++k;
        }

        bool json_like = false;
        char32_t first = cur.peek(k);

        if (first == U'"' || first == U'\'')
        {
            k = detail::skip_quoted(cur, k);
            json_like = true;
        }
        else if (first == U'[' || first == U'{')
        {
            k = detail::skip_bracketed(cur, k);
            json_like = true;
        }
        else if (first == U'*')
        {
            ++k;
            while (chars::is_anchor_char(cur.peek(k)))
                ++k;
        }
        else
        {
            // plain key
            for (; !too_long(); ++k)
            {
                char32_t c = cur.peek(k);
                if (c == end_of_input || chars::is_break(c))
                    return false;
                if (c == U':')
                {
                    char32_t next = cur.peek(k + 1);
                    if (chars::is_blank_or_end(next) || (in_flow && chars::is_flow_indicator(next)))
                        return k > offset;
                }
                if (c == U'#' && k > offset && chars::is_white(cur.peek(k - 1)))
                    return false;
                if (in_flow && chars::is_flow_indicator(c))
                    return false;
            }
            return false;
        }

        if (k == npos() || too_long())
            return false;

        while (chars::is_white(cur.peek(k)))
            ++k;

        if (cur.peek(k) != U':')
            return false;
        if (in_flow && json_like)
            return true;

        char32_t next = cur.peek(k + 1);
        return chars::is_blank_or_end(next) || (in_flow && chars::is_flow_indicator(next));
    }

//========================================================================
// flow_parser
//
// n is the minimum indentation of continuation lines. It is only enforced
// for scalars that sit directly in a block context; lines inside flow
// collections are not indentation sensitive.
//========================================================================

    class flow_parser
    {
    public:
        explicit flow_parser(scan_state & st)
            : st_(st)
            , cur_(st.cur)
        {}

        node_id parse_flow_node(int n, context_kind c)
        {
            node_properties props = parse_properties(c);
            if (!props.empty())
            {
                bool separated = is_inside_flow_collection(c)
                    ? structure::separate(cur_, n, c)
                    : structure::separate_in_line(cur_);

                if (!separated && !at_empty_node(cur_, c))
                    cur_.fail(scan_error_kind::expected_separation, "expected white space after node properties");
            }
            return parse_flow_content(n, c, props);
        }

        // Content after properties that the caller has already consumed.
        node_id parse_flow_content(int n, context_kind c, node_properties const & props);

        node_properties parse_properties(context_kind c);

    private:
        void parse_tag(node_properties & props, context_kind c);
        void parse_anchor(node_properties & props);
        std::string read_tag_chars(source_location tag_loc, bool uri);

        node_id parse_alias(int n, node_properties const & props);
        node_id parse_plain(int n, context_kind c, node_properties const & props);
        node_id parse_single_quoted(int n, context_kind c, node_properties const & props);
        node_id parse_double_quoted(int n, context_kind c, node_properties const & props);
        node_id parse_flow_sequence(int n, node_properties const & props);
        node_id parse_flow_mapping(int n, node_properties const & props);

        node_id parse_sequence_entry(int n, source_location open);
        void    parse_mapping_entry(node_id map, int n, source_location open);
        node_id parse_entry_value(int n, char32_t closing, source_location open);
        node_id single_pair(node_id key, node_id value, source_location loc, int n);

        struct continuation
        {
            size_t breaks;
            size_t advance;
        };

        std::optional<continuation> plain_continuation(int n, context_kind c) const;
        size_t fold_quoted_lines(int n, context_kind c, source_location open);
        void   skip_separation(int n, source_location open);

        bool at_explicit_key() const noexcept
        {
            char32_t next = cur_.peek(1);
            return cur_.peek() == U'?' && (chars::is_blank_or_end(next) || chars::is_flow_indicator(next));
        }

        bool at_value_indicator() const noexcept
        {
            char32_t next = cur_.peek(1);
            return cur_.peek() == U':' && (chars::is_blank_or_end(next) || chars::is_flow_indicator(next));
        }

        scan_state & st_;
        cursor &     cur_;
    };

//========================================================================
// Properties
//========================================================================

    inline node_properties flow_parser::parse_properties(context_kind c)
    {
        node_properties props;
        props.loc = cur_.location();

        for (;;)
        {
            char32_t ch = cur_.peek();
            if (ch == U'!' && !props.has_tag)
                parse_tag(props, c);
            else if (ch == U'&' && !props.has_anchor)
                parse_anchor(props);
            else
                break;

            // a second property on the same line
            size_t k = 0;
            while (chars::is_white(cur_.peek(k)))
                ++k;

            char32_t next = cur_.peek(k);
            bool more = k > 0 && ((next == U'!' && !props.has_tag) || (next == U'&' && !props.has_anchor));
            if (!more)
                break;
            cur_.advance(k);
        }
        return props;
    }

//------------------------------------------------------------------------

    inline std::string flow_parser::read_tag_chars(source_location tag_loc, bool uri)
    {
        std::string out;
        for (;;)
        {
            char32_t ch = cur_.peek();
            if (ch == U'%')
            {
                int hi = chars::hex_value(cur_.peek(1));
                int lo = chars::hex_value(cur_.peek(2));
                if (hi < 0 || lo < 0)
                    cur_.fail_at(tag_loc, scan_error_kind::invalid_tag, "invalid URI escape in tag");
                out += static_cast<char>(hi * 16 + lo);
                cur_.advance(3);
                continue;
            }

            bool ok = uri ? chars::is_uri_char(ch) : chars::is_tag_char(ch);
            if (!ok)
                return out;

            chars::append_utf8(out, ch);
            cur_.advance();
        }
    }

//------------------------------------------------------------------------

    inline void flow_parser::parse_tag(node_properties & props, context_kind c)
    {
        auto loc = cur_.location();
        cur_.advance();   // '!'

        if (cur_.peek() == U'<')
        {
            cur_.advance();
            std::string uri = read_tag_chars(loc, true);
            if (cur_.peek() != U'>')
                cur_.fail_at(loc, scan_error_kind::invalid_tag, "unterminated verbatim tag");
            cur_.advance();
            if (uri.empty() || uri == "!")
                cur_.fail_at(loc, scan_error_kind::invalid_tag, "verbatim tag must not be empty");

            props.tag = std::move(uri);
        }
        else if (chars::is_blank_or_end(cur_.peek()) ||
                 (is_inside_flow_collection(c) && chars::is_flow_indicator(cur_.peek())))
        {
            props.tag = "!";
        }
        else
        {
            std::string handle = "!";
            if (cur_.peek() == U'!')
            {
                handle = "!!";
                cur_.advance();
            }
            else
            {
                size_t k = 0;
                while (chars::is_word_char(cur_.peek(k)))
                    ++k;
                if (k > 0 && cur_.peek(k) == U'!')
                {
                    for (size_t i = 0; i < k; ++i)
                        chars::append_utf8(handle, cur_.peek(i));
                    handle += '!';
                    cur_.advance(k + 1);
                }
            }

            std::string suffix = read_tag_chars(loc, false);
            if (suffix.empty())
                cur_.fail_at(loc, scan_error_kind::invalid_tag, "tag suffix expected after " + handle);

            auto resolved = st_.tags.resolve(handle, suffix);
            if (!resolved)
                cur_.fail_at(loc, scan_error_kind::unknown_tag_handle, "undefined tag handle " + handle);

            props.tag = std::move(*resolved);
        }

        char32_t next = cur_.peek();
        bool terminated = chars::is_blank_or_end(next) ||
                          (is_inside_flow_collection(c) && chars::is_flow_indicator(next));
        if (!terminated)
            cur_.fail(scan_error_kind::invalid_tag, "invalid character in tag");

        props.has_tag = true;
    }

//------------------------------------------------------------------------

    inline void flow_parser::parse_anchor(node_properties & props)
    {
        auto loc = cur_.location();
        cur_.advance();   // '&'

        std::string name;
        while (chars::is_anchor_char(cur_.peek()))
        {
            chars::append_utf8(name, cur_.peek());
            cur_.advance();
        }
        if (name.empty())
            cur_.fail_at(loc, scan_error_kind::invalid_anchor, "anchor name expected after '&'");

        props.anchor     = std::move(name);
        props.has_anchor = true;
    }

//========================================================================
// Node content
//========================================================================

    inline node_id flow_parser::parse_flow_content(int n, context_kind c, node_properties const & props)
    {
        switch (decide_flow_production(cur_, c))
        {
            case flow_production::alias:         return parse_alias(n, props);
            case flow_production::sequence:      return parse_flow_sequence(n, props);
            case flow_production::mapping:       return parse_flow_mapping(n, props);
            case flow_production::double_quoted: return parse_double_quoted(n, c, props);
            case flow_production::single_quoted: return parse_single_quoted(n, c, props);
            case flow_production::plain:         return parse_plain(n, c, props);

            case flow_production::empty:
                if (!props.empty())
                    return st_.make_empty(props, props.loc, n);
                break;

            case flow_production::invalid:
                break;
        }

        if (cur_.peek() == U'-' && chars::is_blank_or_end(cur_.peek(1)))
            cur_.fail(scan_error_kind::unexpected_character,
                      "block sequence entries are not allowed in this context");
        cur_.fail(scan_error_kind::unexpected_character, "unexpected character at start of node");
    }

//------------------------------------------------------------------------

    inline node_id flow_parser::parse_alias(int n, node_properties const & props)
    {
        if (!props.empty())
            cur_.fail_at(props.loc, scan_error_kind::unexpected_character, "an alias node cannot carry properties");

        auto loc = cur_.location();
        cur_.advance();   // '*'

        std::string name;
        while (chars::is_anchor_char(cur_.peek()))
        {
            chars::append_utf8(name, cur_.peek());
            cur_.advance();
        }
        if (name.empty())
            cur_.fail_at(loc, scan_error_kind::invalid_anchor, "alias name expected after '*'");

        auto it = st_.anchors.find(name);
        if (it == st_.anchors.end())
            cur_.fail_at(loc, scan_error_kind::unknown_anchor, "undefined alias '" + name + "'");

        return st_.builder.add_alias(it->second, std::move(name), loc, n);
    }

//========================================================================
// Scalars
//========================================================================

    // At a line break inside a plain scalar: is the scalar continued on a
    // following line, and how many breaks are folded?
    inline std::optional<flow_parser::continuation> flow_parser::plain_continuation(int n, context_kind c) const
    {
        bool in_collection = is_inside_flow_collection(c);
        size_t k = cur_.break_length();
        size_t breaks = 1;

        for (;;)
        {
            size_t spaces = structure::count_spaces(cur_, k);
            size_t j = k + spaces;
            while (chars::is_white(cur_.peek(j)))
                ++j;

            char32_t ch = cur_.peek(j);
            if (chars::is_break(ch))
            {
                ++breaks;
                k = j + cur_.break_length(j);
                continue;
            }
            if (ch == end_of_input || ch == U'#')
                return std::nullopt;

            if (structure::marker_at(cur_, k) || (j == k && ch == U'%'))
                return std::nullopt;
            if (!in_collection && static_cast<int>(spaces) < n)
                return std::nullopt;

            if (ch == U':' && (chars::is_blank_or_end(cur_.peek(j + 1)) ||
                               (in_collection && chars::is_flow_indicator(cur_.peek(j + 1)))))
                return std::nullopt;
            if (in_collection && chars::is_flow_indicator(ch))
                return std::nullopt;

            return continuation{ breaks, j };
        }
    }

//------------------------------------------------------------------------

    inline node_id flow_parser::parse_plain(int n, context_kind c, node_properties const & props)
    {
        auto loc = cur_.location();
        bool in_collection = is_inside_flow_collection(c);
        std::string text;

        for (;;)
        {
            for (;;)
            {
                char32_t ch = cur_.peek();
                if (ch == end_of_input || chars::is_break(ch))
                    break;

                if (chars::is_white(ch))
                {
                    // keep white space only when more content follows on the line
                    size_t k = 0;
                    while (chars::is_white(cur_.peek(k)))
                        ++k;
                    char32_t after = cur_.peek(k);
                    bool ends = after == end_of_input || chars::is_break(after) || after == U'#' ||
                                (after == U':' && (chars::is_blank_or_end(cur_.peek(k + 1)) ||
                                                   (in_collection && chars::is_flow_indicator(cur_.peek(k + 1))))) ||
                                (in_collection && chars::is_flow_indicator(after));
                    if (ends)
                        break;

                    for (size_t i = 0; i < k; ++i)
                        chars::append_utf8(text, cur_.peek(i));
                    cur_.advance(k);
                    continue;
                }

                if (ch == U':')
                {
                    char32_t next = cur_.peek(1);
                    if (chars::is_blank_or_end(next) || (in_collection && chars::is_flow_indicator(next)))
                        break;
                }
                if (in_collection && chars::is_flow_indicator(ch))
                    break;
                if (!chars::is_nb_char(ch))
                    cur_.fail(scan_error_kind::unexpected_character, "invalid character in plain scalar");

                chars::append_utf8(text, ch);
                cur_.advance();
            }

            if (is_key_context(c) || !chars::is_break(cur_.peek()))
                break;

            auto next = plain_continuation(n, c);
            if (!next)
                break;

            cur_.advance(next->advance);
            text += structure::line_folding(next->breaks, false);
        }

        return st_.make_scalar(std::move(text), node_style::plain, props, loc, n);
    }

//------------------------------------------------------------------------

    // After a consumed line break inside a quoted scalar: drops empty lines
    // and the next line's leading white space, returning the empty lines
    // seen.
    inline size_t flow_parser::fold_quoted_lines(int n, context_kind c, source_location open)
    {
        if (is_key_context(c))
            cur_.fail_at(open, scan_error_kind::unexpected_character, "implicit keys must be on a single line");

        size_t empty = 0;
        for (;;)
        {
            if (structure::at_document_marker(cur_))
                cur_.fail_at(open, scan_error_kind::unterminated_scalar, "document marker inside quoted scalar");

            size_t spaces = structure::count_spaces(cur_);
            size_t k = spaces;
            while (chars::is_white(cur_.peek(k)))
                ++k;

            char32_t ch = cur_.peek(k);
            if (ch == end_of_input)
                cur_.fail_at(open, scan_error_kind::unterminated_scalar, "unterminated quoted scalar");

            if (chars::is_break(ch))
            {
                cur_.advance(k);
                cur_.consume_break();
                ++empty;
                continue;
            }

            if (!is_inside_flow_collection(c) && static_cast<int>(spaces) < n)
            {
                cur_.advance(spaces);
                cur_.fail(scan_error_kind::unexpected_indentation,
                          "continuation line of quoted scalar is not indented enough");
            }

            cur_.advance(k);
            return empty;
        }
    }

//------------------------------------------------------------------------

    inline node_id flow_parser::parse_single_quoted(int n, context_kind c, node_properties const & props)
    {
        auto loc = cur_.location();
        cur_.advance();   // '\''
        std::string text;

        for (;;)
        {
            char32_t ch = cur_.peek();
            if (ch == end_of_input)
                cur_.fail_at(loc, scan_error_kind::unterminated_scalar, "unterminated single-quoted scalar");

            if (ch == U'\'')
            {
                if (cur_.peek(1) != U'\'')
                {
                    cur_.advance();
                    break;
                }
                text += '\'';
                cur_.advance(2);
                continue;
            }

            if (chars::is_white(ch))
            {
                size_t k = 0;
                while (chars::is_white(cur_.peek(k)))
                    ++k;
                if (!chars::is_break(cur_.peek(k)))
                {
                    for (size_t i = 0; i < k; ++i)
                        chars::append_utf8(text, cur_.peek(i));
                }
                cur_.advance(k);
                continue;
            }

            if (chars::is_break(ch))
            {
                cur_.consume_break();
                text += structure::line_folding(1 + fold_quoted_lines(n, c, loc), false);
                continue;
            }

            if (!chars::is_json(ch))
                cur_.fail(scan_error_kind::unexpected_character, "invalid character in quoted scalar");

            chars::append_utf8(text, ch);
            cur_.advance();
        }

        return st_.make_scalar(std::move(text), node_style::single_quoted, props, loc, n);
    }

//------------------------------------------------------------------------

    inline node_id flow_parser::parse_double_quoted(int n, context_kind c, node_properties const & props)
    {
        auto loc = cur_.location();
        cur_.advance();   // '"'
        std::string text;

        for (;;)
        {
            char32_t ch = cur_.peek();
            if (ch == end_of_input)
                cur_.fail_at(loc, scan_error_kind::unterminated_scalar, "unterminated double-quoted scalar");

            if (ch == U'"')
            {
                cur_.advance();
                break;
            }

            if (ch == U'\\')
            {
                if (chars::is_break(cur_.peek(1)))
                {
                    // escaped line break: no folding, empty lines still count
                    cur_.advance();
                    cur_.consume_break();
                    text.append(fold_quoted_lines(n, c, loc), '\n');
                    continue;
                }

                auto escape = chars::decode_escape(cur_.remaining().substr(1));
                if (!escape)
                    cur_.fail(scan_error_kind::invalid_escape, "invalid escape sequence in double-quoted scalar");

                chars::append_utf8(text, escape->value);
                cur_.advance(1 + escape->length);
                continue;
            }

            if (chars::is_white(ch))
            {
                size_t k = 0;
                while (chars::is_white(cur_.peek(k)))
                    ++k;
                if (!chars::is_break(cur_.peek(k)))
                {
                    for (size_t i = 0; i < k; ++i)
                        chars::append_utf8(text, cur_.peek(i));
                }
                cur_.advance(k);
                continue;
            }

            if (chars::is_break(ch))
            {
                cur_.consume_break();
                text += structure::line_folding(1 + fold_quoted_lines(n, c, loc), false);
                continue;
            }

            if (!chars::is_json(ch))
                cur_.fail(scan_error_kind::unexpected_character, "invalid character in quoted scalar");

            chars::append_utf8(text, ch);
            cur_.advance();
        }

        return st_.make_scalar(std::move(text), node_style::double_quoted, props, loc, n);
    }

//========================================================================
// Collections
//========================================================================

    inline void flow_parser::skip_separation(int n, source_location open)
    {
        structure::separate_lines(cur_, n);

        if (cur_.at_end())
            cur_.fail(scan_error_kind::expected_close_delimiter,
                      "unterminated flow collection opened at line " + std::to_string(open.line));
        if (structure::at_document_marker(cur_))
            cur_.fail(scan_error_kind::expected_close_delimiter,
                      "document marker inside flow collection opened at line " + std::to_string(open.line));
    }

//------------------------------------------------------------------------

    inline node_id flow_parser::single_pair(node_id key, node_id value, source_location loc, int n)
    {
        auto map = st_.builder.open_mapping(node_style::flow, schema::core_tag("map"), loc, n);
        st_.builder.append_pair(map, key, value);
        return map;
    }

//------------------------------------------------------------------------

    inline node_id flow_parser::parse_entry_value(int n, char32_t closing, source_location open)
    {
        skip_separation(n, open);
        if (cur_.peek() == U',' || cur_.peek() == closing)
            return st_.make_empty({}, cur_.location(), n);
        return parse_flow_node(n, context_kind::flow_in);
    }

//------------------------------------------------------------------------

    inline node_id flow_parser::parse_sequence_entry(int n, source_location open)
    {
        auto loc = cur_.location();

        if (at_explicit_key())
        {
            cur_.advance();
            skip_separation(n, open);

            char32_t ch = cur_.peek();
            node_id key = (ch == U',' || ch == U']' || at_value_indicator())
                ? st_.make_empty({}, cur_.location(), n)
                : parse_flow_node(n, context_kind::flow_in);

            skip_separation(n, open);
            node_id value = st_.make_empty({}, cur_.location(), n);
            if (cur_.peek() == U':')
            {
                cur_.advance();
                value = parse_entry_value(n, U']', open);
            }
            return single_pair(key, value, loc, n);
        }

        if (at_value_indicator())
        {
            node_id key = st_.make_empty({}, loc, n);
            cur_.advance();
            return single_pair(key, parse_entry_value(n, U']', open), loc, n);
        }

        if (implicit_key_ahead(cur_, 0, true, st_.opts.max_implicit_key_length))
        {
            node_id key = parse_flow_node(n, context_kind::flow_key);
            structure::separate_in_line(cur_);
            if (cur_.peek() != U':')
                cur_.fail(scan_error_kind::expected_mapping_value, "expected ':' after implicit key");
            cur_.advance();
            return single_pair(key, parse_entry_value(n, U']', open), loc, n);
        }

        return parse_flow_node(n, context_kind::flow_in);
    }

//------------------------------------------------------------------------

    inline node_id flow_parser::parse_flow_sequence(int n, node_properties const & props)
    {
        auto loc = cur_.location();
        context_scope scope(st_.frames, cur_, context_kind::flow_in, n);

        cur_.advance();   // '['
        auto seq = st_.builder.open_sequence(node_style::flow, st_.collection_tag(props, "seq"), loc, n);

        skip_separation(n, loc);
        while (cur_.peek() != U']')
        {
            if (cur_.peek() == U',')
                cur_.fail(scan_error_kind::unexpected_character, "empty entry in flow sequence");

            st_.builder.append_item(seq, parse_sequence_entry(n, loc));

            skip_separation(n, loc);
            if (cur_.peek() == U',')
            {
                cur_.advance();
                skip_separation(n, loc);
                continue;
            }
            if (cur_.peek() != U']')
                cur_.fail(scan_error_kind::expected_separation, "expected ',' or ']' in flow sequence");
        }
        cur_.advance();

        st_.register_anchor(seq, props);
        return seq;
    }

//------------------------------------------------------------------------

    inline void flow_parser::parse_mapping_entry(node_id map, int n, source_location open)
    {
        node_id key;

        if (at_explicit_key())
        {
            cur_.advance();
            skip_separation(n, open);

            char32_t ch = cur_.peek();
            key = (ch == U',' || ch == U'}' || at_value_indicator())
                ? st_.make_empty({}, cur_.location(), n)
                : parse_flow_node(n, context_kind::flow_in);
        }
        else if (at_value_indicator())
        {
            key = st_.make_empty({}, cur_.location(), n);
        }
        else
        {
            key = parse_flow_node(n, context_kind::flow_in);
        }

        skip_separation(n, open);

        node_id value;
        if (cur_.peek() == U':')
        {
            cur_.advance();
            value = parse_entry_value(n, U'}', open);
        }
        else
        {
            value = st_.make_empty({}, cur_.location(), n);
        }

        st_.builder.append_pair(map, key, value);
    }

//------------------------------------------------------------------------

    inline node_id flow_parser::parse_flow_mapping(int n, node_properties const & props)
    {
        auto loc = cur_.location();
        context_scope scope(st_.frames, cur_, context_kind::flow_in, n);

        cur_.advance();   // '{'
        auto map = st_.builder.open_mapping(node_style::flow, st_.collection_tag(props, "map"), loc, n);

        skip_separation(n, loc);
        while (cur_.peek() != U'}')
        {
            if (cur_.peek() == U',')
            {
                auto at = cur_.location();
                st_.builder.append_pair(map, st_.make_empty({}, at, n), st_.make_empty({}, at, n));
            }
            else
            {
                parse_mapping_entry(map, n, loc);
            }

            skip_separation(n, loc);
            if (cur_.peek() == U',')
            {
                cur_.advance();
                skip_separation(n, loc);
                continue;
            }
            if (cur_.peek() != U'}')
                cur_.fail(scan_error_kind::expected_separation, "expected ',' or '}' in flow mapping");
        }
        cur_.advance();

        st_.register_anchor(map, props);
        return map;
    }

} // namespace yml

#endif // YML_FLOW_HPP
