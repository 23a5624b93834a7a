// yml_block.hpp - yml YAML 1.2 grammar engine - Block Style
// Version 0.3.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef YML_BLOCK_HPP
#define YML_BLOCK_HPP

#include "yml_flow.hpp"

namespace yml
{
//========================================================================
// Block scalar header
//========================================================================

    enum class chomping
    {
        strip,
        clip,
        keep
    };

    struct block_scalar_header
    {
        node_style         style = node_style::literal;
        chomping           chomp = chomping::clip;
        std::optional<int> explicit_indent;
    };

//========================================================================
// Production selection
//========================================================================

    enum class block_state
    {
        block_node,
        sequence_first_entry,
        sequence_entry,
        mapping_first_key,
        mapping_key,
        mapping_value
    };

    enum class block_production
    {
        empty,
        sequence,
        mapping,
        literal_or_folded,
        flow_in_block
    };

    // `compact` allows a collection to open on the current line, as it may
    // right after "- ", "? " or at the start of a line.
    inline block_production decide_block_production(cursor const & cur, bool compact, size_t max_key_length) noexcept
    {
        char32_t c = cur.peek();
        if (c == end_of_input || chars::is_break(c))
            return block_production::empty;
        if (c == U'|' || c == U'>')
            return block_production::literal_or_folded;
        if (c == U'-' && chars::is_blank_or_end(cur.peek(1)))
            return block_production::sequence;

        if (compact)
        {
            if ((c == U'?' || c == U':') && chars::is_blank_or_end(cur.peek(1)))
                return block_production::mapping;
            if (implicit_key_ahead(cur, 0, false, max_key_length))
                return block_production::mapping;
        }
        return block_production::flow_in_block;
    }

//========================================================================
// block_parser
//
// Every block node returns with the cursor at the start of the next
// content line (or at the end of input), trailing comments consumed.
//========================================================================

    class block_parser
    {
    public:
        explicit block_parser(scan_state & st)
            : st_(st)
            , cur_(st.cur)
            , flow_(st)
        {}

        node_id parse_document_root(bool after_marker)
        {
            if (after_marker)
                return parse_block_node(-1, context_kind::block_in, false);
            return parse_node_below(-1, context_kind::block_in, {});
        }

        node_id parse_block_node(int n, context_kind c, bool compact);

        block_scalar_header parse_block_scalar_header();

    private:
        node_id parse_inline_node(int n, context_kind c, bool compact, node_properties props);
        node_id parse_node_below(int n, context_kind c, node_properties const & props);

        node_id parse_block_sequence(int k, node_properties const & props);
        node_id parse_block_mapping(int k, node_properties const & props);
        node_id parse_mapping_key(int k);
        node_id parse_mapping_value(int k, bool explicit_key);
        node_id parse_block_scalar(int n, node_properties const & props);

        bool at_entry_indicator(size_t k) const noexcept
        {
            return cur_.peek(k) == U'-' && chars::is_blank_or_end(cur_.peek(k + 1));
        }

        bool at_stream_boundary() const noexcept
        {
            return cur_.at_end() || structure::at_document_marker(cur_) || structure::directive_at(cur_);
        }

        bool next_entry(int k, bool sequence);
        void reject_tab_indent(size_t spaces);

        scan_state &  st_;
        cursor &      cur_;
        flow_parser   flow_;
    };

//------------------------------------------------------------------------

    inline void block_parser::reject_tab_indent(size_t spaces)
    {
        if (cur_.peek(spaces) == U'\t')
        {
            cur_.advance(spaces);
            cur_.fail(scan_error_kind::unexpected_character, "tabs are not allowed in block indentation");
        }
    }

//========================================================================
// Block nodes
//========================================================================

    // Right after an indicator ("- ", "? ", ": ") or a document start marker.
    inline node_id block_parser::parse_block_node(int n, context_kind c, bool compact)
    {
        // A comment must keep the white space that separates it from the
        // indicator, so look for the line end before consuming anything.
        if (structure::at_line_end(cur_))
        {
            structure::finish_line(cur_);
            return parse_node_below(n, c, {});
        }

        structure::separate_in_line(cur_);
        return parse_inline_node(n, c, compact, {});
    }

//------------------------------------------------------------------------

    inline node_id block_parser::parse_inline_node(int n, context_kind c, bool compact, node_properties props)
    {
        int column = static_cast<int>(cur_.column());
        auto production = decide_block_production(cur_, compact, st_.opts.max_implicit_key_length);

        if (production == block_production::sequence && compact)
            return parse_block_sequence(column, props);
        if (production == block_production::mapping)
            return parse_block_mapping(column, props);

        char32_t ch = cur_.peek();
        if (ch == U'!' || ch == U'&')
        {
            if (!props.empty())
                cur_.fail(scan_error_kind::unexpected_character, "node properties are already given for this node");

            props = flow_.parse_properties(c);
            if (structure::at_line_end(cur_))
            {
                structure::finish_line(cur_);
                return parse_node_below(n, c, props);
            }
            structure::require_separation(cur_, n, c, "node properties");

            production = decide_block_production(cur_, false, st_.opts.max_implicit_key_length);
        }

        switch (production)
        {
            case block_production::literal_or_folded:
                return parse_block_scalar(n, props);

            case block_production::sequence:
                cur_.fail(scan_error_kind::unexpected_character,
                          "block sequence entries are not allowed in this context");

            default:
                break;
        }

        // flow-in-block
        auto node = flow_.parse_flow_content(n + 1, context_kind::flow_out, props);
        structure::finish_line(cur_);
        return node;
    }

//------------------------------------------------------------------------

    // Content that starts on a following line, or an empty node.
    inline node_id block_parser::parse_node_below(int n, context_kind c, node_properties const & props)
    {
        if (at_stream_boundary())
            return st_.make_empty(props, cur_.location(), n + 1);

        size_t spaces = structure::count_spaces(cur_);
        int minimum = at_entry_indicator(spaces) ? seq_spaces(n, c) + 1 : n + 1;

        if (structure::validate_indent_less_than(cur_, minimum))
            return st_.make_empty(props, cur_.location(), n + 1);

        reject_tab_indent(spaces);
        cur_.advance(spaces);
        return parse_inline_node(n, c, true, props);
    }

//========================================================================
// Block collections
//========================================================================

    // At the start of a line: continue a collection whose entries sit at
    // column k? Consumes the indentation when it does.
    inline bool block_parser::next_entry(int k, bool sequence)
    {
        if (at_stream_boundary())
            return false;

        if (structure::validate_indent_less_than(cur_, k))
            return false;

        size_t spaces = structure::count_spaces(cur_);

        if (static_cast<int>(spaces) > k)
        {
            cur_.advance(spaces);
            cur_.fail(scan_error_kind::unexpected_indentation,
                      "expected indentation of " + std::to_string(k) + " spaces, found " + std::to_string(spaces));
        }

        reject_tab_indent(spaces);
        if (sequence && !at_entry_indicator(spaces))
            return false;

        cur_.advance(spaces);
        return true;
    }

//------------------------------------------------------------------------

    inline node_id block_parser::parse_block_sequence(int k, node_properties const & props)
    {
        auto loc = cur_.location();
        context_scope scope(st_.frames, cur_, context_kind::block_in, k);

        auto seq = st_.builder.open_sequence(node_style::block, st_.collection_tag(props, "seq"), loc, k);

        block_state state = block_state::sequence_first_entry;
        while (state == block_state::sequence_first_entry || next_entry(k, true))
        {
            cur_.advance();   // '-'
            st_.builder.append_item(seq, parse_block_node(k, context_kind::block_in, true));
            state = block_state::sequence_entry;
        }

        st_.register_anchor(seq, props);
        return seq;
    }

//------------------------------------------------------------------------

    inline node_id block_parser::parse_mapping_key(int k)
    {
        if (cur_.peek() == U'?' && chars::is_blank_or_end(cur_.peek(1)))
        {
            cur_.advance();
            return parse_block_node(k, context_kind::block_out, true);
        }

        if (cur_.peek() == U':' && chars::is_blank_or_end(cur_.peek(1)))
            return st_.make_empty({}, cur_.location(), k + 1);

        if (!implicit_key_ahead(cur_, 0, false, st_.opts.max_implicit_key_length))
            cur_.fail(scan_error_kind::expected_mapping_value, "could not find expected ':' after mapping key");

        auto key = flow_.parse_flow_node(k + 1, context_kind::block_key);

        structure::separate_in_line(cur_);
        if (cur_.peek() != U':')
            cur_.fail(scan_error_kind::expected_mapping_value, "could not find expected ':' after mapping key");
        return key;
    }

//------------------------------------------------------------------------

    inline node_id block_parser::parse_mapping_value(int k, bool explicit_key)
    {
        if (!explicit_key)
        {
            cur_.advance();   // ':'
            return parse_block_node(k, context_kind::block_out, false);
        }

        // ": value" on its own line at the key's indentation
        if (!at_stream_boundary() && structure::validate_indent_exact(cur_, k) &&
            cur_.peek(k) == U':' && chars::is_blank_or_end(cur_.peek(k + 1)))
        {
            cur_.advance(k + 1);
            return parse_block_node(k, context_kind::block_out, true);
        }
        return st_.make_empty({}, cur_.location(), k + 1);
    }

//------------------------------------------------------------------------

    inline node_id block_parser::parse_block_mapping(int k, node_properties const & props)
    {
        auto loc = cur_.location();
        context_scope scope(st_.frames, cur_, context_kind::block_out, k);

        auto map = st_.builder.open_mapping(node_style::block, st_.collection_tag(props, "map"), loc, k);

        block_state state = block_state::mapping_first_key;
        node_id key;
        bool explicit_key = false;

        for (bool done = false; !done; )
        {
            switch (state)
            {
                case block_state::mapping_key:
                    if (!next_entry(k, false))
                    {
                        done = true;
                        break;
                    }
                    [[fallthrough]];

                case block_state::mapping_first_key:
                    explicit_key = cur_.peek() == U'?' && chars::is_blank_or_end(cur_.peek(1));
                    key = parse_mapping_key(k);
                    state = block_state::mapping_value;
                    break;

                case block_state::mapping_value:
                    st_.builder.append_pair(map, key, parse_mapping_value(k, explicit_key));
                    state = block_state::mapping_key;
                    break;

                default:
                    done = true;
                    break;
            }
        }

        st_.register_anchor(map, props);
        return map;
    }

//========================================================================
// Block scalars
//========================================================================

    inline block_scalar_header block_parser::parse_block_scalar_header()
    {
        block_scalar_header header;
        header.style = cur_.peek() == U'|' ? node_style::literal : node_style::folded;
        cur_.advance();

        bool chomp_seen = false;
        for (int i = 0; i < 2; ++i)
        {
            char32_t ch = cur_.peek();
            if ((ch == U'-' || ch == U'+') && !chomp_seen)
            {
                header.chomp = ch == U'-' ? chomping::strip : chomping::keep;
                chomp_seen = true;
            }
            else if (chars::is_dec_digit(ch) && !header.explicit_indent)
            {
                if (ch == U'0')
                    cur_.fail(scan_error_kind::invalid_block_header,
                              "indentation indicator must be between 1 and 9");
                header.explicit_indent = static_cast<int>(ch - U'0');
            }
            else
            {
                break;
            }
            cur_.advance();
        }

        bool white = structure::separate_in_line(cur_);
        if (cur_.peek() == U'#')
        {
            if (!white)
                cur_.fail(scan_error_kind::invalid_block_header, "comment must be separated from the header");
            structure::comment_skip(cur_);
        }

        if (!cur_.at_end() && !cur_.consume_break())
            cur_.fail(scan_error_kind::invalid_block_header, "unexpected character in block scalar header");

        return header;
    }

//------------------------------------------------------------------------

    inline node_id block_parser::parse_block_scalar(int n, node_properties const & props)
    {
        auto loc = cur_.location();
        auto header = parse_block_scalar_header();
        bool literal = header.style == node_style::literal;

        int minimum = n + 1;
        int indent = 0;

        if (header.explicit_indent)
        {
            indent = std::max(n, 0) + *header.explicit_indent;
        }
        else
        {
            // Auto-detect from the first non-empty line, by lookahead only.
            size_t k = 0;
            size_t max_empty = 0;
            std::optional<size_t> detected;

            for (;;)
            {
                size_t spaces = structure::count_spaces(cur_, k);
                char32_t ch = cur_.peek(k + spaces);
                if (chars::is_break(ch))
                {
                    max_empty = std::max(max_empty, spaces);
                    k += spaces + cur_.break_length(k + spaces);
                    continue;
                }
                if (ch != end_of_input && !(spaces == 0 && structure::marker_at(cur_, k)))
                    detected = spaces;
                else
                    max_empty = std::max(max_empty, spaces);
                break;
            }

            if (detected && static_cast<int>(*detected) >= minimum)
            {
                indent = static_cast<int>(*detected);
                if (static_cast<int>(max_empty) > indent)
                    cur_.fail(scan_error_kind::unexpected_indentation,
                              "leading empty lines of a block scalar are indented more than its content");
            }
            else
            {
                indent = std::max(minimum, static_cast<int>(max_empty));
            }
        }

        std::string text;
        size_t trailing = 0;          // empty lines since the last content line
        bool has_content = false;
        bool final_break = false;     // break after the last content line
        bool prev_more_indented = false;

        while (!cur_.at_end())
        {
            size_t spaces = structure::count_spaces(cur_);
            char32_t ch = cur_.peek(spaces);

            if (structure::empty_line(cur_, indent, context_kind::block_in))
            {
                ++trailing;
                continue;
            }
            if (ch == end_of_input && structure::validate_indent_less_or_equal(cur_, indent))
            {
                cur_.advance(spaces);
                break;
            }
            if (structure::validate_indent_less_than(cur_, indent))
                break;
            if (indent == 0 && structure::at_document_marker(cur_))
                break;

            cur_.advance(static_cast<size_t>(indent));
            bool more_indented = chars::is_white(cur_.peek());

            if (has_content)
                text += structure::line_folding(1 + trailing, literal || more_indented || prev_more_indented);
            else
                text.append(trailing, '\n');

            trailing = 0;
            has_content = true;
            prev_more_indented = more_indented;

            while (!cur_.at_end() && !chars::is_break(cur_.peek()))
            {
                char32_t c = cur_.peek();
                if (!chars::is_printable(c))
                    cur_.fail(scan_error_kind::unexpected_character, "invalid character in block scalar");
                chars::append_utf8(text, c);
                cur_.advance();
            }

            final_break = cur_.consume_break();
            if (!final_break)
                break;
        }

        switch (header.chomp)
        {
            case chomping::strip:
                break;

            case chomping::clip:
                if (has_content && final_break)
                    text += '\n';
                break;

            case chomping::keep:
                if (has_content && final_break)
                    text += '\n';
                text.append(trailing, '\n');
                break;
        }

        structure::skip_comment_lines(cur_);

        return st_.make_scalar(std::move(text), header.style, props, loc, indent);
    }

} // namespace yml

#endif // YML_BLOCK_HPP
