// yml_parser.hpp - yml YAML 1.2 grammar engine - Parser
// Version 0.3.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef YML_PARSER_HPP
#define YML_PARSER_HPP

#include "yml_block.hpp"
#include "yml_stream.hpp"

namespace yml
{
//========================================================================
// PARSER API
//========================================================================

    using parse_context = context<std::vector<document>, scan_error>;

    // Parses a byte stream in UTF-8, UTF-16 or UTF-32 into its documents.
    // On failure `result` is empty and `errors` holds exactly one entry.
    parse_context parse(std::string_view bytes, parser_options const & options = {});

//========================================================================
// State machine
//========================================================================

    enum class parse_state
    {
        stream_start,
        directive_or_document_start,
        document_start,
        document_content,
        document_end,
        stream_end
    };

    inline std::string_view to_string(parse_state s)
    {
        switch (s)
        {
            case parse_state::stream_start:                return "stream-start";
            case parse_state::directive_or_document_start: return "directive-or-document-start";
            case parse_state::document_start:              return "document-start";
            case parse_state::document_content:            return "document-content";
            case parse_state::document_end:                return "document-end";
            case parse_state::stream_end:                  return "stream-end";
        }
        return "unknown";
    }

    // One instance per stream. Fatal errors surface as detail::scan_failure.
    class state_machine
    {
    public:
        state_machine(std::u32string text, parser_options const & options)
            : st_(std::move(text), options)
            , blocks_(st_)
        {}

        state_machine(state_machine const &) = delete;
        state_machine & operator=(state_machine const &) = delete;

        std::vector<document> run()
        {
            while (state_ != parse_state::stream_end)
                step();
            return std::move(documents_);
        }

        parse_state state() const noexcept { return state_; }

        std::vector<scan_error> & warnings() noexcept { return st_.warnings; }

    private:
        void step();

        void begin_document(bool explicit_start);
        void finish_document(bool explicit_end);
        void check_after_root();

        scan_state               st_;
        block_parser             blocks_;
        parse_state              state_ = parse_state::stream_start;
        std::vector<document>    documents_;
        std::vector<directive>   directives_;
        node_id                  root_;
        bool                     explicit_start_ = false;
    };

//------------------------------------------------------------------------

    inline void state_machine::step()
    {
        auto & cur = st_.cur;

        switch (state_)
        {
            case parse_state::stream_start:
                state_ = parse_state::directive_or_document_start;
                break;

            case parse_state::directive_or_document_start:
            {
                stream::skip_document_prefix(cur);
                bool pending = !directives_.empty() || st_.version_declared;

                if (cur.at_end())
                {
                    if (pending)
                        cur.fail(scan_error_kind::malformed_directive, "directives must be followed by a document");
                    state_ = parse_state::stream_end;
                }
                else if (structure::directive_at(cur))
                {
                    if (auto d = stream::parse_directive(st_))
                        directives_.push_back(std::move(*d));
                }
                else if (structure::at_document_start(cur))
                {
                    state_ = parse_state::document_start;
                }
                else if (structure::at_document_end(cur))
                {
                    if (pending)
                        cur.fail(scan_error_kind::malformed_directive, "directives must be followed by '---'");
                    cur.advance(3);
                    structure::finish_line(cur);
                }
                else
                {
                    if (pending)
                        cur.fail(scan_error_kind::malformed_directive, "directives must be followed by '---'");
                    begin_document(false);
                }
                break;
            }

            case parse_state::document_start:
                cur.advance(3);   // "---"
                begin_document(true);
                break;

            case parse_state::document_content:
                root_ = blocks_.parse_document_root(explicit_start_);
                check_after_root();
                break;

            case parse_state::document_end:
                cur.advance(3);   // "..."
                structure::finish_line(cur);
                finish_document(true);
                state_ = parse_state::directive_or_document_start;
                break;

            case parse_state::stream_end:
                break;
        }
    }

//------------------------------------------------------------------------

    inline void state_machine::begin_document(bool explicit_start)
    {
        explicit_start_ = explicit_start;
        state_ = parse_state::document_content;
    }

//------------------------------------------------------------------------

    // The root node has been read; only a marker or the end of the stream
    // may follow.
    inline void state_machine::check_after_root()
    {
        auto & cur = st_.cur;

        if (cur.at_end())
        {
            finish_document(false);
            state_ = parse_state::stream_end;
        }
        else if (structure::at_document_end(cur))
        {
            state_ = parse_state::document_end;
        }
        else if (structure::at_document_start(cur))
        {
            finish_document(false);
            state_ = parse_state::document_start;
        }
        else if (structure::directive_at(cur))
        {
            cur.fail(scan_error_kind::directive_after_content,
                     "directive found after document content; end the document with '...' first");
        }
        else
        {
            cur.advance(structure::count_spaces(cur));
            cur.fail(scan_error_kind::unexpected_content, "unexpected content after the document's root node");
        }
    }

//------------------------------------------------------------------------

    inline void state_machine::finish_document(bool explicit_end)
    {
        auto & b = st_.builder;
        b.set_root(root_);
        b.set_version(st_.version);
        b.set_tags(st_.tags);
        b.set_directives(std::move(directives_));
        b.set_explicit_start(explicit_start_);
        b.set_explicit_end(explicit_end);
        documents_.push_back(b.finish());

        // per-document scope
        directives_.clear();
        st_.tags.reset();
        st_.anchors.clear();
        st_.version = version_directive{};
        st_.version_declared = false;
        root_ = invalid_id<node_tag>();
        explicit_start_ = false;
    }

//========================================================================
// Entry point
//========================================================================

    namespace detail
    {
        inline source_location locate_offset(std::u32string_view text, size_t byte_offset)
        {
            source_location loc{ 1, 1, byte_offset };
            for (char32_t c : text)
            {
                if (c == U'\n')
                {
                    ++loc.line;
                    loc.column = 1;
                }
                else
                {
                    ++loc.column;
                }
            }
            return loc;
        }
    }

    inline parse_context parse(std::string_view bytes, parser_options const & options)
    {
        parse_context ctx;

        auto decoded = decode_stream(bytes);
        if (!decoded.ok())
        {
            ctx.errors.push_back({ scan_error_kind::invalid_encoding,
                                   detail::locate_offset(decoded.text, *decoded.bad_offset),
                                   "input is not valid in its detected encoding" });
            return ctx;
        }

        // The stream may only hold printable characters.
        std::u32string_view text = decoded.text;
        auto bad = std::find_if(text.begin(), text.end(),
                                [](char32_t c) { return !chars::is_printable(c) && !chars::is_bom(c); });
        if (bad != text.end())
        {
            size_t index = static_cast<size_t>(bad - text.begin());
            size_t offset = 0;
            for (size_t i = 0; i < index; ++i)
                offset += chars::utf8_length(text[i]);

            ctx.errors.push_back({ scan_error_kind::unexpected_character,
                                   detail::locate_offset(text.substr(0, index), offset),
                                   "input contains a non-printable character" });
            return ctx;
        }

        state_machine machine(std::move(decoded.text), options);
        try
        {
            ctx.result = machine.run();
        }
        catch (detail::scan_failure const & e)
        {
            ctx.result.clear();
            ctx.errors.push_back(e.err);
        }

        ctx.warnings = std::move(machine.warnings());
        return ctx;
    }

} // namespace yml

#endif // YML_PARSER_HPP
