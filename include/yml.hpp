// yml.hpp - yml YAML 1.2 grammar engine
// Version 0.3.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

//========================================================================
// yml Core Principles:
//========================================================================
//
// The Grammar-First Principle
// ---------------------------
// Every construct is recognised by the production that defines it.
// Indentation and context are parameters of the grammar, carried
// explicitly, never guessed from surrounding state.
//
//
// The No-Rewind Principle
// -----------------------
// Input is inspected by lookahead before it is consumed.
// Once consumed it is never put back.
//
//
// The Whole-Stream Principle
// --------------------------
// A stream either parses completely or not at all.
// A failure carries exactly one positioned error; warnings never stop
// the parse.
//
//========================================================================


#ifndef YML_YAML_GRAMMAR_ENGINE
#define YML_YAML_GRAMMAR_ENGINE

#include "yml_core.hpp"
#include "yml_document.hpp"
#include "yml_parser.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace yml
{
//========================================================================
// File loading
//========================================================================

    parse_context load_file(std::filesystem::path const & path, parser_options const & options = {});


    inline parse_context load_file(std::filesystem::path const & path, parser_options const & options)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in)
        {
            parse_context out;
            out.errors.push_back({ scan_error_kind::unreadable_input, {},
                                   "cannot open '" + path.string() + "'" });
            return out;
        }

        std::ostringstream buffer;
        buffer << in.rdbuf();
        if (in.bad())
        {
            parse_context out;
            out.errors.push_back({ scan_error_kind::unreadable_input, {},
                                   "failed reading '" + path.string() + "'" });
            return out;
        }

        return parse(buffer.str(), options);
    }

}

#endif
