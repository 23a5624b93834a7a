// yml_core.hpp - yml YAML 1.2 grammar engine - Core Data Structures
// Version 0.3.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef YML_CORE_HPP
#define YML_CORE_HPP

#include <string>
#include <string_view>
#include <vector>
#include <variant>
#include <optional>
#include <cstdint>
#include <ostream>
#include <stdexcept>

namespace yml
{
//========================================================================
// IDs
//========================================================================

    inline constexpr size_t npos() { return static_cast<size_t>(-1); }

    template <typename Tag>
    struct id
    {
        size_t val;

        explicit id(size_t v = npos()) : val(v) {}
        operator size_t() const { return val; }
        id & operator= (size_t v) { val = v; return *this; }
        auto operator<=>(id const &) const = default;
        id & operator++() { ++val; return *this; }
        id operator++(int) { id temp = *this; ++val; return temp; }
    };

    template <typename Tag>
    constexpr id<Tag> invalid_id()
    {
        return id<Tag>{ npos() };
    }

    struct node_tag;

    using node_id = id<node_tag>;

//========================================================================
// Source positions and diagnostics
//========================================================================

    struct source_location
    {
        size_t line   = 0;   // 1-based, 0 when unknown
        size_t column = 0;   // 1-based
        size_t offset = 0;   // byte offset into the UTF-8 text
    };

    enum class scan_error_kind
    {
        invalid_encoding,
        invalid_escape,
        invalid_tag,
        invalid_anchor,
        invalid_block_header,
        expected_separation,
        expected_close_delimiter,
        expected_mapping_value,
        unexpected_indentation,
        unexpected_character,
        unexpected_content,
        unterminated_scalar,
        unknown_anchor,
        unknown_tag_handle,
        directive_after_content,
        malformed_directive,
        depth_exceeded,
        unreadable_input,
    // warnings
        duplicate_tag_handle,
        unsupported_version,
        unknown_directive,
        tag_mismatch,
    };

    template <typename Kind>
    struct error
    {
        Kind            kind;
        source_location loc;
        std::string     message;
    };

    using scan_error = error<scan_error_kind>;

    inline bool is_warning(scan_error_kind kind)
    {
        switch (kind)
        {
            case scan_error_kind::duplicate_tag_handle:
            case scan_error_kind::unsupported_version:
            case scan_error_kind::unknown_directive:
            case scan_error_kind::tag_mismatch:
                return true;
            default:
                return false;
        }
    }

    inline std::string_view to_string(scan_error_kind kind)
    {
        switch (kind)
        {
            case scan_error_kind::invalid_encoding:         return "invalid encoding";
            case scan_error_kind::invalid_escape:           return "invalid escape";
            case scan_error_kind::invalid_tag:              return "invalid tag";
            case scan_error_kind::invalid_anchor:           return "invalid anchor";
            case scan_error_kind::invalid_block_header:     return "invalid block scalar header";
            case scan_error_kind::expected_separation:      return "expected separation";
            case scan_error_kind::expected_close_delimiter: return "expected closing delimiter";
            case scan_error_kind::expected_mapping_value:   return "expected mapping value";
            case scan_error_kind::unexpected_indentation:   return "unexpected indentation";
            case scan_error_kind::unexpected_character:     return "unexpected character";
            case scan_error_kind::unexpected_content:       return "unexpected content";
            case scan_error_kind::unterminated_scalar:      return "unterminated scalar";
            case scan_error_kind::unknown_anchor:           return "unknown anchor";
            case scan_error_kind::unknown_tag_handle:       return "unknown tag handle";
            case scan_error_kind::directive_after_content:  return "directive after content";
            case scan_error_kind::malformed_directive:      return "malformed directive";
            case scan_error_kind::depth_exceeded:           return "depth exceeded";
            case scan_error_kind::unreadable_input:         return "unreadable input";
            case scan_error_kind::duplicate_tag_handle:     return "duplicate tag handle";
            case scan_error_kind::unsupported_version:      return "unsupported version";
            case scan_error_kind::unknown_directive:        return "unknown directive";
            case scan_error_kind::tag_mismatch:             return "tag mismatch";
        }
        return "unknown";
    }

    inline std::ostream & operator<<(std::ostream & os, scan_error const & e)
    {
        os << e.loc.line << ':' << e.loc.column << ": "
           << (is_warning(e.kind) ? "warning: " : "error: ")
           << to_string(e.kind) << ": " << e.message;
        return os;
    }

//========================================================================
// Parse configuration
//========================================================================

    enum class schema_kind
    {
        failsafe,   // every scalar is a string
        json,       // JSON-compatible literals only
        core        // YAML 1.2 core schema
    };

    struct parser_options
    {
        schema_kind schema                  = schema_kind::core;
        size_t      max_depth               = 512;
        size_t      max_implicit_key_length = 1024;
    };

//========================================================================
// Document generation context
//========================================================================

    template <typename T, typename Error>
    struct context
    {
        T result;
        std::vector<Error> errors;
        std::vector<Error> warnings;

        bool has_errors() const { return !errors.empty(); }
        bool has_warnings() const { return !warnings.empty(); }
    };

//========================================================================
// UTILITY FUNCTIONS
//========================================================================

    namespace detail
    {
        constexpr std::string_view CORE_TAG_PREFIX = "tag:yaml.org,2002:";

        // Thrown inside the grammar engine; never escapes parse().
        struct scan_failure : std::runtime_error
        {
            scan_error err;

            explicit scan_failure(scan_error e)
                : std::runtime_error(e.message)
                , err(std::move(e))
            {}
        };
    }

} // namespace yml

#endif // YML_CORE_HPP
