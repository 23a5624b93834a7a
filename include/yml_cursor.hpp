// yml_cursor.hpp - yml YAML 1.2 grammar engine - Input Cursor
// Version 0.3.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef YML_CURSOR_HPP
#define YML_CURSOR_HPP

#include "yml_chars.hpp"

#include <algorithm>

namespace yml
{
//========================================================================
// cursor
//
// The only way productions touch the input: peek(k) never consumes,
// advance() always does. There is no rewind.
//========================================================================

    class cursor
    {
    public:
        explicit cursor(std::u32string text)
            : text_(std::move(text))
        {}

        char32_t peek(size_t k = 0) const noexcept
        {
            return pos_ + k < text_.size() ? text_[pos_ + k] : end_of_input;
        }

        bool at_end() const noexcept
        {
            return pos_ >= text_.size();
        }

        std::u32string_view remaining() const noexcept
        {
            return std::u32string_view(text_).substr(std::min(pos_, text_.size()));
        }

        size_t line() const noexcept { return line_; }
        size_t column() const noexcept { return column_; }
        size_t index() const noexcept { return pos_; }

        bool at_line_start() const noexcept { return column_ == 0; }

        source_location location() const noexcept
        {
            return { line_, column_ + 1, offset_ };
        }

        char32_t advance() noexcept
        {
            if (at_end())
                return end_of_input;

            char32_t c = text_[pos_++];
            offset_ += chars::utf8_length(c);

            bool ends_line = c == U'\n' || c == 0x85 || (c == U'\r' && peek() != U'\n');
            if (ends_line)
            {
                ++line_;
                column_ = 0;
            }
            else if (!(chars::is_bom(c) && column_ == 0))
            {
                // a byte order mark in front of a line does not indent it
                ++column_;
            }
            return c;
        }

        void advance(size_t n) noexcept
        {
            while (n-- > 0 && !at_end())
                advance();
        }

        // Length of the line break at lookahead offset k, 0 if there is none.
        size_t break_length(size_t k = 0) const noexcept
        {
            char32_t c = peek(k);
            if (c == U'\r' && peek(k + 1) == U'\n')
                return 2;
            return chars::is_break(c) ? 1 : 0;
        }

        // Consumes one line break (CR LF counts as one).
        bool consume_break() noexcept
        {
            size_t len = break_length();
            if (len == 0)
                return false;
            advance(len);
            return true;
        }

        [[noreturn]] void fail(scan_error_kind kind, std::string message) const
        {
            throw detail::scan_failure({ kind, location(), std::move(message) });
        }

        [[noreturn]] void fail_at(source_location loc, scan_error_kind kind, std::string message) const
        {
            throw detail::scan_failure({ kind, loc, std::move(message) });
        }

    private:
        std::u32string text_;
        size_t pos_    {0};
        size_t line_   {1};
        size_t column_ {0};
        size_t offset_ {0};
    };

} // namespace yml

#endif // YML_CURSOR_HPP
