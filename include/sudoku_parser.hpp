// sudoku_parser.hpp - Sudoku grid checker - Parser
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef SUDOKU_PARSER_HPP
#define SUDOKU_PARSER_HPP

#include "sudoku_core.hpp"

namespace sudoku
{
//========================================================================
// Parse errors
//========================================================================

    enum class parse_error_kind
    {
        wrong_symbol,     // a character that is not a decimal digit
        wrong_row_size,   // a row without exactly 9 digits
        wrong_row_count,  // a grid without exactly 9 rows
    };

    struct parse_error
    {
        parse_error_kind kind;
        size_t           row      {0};  // wrong_symbol, wrong_row_size
        size_t           position {0};  // wrong_symbol, in characters
        char32_t         symbol   {0};  // wrong_symbol
        size_t           length   {0};  // row size or row count

        bool operator==(parse_error const &) const = default;
    };

    using parse_context = context<grid, parse_error>;

//========================================================================
// PARSER API
//========================================================================

    // One row per line, nine digits per row. Parsing stops at the first
    // structural problem, so at most one error is ever reported.
    parse_context parse(std::string_view input);

    std::string to_string(parse_error_kind kind);
    std::string to_string(parse_error const & err);

//========================================================================
// Implementation details
//========================================================================

    namespace detail
    {
        // Decodes one UTF-8 sequence starting at pos and advances pos past
        // it. Malformed input decodes to U+FFFD one byte at a time.
        inline char32_t decode_utf8(std::string_view s, size_t & pos)
        {
            constexpr char32_t replacement = 0xFFFD;

            auto lead = static_cast<unsigned char>(s[pos++]);
            if (lead < 0x80)
                return lead;

            size_t   extra = 0;
            char32_t cp    = 0;

            // C0 and C1 only start overlong forms, F5 and above exceed U+10FFFF
            if (lead == 0xC0 || lead == 0xC1 || lead >= 0xF5)
                return replacement;

            if      ((lead & 0xE0) == 0xC0) { extra = 1; cp = lead & 0x1F; }
            else if ((lead & 0xF0) == 0xE0) { extra = 2; cp = lead & 0x0F; }
            else if ((lead & 0xF8) == 0xF0) { extra = 3; cp = lead & 0x07; }
            else return replacement;

            if (pos + extra > s.size())
                return replacement;

            for (size_t i = 0; i < extra; ++i)
            {
                auto b = static_cast<unsigned char>(s[pos + i]);
                if ((b & 0xC0) != 0x80)
                    return replacement;
                cp = (cp << 6) | (b & 0x3F);
            }

            bool overlong = (extra == 1 && cp < 0x80)
                         || (extra == 2 && cp < 0x800)
                         || (extra == 3 && cp < 0x10000);
            bool surrogate = cp >= 0xD800 && cp <= 0xDFFF;
            if (overlong || surrogate || cp > 0x10FFFF)
                return replacement;

            pos += extra;
            return cp;
        }

        struct parser_impl
        {
            parse_context ctx;

            grid_rows rows {};
            size_t    row_count {0};

            void parse(std::string_view input);
            bool parse_row(std::string_view line, size_t row_no);

            void fail(parse_error err);
        };

//---------------------------------------------------------------------------

        inline void parser_impl::parse(std::string_view input)
        {
            size_t start = 0;

            while (start < input.size())
            {
                size_t end = input.find('\n', start);
                bool   terminated = end != std::string_view::npos;
                if (!terminated)
                    end = input.size();

                std::string_view line = input.substr(start, end - start);
                if (terminated && line.ends_with('\r'))
                    line.remove_suffix(1);

                if (!parse_row(line, row_count))
                    return;

                ++row_count;
                start = end + 1;
            }

            if (row_count != grid_size)
            {
                fail({ .kind = parse_error_kind::wrong_row_count, .length = row_count });
                return;
            }

            ctx.result = grid::from_rows(rows);
        }

//---------------------------------------------------------------------------

        inline bool parser_impl::parse_row(std::string_view line, size_t row_no)
        {
            grid_row decoded {};
            size_t   len = 0;
            size_t   pos = 0;

            while (pos < line.size())
            {
                char32_t c = decode_utf8(line, pos);
                if (c < U'0' || c > U'9')
                {
                    fail({ .kind     = parse_error_kind::wrong_symbol,
                           .row      = row_no,
                           .position = len,
                           .symbol   = c });
                    return false;
                }

                // Digits past the ninth are counted but not stored.
                if (len < grid_size && row_no < grid_size)
                    decoded[len] = static_cast<digit>(c - U'0');
                ++len;
            }

            if (len != grid_size)
            {
                fail({ .kind = parse_error_kind::wrong_row_size, .row = row_no, .length = len });
                return false;
            }

            if (row_no < grid_size)
                rows[row_no] = decoded;
            return true;
        }

//---------------------------------------------------------------------------

        inline void parser_impl::fail(parse_error err)
        {
            ctx.errors.push_back(err);
        }

    } // namespace detail

//========================================================================
// Parser API implementation
//========================================================================

    inline parse_context parse(std::string_view input)
    {
        detail::parser_impl p;
        p.parse(input);
        return std::move(p.ctx);
    }

    inline std::string to_string(parse_error_kind kind)
    {
        switch (kind)
        {
            case parse_error_kind::wrong_symbol:    return "wrong symbol";
            case parse_error_kind::wrong_row_size:  return "wrong row size";
            case parse_error_kind::wrong_row_count: return "wrong row count";
        }
        return "unknown parse error";
    }

    inline std::string to_string(parse_error const & err)
    {
        switch (err.kind)
        {
            case parse_error_kind::wrong_symbol:
                return "row " + std::to_string(err.row) + ", position " + std::to_string(err.position)
                     + ": unrecognised symbol '" + detail::to_utf8(err.symbol) + "'";

            case parse_error_kind::wrong_row_size:
                return "row " + std::to_string(err.row) + ": expected "
                     + std::to_string(grid_size) + " digits, found " + std::to_string(err.length);

            case parse_error_kind::wrong_row_count:
                return "expected " + std::to_string(grid_size) + " rows, found "
                     + std::to_string(err.length);
        }
        return to_string(err.kind);
    }

} // namespace sudoku

#endif // SUDOKU_PARSER_HPP
