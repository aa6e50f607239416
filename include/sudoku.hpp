// sudoku.hpp - Sudoku grid checker
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

//========================================================================
// Pipeline:
//========================================================================
//
// Parsing
// -------
// Text becomes a 9x9 grid or a single structural error. The first bad
// symbol, row length or row count ends the parse.
//
//
// Validation
// ----------
// A parsed grid is checked against the placement rules of every row,
// column and 3x3 box. All duplicates are collected, none is more fatal
// than another, and a clean grid is handed back unchanged.
//
//========================================================================


#ifndef SUDOKU_GRID_CHECKER
#define SUDOKU_GRID_CHECKER

#include "sudoku_core.hpp"
#include "sudoku_parser.hpp"
#include "sudoku_validator.hpp"
#include "sudoku_serializer.hpp"

namespace sudoku
{
//========================================================================
// Combined check errors
//========================================================================

    using any_error = std::variant<parse_error, validation_error>;

    using check_context = context<grid, any_error>;
    check_context check(std::string_view text, validator_options opt = {});

    inline bool is_parse_error(any_error const & e) { return std::holds_alternative<parse_error>(e); }
    inline bool is_validation_error(any_error const & e) { return std::holds_alternative<validation_error>(e); }

    inline parse_error const & get_parse_error(any_error const & e) { return std::get<parse_error>(e); }
    inline validation_error const & get_validation_error(any_error const & e) { return std::get<validation_error>(e); }

    inline std::string to_string(any_error const & e)
    {
        if (is_parse_error(e))
            return "parse error: " + to_string(get_parse_error(e));
        return "rule violation: " + to_string(get_validation_error(e));
    }


    inline check_context check(std::string_view text, validator_options opt)
    {
        check_context out{};

        auto parse_ctx = parse(text);
        if (!parse_ctx)
        {
            out.errors.reserve(parse_ctx.errors.size());
            for (auto const & pe : parse_ctx.errors)
                out.errors.push_back(pe);
            return out;
        }

        auto val_ctx = validate(std::move(*parse_ctx.result), opt);
        if (val_ctx)
        {
            out.result = std::move(val_ctx.result);
            return out;
        }

        out.errors.reserve(val_ctx.errors.size());
        for (auto const & ve : val_ctx.errors)
            out.errors.push_back(ve);

        return out;
    }

}

#endif
