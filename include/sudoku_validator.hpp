// sudoku_validator.hpp - Sudoku grid checker - Placement rule validation
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef SUDOKU_VALIDATOR_HPP
#define SUDOKU_VALIDATOR_HPP

#include "sudoku_core.hpp"

#include <utility>
#include <variant>

namespace sudoku
{
//========================================================================
// Rule groups
//========================================================================

    enum class group_kind
    {
        row,
        column,
        box
    };

    struct rule_group
    {
        group_kind kind;
        size_t     index {0};

        bool operator==(rule_group const &) const = default;
    };

//========================================================================
// Validation errors
//========================================================================

    enum class validation_error_kind
    {
        duplication,  // a digit repeated inside one rule group
        blank_cell,   // a 0 cell under blank_policy::reject
    };

    struct validation_error
    {
        validation_error_kind kind;
        rule_group            group;
        digit                 value {0};
        cell_list             cells;

        bool operator==(validation_error const &) const = default;
    };

    using validation_context = context<grid, validation_error>;

    enum class blank_policy
    {
        ignore,  // 0 marks an unfilled cell and is skipped
        reject   // every 0 cell is reported as blank_cell
    };

    struct validator_options
    {
        blank_policy blanks = blank_policy::ignore;
    };

    // Facade
    validation_context validate(grid && g, validator_options opts = {});

    std::string to_string(group_kind kind);
    std::string to_string(rule_group group);
    std::string to_string(validation_error const & err);

//========================================================================
// Slot tracking
//========================================================================

    // What has been seen of one digit inside one rule group. Transitions
    // only ever go unknown -> present -> corrupted.
    namespace slot_state
    {
        struct unknown {};
        struct present { cell at; };
        struct corrupted { cell_list cells; };
    }

    using slot = std::variant<slot_state::unknown, slot_state::present, slot_state::corrupted>;

    // [group index][digit - 1]
    using slot_table = std::array<std::array<slot, grid_size>, grid_size>;

    inline void indicate(slot & s, cell c)
    {
        if (std::holds_alternative<slot_state::unknown>(s))
        {
            s = slot_state::present{ c };
        }
        else if (auto const * p = std::get_if<slot_state::present>(&s))
        {
            cell first = p->at;
            s = slot_state::corrupted{ { first, c } };
        }
        else
        {
            std::get<slot_state::corrupted>(s).cells.push_back(c);
        }
    }

//========================================================================
// validator
//========================================================================

    class validator
    {
    public:
        validator(grid && g, validator_options opts);

        validation_context run();

    private:
        grid              grid_;
        validator_options opts_;

        slot_table rows_seen_    {};
        slot_table columns_seen_ {};
        slot_table boxes_seen_   {};

        std::vector<validation_error> errors_;

        void record_cells();
        void collect(slot_table const & seen, group_kind kind);
        void collect_blanks();
    };

//========================================================================
// Implementation
//========================================================================

    inline validator::validator(grid && g, validator_options opts)
        : grid_(std::move(g))
        , opts_(opts)
    {
    }

//---------------------------------------------------------------------------

    // All 81 cells are visited once to fill the three tables, and the 243
    // slots are then scanned, so every violation is reported in one call.
    inline validation_context validator::run()
    {
        record_cells();

        collect(rows_seen_,    group_kind::row);
        collect(columns_seen_, group_kind::column);
        collect(boxes_seen_,   group_kind::box);

        if (opts_.blanks == blank_policy::reject)
            collect_blanks();

        validation_context out;
        if (errors_.empty())
            out.result = std::move(grid_);
        else
            out.errors = std::move(errors_);
        return out;
    }

//---------------------------------------------------------------------------

    inline void validator::record_cells()
    {
        auto const & rows = grid_.rows();

        for (size_t i = 0; i < grid_size; ++i)
        {
            for (size_t j = 0; j < grid_size; ++j)
            {
                digit v = rows[i][j];
                if (v == blank)
                    continue;

                size_t slot_index = static_cast<size_t>(v) - 1;
                cell   c { i, j };

                indicate(rows_seen_[i][slot_index], c);
                indicate(columns_seen_[j][slot_index], c);
                indicate(boxes_seen_[detail::box_index(i, j)][slot_index], c);
            }
        }
    }

//---------------------------------------------------------------------------

    inline void validator::collect(slot_table const & seen, group_kind kind)
    {
        for (size_t group = 0; group < grid_size; ++group)
        {
            for (size_t value = 0; value < grid_size; ++value)
            {
                auto const * bad = std::get_if<slot_state::corrupted>(&seen[group][value]);
                if (!bad)
                    continue;

                errors_.push_back({
                    validation_error_kind::duplication,
                    { kind, group },
                    static_cast<digit>(value + 1),
                    bad->cells
                });
            }
        }
    }

//---------------------------------------------------------------------------

    inline void validator::collect_blanks()
    {
        auto const & rows = grid_.rows();

        for (size_t i = 0; i < grid_size; ++i)
            for (size_t j = 0; j < grid_size; ++j)
                if (rows[i][j] == blank)
                    errors_.push_back({
                        validation_error_kind::blank_cell,
                        { group_kind::row, i },
                        blank,
                        { cell{ i, j } }
                    });
    }

//========================================================================
// Facade and diagnostics
//========================================================================

    inline validation_context validate(grid && g, validator_options opts)
    {
        validator v(std::move(g), opts);
        return v.run();
    }

    inline std::string to_string(group_kind kind)
    {
        switch (kind)
        {
            case group_kind::row:    return "row";
            case group_kind::column: return "column";
            case group_kind::box:    return "box";
        }
        return "group";
    }

    inline std::string to_string(rule_group group)
    {
        return to_string(group.kind) + " " + std::to_string(group.index);
    }

    inline std::string to_string(validation_error const & err)
    {
        std::string cells;
        for (auto const & c : err.cells)
            cells += " " + detail::cell_to_string(c);

        switch (err.kind)
        {
            case validation_error_kind::duplication:
                return to_string(err.group) + ": digit " + std::to_string(err.value)
                     + " repeated at" + cells;

            case validation_error_kind::blank_cell:
                return to_string(err.group) + ": blank cell at" + cells;
        }
        return to_string(err.group) + ":" + cells;
    }

} // namespace sudoku

#endif // SUDOKU_VALIDATOR_HPP
