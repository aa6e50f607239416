#ifndef SUDOKU_TESTS_CORE__
#define SUDOKU_TESTS_CORE__

#include "sudoku_test_harness.hpp"
#include "../include/sudoku_core.hpp"

#include <iterator>

namespace sudoku::tests
{

static bool grid_rejects_values_above_nine()
{
    grid_rows rows {};
    rows[4][7] = 10;
    EXPECT(!grid::from_rows(rows).has_value(), "out of range digit accepted");

    rows[4][7] = 9;
    EXPECT(grid::from_rows(rows).has_value(), "nine rejected");
    return true;
}

static bool grid_access_is_bounds_checked()
{
    grid_rows rows {};
    rows[2][5] = 6;
    auto g = *grid::from_rows(rows);

    EXPECT(g.at(2, 5) == 6, "wrong cell read");
    EXPECT(g.row(2)[5] == 6, "wrong row view");

    bool threw = false;
    try { (void)g.at(9, 0); }
    catch (std::out_of_range const &) { threw = true; }
    EXPECT(threw, "row 9 accessible");

    threw = false;
    try { (void)g.row(9); }
    catch (std::out_of_range const &) { threw = true; }
    EXPECT(threw, "row view 9 accessible");
    return true;
}

static bool grid_counts_blanks()
{
    grid_rows rows {};
    auto empty = *grid::from_rows(rows);
    EXPECT(empty.blank_count() == cell_count, "empty grid blank count");
    EXPECT(!empty.is_complete(), "empty grid complete");

    for (auto & r : rows)
        r.fill(1);
    auto full = *grid::from_rows(rows);
    EXPECT(full.blank_count() == 0, "full grid blank count");
    EXPECT(full.is_complete(), "full grid incomplete");
    EXPECT(!(full == empty), "different grids compare equal");
    return true;
}

static bool cell_list_is_bounded()
{
    cell_list cells;
    EXPECT(cells.empty(), "new list not empty");

    for (size_t i = 0; i < grid_size; ++i)
        cells.push_back({ i, 0 });
    EXPECT(cells.size() == grid_size, "wrong size");

    bool threw = false;
    try { cells.push_back({ 0, 1 }); }
    catch (std::length_error const &) { threw = true; }
    EXPECT(threw, "capacity exceeded silently");
    EXPECT(cells.size() == grid_size, "size changed on overflow");
    return true;
}

static bool cell_list_compares_live_entries_only()
{
    cell_list a = { {1, 2}, {3, 4} };
    cell_list b = { {1, 2}, {3, 4} };
    cell_list c = { {1, 2} };

    EXPECT(a == b, "equal lists differ");
    EXPECT(!(a == c), "prefix compares equal");
    EXPECT(std::distance(a.begin(), a.end()) == 2, "iteration past live entries");
    return true;
}

static bool box_index_tiles_grid()
{
    EXPECT(detail::box_index(0, 0) == 0, "top left");
    EXPECT(detail::box_index(2, 8) == 2, "top right");
    EXPECT(detail::box_index(4, 4) == 4, "centre");
    EXPECT(detail::box_index(6, 2) == 6, "bottom left");
    EXPECT(detail::box_index(8, 8) == 8, "bottom right");
    return true;
}

//----------------------------------------------------------------------------

inline void run_core_tests()
{
    SUBCAT("Grid");
    RUN_TEST(grid_rejects_values_above_nine);
    RUN_TEST(grid_access_is_bounds_checked);
    RUN_TEST(grid_counts_blanks);

    SUBCAT("Cells");
    RUN_TEST(cell_list_is_bounded);
    RUN_TEST(cell_list_compares_live_entries_only);
    RUN_TEST(box_index_tiles_grid);
}

} // ns sudoku::tests

#endif
