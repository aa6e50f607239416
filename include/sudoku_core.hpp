// sudoku_core.hpp - Sudoku grid checker - Core Data Structures
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef SUDOKU_CORE_HPP
#define SUDOKU_CORE_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <compare>
#include <initializer_list>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sudoku
{
//========================================================================
// Dimensions
//========================================================================

    inline constexpr size_t  box_size   = 3;
    inline constexpr size_t  grid_size  = box_size * box_size;
    inline constexpr size_t  cell_count = grid_size * grid_size;
    inline constexpr uint8_t blank      = 0;

    using digit    = uint8_t;
    using grid_row = std::array<digit, grid_size>;
    using grid_rows = std::array<grid_row, grid_size>;

//========================================================================
// Coordinates
//========================================================================

    struct cell
    {
        size_t row {0};
        size_t col {0};

        auto operator<=>(cell const &) const = default;
    };

    // Ordered list of at most grid_size cells, stored inline.
    class cell_list
    {
    public:
        using storage        = std::array<cell, grid_size>;
        using const_iterator = storage::const_iterator;

        cell_list() = default;

        cell_list(std::initializer_list<cell> cells)
        {
            for (auto const & c : cells)
                push_back(c);
        }

        void push_back(cell c)
        {
            if (size_ == cells_.size())
                throw std::length_error("cell_list capacity exceeded");
            cells_[size_++] = c;
        }

        size_t size() const noexcept { return size_; }
        bool   empty() const noexcept { return size_ == 0; }

        cell const & operator[](size_t i) const noexcept { return cells_[i]; }

        const_iterator begin() const noexcept { return cells_.begin(); }
        const_iterator end() const noexcept { return cells_.begin() + static_cast<std::ptrdiff_t>(size_); }

        bool operator==(cell_list const & other) const noexcept
        {
            if (size_ != other.size_)
                return false;
            for (size_t i = 0; i < size_; ++i)
                if (cells_[i] != other.cells_[i])
                    return false;
            return true;
        }

    private:
        storage cells_ {};
        size_t  size_  {0};
    };

//========================================================================
// Grid
//========================================================================

    class grid
    {
    public:
        // Values above 9 are rejected; 0 is a blank cell.
        static std::optional<grid> from_rows(grid_rows const & rows)
        {
            for (auto const & r : rows)
                for (auto v : r)
                    if (v > grid_size)
                        return std::nullopt;
            return grid(rows);
        }

        digit at(size_t row, size_t col) const
        {
            if (row >= grid_size || col >= grid_size)
                throw std::out_of_range("grid cell out of range");
            return rows_[row][col];
        }

        std::span<const digit, grid_size> row(size_t i) const
        {
            if (i >= grid_size)
                throw std::out_of_range("grid row out of range");
            return rows_[i];
        }

        grid_rows const & rows() const noexcept { return rows_; }

        size_t blank_count() const noexcept
        {
            size_t n = 0;
            for (auto const & r : rows_)
                for (auto v : r)
                    if (v == blank) ++n;
            return n;
        }

        bool is_complete() const noexcept { return blank_count() == 0; }

        bool operator==(grid const &) const = default;

    private:
        explicit grid(grid_rows const & rows) : rows_(rows) {}

        grid_rows rows_ {};
    };

//========================================================================
// Stage result context
//========================================================================

    // Every stage either produces a result or reports errors, never both.
    template <typename T, typename Error>
    struct context
    {
        std::optional<T>   result;
        std::vector<Error> errors;

        bool has_errors() const { return !errors.empty(); }
        bool has_value() const { return result.has_value(); }

        explicit operator bool() const { return has_value(); }
    };

//========================================================================
// UTILITY FUNCTIONS
//========================================================================

    namespace detail
    {
        constexpr size_t box_index(size_t row, size_t col)
        {
            return (row / box_size) * box_size + col / box_size;
        }

        inline std::string to_utf8(char32_t cp)
        {
            std::string out;
            if (cp < 0x80)
            {
                out += static_cast<char>(cp);
            }
            else if (cp < 0x800)
            {
                out += static_cast<char>(0xC0 | (cp >> 6));
                out += static_cast<char>(0x80 | (cp & 0x3F));
            }
            else if (cp < 0x10000)
            {
                out += static_cast<char>(0xE0 | (cp >> 12));
                out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
                out += static_cast<char>(0x80 | (cp & 0x3F));
            }
            else
            {
                out += static_cast<char>(0xF0 | (cp >> 18));
                out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
                out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
                out += static_cast<char>(0x80 | (cp & 0x3F));
            }
            return out;
        }

        inline std::string cell_to_string(cell c)
        {
            return "(" + std::to_string(c.row) + "," + std::to_string(c.col) + ")";
        }
    }

} // namespace sudoku

#endif // SUDOKU_CORE_HPP
