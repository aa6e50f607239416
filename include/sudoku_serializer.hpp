// sudoku_serializer.hpp - Sudoku grid checker - Serializer
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef SUDOKU_SERIALIZER_HPP
#define SUDOKU_SERIALIZER_HPP

#include "sudoku_core.hpp"

#include <ostream>
#include <sstream>

namespace sudoku
{
    enum class serializer_style
    {
        display,  // digits separated by single spaces
        compact   // the parser's input format; parse() reads it back to an equal grid
    };

    struct serializer_options
    {
        serializer_style style = serializer_style::display;
    };

    class serializer
    {
    public:
        explicit serializer(grid const & g, serializer_options opts = {})
            : grid_(g)
            , opts_(opts)
        {
        }

        void write(std::ostream & out) const
        {
            for (auto const & row : grid_.rows())
            {
                for (size_t col = 0; col < row.size(); ++col)
                {
                    if (col > 0 && opts_.style == serializer_style::display)
                        out << ' ';
                    out << static_cast<char>('0' + row[col]);
                }
                out << '\n';
            }
        }

        std::string str() const
        {
            std::ostringstream out;
            write(out);
            return out.str();
        }

    private:
        grid const &       grid_;
        serializer_options opts_;
    };

    inline std::ostream & operator<<(std::ostream & out, grid const & g)
    {
        serializer(g).write(out);
        return out;
    }

} // namespace sudoku

#endif // SUDOKU_SERIALIZER_HPP
