// sudoku_example.cpp - Sudoku grid checker - Example driver
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#include "include/sudoku.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

// Example puzzles
const char* solved_puzzle =
    "534678912\n"
    "672195348\n"
    "198342567\n"
    "859761423\n"
    "426853791\n"
    "713924856\n"
    "961537284\n"
    "287419635\n"
    "345286179\n";

// Same puzzle with a second 7 in the last row
const char* broken_puzzle =
    "534678912\n"
    "672195348\n"
    "198342567\n"
    "859761423\n"
    "426853791\n"
    "713924856\n"
    "961537284\n"
    "287419635\n"
    "345286177\n";

const char* malformed_puzzle =
    "534678912\n"
    "6721953480\n";

const char* partial_puzzle =
    "530070000\n"
    "600195000\n"
    "098000060\n"
    "800060003\n"
    "400803001\n"
    "700020006\n"
    "060000280\n"
    "000419005\n"
    "000080079\n";

namespace
{
    void print_header(std::string_view title)
    {
        std::cout << "\n" << std::string(50, '=') << "\n";
        std::cout << title << "\n";
        std::cout << std::string(50, '=') << "\n\n";
    }

    // Returns true when the input is a valid grid.
    bool report(std::string_view text, sudoku::validator_options opts)
    {
        auto ctx = sudoku::check(text, opts);

        if (ctx)
        {
            std::cout << "✓ Valid grid";
            if (!ctx.result->is_complete())
                std::cout << " (" << ctx.result->blank_count() << " blank cells)";
            std::cout << "\n\n" << *ctx.result;
            return true;
        }

        std::cout << "✗ " << ctx.errors.size() << (ctx.errors.size() == 1 ? " error" : " errors") << ":\n";
        for (auto const & err : ctx.errors)
            std::cout << "  " << sudoku::to_string(err) << "\n";
        return false;
    }

    int run_showcase()
    {
        print_header("Solved puzzle");
        report(solved_puzzle, {});

        print_header("Partially filled puzzle");
        report(partial_puzzle, {});

        print_header("Partially filled puzzle, blanks rejected");
        report(partial_puzzle, { .blanks = sudoku::blank_policy::reject });

        print_header("Puzzle with a repeated digit");
        report(broken_puzzle, {});

        print_header("Malformed input");
        report(malformed_puzzle, {});

        return 0;
    }

    bool read_file(std::string const & path, std::string & out)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
            return false;

        std::ostringstream ss;
        ss << file.rdbuf();
        out = ss.str();
        return !file.bad();
    }
}

int main(int argc, char** argv)
{
    sudoku::validator_options opts;
    std::vector<std::string> paths;

    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg = argv[i];
        if (arg == "--strict")
            opts.blanks = sudoku::blank_policy::reject;
        else if (arg.starts_with("--"))
        {
            std::cerr << "usage: " << argv[0] << " [--strict] [FILE...]\n";
            return 2;
        }
        else
            paths.emplace_back(arg);
    }

    if (paths.empty())
        return run_showcase();

    bool all_valid = true;
    for (auto const & path : paths)
    {
        std::string text;
        if (!read_file(path, text))
        {
            std::cerr << "Could not read " << path << "\n";
            return 2;
        }

        print_header(path);
        all_valid = report(text, opts) && all_valid;
    }

    return all_valid ? 0 : 1;
}
