#include "sudoku_test_harness.hpp"
#include "sudoku_core_tests.hpp"
#include "sudoku_parser_tests.hpp"
#include "sudoku_validator_tests.hpp"
#include "sudoku_serializer_tests.hpp"
#include "sudoku_integration_tests.hpp"

#include <iostream>

namespace sudoku::tests
{
    std::vector<test_result> results;
    char const * last_error = "";
}

bool first = true;

void run_tests( std::string suite_name, void(*pf_tests)() )
{
    if (!first)
        std::cout << '\n';
    else first = false;

    std::cout << suite_name << '\n';
    std::cout << std::string(suite_name.length(), '=') << '\n';
    pf_tests();
}

int main()
{
    using namespace sudoku::tests;

    #ifdef SUDOKU_TESTS_CORE__
        run_tests("Core data model", run_core_tests);
    #endif

    #ifdef SUDOKU_TESTS_PARSER__
        run_tests("Parser", run_parser_tests);
    #endif

    #ifdef SUDOKU_TESTS_VALIDATOR__
        run_tests("Validator", run_validator_tests);
    #endif

    #ifdef SUDOKU_TESTS_SERIALIZER__
        run_tests("Serialization", run_serializer_tests);
    #endif

    #ifdef SUDOKU_TESTS_COMPREHENSIVE__
        run_tests("Integration", run_integration_tests);
    #endif

    auto failed = static_cast<size_t>(std::count_if(results.begin(), results.end(),
        [](test_result const & r) { return !r.passed; }));

    std::cout << '\n' << (results.size() - failed) << '/' << results.size() << " tests passed\n";
    return failed == 0 ? 0 : 1;
}
