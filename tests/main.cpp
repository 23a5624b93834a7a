#include "yml_test_harness.hpp"
#include "yml_chars_tests.hpp"
#include "yml_context_tests.hpp"
#include "yml_structure_tests.hpp"
#include "yml_block_tests.hpp"
#include "yml_flow_tests.hpp"
#include "yml_stream_tests.hpp"
#include "yml_parser_tests.hpp"

#include <cstring>
#include <iostream>

namespace yml::tests 
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
    using namespace yml::tests;

    #ifdef YML_TESTS_CHARS__ 
        run_tests("Character classifier", run_chars_tests); 
    #endif

    #ifdef YML_TESTS_CONTEXT__ 
        run_tests("Parametric context", run_context_tests);
    #endif

    #ifdef YML_TESTS_STRUCTURE__ 
        run_tests("Structural layer", run_structure_tests);
    #endif

    #ifdef YML_TESTS_BLOCK__ 
        run_tests("Block style", run_block_tests);
    #endif

    #ifdef YML_TESTS_FLOW__ 
        run_tests("Flow style", run_flow_tests);
    #endif

    #ifdef YML_TESTS_STREAM__ 
        run_tests("Document stream", run_stream_tests);
    #endif

    #ifdef YML_TESTS_PARSER__ 
        run_tests("Parser", run_parser_tests);
    #endif

    size_t failed = 0;
    for (auto const & r : results)
        if (!r.passed) ++failed;

    std::cout << '\n' << results.size() - failed << '/' << results.size() << " passed\n";
    return failed == 0 ? 0 : 1;
}
