#include <map>
#include <string>
#include <cstdlib>

#include <rr/helpers/types.hpp>
#include <wolv/utils/guards.hpp>

#include "test_cases/test_case.hpp"

#include <fmt/format.h>

using namespace rr;
using namespace rr::test;

int runTests(TestCase &test) {
    bool failing = test.getMode() == Mode::Failing;

    bool result = false;
    try {
        result = test.run();
    } catch (const std::exception &e) {
        fmt::print("Exception during test: {}\n", e.what());
    }

    if (!result) {
        fmt::print("Checks failed!\n");

        return failing ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    if (failing) {
        fmt::print("Failing test succeeded!\n");
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

int main(int argc, char **argv) {
    auto &testCases = TestCase::getTests();

    ON_SCOPE_EXIT {
        for (auto &[key, value] : TestCase::getTests())
            delete value;
    };

    // Check if a test to run has been provided
    if (argc != 2) {
        fmt::print("Invalid number of arguments specified! {}\n", argc);
        return EXIT_FAILURE;
    }

    // Check if that test exists
    std::string testName = argv[1];
    if (!testCases.contains(testName)) {
        fmt::print("No test with name {} found!\n", testName);
        return EXIT_FAILURE;
    }

    auto &test = *testCases[testName];

    try {
        test.setup();
    } catch (const std::exception &e) {
        fmt::print("Setting up test {} failed: {}\n", testName, e.what());
        return EXIT_FAILURE;
    }

    int result = EXIT_SUCCESS;

    for (u32 i = 0; i < 16; i++) { // Resolve against the same files several times to check that nothing carries over between runs
        result = runTests(test);
        if (result != EXIT_SUCCESS)
            break;
    }

    if (result == EXIT_SUCCESS)
        fmt::print("Success!\n");
    else
        fmt::print("Failed!\n");

    return result;
}
