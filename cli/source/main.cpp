#include <rr/cli/cli.hpp>

#include <CLI/CLI.hpp>
#include <CLI/App.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cstdlib>
#include <iostream>

// Available subcommands
namespace rr::cli {

    namespace sub {

        void addResolveSubcommand(CLI::App *app);
        void addInfoSubcommand(CLI::App *app);

    }

    // Run the reference resolver CLI
    // first argument (args[0]) is the subcommand, not the executable name
    int executeCommandLineInterface(std::vector<std::string> args) {
        CLI::App app("Reference Resolver CLI");
        app.require_subcommand();

        // Add subcommands
        sub::addResolveSubcommand(&app);
        sub::addInfoSubcommand(&app);

        // Print help message if no subcommand was provided
        if (args.empty()) {
            fmt::print("{}", app.help());
            return EXIT_FAILURE;
        } else if (args.size() == 1 && (args[0] == "-h" || args[0] == "--help")) {
            fmt::print("{}", app.help());
            return EXIT_FAILURE;
        }

        // Parse command line input
        try {
            std::reverse(args.begin(), args.end()); // wanted by CLI11
            app.parse(args);
        } catch(const CLI::ParseError &e) {
            return app.exit(e, std::cout, std::cout);
        }

        return EXIT_SUCCESS;
    }

}

#if defined (LIBRR_CLI_AS_EXECUTABLE)
    int main(int argc, char** argv) {
        std::vector<std::string> args;
        for (int i = 1; i < argc; i++) {
            args.push_back(argv[i]);
        }

        return rr::cli::executeCommandLineInterface(args);
    }
#endif
