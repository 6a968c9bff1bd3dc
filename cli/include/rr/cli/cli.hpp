#pragma once

#include <string>
#include <vector>

namespace rr::cli {

    /**
     * @brief Runs the command line interface
     * @param args Arguments without the executable name, args[0] is the subcommand
     * @return Process exit code
     */
    int executeCommandLineInterface(std::vector<std::string> args);

}
