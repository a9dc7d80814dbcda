#pragma once

#include <iosfwd>
#include <string>
#include <vector>

namespace SeqCDC {

    constexpr int EXIT_OK = 0;
    constexpr int EXIT_RUNTIME_ERROR = 1;
    constexpr int EXIT_USAGE = 2;

    /**
     * @brief Run the seqcdc command line.
     *
     * args[0] is the program name. Reports go to out, diagnostics to err.
     * @return EXIT_OK, EXIT_RUNTIME_ERROR on a configuration or I/O
     *         failure, EXIT_USAGE on bad arguments.
     */
    int runCli(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

}
