#include <iostream>
#include <string>
#include <vector>

#include "SeqcdcCli.h"

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv, argv + argc);
    return SeqCDC::runCli(args, std::cout, std::cerr);
}
