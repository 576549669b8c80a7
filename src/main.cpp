#include <iostream>
#include <string>
#include <vector>

#include "beach/cli.hpp"

int main(int argc, char* argv[])
{
    std::vector<std::string> args(argv + 1, argv + argc);
    return Beach::Cli::run(args, std::cout);
}
