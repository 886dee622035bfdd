// main.cpp
#include <iostream>
#include <string>
#include <vector>

#include "combine_app.hpp"

int main(int argc, char *argv[])
{
    std::vector<std::string> args(argv, argv + argc);
    return ChunkCombiner::runCombine(args, std::cin, std::cout, std::cerr);
}
