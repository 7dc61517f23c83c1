#include "cli.hpp"

#include <iostream>

int main(int argc, char* argv[])
{
    return easepath::cli::run(argc, argv, std::cout);
}
