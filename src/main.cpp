#include <iostream>
#include "cli.hpp"

int main(int argc, char** argv) {
    return vecanalogy::RunCommandLine(argc, argv, std::cout, std::cerr);
}
