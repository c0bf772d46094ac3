// main.cpp
#include "CliOptions.hpp"
#include <cstdlib>
#include <iostream>
#include <unistd.h>

int main(int argc, char** argv) {
    EngineStreams io{std::cin, ::isatty(STDIN_FILENO) != 0, std::cout, std::cerr};
    return run_cli(argc, argv, std::getenv("SECURE_REDACTOR_CONFIG"), io);
}
