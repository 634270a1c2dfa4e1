// File: src/cli/main.cpp
//
// Entry point for the mmq command-line tool

#include "cli/mmq_cli.hpp"
#include <exception>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    try {
        mmq::MmqCli cli(std::cout, std::cerr);
        return cli.Run(args, std::cin);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 2;
    }
}
