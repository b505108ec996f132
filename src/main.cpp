// src/main.cpp - skybricks-cli entry point

#include "cli/cli_app.hpp"

#include <iostream>

int main(int argc, char** argv)
{
    return skybricks::cli::run(argc, argv, std::cout, std::cerr);
}
