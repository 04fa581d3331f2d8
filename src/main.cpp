#include <iostream>

#include "chatbench/app.hpp"

int main(int argc, char** argv) { return chatbench::run_cli(argc, argv, std::cin, std::cout, std::cerr); }
