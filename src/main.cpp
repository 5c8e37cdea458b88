#include "app/Application.hpp"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv)
{
    std::vector<std::string> args(argv + 1, argv + argc);
    return Application{ std::move(args), std::cin, std::cout, std::cerr }.run();
}
