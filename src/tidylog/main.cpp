#include "tidylog/cli.h"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    std::vector<std::string> arguments(argv, argv + argc);

    return tidy::tidylog::run(arguments, std::cin, std::cerr);
}
