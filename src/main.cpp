#include "filefuse/cli.h"

#include <iostream>

int main(int argc, char **argv) {
    return filefuse::runCli(argc, argv, std::cout, std::cerr);
}
