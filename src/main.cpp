#include "cli.hpp"

int main(int argc, char** argv) {
    return runCli(argc, argv);
}
