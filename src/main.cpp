#include <iostream>
#include <string>
#include "cli/podtun_cli.hpp"
#include "cli/theme.hpp"

int main(int argc, char** argv) {
    try {
        PodtunCLI cli;
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << theme::fail(std::string("Fatal: ") + e.what());
        return 1;
    }
}
