#include "app/Cli.h"
#include "common/Logger.h"

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace quantscan;

int main(int argc, char* argv[]) {
    app::CliOptions opts;
    const std::vector<std::string> args(argv + 1, argv + argc);
    if (!app::parseArgs(args, opts, std::cerr)) {
        app::printUsage(std::cout);
        return 2;
    }

    try {
        Logger::getInstance().initialize("logs");
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return app::run(opts, std::cout);
}
