#include <iostream>
#include <string>
#include <vector>

#include "../utils/logging.hpp"
#include "../net/HttpClient.hpp"
#include "RecommendCommand.hpp"

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    CommandOptions options;
    std::string error;
    if (!parseCommandLine(args, options, error)) {
        std::cerr << "error: " << error << "\n";
        printUsage(std::cerr);
        return RecommendCommand::kExitUsage;
    }
    if (options.help) {
        printUsage(std::cout);
        return RecommendCommand::kExitOk;
    }

    try {
        Log::init(options.log);
    }
    catch (const spdlog::spdlog_ex& e) {
        std::cerr << "error: cannot open log file: " << e.what() << "\n";
        return RecommendCommand::kExitUsage;
    }

    HttpGlobal curl;

    RecommendCommand command(options);
    return command.run(std::cout, std::cerr);
}
