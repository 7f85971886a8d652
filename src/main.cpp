#include "Folio/CliParser.hpp"
#include "Folio/Core.hpp"
#include <iostream>

int main(int argc, char** argv) {
    // CliParser is responsible for defining and parsing all command-line
    // arguments using the CLI11 library.
    Folio::CliParser parser;
    auto app = parser.setupCli();

    // CLI11's exit exceptions (--help, --version, bad arguments) are turned
    // into the library's own exit codes.
    try {
        app->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app->exit(e);
    } catch (const std::exception& e) {
        std::cerr << "An unexpected error occurred: " << e.what() << std::endl;
        return 1;
    }

    // Core layers defaults, configuration file and command line, then runs
    // the aggregation and maps failures to exit codes.
    Folio::Core core(parser.getCommands());

    try {
        return core.run();
    } catch (const std::exception& e) {
        std::cerr << "Error during execution: " << e.what() << std::endl;
        return static_cast<int>(Folio::ExitCode::Failure);
    }
}
