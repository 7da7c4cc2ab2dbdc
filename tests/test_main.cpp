#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include "tacto_tests.hpp"

// Default values
std::string TestOptions::log_level = "warn";

int main(int argc, char* argv[]) {
    Catch::Session session;  // There must be exactly one instance

    // Build a new parser on top of Catch's
    using namespace Catch::clara;
    auto cli = session.cli()  // Get Catch's composite command line parser
               | Opt(TestOptions::log_level, "level")["--log-level"](
                     "spdlog level (trace, debug, info, warn, ...)");

    // Now pass the new composite back to Catch so it uses that
    session.cli(cli);

    // Let Catch (using Clara) parse the command line
    int returnCode = session.applyCommandLine(argc, argv);
    if (returnCode != 0)  // Indicates a command line error
        return returnCode;

    spdlog::set_level(spdlog::level::from_str(TestOptions::log_level));

    return session.run();
}
