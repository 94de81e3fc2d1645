#include "main/Config.hh"
#include "main/GameSession.hh"
#include "Logging.hh"

#include <getopt.h>

#include <array>
#include <cstdlib>
#include <iostream>
#include <string>

namespace {

using namespace Coup;
using Main::GameSession;

class CoupApp {
public:

    CoupApp(const std::string& configPath) :
        app {Main::configFromPath(configPath)}
    {
        log(Coup::LogLevel::INFO, "Startup completed");
    }

    ~CoupApp()
    {
        log(Coup::LogLevel::INFO, "Shutting down");
    }

    void run()
    {
        app.run(std::cin, std::cout);
    }

private:

    GameSession app;
};

CoupApp createApp(int argc, char* argv[])
{
    auto configPath = std::string {};

    const auto short_opt = "vf:";
    auto long_opt = std::array {
        option { "config", required_argument, 0, 'f' },
        option { nullptr, 0, 0, 0 },
    };
    auto verbosity = 0;
    auto opt_index = 0;
    while (true) {
        auto c = getopt_long(
            argc, argv, short_opt, long_opt.data(), &opt_index);
        if (c == -1 || c == '?') {
            break;
        } else if (c == 'v') {
            ++verbosity;
        } else if (c == 'f') {
            configPath = optarg;
        } else {
            std::exit(EXIT_FAILURE);
        }
    }

    setupLogging(Coup::getLogLevel(verbosity), std::cerr);

    return CoupApp {configPath};
}

}

int coup_main(int argc, char* argv[])
{
    createApp(argc, argv).run();
    return EXIT_SUCCESS;
}
