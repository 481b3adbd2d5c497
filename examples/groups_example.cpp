#include <iostream>
#include <string>

#include "optbind/optbind.hpp"

enum class Mode { Fast, Thorough };

struct ServerConfig {
    std::string host = "localhost";
    int port = 8080;
    Mode mode = Mode::Fast;
    bool debug_dump = false;
    int retries = 3;
};

int main(int argc, char** argv) {
    ServerConfig cfg;
    optbind::Options opts;
    opts.repeatPolicy(optbind::RepeatPolicy::Reject)
        .enumeration<Mode>("mode", {{"FAST", Mode::Fast}, {"THOROUGH", Mode::Thorough}});

    opts.holder("ServerConfig")
        .add(cfg.host, optbind::option("host", "Address to listen on").group("Network"))
        .add(cfg.port, optbind::option("port", "Port to listen on").shortName('p'))
        .add(cfg.mode, optbind::option("mode", "Scheduling mode").group("Tuning"))
        .add(cfg.retries, optbind::option("retries", "Attempts before giving up"))
        .add(cfg.debug_dump, optbind::option("debug_dump", "Dump internal state").group("Debugging", true).unpublicized());

    const auto result = opts.parse(argc, argv);
    if (!result.ok()) {
        std::cerr << "Error: " << result.error() << "\n\n";
        opts.printUsage(std::cerr);
        return 1;
    }

    opts.printUsage(std::cout);
    std::cout << "\n" << opts.settings();
    return 0;
}
