#include <iostream>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "optbind/optbind.hpp"

// Constructible from a string; throws on malformed input.
class Endpoint {
public:
    explicit Endpoint(const std::string& text) {
        const auto colon = text.rfind(':');
        if (colon == std::string::npos || colon == 0) throw std::invalid_argument("missing host:port");
        host_ = text.substr(0, colon);
        port_ = std::stoi(text.substr(colon + 1));
    }

    friend std::ostream& operator<<(std::ostream& os, const Endpoint& e) { return os << e.host_ << ":" << e.port_; }

private:
    std::string host_;
    int port_{0};
};

struct Level {
    int value{0};
};

std::optional<Level> parseLevel(std::string_view text) {
    if (text == "debug") return Level{0};
    if (text == "info") return Level{1};
    if (text == "warn") return Level{2};
    return std::nullopt;
}

struct ClientConfig {
    std::vector<Endpoint> server;
    std::optional<Level> level;
};

int main(int argc, char** argv) {
    ClientConfig cfg;
    optbind::Options opts;
    opts.registerType<Endpoint>("endpoint").registerType<Level>("level", parseLevel);

    opts.holder("ClientConfig")
        .add(cfg.server, optbind::option("server", "Server to contact").shortName('s'))
        .add(cfg.level, optbind::option("level", "Log level: debug, info or warn"));

    const auto result = opts.parse(argc, argv);
    if (!result.ok()) {
        std::cerr << "Error: " << result.error() << "\n";
        return 1;
    }

    for (const auto& s : cfg.server) std::cout << "server " << s << "\n";
    if (cfg.level) std::cout << "level " << cfg.level->value << "\n";
    return 0;
}
