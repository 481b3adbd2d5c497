#include <iostream>
#include <string>
#include <vector>

#include "optbind/optbind.hpp"

struct GrepConfig {
    bool ignore_case = false;
    long max_count = 10;
    double threshold = 0.5;
    std::string color;
    std::vector<std::string> tag;
};

int main(int argc, char** argv) {
    GrepConfig cfg;
    optbind::Options opts;
    opts.holder("GrepConfig")
        .add(cfg.ignore_case, optbind::option("ignore_case", "Ignore case distinctions").shortName('i'))
        .add(cfg.max_count, optbind::option("max_count", "Stop after this many matches").shortName('m').alias("--maxcount"))
        .add(cfg.threshold, optbind::option("threshold", "Minimum match score"))
        .add(cfg.color, optbind::option("color", "Highlight color"))
        .add(cfg.tag, optbind::option("tag", "Tag to attach; may be repeated"));

    const auto result = opts.parse(argc, argv);
    if (!result.ok()) {
        std::cerr << "Error: " << result.error() << "\n\n";
        opts.printUsage(std::cerr);
        return 1;
    }

    std::cout << opts.settings();
    for (const auto& arg : result.arguments()) std::cout << "arg: " << arg << "\n";
    return 0;
}
