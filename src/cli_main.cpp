#include "CliGame.hpp"
#include "Dictionary.hpp"
#include "Engine.hpp"
#include "Log.hpp"
#include "WordList.hpp"
#include <cstdlib>
#include <iostream>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>

namespace {
    void usage(const char* argv0) {
        std::cout << "usage: " << argv0
                  << " [--dict <path>] [--seed <n>] [--random] [--show-path] [--no-errors] [--verbose]\n";
    }
}

int main(int argc, char* argv[]) {
    std::string dictPath = "assets/words.txt";
    uint64_t seed = std::random_device{}();
    EngineConfig cfg;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--dict" && i + 1 < argc) {
            dictPath = argv[++i];
        } else if (arg == "--seed" && i + 1 < argc) {
            seed = std::strtoull(argv[++i], nullptr, 10);
        } else if (arg == "--random") {
            cfg.randomWords = true;
        } else if (arg == "--show-path") {
            cfg.showPath = true;
        } else if (arg == "--no-errors") {
            cfg.showErrorMessages = false;
        } else if (arg == "--verbose") {
            Log::setMinLevel(LogLevel::Debug);
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else {
            usage(argv[0]);
            return 2;
        }
    }

    try {
        auto dict = std::make_shared<const Dictionary>(WordList::load(dictPath, cfg.wordLength), cfg.wordLength);
        Engine engine(dict, cfg, makeRandomSource(seed));
        CliGame cli(engine, std::cin, std::cout);
        return cli.run();
    } catch (const std::invalid_argument& e) {
        Log::error("cli", e.what());
        return 1;
    }
}
