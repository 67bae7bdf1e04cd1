#include <functional>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "boc_valet.hpp"
#include "cli_args.hpp"
#include "valet_config.hpp"

struct Defer {
    std::function<void()> f;
    explicit Defer(std::function<void()> f)
        : f(std::move(f)) {}
    ~Defer() {
        if (f) {
            f();
        }
    }
};

int main(int argc, char* argv[]) {
    const std::string program = (argc > 0) ? argv[0] : "usdcad";

    /* parse arguments */
    CliArgs     args;
    std::string error;
    if (!parseArgs(std::vector<std::string>(argv + 1, argv + argc), args, error)) {
        std::cerr << "Error: " << error << "\n\n" << usage(program);
        return 1;
    }
    if (args.help) {
        std::cout << usage(program);
        return 0;
    }

    /* load settings */
    ValetConfig config;
    if (!args.configPath.empty() && !ValetConfig::loadFile(args.configPath, config)) {
        return 1;
    }
    if (!ValetConfig::applyEnvironment(config)) {
        return 1;
    }

    BocValet::init();
    Defer _cleanup([] { BocValet::close(); });

    FxQuery query;
    query.start     = args.start;
    query.end       = args.end;
    query.direction = args.reverse ? Direction::CadToUsd : Direction::UsdToCad;

    const auto strategy = args.reciprocal ? ReverseStrategy::Reciprocal : ReverseStrategy::Series;
    const auto rates    = BocValet::getRates(query, config, strategy);
    if (!rates) {
        return 1;
    }

    if (args.json) {
        std::cout << BocValet::toJson(*rates).dump(2) << std::endl;
        return 0;
    }

    for (const auto& obs : rates->observations) {
        std::cout << obs.date.toString() << ": " << obs.rate.toString() << "\n";
    }

    return 0;
}
