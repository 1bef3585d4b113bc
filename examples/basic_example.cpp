#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "argot/argot.hpp"

int main(int argc, char** argv) {
    argot::Parser parser;
    const auto verbose = parser.add<bool>(argot::tag::both('v', "verbose"));
    const auto message = parser.add<std::string>(argot::tag::both('m', "message").withEnv("APP_MESSAGE"), "Hello, World!");
    const auto times = parser.add<std::uint32_t>(argot::tag::longName("times"));

    const auto args = parser.parseProcess(argc, argv);
    if (!args.ok()) {
        std::cerr << args.error()->message() << "\n";
        return 1;
    }

    const auto count = times.result(args);
    if (count && !count->ok()) {
        std::cerr << "--times: " << count->error().message() << "\n";
        return 1;
    }

    const auto n = count ? count->value() : 1u;
    for (std::uint32_t i = 0; i < n; ++i) std::cout << message.get(args) << "\n";

    if (verbose.get(args)) {
        std::cout << "positionals:";
        for (const auto& p : args.positionals()) std::cout << " " << p;
        std::cout << "\n";
    }
    return 0;
}
