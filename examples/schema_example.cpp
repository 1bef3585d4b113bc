#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

#include "argot/argot.hpp"

struct Args {
    bool help{};
    std::optional<std::string> name;
    std::optional<std::uint32_t> times;
};

int main(int argc, char** argv) {
    argot::Schema<Args> schema;
    schema.field(&Args::help, ARGOT_LONG(help).withShort('h'))
        .field(&Args::name, ARGOT_LONG(name).withShort('n').withEnv("NAME"))
        .field(&Args::times, ARGOT_LONG(times), 1u);

    Args args;
    const auto parsed = schema.parseProcess(argc, argv, args);
    if (!parsed.ok()) {
        std::cerr << "failed to parse arguments: " << parsed.error()->message() << "\n";
        return 1;
    }

    if (args.help) {
        std::cout << "usage: greet -n <name> [--times <n>]\n";
        return 0;
    }
    if (!args.name) {
        std::cerr << "missing --name\n";
        return 1;
    }

    for (std::uint32_t i = 0; i < args.times.value_or(1); ++i) std::cout << "Hello, " << *args.name << "!\n";
    return 0;
}
