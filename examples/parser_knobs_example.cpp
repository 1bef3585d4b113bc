#include <iostream>
#include <string>
#include <vector>

#include "argot/argot.hpp"

static void printArgs(const std::vector<std::string>& args) {
    std::cout << "args=[";
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (i) std::cout << ",";
        std::cout << args[i];
    }
    std::cout << "]\n";
}

int main(int argc, char** argv) {
    argot::Parser::Options options;
    options.unknownFlags = argot::UnknownFlagPolicy::Error;
    options.shortFlagGrouping = true;
    options.doubleDashEndsFlags = true;

    argot::Parser parser(options);
    const auto verbose = parser.add<bool>(argot::tag::both('v', "verbose"));
    const auto quiet = parser.add<bool>(argot::tag::both('q', "quiet"));
    const auto output = parser.add<std::string>(argot::tag::both('o', "output"));

    const auto args = parser.parseProcess(argc, argv);
    if (!args.ok()) {
        std::cerr << args.error()->message() << "\n";
        return 1;
    }

    std::cout << "verbose=" << (verbose.get(args) ? "true" : "false") << " ";
    std::cout << "quiet=" << (quiet.get(args) ? "true" : "false") << " ";
    std::cout << "output=" << output.ok(args).value_or("-") << " ";
    printArgs(args.positionals());
    return 0;
}
