#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "argot/argot.hpp"

static std::string join(const std::vector<std::string>& v, const std::string& sep) {
    std::string out;
    for (std::size_t i = 0; i < v.size(); ++i) {
        if (i) out += sep;
        out += v[i];
    }
    return out;
}

int main(int argc, char** argv) {
    argot::Parser parser;
    // `-t a -t b,c` accumulates to a|b|c; TAGS is read only when no -t was given.
    const auto tags = parser.add<std::vector<std::string>>(argot::tag::both('t', "tag").withEnv("TAGS"));
    const auto ids = parser.add<std::vector<std::uint64_t>>(argot::tag::longName("id"), "1,2,3");

    const auto args = parser.parseProcess(argc, argv);
    if (!args.ok()) {
        std::cerr << args.error()->message() << "\n";
        return 1;
    }

    std::cout << "tags=" << join(tags.ok(args).value_or(std::vector<std::string>{}), "|") << "\n";

    const auto idList = ids.result(args);
    if (!idList || !idList->ok()) {
        std::cerr << "--id: " << (idList ? idList->error().message() : std::string("missing")) << "\n";
        return 1;
    }
    std::cout << "ids=";
    for (const auto id : idList->value()) std::cout << id << " ";
    std::cout << "\n";
    return 0;
}
