#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include "argot/argot.hpp"

enum class Level { Debug, Info, Warn, Error };

namespace argot {

template <>
struct ValueTraits<Level> : CustomTraits<Level> {
    static std::optional<argot::Result<Level>> fromValue(std::optional<std::string_view> v) {
        if (!v) return std::nullopt;
        if (*v == "debug") return argot::Result<Level>::success(Level::Debug);
        if (*v == "info") return argot::Result<Level>::success(Level::Info);
        if (*v == "warn") return argot::Result<Level>::success(Level::Warn);
        if (*v == "error") return argot::Result<Level>::success(Level::Error);
        return argot::Result<Level>::failure(argot::ConversionError(std::string(*v), "debug, info, warn or error"));
    }

    static std::optional<Level> defaultValue() { return Level::Info; }
};

} // namespace argot

static const char* levelName(Level level) {
    switch (level) {
        case Level::Debug: return "debug";
        case Level::Info: return "info";
        case Level::Warn: return "warn";
        case Level::Error: return "error";
    }
    return "?";
}

int main(int argc, char** argv) {
    argot::Parser parser;
    // `--level`, `-l`, or env `APP_LEVEL`.
    const auto level = parser.add<Level>(argot::tag::both('l', "level").withEnv("APP_LEVEL"));

    // A one-off kind without a traits specialization.
    const auto port = parser.addWith<int>(
        argot::tag::longName("port"),
        [](std::optional<std::string_view> v) -> std::optional<argot::Result<int>> {
            if (!v) return std::nullopt;
            std::int64_t n = 0;
            if (!argot::parseSigned(*v, 1, 65535, n)) {
                return argot::Result<int>::failure(argot::ConversionError(std::string(*v), "a port in 1..65535"));
            }
            return argot::Result<int>::success(static_cast<int>(n));
        },
        [] { return std::optional<int>(8080); });

    const auto args = parser.parseProcess(argc, argv);
    if (!args.ok()) {
        std::cerr << args.error()->message() << "\n";
        return 1;
    }

    try {
        std::cout << "level=" << levelName(level.get(args)) << "\n";
        std::cout << "port=" << port.get(args) << "\n";
    } catch (const argot::ValueError& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
    return 0;
}
