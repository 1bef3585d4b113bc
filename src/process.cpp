#include "argot/process.hpp"

#include <cstring>
#include <string_view>

#if defined(_WIN32)
#include <windows.h>
#else
#include <unistd.h>
extern char** environ;
#endif

namespace {

static void appendEntry(argot::EnvPairs& out, std::string_view entry) {
    const auto eq = entry.find('=');
    // Windows keeps per-drive cwd entries like "=C:=C:\dir".
    if (eq == std::string_view::npos || eq == 0) return;
    out.emplace_back(std::string(entry.substr(0, eq)), std::string(entry.substr(eq + 1)));
}

} // namespace

namespace argot {

std::vector<std::string> processArgs(int argc, char** argv) {
    std::vector<std::string> out;
    if (argc <= 0 || argv == nullptr) return out;
    out.reserve(static_cast<std::size_t>(argc));
    for (int i = 0; i < argc; ++i) {
        if (argv[i] != nullptr) out.emplace_back(argv[i]);
    }
    return out;
}

EnvPairs processEnv() {
    EnvPairs out;
#if defined(_WIN32)
    LPCH block = GetEnvironmentStringsA();
    if (block == nullptr) return out;
    for (const char* p = block; *p != '\0'; p += std::strlen(p) + 1) appendEntry(out, p);
    FreeEnvironmentStringsA(block);
#else
    if (environ == nullptr) return out;
    for (char** p = environ; *p != nullptr; ++p) appendEntry(out, *p);
#endif
    return out;
}

} // namespace argot
