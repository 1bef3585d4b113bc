#ifndef ARGOT_PROCESS_HPP
#define ARGOT_PROCESS_HPP

#include <string>
#include <utility>
#include <vector>

namespace argot {

using EnvPairs = std::vector<std::pair<std::string, std::string>>;

// argv[0..argc) as strings; null entries are skipped.
std::vector<std::string> processArgs(int argc, char** argv);

// The current process environment, in the order the platform reports it.
EnvPairs processEnv();

} // namespace argot

#endif // ARGOT_PROCESS_HPP
