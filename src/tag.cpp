#include "argot/tag.hpp"

#include <cctype>
#include <utility>

#include "argot/error.hpp"

namespace {

static void validateShort(char c) {
    if (c == '-' || c == '=' || c == '\0' || std::isspace(static_cast<unsigned char>(c))) {
        throw argot::TagError(std::string("invalid short tag: '") + c + "'");
    }
}

static void validateLong(const std::string& name) {
    if (name.empty()) throw argot::TagError("long tag must not be empty");
    if (name.front() == '-') throw argot::TagError("long tag must be given without dashes: " + name);
    if (name.find('=') != std::string::npos) throw argot::TagError("long tag must not contain '=': " + name);
}

static void validateEnv(const std::string& name) {
    if (name.empty()) throw argot::TagError("environment variable name must not be empty");
    if (name.find('=') != std::string::npos) throw argot::TagError("environment variable name must not contain '=': " + name);
}

} // namespace

namespace argot {

Tag::Tag(std::optional<char> shortName, std::optional<std::string> longName, std::optional<std::string> envName)
    : shortName_(shortName),
      longName_(std::move(longName)),
      envName_(std::move(envName)) {
    if (!shortName_ && !longName_ && !envName_) throw TagError("tag needs a short, long or environment form");
    if (shortName_) validateShort(*shortName_);
    if (longName_) validateLong(*longName_);
    if (envName_) validateEnv(*envName_);
}

bool Tag::collidesWith(const Tag& other) const {
    if (shortName_ && other.shortName_ && *shortName_ == *other.shortName_) return true;
    if (longName_ && other.longName_ && *longName_ == *other.longName_) return true;
    if (envName_ && other.envName_ && *envName_ == *other.envName_) return true;
    return false;
}

Tag Tag::withShort(char c) const {
    return Tag(c, longName_, envName_);
}

Tag Tag::withLong(std::string name) const {
    return Tag(shortName_, std::move(name), envName_);
}

Tag Tag::withEnv(std::string name) const {
    return Tag(shortName_, longName_, std::move(name));
}

std::string Tag::str() const {
    std::string out;
    auto append = [&out](const std::string& part) {
        if (!out.empty()) out += " / ";
        out += part;
    };
    if (shortName_) append(std::string("-") + *shortName_);
    if (longName_) append("--" + *longName_);
    if (envName_) append("$" + *envName_);
    return out;
}

namespace tag {

Tag shortName(char c) {
    return Tag(c, std::nullopt, std::nullopt);
}

Tag longName(std::string name) {
    return Tag(std::nullopt, std::move(name), std::nullopt);
}

Tag both(char c, std::string name) {
    return Tag(c, std::move(name), std::nullopt);
}

Tag env(std::string name) {
    return Tag(std::nullopt, std::nullopt, std::move(name));
}

} // namespace tag

} // namespace argot
