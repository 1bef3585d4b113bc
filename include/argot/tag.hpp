#ifndef ARGOT_TAG_HPP
#define ARGOT_TAG_HPP

#include <optional>
#include <string>
#include <string_view>

namespace argot {

// Names an argument: `-s`, `--long` and/or the environment variable `ENV`.
// At least one form is present; construction throws TagError otherwise.
class Tag {
public:
    Tag(std::optional<char> shortName, std::optional<std::string> longName, std::optional<std::string> envName);

    [[nodiscard]] const std::optional<char>& shortName() const { return shortName_; }
    [[nodiscard]] const std::optional<std::string>& longName() const { return longName_; }
    [[nodiscard]] const std::optional<std::string>& envName() const { return envName_; }

    [[nodiscard]] bool hasCli() const { return shortName_.has_value() || longName_.has_value(); }
    [[nodiscard]] bool hasEnv() const { return envName_.has_value(); }

    [[nodiscard]] bool matchesShort(char c) const { return shortName_ && *shortName_ == c; }
    [[nodiscard]] bool matchesLong(std::string_view name) const { return longName_ && *longName_ == name; }
    [[nodiscard]] bool matchesEnv(std::string_view name) const { return envName_ && *envName_ == name; }

    // True if any form is shared with `other`.
    [[nodiscard]] bool collidesWith(const Tag& other) const;

    [[nodiscard]] Tag withShort(char c) const;
    [[nodiscard]] Tag withLong(std::string name) const;
    [[nodiscard]] Tag withEnv(std::string name) const;

    // "-s / --long / $ENV", present forms only.
    [[nodiscard]] std::string str() const;

    bool operator==(const Tag& other) const {
        return shortName_ == other.shortName_ && longName_ == other.longName_ && envName_ == other.envName_;
    }
    bool operator!=(const Tag& other) const { return !(*this == other); }

private:
    std::optional<char> shortName_;   // -h
    std::optional<std::string> longName_; // --help
    std::optional<std::string> envName_;  // APP_HELP
};

namespace tag {

Tag shortName(char c);
Tag longName(std::string name);
Tag both(char c, std::string name);
Tag env(std::string name);

} // namespace tag

} // namespace argot

#endif // ARGOT_TAG_HPP
