#ifndef ARGOT_ERROR_HPP
#define ARGOT_ERROR_HPP

#include <stdexcept>
#include <string>
#include <utility>

namespace argot {

// Thrown by the tag builders when a tag has no form or a malformed one.
class TagError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Thrown by Parser::add when a tag shares a short, long or env form with an already registered tag.
class DuplicateTagError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Thrown when an unwrapped value is retrieved but was not supplied or failed to convert.
class ValueError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Raw text that could not be converted to the declared kind.
class ConversionError {
public:
    ConversionError(std::string input, std::string expected)
        : input_(std::move(input)), expected_(std::move(expected)) {}

    [[nodiscard]] const std::string& input() const { return input_; }
    // What the converter wanted, e.g. "an integer".
    [[nodiscard]] const std::string& expected() const { return expected_; }
    [[nodiscard]] std::string message() const { return "invalid value \"" + input_ + "\" (expected " + expected_ + ")"; }

    bool operator==(const ConversionError& other) const {
        return input_ == other.input_ && expected_ == other.expected_;
    }
    bool operator!=(const ConversionError& other) const { return !(*this == other); }

private:
    std::string input_;
    std::string expected_;
};

// Structural failure of a parse pass. Per-argument problems never end up here.
class ParseError {
public:
    enum class Code {
        UnknownFlag,   // only with UnknownFlagPolicy::Error
        ConsumedValue, // two tags of one short group both need the next token
    };

    ParseError(Code code, std::string token, std::string message)
        : code_(code), token_(std::move(token)), message_(std::move(message)) {}

    [[nodiscard]] Code code() const { return code_; }
    [[nodiscard]] const std::string& token() const { return token_; }
    [[nodiscard]] const std::string& message() const { return message_; }

private:
    Code code_;
    std::string token_;
    std::string message_;
};

} // namespace argot

#endif // ARGOT_ERROR_HPP
