#ifndef ARGOT_ARGUMENTS_HPP
#define ARGOT_ARGUMENTS_HPP

#include <any>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "error.hpp"
#include "value.hpp"

namespace argot {

class Parser;

template <typename T>
class Ref;

// Outcome of one parse pass: the resolved value of every declared argument plus the remainder.
class Arguments {
public:
    [[nodiscard]] bool ok() const { return !error_.has_value(); }
    [[nodiscard]] const std::optional<ParseError>& error() const { return error_; }

    [[nodiscard]] const std::optional<std::string>& binary() const { return binary_; }

    // Unmatched tokens in their original order, starting with the binary name if there was one.
    [[nodiscard]] const std::vector<std::string>& remainder() const { return remainder_; }

    // The remainder without the binary name.
    [[nodiscard]] std::vector<std::string> positionals() const {
        if (!binary_ || remainder_.empty()) return remainder_;
        return std::vector<std::string>(remainder_.begin() + 1, remainder_.end());
    }

    // Number of resolved arguments; zero after a failed pass.
    [[nodiscard]] std::size_t size() const { return values_.size(); }

private:
    friend class Parser;
    template <typename T>
    friend class Ref;

    const std::any& slot(std::size_t index) const {
        if (error_) throw ValueError("arguments unavailable: " + error_->message());
        if (index >= values_.size()) throw ValueError("argument #" + std::to_string(index) + " was not declared before parsing");
        return values_[index];
    }

    const std::string& name(std::size_t index) const { return names_[index]; }

    std::optional<std::string> binary_;
    std::vector<std::string> remainder_;
    std::vector<std::any> values_; // std::optional<Result<T>> per declared argument
    std::vector<std::string> names_;
    std::optional<ParseError> error_;
};

// Handle returned at registration. It only holds the argument's index, so it is valid for every
// Arguments produced by the parser it came from (or any copy of it).
template <typename T>
class Ref {
public:
    [[nodiscard]] std::size_t index() const { return index_; }

    // Error-preserving: nullopt when not supplied, otherwise the value or its conversion error.
    // Throws ValueError when `args` came from a parser that declared another type at this index.
    std::optional<Result<T>> result(const Arguments& args) const {
        const std::any& slot = args.slot(index_);
        const auto* value = std::any_cast<std::optional<Result<T>>>(&slot);
        if (value == nullptr) throw ValueError("argument " + args.name(index_) + " holds a different type");
        return *value;
    }

    // Error-discarding: conversion failures read as not supplied.
    std::optional<T> ok(const Arguments& args) const {
        auto r = result(args);
        if (!r || !r->ok()) return std::nullopt;
        return std::move(*r).value();
    }

    // Unwrapped: throws ValueError when the argument was not supplied or failed to convert.
    T get(const Arguments& args) const {
        auto r = result(args);
        if (!r) throw ValueError("argument " + args.name(index_) + " was not supplied");
        if (!r->ok()) throw ValueError("argument " + args.name(index_) + ": " + r->error().message());
        return std::move(*r).value();
    }

    [[nodiscard]] bool supplied(const Arguments& args) const { return result(args).has_value(); }

    bool operator==(const Ref& other) const { return index_ == other.index_; }
    bool operator!=(const Ref& other) const { return index_ != other.index_; }

private:
    friend class Parser;

    explicit Ref(std::size_t index) : index_(index) {}

    std::size_t index_;
};

} // namespace argot

#endif // ARGOT_ARGUMENTS_HPP
