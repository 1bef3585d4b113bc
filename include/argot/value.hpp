#ifndef ARGOT_VALUE_HPP
#define ARGOT_VALUE_HPP

#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "error.hpp"

namespace argot {

enum class Kind { Flag, Int, UInt, Float, Text, List, Custom };

// Either a converted value or the reason it could not be converted.
template <typename T>
class Result {
public:
    static Result success(T value) { return Result(std::in_place_index<0>, std::move(value)); }
    static Result failure(ConversionError error) { return Result(std::in_place_index<1>, std::move(error)); }

    [[nodiscard]] bool ok() const { return storage_.index() == 0; }
    explicit operator bool() const { return ok(); }

    const T& value() const& {
        if (!ok()) throw ValueError(std::get<1>(storage_).message());
        return std::get<0>(storage_);
    }
    T&& value() && {
        if (!ok()) throw ValueError(std::get<1>(storage_).message());
        return std::get<0>(std::move(storage_));
    }

    const ConversionError& error() const {
        if (ok()) throw std::logic_error("result holds a value, not an error");
        return std::get<1>(storage_);
    }

    bool operator==(const Result& other) const { return storage_ == other.storage_; }
    bool operator!=(const Result& other) const { return !(*this == other); }

private:
    template <std::size_t I, typename V>
    Result(std::in_place_index_t<I> which, V&& v) : storage_(which, std::forward<V>(v)) {}

    std::variant<T, ConversionError> storage_;
};

// A nullopt argument means the tag was present without a value.
template <typename T>
using Converter = std::function<std::optional<Result<T>>(std::optional<std::string_view>)>;

// Value used when neither the CLI nor the environment supplied any text.
template <typename T>
using DefaultProvider = std::function<std::optional<T>()>;

// Conversion primitives. Whitespace is never trimmed.
// "0" and "false" (any case) are false, anything else is true.
bool parseBool(std::string_view s);
bool parseSigned(std::string_view s, std::int64_t min, std::int64_t max, std::int64_t& out);
bool parseUnsigned(std::string_view s, std::uint64_t max, std::uint64_t& out);
bool parseFloat(std::string_view s, float& out);
bool parseFloat(std::string_view s, double& out);

// Keeps empty pieces: split("a,,b", ',') == {"a", "", "b"}.
std::vector<std::string_view> split(std::string_view s, char sep);

inline constexpr char kListSeparator = ',';

// The conversion contract. Built-in kinds are specialized below; user kinds specialize it too
// (deriving from CustomTraits for the defaults) or are registered with Parser::addWith.
template <typename T, typename Enable = void>
struct ValueTraits;

template <typename T>
struct CustomTraits {
    static constexpr Kind kind = Kind::Custom;
    static constexpr bool consumes = true;
    static constexpr bool repeatable = false;

    static std::optional<T> defaultValue() { return std::nullopt; }
};

template <>
struct ValueTraits<bool> {
    static constexpr Kind kind = Kind::Flag;
    static constexpr bool consumes = false;
    static constexpr bool repeatable = false;

    static std::optional<Result<bool>> fromValue(std::optional<std::string_view> raw) {
        if (!raw) return Result<bool>::success(true);
        return Result<bool>::success(parseBool(*raw));
    }

    static std::optional<bool> defaultValue() { return false; }
};

template <typename T>
struct ValueTraits<T, std::enable_if_t<std::is_integral_v<T> && std::is_signed_v<T>>> {
    static constexpr Kind kind = Kind::Int;
    static constexpr bool consumes = true;
    static constexpr bool repeatable = false;

    static std::optional<Result<T>> fromValue(std::optional<std::string_view> raw) {
        if (!raw) return std::nullopt;
        std::int64_t v = 0;
        if (!parseSigned(*raw, std::numeric_limits<T>::min(), std::numeric_limits<T>::max(), v)) {
            return Result<T>::failure(ConversionError(std::string(*raw), "an integer"));
        }
        return Result<T>::success(static_cast<T>(v));
    }

    static std::optional<T> defaultValue() { return std::nullopt; }
};

template <typename T>
struct ValueTraits<T, std::enable_if_t<std::is_integral_v<T> && std::is_unsigned_v<T> && !std::is_same_v<T, bool>>> {
    static constexpr Kind kind = Kind::UInt;
    static constexpr bool consumes = true;
    static constexpr bool repeatable = false;

    static std::optional<Result<T>> fromValue(std::optional<std::string_view> raw) {
        if (!raw) return std::nullopt;
        std::uint64_t v = 0;
        if (!parseUnsigned(*raw, std::numeric_limits<T>::max(), v)) {
            return Result<T>::failure(ConversionError(std::string(*raw), "an unsigned integer"));
        }
        return Result<T>::success(static_cast<T>(v));
    }

    static std::optional<T> defaultValue() { return std::nullopt; }
};

template <typename T>
struct ValueTraits<T, std::enable_if_t<std::is_same_v<T, float> || std::is_same_v<T, double>>> {
    static constexpr Kind kind = Kind::Float;
    static constexpr bool consumes = true;
    static constexpr bool repeatable = false;

    static std::optional<Result<T>> fromValue(std::optional<std::string_view> raw) {
        if (!raw) return std::nullopt;
        T v{};
        if (!parseFloat(*raw, v)) return Result<T>::failure(ConversionError(std::string(*raw), "a float"));
        return Result<T>::success(v);
    }

    static std::optional<T> defaultValue() { return std::nullopt; }
};

template <>
struct ValueTraits<std::string> {
    static constexpr Kind kind = Kind::Text;
    static constexpr bool consumes = true;
    static constexpr bool repeatable = false;

    static std::optional<Result<std::string>> fromValue(std::optional<std::string_view> raw) {
        if (!raw) return std::nullopt;
        return Result<std::string>::success(std::string(*raw));
    }

    static std::optional<std::string> defaultValue() { return std::nullopt; }
};

// Lists split on ',' and accumulate across repeated occurrences of the tag.
template <typename E>
struct ValueTraits<std::vector<E>> {
    static constexpr Kind kind = Kind::List;
    static constexpr bool consumes = true;
    static constexpr bool repeatable = true;

    static std::optional<Result<std::vector<E>>> fromValue(std::optional<std::string_view> raw) {
        if (!raw) return std::nullopt;
        std::vector<E> values;
        for (const auto part : split(*raw, kListSeparator)) {
            auto element = ValueTraits<E>::fromValue(part);
            if (!element) return std::nullopt;
            if (!element->ok()) return Result<std::vector<E>>::failure(element->error());
            values.push_back(std::move(*element).value());
        }
        return Result<std::vector<E>>::success(std::move(values));
    }

    static std::optional<std::vector<E>> defaultValue() { return std::nullopt; }
};

} // namespace argot

#endif // ARGOT_VALUE_HPP
