#ifndef ARGOT_PARSER_HPP
#define ARGOT_PARSER_HPP

#include <any>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <vector>

#include "arguments.hpp"
#include "error.hpp"
#include "process.hpp"
#include "tag.hpp"
#include "value.hpp"

namespace argot {

enum class UnknownFlagPolicy {
    Remainder, // keep unknown `-x` / `--x` tokens as positionals
    Error,     // fail the pass with ParseError::Code::UnknownFlag
};

// Declares arguments and runs parse passes over them.
//
// Copies share one registry, guarded by a mutex, so a Parser can be handed to different parts of a
// program to register arguments without threading a mutable reference around.
class Parser {
public:
    struct Options {
        UnknownFlagPolicy unknownFlags{UnknownFlagPolicy::Remainder};
        bool shortFlagGrouping{true};   // -abc
        bool doubleDashEndsFlags{true}; // everything after `--` is positional
        bool suggestFlags{true};
        std::size_t suggestionsMaximumDistance{2};
    };

    Parser() : Parser(Options{}) {}
    explicit Parser(Options options) : options_(options), registry_(std::make_shared<Registry>()) {}

    template <typename T>
    Ref<T> add(Tag tag) {
        using Traits = ValueTraits<T>;
        return Ref<T>(insert(makeEntry<T>(std::move(tag),
                                          Traits::consumes,
                                          Traits::repeatable,
                                          /*plain=*/true,
                                          &Traits::fromValue,
                                          std::nullopt,
                                          &Traits::defaultValue)));
    }

    // `defaultRaw` is converted like CLI text when neither the CLI nor the environment supplied any.
    template <typename T>
    Ref<T> add(Tag tag, std::string defaultRaw) {
        using Traits = ValueTraits<T>;
        return Ref<T>(insert(makeEntry<T>(std::move(tag),
                                          Traits::consumes,
                                          Traits::repeatable,
                                          /*plain=*/false,
                                          &Traits::fromValue,
                                          std::move(defaultRaw),
                                          &Traits::defaultValue)));
    }

    template <typename T>
    Ref<T> addDefault(Tag tag, T value) {
        using Traits = ValueTraits<T>;
        DefaultProvider<T> fallback = [value = std::move(value)]() -> std::optional<T> { return value; };
        return Ref<T>(insert(makeEntry<T>(std::move(tag),
                                          Traits::consumes,
                                          Traits::repeatable,
                                          /*plain=*/false,
                                          &Traits::fromValue,
                                          std::nullopt,
                                          std::move(fallback))));
    }

    // For kinds without a ValueTraits specialization. They always consume a value.
    template <typename T>
    Ref<T> addWith(Tag tag, Converter<T> convert, DefaultProvider<T> fallback = {}) {
        if (!convert) throw std::invalid_argument("converter for " + tag.str() + " is empty");
        return Ref<T>(insert(makeEntry<T>(std::move(tag),
                                          /*consumes=*/true,
                                          /*repeatable=*/false,
                                          /*plain=*/false,
                                          std::move(convert),
                                          std::nullopt,
                                          std::move(fallback))));
    }

    // tokens[0] is the binary name. Only structural problems fail the pass; see Arguments::ok().
    Arguments parse(const std::vector<std::string>& tokens, const EnvPairs& env) const;
    Arguments parseCli(const std::vector<std::string>& tokens) const { return parse(tokens, {}); }
    Arguments parseEnv(const EnvPairs& env) const { return parse({}, env); }
    Arguments parseProcess(int argc, char** argv) const;

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] const Options& options() const { return options_; }

private:
    struct RawValue {
        bool present{false};
        std::optional<std::string> text;
    };

    using Resolver = std::function<std::any(const RawValue&)>;

    struct Entry {
        Tag tag;
        std::type_index type;
        bool consumes;
        bool repeatable;
        bool plain; // registered without default or converter; re-adding it is idempotent
        Resolver resolve;
    };

    struct Registry {
        std::mutex mutex;
        std::vector<Entry> entries;
    };

    template <typename T>
    static Entry makeEntry(Tag tag,
                           bool consumes,
                           bool repeatable,
                           bool plain,
                           Converter<T> convert,
                           std::optional<std::string> defaultRaw,
                           DefaultProvider<T> fallback) {
        Resolver resolve = [convert = std::move(convert), defaultRaw = std::move(defaultRaw), fallback = std::move(fallback)](
                               const RawValue& raw) -> std::any {
            std::optional<Result<T>> out;
            if (raw.present) {
                out = raw.text ? convert(std::string_view(*raw.text)) : convert(std::nullopt);
            }
            if (!out && defaultRaw) out = convert(std::string_view(*defaultRaw));
            if (!out && fallback) {
                if (auto v = fallback()) out = Result<T>::success(std::move(*v));
            }
            return out;
        };
        return Entry{std::move(tag), std::type_index(typeid(T)), consumes, repeatable, plain, std::move(resolve)};
    }

    std::size_t insert(Entry entry);

    RawValue collect(const Entry& entry, const std::vector<std::optional<std::string>>& occurrences, const EnvPairs& env) const;
    ParseError unknownFlag(const std::vector<Entry>& entries, const std::string& token, const std::string& key) const;

    Options options_;
    std::shared_ptr<Registry> registry_;
};

} // namespace argot

#endif // ARGOT_PARSER_HPP
