#ifndef ARGOT_SCHEMA_HPP
#define ARGOT_SCHEMA_HPP

#include <algorithm>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "arguments.hpp"
#include "parser.hpp"
#include "tag.hpp"
#include "error.hpp"
#include "value.hpp"

// Long tag named after a struct member, underscores turned into dashes: ARGOT_LONG(first_arg) is --first-arg.
#define ARGOT_LONG(member) ::argot::tag::longName(::argot::detail::dashify(#member))

namespace argot {

namespace detail {

inline std::string dashify(std::string name) {
    std::replace(name.begin(), name.end(), '_', '-');
    return name;
}

// The member type picks how a missing or unconvertible value is surfaced.
template <typename M>
struct FieldPolicy {
    using Value = M;
    static M take(const Ref<Value>& ref, const Arguments& args) { return ref.get(args); }
};

template <typename T>
struct FieldPolicy<std::optional<T>> {
    using Value = T;
    static std::optional<T> take(const Ref<Value>& ref, const Arguments& args) { return ref.ok(args); }
};

template <typename T>
struct FieldPolicy<std::optional<Result<T>>> {
    using Value = T;
    static std::optional<Result<T>> take(const Ref<Value>& ref, const Arguments& args) { return ref.result(args); }
};

} // namespace detail

// Binds the members of `S` to tags, so a whole argument struct is declared and filled in one place:
//
//   struct Args { bool verbose; std::optional<std::uint32_t> times; };
//   argot::Schema<Args> schema;
//   schema.field(&Args::verbose, argot::tag::both('v', "verbose"))
//         .field(&Args::times, ARGOT_LONG(times), 1u);
//
// Plain members throw ValueError from parse() when missing or malformed, std::optional<T> members
// drop conversion errors, and std::optional<Result<T>> members keep them.
template <typename S>
class Schema {
public:
    Schema() = default;
    explicit Schema(Parser::Options options) : options_(options) {}

    // Throws DuplicateTagError when `tag` shares a form with an earlier field.
    template <typename M>
    Schema& field(M S::*member, Tag tag) {
        reserve(tag);
        using Policy = detail::FieldPolicy<M>;
        using V = typename Policy::Value;
        binders_.push_back([member, tag](Parser& parser) -> Assign {
            const auto ref = parser.add<V>(tag);
            return [member, ref](const Arguments& args, S& out) { out.*member = Policy::take(ref, args); };
        });
        return *this;
    }

    // `defaultValue` is used only when the argument was not supplied at all.
    template <typename M, typename D>
    Schema& field(M S::*member, Tag tag, D defaultValue) {
        reserve(tag);
        using Policy = detail::FieldPolicy<M>;
        using V = typename Policy::Value;
        binders_.push_back([member, tag, value = V(std::move(defaultValue))](Parser& parser) -> Assign {
            const auto ref = parser.addDefault<V>(tag, value);
            return [member, ref](const Arguments& args, S& out) { out.*member = Policy::take(ref, args); };
        });
        return *this;
    }

    // `out` is written only when the pass succeeds and every member could be filled; a ValueError from a
    // plain member leaves it untouched.
    Arguments parse(const std::vector<std::string>& tokens, const EnvPairs& env, S& out) const {
        Parser parser(options_);
        std::vector<Assign> assigns;
        assigns.reserve(binders_.size());
        for (const auto& bind : binders_) assigns.push_back(bind(parser));

        auto args = parser.parse(tokens, env);
        if (!args.ok()) return args;
        S filled = out;
        for (const auto& assign : assigns) assign(args, filled);
        out = std::move(filled);
        return args;
    }

    Arguments parseCli(const std::vector<std::string>& tokens, S& out) const { return parse(tokens, {}, out); }
    Arguments parseEnv(const EnvPairs& env, S& out) const { return parse({}, env, out); }
    Arguments parseProcess(int argc, char** argv, S& out) const { return parse(processArgs(argc, argv), processEnv(), out); }

    [[nodiscard]] std::size_t size() const { return binders_.size(); }

private:
    using Assign = std::function<void(const Arguments&, S&)>;
    using Binder = std::function<Assign(Parser&)>;

    void reserve(const Tag& tag) {
        for (const auto& existing : tags_) {
            if (existing.collidesWith(tag)) {
                throw DuplicateTagError("tag " + tag.str() + " collides with field tag " + existing.str());
            }
        }
        tags_.push_back(tag);
    }

    Parser::Options options_{};
    std::vector<Binder> binders_;
    std::vector<Tag> tags_;
};

} // namespace argot

#endif // ARGOT_SCHEMA_HPP
