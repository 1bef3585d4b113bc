#include "argot/parser.hpp"

#include <algorithm>
#include <cctype>
#include <numeric>

namespace {

static bool isFlagToken(const std::string& s) {
    return s.size() >= 2 && s[0] == '-';
}

template <typename Entries, typename Pred>
static std::optional<std::size_t> findEntry(const Entries& entries, Pred pred) {
    for (std::size_t i = 0; i < entries.size(); ++i) {
        if (pred(entries[i].tag)) return i;
    }
    return std::nullopt;
}

// Single-row Levenshtein distance.
static std::size_t editDistance(std::string_view from, std::string_view to) {
    std::vector<std::size_t> row(to.size() + 1);
    std::iota(row.begin(), row.end(), std::size_t{0});
    for (std::size_t i = 0; i < from.size(); ++i) {
        std::size_t diagonal = row[0];
        row[0] = i + 1;
        for (std::size_t j = 0; j < to.size(); ++j) {
            const std::size_t above = row[j + 1];
            const std::size_t replace = diagonal + (from[i] == to[j] ? 0 : 1);
            row[j + 1] = std::min({above + 1, row[j] + 1, replace});
            diagonal = above;
        }
    }
    return row.back();
}

struct Suggestion {
    std::size_t score;
    std::string form;
};

// How close `tag` is to the unknown `key` ("--name" or "-x"), or nullopt when it is no candidate.
// Long keys are compared with long names, a prefix scoring 0; short keys only match a short name
// that differs in case.
static std::optional<Suggestion> rateTag(const argot::Tag& tag, const std::string& key, std::size_t maxDistance) {
    if (key.rfind("--", 0) == 0) {
        if (!tag.longName()) return std::nullopt;
        const std::string_view name = std::string_view(key).substr(2);
        const std::string& candidate = *tag.longName();
        if (!name.empty() && candidate.rfind(name, 0) == 0) return Suggestion{0, "--" + candidate};
        const std::size_t distance = editDistance(name, candidate);
        if (distance > maxDistance) return std::nullopt;
        return Suggestion{distance, "--" + candidate};
    }
    if (key.size() != 2 || !tag.shortName()) return std::nullopt;
    const auto lower = [](char c) { return std::tolower(static_cast<unsigned char>(c)); };
    if (lower(key[1]) != lower(*tag.shortName())) return std::nullopt;
    return Suggestion{1, std::string("-") + *tag.shortName()};
}

constexpr std::size_t kMaxSuggestions = 3;

} // namespace

namespace argot {

std::size_t Parser::insert(Entry entry) {
    std::lock_guard<std::mutex> lock(registry_->mutex);
    auto& entries = registry_->entries;
    for (std::size_t i = 0; i < entries.size(); ++i) {
        const auto& existing = entries[i];
        if (!existing.tag.collidesWith(entry.tag)) continue;
        if (entry.plain && existing.plain && existing.tag == entry.tag && existing.type == entry.type) return i;
        throw DuplicateTagError("tag " + entry.tag.str() + " collides with registered tag " + existing.tag.str());
    }
    entries.push_back(std::move(entry));
    return entries.size() - 1;
}

std::size_t Parser::size() const {
    std::lock_guard<std::mutex> lock(registry_->mutex);
    return registry_->entries.size();
}

Arguments Parser::parseProcess(int argc, char** argv) const {
    return parse(processArgs(argc, argv), processEnv());
}

Arguments Parser::parse(const std::vector<std::string>& tokens, const EnvPairs& env) const {
    std::vector<Entry> entries;
    {
        std::lock_guard<std::mutex> lock(registry_->mutex);
        entries = registry_->entries;
    }

    Arguments args;
    std::vector<std::vector<std::optional<std::string>>> occurrences(entries.size());

    auto fail = [&args](ParseError error) {
        args.error_ = std::move(error);
        args.remainder_.clear();
        return args;
    };

    // Unknown flags never consume the following token.
    auto unmatched = [&](const std::string& token, const std::string& key) -> bool {
        if (options_.unknownFlags == UnknownFlagPolicy::Remainder) {
            args.remainder_.push_back(token);
            return true;
        }
        args.error_ = unknownFlag(entries, token, key);
        return false;
    };

    // Non-consuming kinds only ever take an inline value.
    auto takeValue = [&tokens](const Entry& entry, std::optional<std::string> inlineValue, std::size_t& i) {
        if (!entry.consumes || inlineValue) return inlineValue;
        if (i + 1 < tokens.size()) return std::optional<std::string>(tokens[++i]);
        return std::optional<std::string>();
    };

    std::size_t i = 0;
    if (!tokens.empty()) {
        args.binary_ = tokens[0];
        args.remainder_.push_back(tokens[0]);
        i = 1;
    }

    bool flagsEnded = false;
    for (; i < tokens.size(); ++i) {
        const std::string& token = tokens[i];
        if (flagsEnded || !isFlagToken(token)) {
            args.remainder_.push_back(token);
            continue;
        }
        if (token == "--") {
            flagsEnded = options_.doubleDashEndsFlags;
            args.remainder_.push_back(token);
            continue;
        }

        const bool isLong = token.rfind("--", 0) == 0;
        const std::string body = token.substr(isLong ? 2 : 1);
        const auto eq = body.find('=');
        const std::string name = body.substr(0, eq);
        std::optional<std::string> inlineValue;
        if (eq != std::string::npos) inlineValue = body.substr(eq + 1);

        if (isLong) {
            const auto index = findEntry(entries, [&name](const Tag& t) { return t.matchesLong(name); });
            if (!index) {
                if (!unmatched(token, "--" + name)) return fail(*args.error_);
                continue;
            }
            occurrences[*index].push_back(takeValue(entries[*index], std::move(inlineValue), i));
            continue;
        }

        if (name.empty()) {
            if (!unmatched(token, token)) return fail(*args.error_);
            continue;
        }

        if (name.size() == 1 || !options_.shortFlagGrouping) {
            const auto index = name.size() == 1
                                   ? findEntry(entries, [c = name[0]](const Tag& t) { return t.matchesShort(c); })
                                   : std::nullopt;
            if (!index) {
                if (!unmatched(token, "-" + name)) return fail(*args.error_);
                continue;
            }
            occurrences[*index].push_back(takeValue(entries[*index], std::move(inlineValue), i));
            continue;
        }

        // -abc: every character must be known before anything is recorded.
        std::vector<std::size_t> group;
        std::optional<char> unknown;
        for (const char c : name) {
            const auto index = findEntry(entries, [c](const Tag& t) { return t.matchesShort(c); });
            if (!index) {
                unknown = c;
                break;
            }
            group.push_back(*index);
        }
        if (unknown) {
            if (!unmatched(token, std::string("-") + *unknown)) return fail(*args.error_);
            continue;
        }

        bool consumed = false;
        for (std::size_t pos = 0; pos < group.size(); ++pos) {
            const Entry& entry = entries[group[pos]];
            const bool last = pos + 1 == group.size();
            if (!entry.consumes || (last && inlineValue)) {
                occurrences[group[pos]].push_back(last ? inlineValue : std::nullopt);
                continue;
            }
            if (consumed) {
                return fail(ParseError(ParseError::Code::ConsumedValue,
                                       token,
                                       "multiple tags in " + token + " need a value; -" + std::string(1, name[pos]) +
                                           " cannot take the one already consumed"));
            }
            consumed = true;
            occurrences[group[pos]].push_back(takeValue(entry, std::nullopt, i));
        }
    }

    args.values_.reserve(entries.size());
    args.names_.reserve(entries.size());
    for (std::size_t n = 0; n < entries.size(); ++n) {
        args.values_.push_back(entries[n].resolve(collect(entries[n], occurrences[n], env)));
        args.names_.push_back(entries[n].tag.str());
    }
    return args;
}

// CLI text wins over the environment. Flags count every occurrence; consuming kinds only the ones that
// carried text, the last one for plain kinds and all of them, joined, for repeatable ones.
Parser::RawValue Parser::collect(const Entry& entry,
                                 const std::vector<std::optional<std::string>>& occurrences,
                                 const EnvPairs& env) const {
    RawValue raw;
    if (!entry.consumes && !occurrences.empty()) {
        raw.present = true;
        raw.text = occurrences.back();
        return raw;
    }

    for (const auto& text : occurrences) {
        if (!text) continue;
        if (raw.text && entry.repeatable) {
            *raw.text += kListSeparator;
            *raw.text += *text;
        } else {
            raw.text = *text;
        }
    }
    if (raw.text) {
        raw.present = true;
        return raw;
    }

    if (entry.tag.envName()) {
        for (const auto& [name, value] : env) {
            if (name == *entry.tag.envName()) {
                raw.present = true;
                raw.text = value;
                return raw;
            }
        }
    }

    // Tag given without a value and nothing in the environment: converters see std::nullopt.
    raw.present = !occurrences.empty();
    return raw;
}

ParseError Parser::unknownFlag(const std::vector<Entry>& entries, const std::string& token, const std::string& key) const {
    std::string message = "unknown flag: " + key;
    if (!options_.suggestFlags) return ParseError(ParseError::Code::UnknownFlag, token, std::move(message));

    std::vector<Suggestion> suggestions;
    for (const auto& entry : entries) {
        if (auto s = rateTag(entry.tag, key, options_.suggestionsMaximumDistance)) suggestions.push_back(std::move(*s));
    }
    std::stable_sort(suggestions.begin(), suggestions.end(), [](const Suggestion& a, const Suggestion& b) {
        return a.score < b.score;
    });
    if (suggestions.size() > kMaxSuggestions) suggestions.resize(kMaxSuggestions);

    if (!suggestions.empty()) {
        message += "\n\nDid you mean this?\n";
        for (const auto& s : suggestions) message += "  " + s.form + "\n";
    }
    return ParseError(ParseError::Code::UnknownFlag, token, std::move(message));
}

} // namespace argot
