#include "mcli/binder.hpp"

#include <algorithm>
#include <unordered_set>

#include "mcli/utils.hpp"

namespace mcli {

namespace {

std::vector<std::string> cliNames(const std::vector<std::string>& names) {
    std::vector<std::string> out;
    out.reserve(names.size());
    for (const auto& n : names) out.push_back(utils::toCliName(n));
    return out;
}

} // namespace

std::string_view toString(BindError::Kind kind) {
    switch (kind) {
        case BindError::Kind::InsufficientArguments: return "InsufficientArguments";
        case BindError::Kind::TooManyPositionals: return "TooManyPositionals";
        case BindError::Kind::TooManyNamed: return "TooManyNamed";
        case BindError::Kind::MissingDefault: return "MissingDefault";
        case BindError::Kind::AmbiguousOption: return "AmbiguousOption";
        case BindError::Kind::UnknownOption: return "UnknownOption";
    }
    return "Unknown";
}

std::string BindError::message() const {
    switch (kind_) {
        case Kind::InsufficientArguments:
            return "not enough arguments: expected at least " + std::to_string(expected_) + ", got " +
                   std::to_string(got_);
        case Kind::TooManyPositionals:
            return "too many arguments: expected at most " + std::to_string(expected_) + ", got " +
                   std::to_string(got_);
        case Kind::TooManyNamed:
            return "argument " + utils::toCliName(name_) + " was already given positionally";
        case Kind::MissingDefault:
            return "missing required argument: " + (named_ ? utils::toCliName(name_) : name_);
        case Kind::AmbiguousOption:
            return "ambiguous option: " + utils::toCliName(name_) + " could match " + utils::join(cliNames(candidates_));
        case Kind::UnknownOption: {
            std::string msg = "unknown option: " + utils::toCliName(name_);
            if (suggestions_.empty()) return msg;
            msg += "\n\nDid you mean this?\n";
            for (const auto& s : suggestions_) msg += "  " + utils::toCliName(s) + "\n";
            return msg;
        }
    }
    return "invalid arguments";
}

const ArgValue* BoundArgs::find(std::string_view name) const {
    for (std::size_t i = 0; i < positionalNames_.size(); ++i) {
        if (positionalNames_[i] == name) return &positionals_[i];
    }
    for (const auto& [n, v] : named_) {
        if (n == name) return &v;
    }
    return nullptr;
}

BindResult Binder::bind(const RawPositionals& positionals, const RawOptions& options, const ArgSpec& spec) const {
    BoundArgs out;
    const auto slots = spec.positionalParams();
    const auto got = positionals.size();

    // Phase 1: positionals.
    if (got < spec.minPositional()) return BindError::insufficientArguments(spec.minPositional(), got);
    if (got > spec.maxPositional() && !spec.hasVariadicPositional()) {
        return BindError::tooManyPositionals(spec.maxPositional(), got);
    }

    const auto assigned = std::min(got, slots.size());
    std::unordered_set<std::string_view> filledAmbiguous;
    for (std::size_t i = 0; i < assigned; ++i) {
        out.positionals_.push_back(positionals[i]);
        out.positionalNames_.push_back(slots[i]->name());
        if (slots[i]->kind() == ParamKind::Ambiguous) filledAmbiguous.insert(slots[i]->name());
    }
    for (std::size_t i = assigned; i < slots.size(); ++i) {
        const auto* p = slots[i];
        if (!p->hasDefault()) return BindError::missingDefault(p->name());
        // Unfilled Ambiguous parameters stay nameable and are resolved in phase 2.
        if (p->kind() == ParamKind::PositionalOnly) {
            out.positionals_.push_back(*p->defaultValue());
            out.positionalNames_.push_back(p->name());
        }
    }
    for (std::size_t i = assigned; i < got; ++i) out.positionals_.push_back(positionals[i]);

    // Phase 2: named options against the unmatched pool, in declaration order.
    std::vector<const ParamSpec*> pool;
    for (const auto& p : spec.params()) {
        if (p.kind() == ParamKind::NamedOnly) pool.push_back(&p);
        if (p.kind() == ParamKind::Ambiguous && filledAmbiguous.find(p.name()) == filledAmbiguous.end()) pool.push_back(&p);
    }

    for (const auto& entry : options) {
        const auto& name = entry.first;
        const auto& value = entry.second;
        const auto exact = std::find_if(pool.begin(), pool.end(), [&](const ParamSpec* p) { return p->name() == name; });
        if (exact != pool.end()) {
            out.named_.emplace_back(name, value);
            pool.erase(exact);
            continue;
        }
        if (filledAmbiguous.find(name) != filledAmbiguous.end()) return BindError::tooManyNamed(name);

        if (isUniversalFlag(name)) {
            out.named_.emplace_back(name, value);
            continue;
        }

        if (options_.allowAbbreviations && !name.empty()) {
            std::vector<std::vector<const ParamSpec*>::iterator> matches;
            for (auto it = pool.begin(); it != pool.end(); ++it) {
                if ((*it)->name().rfind(name, 0) == 0) matches.push_back(it);
            }
            if (matches.size() == 1) {
                out.named_.emplace_back((*matches.front())->name(), value);
                pool.erase(matches.front());
                continue;
            }
            if (matches.size() > 1) {
                std::vector<std::string> candidates;
                candidates.reserve(matches.size());
                for (const auto& it : matches) candidates.push_back((*it)->name());
                return BindError::ambiguousOption(name, std::move(candidates));
            }
        }

        if (spec.hasVariadicNamed()) {
            out.named_.emplace_back(name, value);
            continue;
        }

        std::vector<std::string> suggestions;
        if (options_.suggestions) {
            std::vector<std::string> known;
            known.reserve(pool.size());
            for (const auto* p : pool) known.push_back(p->name());
            suggestions = utils::suggest(name, known, /*maxResults=*/3, options_.suggestionsMinimumDistance);
        }
        return BindError::unknownOption(name, std::move(suggestions));
    }

    for (const auto* p : pool) {
        if (!p->hasDefault()) return BindError::missingDefault(p->name(), /*named=*/true);
        out.named_.emplace_back(p->name(), *p->defaultValue());
    }
    return out;
}

BindResult bind(const RawPositionals& positionals,
                const RawOptions& options,
                const ArgSpec& spec,
                const Binder::Options& binderOptions) {
    return Binder(binderOptions).bind(positionals, options, spec);
}

} // namespace mcli
