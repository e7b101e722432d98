#include "mcli/argspec.hpp"

#include <stdexcept>
#include <unordered_set>

namespace mcli {

std::string_view toString(ParamKind kind) {
    switch (kind) {
        case ParamKind::PositionalOnly: return "positional-only";
        case ParamKind::Ambiguous: return "positional-or-named";
        case ParamKind::NamedOnly: return "named-only";
        case ParamKind::VariadicPositional: return "variadic-positional";
        case ParamKind::VariadicNamed: return "variadic-named";
    }
    return "unknown";
}

ArgSpec::ArgSpec(std::vector<ParamSpec> params) : params_(std::move(params)) {
    for (const auto& p : params_) {
        switch (p.kind()) {
            case ParamKind::PositionalOnly:
                ++maxPositional_;
                if (!p.hasDefault()) ++minPositional_;
                break;
            case ParamKind::Ambiguous:
                ++maxPositional_;
                ++maxNamed_;
                if (!p.hasDefault()) ++minPositional_;
                break;
            case ParamKind::NamedOnly:
                ++maxNamed_;
                if (!p.hasDefault()) ++minNamed_;
                break;
            case ParamKind::VariadicPositional:
                variadicPositional_ = p.name();
                break;
            case ParamKind::VariadicNamed:
                variadicNamed_ = p.name();
                break;
        }
    }
}

const ParamSpec* ArgSpec::find(std::string_view name) const {
    for (const auto& p : params_) {
        if (p.name() == name) return &p;
    }
    return nullptr;
}

std::vector<const ParamSpec*> ArgSpec::positionalParams() const {
    std::vector<const ParamSpec*> out;
    out.reserve(maxPositional_);
    for (const auto& p : params_) {
        if (p.kind() == ParamKind::PositionalOnly) out.push_back(&p);
    }
    for (const auto& p : params_) {
        if (p.kind() == ParamKind::Ambiguous) out.push_back(&p);
    }
    return out;
}

ArgSpec ArgSpecBuilder::build() const {
    std::unordered_set<std::string> seen;
    bool variadicPositional = false;
    bool variadicNamed = false;
    for (const auto& p : params_) {
        if (p.name().empty()) throw std::invalid_argument("parameter name must not be empty");
        if (!seen.insert(p.name()).second) throw std::invalid_argument("duplicate parameter: " + p.name());
        if (p.isVariadic() && p.hasDefault()) {
            throw std::invalid_argument("variadic parameter cannot have a default: " + p.name());
        }
        if (p.kind() == ParamKind::VariadicPositional) {
            if (variadicPositional) throw std::invalid_argument("more than one variadic-positional parameter: " + p.name());
            variadicPositional = true;
        } else if (p.kind() == ParamKind::VariadicNamed) {
            if (variadicNamed) throw std::invalid_argument("more than one variadic-named parameter: " + p.name());
            variadicNamed = true;
        }
    }
    return ArgSpec(params_);
}

} // namespace mcli
