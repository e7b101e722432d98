#ifndef MCLI_ARGSPEC_HPP
#define MCLI_ARGSPEC_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "value.hpp"

namespace mcli {

enum class ParamKind {
    PositionalOnly,
    Ambiguous,   // positional or by name
    NamedOnly,
    VariadicPositional,
    VariadicNamed,
};

std::string_view toString(ParamKind kind);

class ParamSpec {
public:
    ParamSpec(std::string name, ParamKind kind, std::optional<ArgValue> defaultValue = std::nullopt)
        : name_(std::move(name)), kind_(kind), defaultValue_(std::move(defaultValue)) {}

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] ParamKind kind() const { return kind_; }
    [[nodiscard]] const std::optional<ArgValue>& defaultValue() const { return defaultValue_; }
    [[nodiscard]] bool hasDefault() const { return defaultValue_.has_value(); }

    // Fills a positional slot: PositionalOnly or Ambiguous.
    [[nodiscard]] bool isPositional() const {
        return kind_ == ParamKind::PositionalOnly || kind_ == ParamKind::Ambiguous;
    }
    // Can be supplied as --name: Ambiguous or NamedOnly.
    [[nodiscard]] bool isNamed() const { return kind_ == ParamKind::Ambiguous || kind_ == ParamKind::NamedOnly; }
    [[nodiscard]] bool isVariadic() const {
        return kind_ == ParamKind::VariadicPositional || kind_ == ParamKind::VariadicNamed;
    }

private:
    std::string name_;
    ParamKind kind_;
    std::optional<ArgValue> defaultValue_;
};

// Ordered parameter list of one target operation. Immutable once built; safe to share
// across threads and across repeated bindings.
class ArgSpec {
public:
    ArgSpec() = default;

    [[nodiscard]] const std::vector<ParamSpec>& params() const { return params_; }
    [[nodiscard]] std::size_t size() const { return params_.size(); }
    [[nodiscard]] bool empty() const { return params_.empty(); }

    [[nodiscard]] const ParamSpec* find(std::string_view name) const;

    // PositionalOnly parameters, then Ambiguous ones, each in declaration order.
    [[nodiscard]] std::vector<const ParamSpec*> positionalParams() const;

    [[nodiscard]] std::size_t minPositional() const { return minPositional_; }
    [[nodiscard]] std::size_t maxPositional() const { return maxPositional_; }
    [[nodiscard]] std::size_t minNamed() const { return minNamed_; }
    [[nodiscard]] std::size_t maxNamed() const { return maxNamed_; }

    [[nodiscard]] bool hasVariadicPositional() const { return variadicPositional_.has_value(); }
    [[nodiscard]] bool hasVariadicNamed() const { return variadicNamed_.has_value(); }
    [[nodiscard]] const std::optional<std::string>& variadicPositionalName() const { return variadicPositional_; }
    [[nodiscard]] const std::optional<std::string>& variadicNamedName() const { return variadicNamed_; }

private:
    friend class ArgSpecBuilder;
    explicit ArgSpec(std::vector<ParamSpec> params);

    std::vector<ParamSpec> params_;
    std::size_t minPositional_{0};
    std::size_t maxPositional_{0};
    std::size_t minNamed_{0};
    std::size_t maxNamed_{0};
    std::optional<std::string> variadicPositional_;
    std::optional<std::string> variadicNamed_;
};

// Fluent construction of an ArgSpec, declaration order preserved.
//
//   auto spec = mcli::ArgSpecBuilder()
//                   .positionalOnly("in_file")
//                   .positionalOnly("out_file")
//                   .namedOnly("create_new", false)
//                   .build();
class ArgSpecBuilder {
public:
    ArgSpecBuilder& add(ParamSpec param) {
        params_.push_back(std::move(param));
        return *this;
    }

    ArgSpecBuilder& positionalOnly(std::string name) { return add({std::move(name), ParamKind::PositionalOnly}); }
    ArgSpecBuilder& positionalOnly(std::string name, ArgValue defaultValue) {
        return add({std::move(name), ParamKind::PositionalOnly, std::move(defaultValue)});
    }

    ArgSpecBuilder& ambiguous(std::string name) { return add({std::move(name), ParamKind::Ambiguous}); }
    ArgSpecBuilder& ambiguous(std::string name, ArgValue defaultValue) {
        return add({std::move(name), ParamKind::Ambiguous, std::move(defaultValue)});
    }

    ArgSpecBuilder& namedOnly(std::string name) { return add({std::move(name), ParamKind::NamedOnly}); }
    ArgSpecBuilder& namedOnly(std::string name, ArgValue defaultValue) {
        return add({std::move(name), ParamKind::NamedOnly, std::move(defaultValue)});
    }

    ArgSpecBuilder& variadicPositional(std::string name) { return add({std::move(name), ParamKind::VariadicPositional}); }
    ArgSpecBuilder& variadicNamed(std::string name) { return add({std::move(name), ParamKind::VariadicNamed}); }

    // Throws std::invalid_argument on an empty or duplicate name, a second variadic of
    // the same kind, or a default on a variadic parameter.
    [[nodiscard]] ArgSpec build() const;

private:
    std::vector<ParamSpec> params_;
};

} // namespace mcli

#endif // MCLI_ARGSPEC_HPP
