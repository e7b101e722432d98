#ifndef MCLI_BINDER_HPP
#define MCLI_BINDER_HPP

#include <array>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "argspec.hpp"
#include "tokenizer.hpp"
#include "value.hpp"

namespace mcli {

// Accepted whatever the ArgSpec declares, so callers can react to them without adding them
// to every ArgSpec. Normalized spelling of -h, --help, -d and --debug.
inline constexpr std::array<std::string_view, 4> kUniversalFlags{"h", "help", "d", "debug"};

inline bool isHelpFlag(std::string_view name) { return name == "h" || name == "help"; }
inline bool isDebugFlag(std::string_view name) { return name == "d" || name == "debug"; }
inline bool isUniversalFlag(std::string_view name) { return isHelpFlag(name) || isDebugFlag(name); }

class BindError {
public:
    enum class Kind {
        InsufficientArguments,
        TooManyPositionals,
        TooManyNamed,       // a named option targets a parameter already filled positionally
        MissingDefault,
        AmbiguousOption,
        UnknownOption,
    };

    static BindError insufficientArguments(std::size_t expected, std::size_t got) {
        BindError e(Kind::InsufficientArguments);
        e.expected_ = expected;
        e.got_ = got;
        return e;
    }
    static BindError tooManyPositionals(std::size_t expected, std::size_t got) {
        BindError e(Kind::TooManyPositionals);
        e.expected_ = expected;
        e.got_ = got;
        return e;
    }
    static BindError tooManyNamed(std::string name) {
        BindError e(Kind::TooManyNamed);
        e.name_ = std::move(name);
        return e;
    }
    // `named` selects the option spelling (--retries) over the bare parameter name.
    static BindError missingDefault(std::string name, bool named = false) {
        BindError e(Kind::MissingDefault);
        e.name_ = std::move(name);
        e.named_ = named;
        return e;
    }
    static BindError ambiguousOption(std::string name, std::vector<std::string> candidates) {
        BindError e(Kind::AmbiguousOption);
        e.name_ = std::move(name);
        e.candidates_ = std::move(candidates);
        return e;
    }
    static BindError unknownOption(std::string name, std::vector<std::string> suggestions = {}) {
        BindError e(Kind::UnknownOption);
        e.name_ = std::move(name);
        e.suggestions_ = std::move(suggestions);
        return e;
    }

    [[nodiscard]] Kind kind() const { return kind_; }
    // Offending parameter or option name, normalized. Empty for arity errors.
    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const std::vector<std::string>& candidates() const { return candidates_; }
    [[nodiscard]] const std::vector<std::string>& suggestions() const { return suggestions_; }
    [[nodiscard]] std::size_t expected() const { return expected_; }
    [[nodiscard]] std::size_t got() const { return got_; }

    [[nodiscard]] std::string message() const;

private:
    explicit BindError(Kind kind) : kind_(kind) {}

    Kind kind_;
    std::string name_;
    std::vector<std::string> candidates_;
    std::vector<std::string> suggestions_;
    std::size_t expected_{0};
    std::size_t got_{0};
    bool named_{false};
};

std::string_view toString(BindError::Kind kind);

// Resolved arguments, ready for invocation. Only ever produced complete.
class BoundArgs {
public:
    using NamedEntry = std::pair<std::string, ArgValue>;

    // Declared positional parameters in order, then the variadic tail.
    [[nodiscard]] const std::vector<ArgValue>& positionals() const { return positionals_; }
    // Parameter name of each declared positional value (the variadic tail has none).
    [[nodiscard]] const std::vector<std::string>& positionalNames() const { return positionalNames_; }
    [[nodiscard]] std::vector<ArgValue> variadic() const {
        return {positionals_.begin() + static_cast<std::ptrdiff_t>(positionalNames_.size()), positionals_.end()};
    }
    // Declared names, variadic-named overflow and universal flags, in binding order.
    [[nodiscard]] const std::vector<NamedEntry>& named() const { return named_; }

    // Looks through declared positional names first, then the named entries.
    [[nodiscard]] const ArgValue* find(std::string_view name) const;
    [[nodiscard]] bool has(std::string_view name) const { return find(name) != nullptr; }

    // Throws std::out_of_range when nothing is bound to `name`, std::invalid_argument
    // when the value does not convert.
    template <typename T>
    T get(std::string_view name) const {
        const auto* v = find(name);
        if (!v) throw std::out_of_range("argument not bound: " + std::string(name));
        return convertArgValue<T>(*v);
    }

    // True when `name` is bound to a truthy value.
    [[nodiscard]] bool flag(std::string_view name) const {
        const auto* v = find(name);
        return v != nullptr && isTruthy(*v);
    }

private:
    friend class Binder;

    std::vector<ArgValue> positionals_;
    std::vector<std::string> positionalNames_;
    std::vector<NamedEntry> named_;
};

using BindResult = std::variant<BoundArgs, BindError>;

class Binder {
public:
    struct Options {
        // --verb resolves to --verbose when no other unmatched name starts with "verb".
        bool allowAbbreviations{true};
        bool suggestions{true};
        std::size_t suggestionsMinimumDistance{2};
    };

    Binder() : Binder(Options{}) {}
    explicit Binder(Options options) : options_(options) {}

    // Binds in two phases (positionals, then named options) and stops at the first error.
    [[nodiscard]] BindResult bind(const RawPositionals& positionals, const RawOptions& options, const ArgSpec& spec) const;

    [[nodiscard]] const Options& options() const { return options_; }

private:
    Options options_;
};

[[nodiscard]] BindResult bind(const RawPositionals& positionals,
                              const RawOptions& options,
                              const ArgSpec& spec,
                              const Binder::Options& binderOptions = {});

} // namespace mcli

#endif // MCLI_BINDER_HPP
