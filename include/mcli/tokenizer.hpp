#ifndef MCLI_TOKENIZER_HPP
#define MCLI_TOKENIZER_HPP

#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "value.hpp"

namespace mcli {

using RawPositionals = std::vector<std::string>;

// Option name -> value, iterated in first-insertion order. Setting an existing name
// overwrites its value in place (last write wins).
class RawOptions {
public:
    using Entry = std::pair<std::string, ArgValue>;
    using const_iterator = std::vector<Entry>::const_iterator;

    RawOptions() = default;
    RawOptions(std::initializer_list<Entry> entries) {
        for (const auto& e : entries) set(e.first, e.second);
    }

    void set(std::string name, ArgValue value);

    [[nodiscard]] const ArgValue* find(std::string_view name) const;
    [[nodiscard]] bool contains(std::string_view name) const { return find(name) != nullptr; }

    [[nodiscard]] std::size_t size() const { return entries_.size(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }
    [[nodiscard]] const_iterator begin() const { return entries_.begin(); }
    [[nodiscard]] const_iterator end() const { return entries_.end(); }

    friend bool operator==(const RawOptions& a, const RawOptions& b) { return a.entries_ == b.entries_; }
    friend bool operator!=(const RawOptions& a, const RawOptions& b) { return !(a == b); }

private:
    std::vector<Entry> entries_;
    std::unordered_map<std::string, std::size_t> index_;
};

struct Tokens {
    RawPositionals positionals;
    RawOptions options;
};

// Splits raw arguments into positionals and options without any knowledge of the target
// parameters. Recognized shapes, first match wins:
//
//   -x             flag x = true
//   --create-new   flag create_new = true
//   -x:value       option x = "value"
//   --name=value   option name = "value"
//
// Everything else (including "-", "--", "-5" and "-xy") is a positional, kept verbatim.
// Option names are normalized from CLI style to identifier style (create-new -> create_new).
class Tokenizer {
public:
    struct Options {
        // A bare "--" ends option recognition; it is dropped and later tokens are positional.
        bool endOfOptions{false};
        // Every token is positional.
        bool disableOptionParsing{false};
    };

    Tokenizer() : Tokenizer(Options{}) {}
    explicit Tokenizer(Options options) : options_(options) {}

    [[nodiscard]] Tokens tokenize(const std::vector<std::string>& args) const;

    [[nodiscard]] const Options& options() const { return options_; }

private:
    Options options_;
};

[[nodiscard]] Tokens tokenize(const std::vector<std::string>& args, const Tokenizer::Options& options = {});

// argv[0] (the program name) is skipped.
[[nodiscard]] Tokens tokenize(int argc, char** argv, const Tokenizer::Options& options = {});

} // namespace mcli

#endif // MCLI_TOKENIZER_HPP
