#include "mcli/tokenizer.hpp"

#include "mcli/utils.hpp"

namespace {

bool isLetter(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

// A letter followed by letters or dashes.
bool isLongName(std::string_view s) {
    if (s.empty() || !isLetter(s.front())) return false;
    for (const char c : s.substr(1)) {
        if (!isLetter(c) && c != '-') return false;
    }
    return true;
}

bool isShortFlag(std::string_view s) {
    return s.size() == 2 && s[0] == '-' && isLetter(s[1]);
}

// At least two name characters; --x alone is a positional.
bool isLongFlag(std::string_view s) {
    return s.size() > 3 && s.rfind("--", 0) == 0 && isLongName(s.substr(2));
}

bool isShortOption(std::string_view s) {
    return s.size() > 3 && s[0] == '-' && isLetter(s[1]) && s[2] == ':';
}

// Returns the position of '=' for a well-formed --name=value token, npos otherwise.
std::size_t longOptionSplit(std::string_view s) {
    if (s.rfind("--", 0) != 0) return std::string_view::npos;
    const auto eq = s.find('=', 2);
    if (eq == std::string_view::npos || eq + 1 >= s.size()) return std::string_view::npos;
    if (!isLongName(s.substr(2, eq - 2))) return std::string_view::npos;
    return eq;
}

} // namespace

namespace mcli {

void RawOptions::set(std::string name, ArgValue value) {
    const auto it = index_.find(name);
    if (it != index_.end()) {
        entries_[it->second].second = std::move(value);
        return;
    }
    index_.emplace(name, entries_.size());
    entries_.emplace_back(std::move(name), std::move(value));
}

const ArgValue* RawOptions::find(std::string_view name) const {
    const auto it = index_.find(std::string(name));
    if (it == index_.end()) return nullptr;
    return &entries_[it->second].second;
}

Tokens Tokenizer::tokenize(const std::vector<std::string>& args) const {
    Tokens out;
    if (options_.disableOptionParsing) {
        out.positionals = args;
        return out;
    }

    bool positionalOnly = false;
    for (const auto& arg : args) {
        if (positionalOnly) {
            out.positionals.push_back(arg);
            continue;
        }
        if (options_.endOfOptions && arg == "--") {
            positionalOnly = true;
            continue;
        }

        if (isShortFlag(arg)) {
            out.options.set(arg.substr(1), true);
        } else if (isLongFlag(arg)) {
            out.options.set(utils::toIdentifier(arg.substr(2)), true);
        } else if (isShortOption(arg)) {
            out.options.set(arg.substr(1, 1), arg.substr(3));
        } else if (const auto eq = longOptionSplit(arg); eq != std::string_view::npos) {
            out.options.set(utils::toIdentifier(arg.substr(2, eq - 2)), arg.substr(eq + 1));
        } else {
            out.positionals.push_back(arg);
        }
    }
    return out;
}

Tokens tokenize(const std::vector<std::string>& args, const Tokenizer::Options& options) {
    return Tokenizer(options).tokenize(args);
}

Tokens tokenize(int argc, char** argv, const Tokenizer::Options& options) {
    std::vector<std::string> args;
    if (argc > 1) args.reserve(static_cast<std::size_t>(argc - 1));
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    return tokenize(args, options);
}

} // namespace mcli
