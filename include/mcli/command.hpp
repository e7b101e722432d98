#ifndef MCLI_COMMAND_HPP
#define MCLI_COMMAND_HPP

#include <cstddef>
#include <exception>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "argspec.hpp"
#include "binder.hpp"
#include "color.hpp"
#include "tokenizer.hpp"
#include "value.hpp"

namespace mcli {

// Wraps one target operation: strips the program name, answers -h/--help, traces with
// -d/--debug, binds the arguments against the operation's ArgSpec and runs it.
//
//   mcli::Command cmd("copy", "Copy a file", helpText);
//   cmd.spec(mcli::ArgSpecBuilder().positionalOnly("in_file").positionalOnly("out_file").build())
//       .action([](const mcli::BoundArgs& args) { ...; return 0; });
//   return cmd.run(argc, argv);
class Command {
public:
    using Action = std::function<int(const BoundArgs& args)>;
    // Return empty optional on success, otherwise an error message.
    using ActionE = std::function<std::optional<std::string>(const BoundArgs& args)>;

    explicit Command(std::string name, std::string shortDesc = {}, std::string help = {})
        : name_(std::move(name)),
          short_(std::move(shortDesc)),
          help_(std::move(help)) {}

    Command& setOut(std::ostream& os) {
        out_ = &os;
        return *this;
    }

    Command& setErr(std::ostream& os) {
        err_ = &os;
        return *this;
    }

    Command& spec(ArgSpec s) {
        spec_ = std::move(s);
        return *this;
    }

    Command& action(Action a) {
        action_ = std::move(a);
        return *this;
    }

    Command& actionE(ActionE a) {
        actionE_ = std::move(a);
        return *this;
    }

    // Arguments used by execute(), without the program name.
    Command& setArgs(std::vector<std::string> args) {
        argsOverride_ = std::move(args);
        return *this;
    }

    Command& silenceErrors(bool v = true) {
        silenceErrors_ = v;
        return *this;
    }

    Command& silenceUsage(bool v = true) {
        silenceUsage_ = v;
        return *this;
    }

    Command& colorMode(ColorMode mode) {
        colorMode_ = mode;
        return *this;
    }

    Command& tokenizerOptions(Tokenizer::Options opts) {
        tokenizerOptions_ = opts;
        return *this;
    }

    Command& binderOptions(Binder::Options opts) {
        binderOptions_ = opts;
        return *this;
    }

    // A bare "--" ends option recognition.
    Command& endOfOptions(bool v = true) {
        tokenizerOptions_.endOfOptions = v;
        return *this;
    }

    Command& allowAbbreviations(bool v = true) {
        binderOptions_.allowAbbreviations = v;
        return *this;
    }

    Command& suggestions(bool v = true) {
        binderOptions_.suggestions = v;
        return *this;
    }

    Command& suggestionsMinimumDistance(std::size_t d) {
        binderOptions_.suggestionsMinimumDistance = d;
        return *this;
    }

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const std::string& shortDescription() const { return short_; }
    [[nodiscard]] const ArgSpec& argSpec() const { return spec_; }

    int execute() { return runArgs(argsOverride_.value_or(std::vector<std::string>{})); }

    int execute(int argc, char** argv) { return run(argc, argv); }

    // argv[0] is the program name and is skipped.
    int run(int argc, char** argv) {
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
        return runArgs(args);
    }

    void printHelp() const {
        if (help_.empty()) {
            out() << name_;
            if (!short_.empty()) out() << " - " << short_;
            out() << "\n";
            return;
        }
        out() << help_;
        if (help_.back() != '\n') out() << "\n";
    }

private:
    int runArgs(const std::vector<std::string>& args) {
        // Help bypasses binding entirely.
        if (hasRawToken(args, "-h", "--help")) {
            printHelp();
            return 0;
        }
        const bool debug = hasRawToken(args, "-d", "--debug");

        const auto tokens = tokenize(args, tokenizerOptions_);
        if (debug) {
            trace("parsed positionals: " + formatList(tokens.positionals));
            trace("parsed options: " + formatOptions(tokens.options));
            trace("spec: " + formatSpec(spec_));
        }

        const auto result = Binder(binderOptions_).bind(tokens.positionals, tokens.options, spec_);
        if (const auto* e = std::get_if<BindError>(&result)) {
            if (debug) trace(std::string("bind failed: ") + std::string(toString(e->kind())));
            return fail(e->message(), /*showUsage=*/true);
        }
        const auto& bound = std::get<BoundArgs>(result);
        if (debug) {
            trace("bound positionals: " + formatList(bound.positionals()));
            trace("bound named: " + formatNamed(bound.named()));
        }

        try {
            if (actionE_) {
                if (auto err = actionE_(bound)) return fail(*err, /*showUsage=*/false);
                return 0;
            }
            if (action_) return action_(bound);
            return 0;
        } catch (const std::exception& ex) {
            // Debug runs surface the original exception to the caller.
            if (debug) throw;
            return fail(std::string("fatal: ") + ex.what(), /*showUsage=*/false);
        }
    }

    bool hasRawToken(const std::vector<std::string>& args, std::string_view shortForm, std::string_view longForm) const {
        if (tokenizerOptions_.disableOptionParsing) return false;
        for (const auto& a : args) {
            if (tokenizerOptions_.endOfOptions && a == "--") return false;
            if (a == shortForm || a == longForm) return true;
        }
        return false;
    }

    std::ostream& out() const {
        if (out_) return *out_;
        return std::cout;
    }

    std::ostream& err() const {
        if (err_) return *err_;
        return std::cerr;
    }

    int fail(std::string message, bool showUsage) const {
        if (!silenceErrors_ && !message.empty()) {
            if (color::enabled(colorMode_, err())) {
                err() << color::kBoldRed << "Error:" << color::kReset << " " << message;
            } else {
                err() << "Error: " << message;
            }
            if (message.back() != '\n') err() << "\n";
        }
        if (showUsage && !silenceUsage_) {
            err() << "Run '" << name_ << " --help' for usage.\n";
        }
        return 1;
    }

    void trace(const std::string& line) const {
        err() << "[debug] " << line << "\n";
    }

    static std::string formatValue(const ArgValue& v) {
        if (const auto* s = std::get_if<std::string>(&v)) return "\"" + *s + "\"";
        return toString(v);
    }

    template <typename Seq>
    static std::string formatList(const Seq& values) {
        std::string out = "[";
        bool first = true;
        for (const auto& v : values) {
            if (!first) out += ", ";
            first = false;
            out += formatValue(v);
        }
        return out + "]";
    }

    template <typename Map>
    static std::string formatNamed(const Map& entries) {
        std::string out = "{";
        bool first = true;
        for (const auto& entry : entries) {
            if (!first) out += ", ";
            first = false;
            out += entry.first + ": " + formatValue(entry.second);
        }
        return out + "}";
    }

    static std::string formatOptions(const RawOptions& options) { return formatNamed(options); }

    static std::string formatSpec(const ArgSpec& spec) {
        std::string out = "(";
        bool first = true;
        for (const auto& p : spec.params()) {
            if (!first) out += ", ";
            first = false;
            out += p.name() + ": " + std::string(toString(p.kind()));
            if (p.hasDefault()) out += " = " + formatValue(*p.defaultValue());
        }
        return out + ")";
    }

    std::string name_;
    std::string short_;
    std::string help_;
    ArgSpec spec_;
    Action action_;
    ActionE actionE_;
    std::optional<std::vector<std::string>> argsOverride_;
    Tokenizer::Options tokenizerOptions_{};
    Binder::Options binderOptions_{};
    ColorMode colorMode_{ColorMode::Never};
    bool silenceErrors_{false};
    bool silenceUsage_{false};
    std::ostream* out_{nullptr};
    std::ostream* err_{nullptr};
};

} // namespace mcli

#endif // MCLI_COMMAND_HPP
