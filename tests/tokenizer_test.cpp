#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "mcli/tokenizer.hpp"

namespace {

std::string stringOption(const mcli::RawOptions& options, const std::string& name) {
    const auto* v = options.find(name);
    if (!v) return "<missing>";
    const auto* s = std::get_if<std::string>(v);
    return s ? *s : "<not a string>";
}

bool flagOption(const mcli::RawOptions& options, const std::string& name) {
    const auto* v = options.find(name);
    if (!v) return false;
    const auto* b = std::get_if<bool>(v);
    return b != nullptr && *b;
}

std::vector<std::string> optionNames(const mcli::RawOptions& options) {
    std::vector<std::string> out;
    for (const auto& entry : options) out.push_back(entry.first);
    return out;
}

} // namespace

TEST(TokenizerTest, ShortFlag) {
    const auto tokens = mcli::tokenize({"-v"});
    EXPECT_TRUE(tokens.positionals.empty());
    ASSERT_EQ(tokens.options.size(), 1u);
    EXPECT_TRUE(flagOption(tokens.options, "v"));
}

TEST(TokenizerTest, LongFlagIsNormalized) {
    const auto tokens = mcli::tokenize({"--create-new"});
    EXPECT_TRUE(tokens.positionals.empty());
    ASSERT_EQ(tokens.options.size(), 1u);
    EXPECT_TRUE(flagOption(tokens.options, "create_new"));
    EXPECT_FALSE(tokens.options.contains("create-new"));
}

TEST(TokenizerTest, SingleLetterLongFlagIsPositional) {
    const auto tokens = mcli::tokenize({"--x", "--xy"});
    EXPECT_EQ(tokens.positionals, (std::vector<std::string>{"--x"}));
    EXPECT_EQ(optionNames(tokens.options), (std::vector<std::string>{"xy"}));
}

TEST(TokenizerTest, SingleLetterLongOptionWithValue) {
    const auto tokens = mcli::tokenize({"--x=1"});
    EXPECT_TRUE(tokens.positionals.empty());
    EXPECT_EQ(stringOption(tokens.options, "x"), "1");
}

TEST(TokenizerTest, ShortOptionWithValue) {
    const auto tokens = mcli::tokenize({"-o:out.txt", "-X:1"});
    EXPECT_EQ(stringOption(tokens.options, "o"), "out.txt");
    EXPECT_EQ(stringOption(tokens.options, "X"), "1");
    EXPECT_TRUE(tokens.positionals.empty());
}

TEST(TokenizerTest, LongOptionWithValue) {
    const auto tokens = mcli::tokenize({"--out-dir=/tmp/x", "--expr=a=b"});
    EXPECT_EQ(stringOption(tokens.options, "out_dir"), "/tmp/x");
    EXPECT_EQ(stringOption(tokens.options, "expr"), "a=b");
}

TEST(TokenizerTest, ValueKeepsDashes) {
    const auto tokens = mcli::tokenize({"--name=my-file"});
    EXPECT_EQ(stringOption(tokens.options, "name"), "my-file");
}

TEST(TokenizerTest, UnrecognizedShapesArePositional) {
    const std::vector<std::string> args{"-", "--", "-5", "-xy", "--x=", "-x:", "--1abc", "--a_b", "file.txt", ""};
    const auto tokens = mcli::tokenize(args);
    EXPECT_TRUE(tokens.options.empty());
    EXPECT_EQ(tokens.positionals, args);
}

TEST(TokenizerTest, PositionalOrderIsKept) {
    const auto tokens = mcli::tokenize({"a", "--verbose", "b", "-q", "c"});
    EXPECT_EQ(tokens.positionals, (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(optionNames(tokens.options), (std::vector<std::string>{"verbose", "q"}));
}

TEST(TokenizerTest, LastWriteWins) {
    const auto tokens = mcli::tokenize({"--x=1", "--x=2"});
    ASSERT_EQ(tokens.options.size(), 1u);
    EXPECT_EQ(stringOption(tokens.options, "x"), "2");
}

TEST(TokenizerTest, FlagAndValueConflictsResolveToLast) {
    const auto valueLast = mcli::tokenize({"--level", "--level=3"});
    EXPECT_EQ(stringOption(valueLast.options, "level"), "3");

    const auto flagLast = mcli::tokenize({"--level=3", "--level"});
    EXPECT_TRUE(flagOption(flagLast.options, "level"));
}

TEST(TokenizerTest, OverwriteKeepsFirstInsertionOrder) {
    const auto tokens = mcli::tokenize({"--alpha", "--beta", "--alpha=1"});
    EXPECT_EQ(optionNames(tokens.options), (std::vector<std::string>{"alpha", "beta"}));
    EXPECT_EQ(stringOption(tokens.options, "alpha"), "1");
}

TEST(TokenizerTest, DashAndUnderscoreSpellingsCollide) {
    const auto tokens = mcli::tokenize({"--dry-run=no", "--dry-run"});
    ASSERT_EQ(tokens.options.size(), 1u);
    EXPECT_TRUE(flagOption(tokens.options, "dry_run"));
}

TEST(TokenizerTest, IsDeterministic) {
    const std::vector<std::string> args{"in.txt", "--create-new", "-o:x", "--mode=fast", "out.txt"};
    const auto first = mcli::tokenize(args);
    const auto second = mcli::tokenize(args);
    EXPECT_EQ(first.positionals, second.positionals);
    EXPECT_TRUE(first.options == second.options);
}

TEST(TokenizerTest, DoubleDashIsPositionalByDefault) {
    const auto tokens = mcli::tokenize({"--", "--verbose"});
    EXPECT_EQ(tokens.positionals, (std::vector<std::string>{"--"}));
    EXPECT_TRUE(flagOption(tokens.options, "verbose"));
}

TEST(TokenizerTest, EndOfOptions) {
    mcli::Tokenizer::Options opts;
    opts.endOfOptions = true;
    const auto tokens = mcli::tokenize({"--verbose", "--", "--force", "-x"}, opts);
    EXPECT_EQ(tokens.positionals, (std::vector<std::string>{"--force", "-x"}));
    EXPECT_EQ(optionNames(tokens.options), (std::vector<std::string>{"verbose"}));
}

TEST(TokenizerTest, DisableOptionParsing) {
    mcli::Tokenizer::Options opts;
    opts.disableOptionParsing = true;
    const mcli::Tokenizer tokenizer(opts);
    const auto tokens = tokenizer.tokenize({"--verbose", "-x:1", "a"});
    EXPECT_TRUE(tokens.options.empty());
    EXPECT_EQ(tokens.positionals, (std::vector<std::string>{"--verbose", "-x:1", "a"}));
}

TEST(TokenizerTest, ArgvSkipsProgramName) {
    std::vector<std::string> storage{"prog", "input.txt", "--create-new"};
    std::vector<char*> argv;
    for (auto& s : storage) argv.push_back(s.data());

    const auto tokens = mcli::tokenize(static_cast<int>(argv.size()), argv.data());
    EXPECT_EQ(tokens.positionals, (std::vector<std::string>{"input.txt"}));
    EXPECT_TRUE(flagOption(tokens.options, "create_new"));
}

TEST(RawOptionsTest, InitializerListAppliesInOrder) {
    const mcli::RawOptions options{{"x", std::string("1")}, {"y", true}, {"x", std::string("2")}};
    EXPECT_EQ(options.size(), 2u);
    EXPECT_EQ(optionNames(options), (std::vector<std::string>{"x", "y"}));
    EXPECT_EQ(stringOption(options, "x"), "2");
    EXPECT_EQ(options.find("z"), nullptr);
}
