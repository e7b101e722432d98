#include <gtest/gtest.h>

#include <sstream>

#include "mcli/color.hpp"

TEST(ColorTest, ParseMode) {
    EXPECT_EQ(mcli::color::parseMode("auto"), mcli::ColorMode::Auto);
    EXPECT_EQ(mcli::color::parseMode("always"), mcli::ColorMode::Always);
    EXPECT_EQ(mcli::color::parseMode("never"), mcli::ColorMode::Never);
    EXPECT_FALSE(mcli::color::parseMode("sometimes").has_value());
}

TEST(ColorTest, ModeNameRoundTrips) {
    for (const auto mode : {mcli::ColorMode::Auto, mcli::ColorMode::Always, mcli::ColorMode::Never}) {
        EXPECT_EQ(mcli::color::parseMode(mcli::color::modeName(mode)), mode);
    }
}

TEST(ColorTest, ExplicitModesIgnoreTheStream) {
    std::ostringstream os;
    EXPECT_TRUE(mcli::color::enabled(mcli::ColorMode::Always, os));
    EXPECT_FALSE(mcli::color::enabled(mcli::ColorMode::Never, os));
}

TEST(ColorTest, AutoNeverColorsStringStreams) {
    std::ostringstream os;
    EXPECT_FALSE(mcli::color::isTerminal(os));
    EXPECT_FALSE(mcli::color::enabled(mcli::ColorMode::Auto, os));
}
