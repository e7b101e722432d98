#ifndef MCLI_COLOR_HPP
#define MCLI_COLOR_HPP

#include <iosfwd>
#include <optional>
#include <string_view>

namespace mcli {

enum class ColorMode {
    Auto,
    Always,
    Never,
};

namespace color {

// True only for std::cout, std::cerr and std::clog attached to a terminal. Any other
// stream (files, string streams) is never treated as a terminal.
bool isTerminal(const std::ostream& os);

// https://no-color.org/
bool noColorRequested();
bool dumbTerminal();

bool enabled(ColorMode mode, const std::ostream& os);

inline constexpr std::string_view kReset = "\x1b[0m";
inline constexpr std::string_view kBoldRed = "\x1b[1m\x1b[31m";

std::optional<ColorMode> parseMode(std::string_view s);
std::string_view modeName(ColorMode mode);

} // namespace color
} // namespace mcli

#endif // MCLI_COLOR_HPP
