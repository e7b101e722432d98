#include "mcli/color.hpp"

#include <cstdio>
#include <cstdlib>
#include <iostream>

#if defined(_WIN32)
#include <io.h>
#else
#include <unistd.h>
#endif

namespace mcli::color {

bool isTerminal(const std::ostream& os) {
    std::FILE* file = nullptr;
    if (&os == &std::cout) {
        file = stdout;
    } else if (&os == &std::cerr || &os == &std::clog) {
        file = stderr;
    } else {
        return false;
    }
#if defined(_WIN32)
    return _isatty(_fileno(file)) != 0;
#else
    return ::isatty(fileno(file)) != 0;
#endif
}

bool noColorRequested() { return std::getenv("NO_COLOR") != nullptr; }

bool dumbTerminal() {
    const char* term = std::getenv("TERM");
    return term != nullptr && std::string_view(term) == "dumb";
}

bool enabled(ColorMode mode, const std::ostream& os) {
    if (mode == ColorMode::Always) return true;
    if (mode == ColorMode::Never) return false;
    return !noColorRequested() && !dumbTerminal() && isTerminal(os);
}

std::optional<ColorMode> parseMode(std::string_view s) {
    if (s == "auto") return ColorMode::Auto;
    if (s == "always") return ColorMode::Always;
    if (s == "never") return ColorMode::Never;
    return std::nullopt;
}

std::string_view modeName(ColorMode mode) {
    switch (mode) {
        case ColorMode::Always: return "always";
        case ColorMode::Never: return "never";
        case ColorMode::Auto: break;
    }
    return "auto";
}

} // namespace mcli::color
