#include "mcli/value.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <type_traits>

namespace {

using mcli::ArgValue;

std::string_view stripSpace(std::string_view s) {
    const auto isSpace = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!s.empty() && isSpace(s.front())) s.remove_prefix(1);
    while (!s.empty() && isSpace(s.back())) s.remove_suffix(1);
    return s;
}

// Case-insensitive flag spellings.
std::optional<bool> parseBoolWord(std::string_view s) {
    std::string word(stripSpace(s));
    std::transform(word.begin(), word.end(), word.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (word == "1" || word == "true" || word == "on" || word == "yes") return true;
    if (word == "0" || word == "false" || word == "off" || word == "no") return false;
    return std::nullopt;
}

// Runs a strto* function over the whole of `s`. Trailing text or overflow fails.
template <typename R, typename Fn>
std::optional<R> parseWith(std::string_view s, Fn parse) {
    const std::string text(stripSpace(s));
    if (text.empty()) return std::nullopt;
    char* end = nullptr;
    errno = 0;
    const R v = parse(text.c_str(), &end);
    if (errno == ERANGE || end != text.c_str() + text.size()) return std::nullopt;
    return v;
}

template <typename T, typename V>
std::optional<T> narrowTo(V v) {
    if constexpr (std::is_signed_v<V>) {
        if (v < 0) {
            if constexpr (std::is_signed_v<T>) {
                if (static_cast<long long>(v) >= static_cast<long long>(std::numeric_limits<T>::min())) {
                    return static_cast<T>(v);
                }
            }
            return std::nullopt;
        }
    }
    if (static_cast<unsigned long long>(v) > static_cast<unsigned long long>(std::numeric_limits<T>::max())) {
        return std::nullopt;
    }
    return static_cast<T>(v);
}

template <typename T>
std::optional<T> parseInteger(std::string_view s) {
    if constexpr (std::is_signed_v<T>) {
        const auto v = parseWith<long long>(s, [](const char* p, char** end) { return std::strtoll(p, end, 0); });
        if (!v) return std::nullopt;
        return narrowTo<T>(*v);
    } else {
        // strtoull accepts and wraps a leading minus.
        const auto t = stripSpace(s);
        if (!t.empty() && t.front() == '-') return std::nullopt;
        const auto v = parseWith<unsigned long long>(t, [](const char* p, char** end) { return std::strtoull(p, end, 0); });
        if (!v) return std::nullopt;
        return narrowTo<T>(*v);
    }
}

std::invalid_argument invalidValue(const char* typeName, const ArgValue& value) {
    return std::invalid_argument(std::string("invalid ") + typeName + ": " + mcli::toString(value));
}

template <typename T>
T toIntegral(const ArgValue& value, const char* typeName) {
    const auto result = std::visit(
        [](const auto& v) -> std::optional<T> {
            using V = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<V, std::string>) {
                return parseInteger<T>(v);
            } else if constexpr (std::is_same_v<V, bool>) {
                return static_cast<T>(v ? 1 : 0);
            } else if constexpr (std::is_floating_point_v<V>) {
                // Whole numbers only, and within long long range.
                if (!(v >= -9.2e18 && v <= 9.2e18) || std::trunc(v) != v) return std::nullopt;
                return narrowTo<T>(static_cast<long long>(v));
            } else {
                return narrowTo<T>(v);
            }
        },
        value);
    if (!result) throw invalidValue(typeName, value);
    return *result;
}

double toFloating(const ArgValue& value, const char* typeName) {
    const auto result = std::visit(
        [](const auto& v) -> std::optional<double> {
            using V = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<V, std::string>) {
                return parseWith<double>(v, [](const char* p, char** end) { return std::strtod(p, end); });
            } else if constexpr (std::is_same_v<V, bool>) {
                return v ? 1.0 : 0.0;
            } else {
                return static_cast<double>(v);
            }
        },
        value);
    if (!result) throw invalidValue(typeName, value);
    return *result;
}

} // namespace

namespace mcli {

std::string toString(const ArgValue& value) {
    return std::visit(
        [](const auto& v) -> std::string {
            using V = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<V, std::string>) {
                return v;
            } else if constexpr (std::is_same_v<V, bool>) {
                return v ? "true" : "false";
            } else if constexpr (std::is_floating_point_v<V>) {
                // Shortest precision that parses back to the same value.
                std::string text;
                for (int digits = std::numeric_limits<V>::digits10; digits <= std::numeric_limits<V>::max_digits10; ++digits) {
                    std::ostringstream oss;
                    oss.precision(digits);
                    oss << v;
                    text = oss.str();
                    if (std::strtod(text.c_str(), nullptr) == v) break;
                }
                return text;
            } else {
                return std::to_string(v);
            }
        },
        value);
}

bool isTruthy(const ArgValue& value) {
    return std::visit(
        [](const auto& v) -> bool {
            using V = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<V, std::string>) {
                if (const auto b = parseBoolWord(v)) return *b;
                return !v.empty();
            } else if constexpr (std::is_same_v<V, bool>) {
                return v;
            } else {
                return v != 0;
            }
        },
        value);
}

template <>
bool convertArgValue<bool>(const ArgValue& value) {
    if (const auto* s = std::get_if<std::string>(&value)) {
        if (s->empty()) return false;
        const auto b = parseBoolWord(*s);
        if (!b) throw std::invalid_argument("invalid bool: " + *s);
        return *b;
    }
    return isTruthy(value);
}

template <>
int convertArgValue<int>(const ArgValue& value) {
    return toIntegral<int>(value, "int");
}

template <>
std::int64_t convertArgValue<std::int64_t>(const ArgValue& value) {
    return toIntegral<std::int64_t>(value, "int64");
}

template <>
std::uint32_t convertArgValue<std::uint32_t>(const ArgValue& value) {
    return toIntegral<std::uint32_t>(value, "uint32");
}

template <>
std::uint64_t convertArgValue<std::uint64_t>(const ArgValue& value) {
    return toIntegral<std::uint64_t>(value, "uint64");
}

template <>
float convertArgValue<float>(const ArgValue& value) {
    return static_cast<float>(toFloating(value, "float"));
}

template <>
double convertArgValue<double>(const ArgValue& value) {
    return toFloating(value, "double");
}

template <>
std::string convertArgValue<std::string>(const ArgValue& value) {
    return toString(value);
}

} // namespace mcli
