#ifndef MCLI_VALUE_HPP
#define MCLI_VALUE_HPP

#include <cstdint>
#include <string>
#include <variant>

namespace mcli {

// Command-line values are always bool (bare flag) or std::string; defaults may hold any alternative.
using ArgValue = std::variant<bool, int, std::int64_t, std::uint64_t, double, std::string>;

// Textual form of a value: true/false, decimal numbers, strings verbatim.
[[nodiscard]] std::string toString(const ArgValue& value);

// Truthiness used for flags: bool literals are parsed, other strings are true when non-empty.
[[nodiscard]] bool isTruthy(const ArgValue& value);

// Typed conversion. String sources are parsed, numeric sources are range-checked.
// Throws std::invalid_argument when the value cannot be represented as T.
template <typename T>
T convertArgValue(const ArgValue& value);

template <>
bool convertArgValue<bool>(const ArgValue& value);
template <>
int convertArgValue<int>(const ArgValue& value);
template <>
std::int64_t convertArgValue<std::int64_t>(const ArgValue& value);
template <>
std::uint32_t convertArgValue<std::uint32_t>(const ArgValue& value);
template <>
std::uint64_t convertArgValue<std::uint64_t>(const ArgValue& value);
template <>
float convertArgValue<float>(const ArgValue& value);
template <>
double convertArgValue<double>(const ArgValue& value);
template <>
std::string convertArgValue<std::string>(const ArgValue& value);

} // namespace mcli

#endif // MCLI_VALUE_HPP
