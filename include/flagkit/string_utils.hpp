#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace flagkit {
namespace string_utils {

// Attribute text matching

std::string_view trim_left(std::string_view str) noexcept;
std::string_view trim_right(std::string_view str) noexcept;
std::string_view trim(std::string_view str) noexcept;

/**
 * Case-insensitive comparisons. Folding is ASCII-only, which covers the
 * attribute values targeting rules compare (ids, emails, plan names).
 */
bool iequals(std::string_view lhs, std::string_view rhs) noexcept;
bool istarts_with(std::string_view str, std::string_view prefix) noexcept;
bool iends_with(std::string_view str, std::string_view suffix) noexcept;
bool icontains(std::string_view str, std::string_view needle) noexcept;

// Position of @p substr at or after @p pos, npos when absent.
std::size_t find(std::string_view str, std::string_view substr,
                 std::size_t pos = 0, bool case_sensitive = true) noexcept;

std::string to_lower(std::string_view str);

std::vector<std::string> split(std::string_view str, char delimiter);

// Numeric attributes and rollout percentages

/**
 * Parses the whole of @p str (surrounding whitespace ignored) as a finite
 * decimal floating point number. Returns nullopt for partial parses
 * ("12abc"), empty input, NaN and infinities.
 */
std::optional<double> parse_double(std::string_view str);

/**
 * Shortest text that round-trips @p value. Integral values print without a
 * fractional part ("50", "-3"), others in the shortest decimal form ("12.5").
 */
std::string format_number(double value);

} // namespace string_utils
} // namespace flagkit
