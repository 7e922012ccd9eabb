#include "flagkit/string_utils.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>

namespace flagkit {
namespace string_utils {

// Attribute text matching

std::string_view trim_left(std::string_view str) noexcept {
  auto start = str.find_first_not_of(" \t\n\r\f\v");
  return start == std::string_view::npos ? std::string_view{}
                                         : str.substr(start);
}

std::string_view trim_right(std::string_view str) noexcept {
  auto end = str.find_last_not_of(" \t\n\r\f\v");
  return end == std::string_view::npos ? std::string_view{}
                                       : str.substr(0, end + 1);
}

std::string_view trim(std::string_view str) noexcept {
  return trim_left(trim_right(str));
}

bool iequals(std::string_view lhs, std::string_view rhs) noexcept {
  if (lhs.size() != rhs.size()) {
    return false;
  }

  return std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
    return std::tolower(static_cast<unsigned char>(a)) ==
           std::tolower(static_cast<unsigned char>(b));
  });
}

bool istarts_with(std::string_view str, std::string_view prefix) noexcept {
  return str.size() >= prefix.size() &&
         iequals(str.substr(0, prefix.size()), prefix);
}

bool iends_with(std::string_view str, std::string_view suffix) noexcept {
  return str.size() >= suffix.size() &&
         iequals(str.substr(str.size() - suffix.size()), suffix);
}

bool icontains(std::string_view str, std::string_view needle) noexcept {
  return find(str, needle, 0, false) != std::string_view::npos;
}

std::size_t find(std::string_view str, std::string_view substr, std::size_t pos,
                 bool case_sensitive) noexcept {
  if (case_sensitive) {
    return str.find(substr, pos);
  }

  if (substr.empty())
    return pos <= str.size() ? pos : std::string_view::npos;
  if (pos >= str.size() || substr.size() > str.size() - pos)
    return std::string_view::npos;

  for (std::size_t i = pos; i <= str.size() - substr.size(); ++i) {
    if (iequals(str.substr(i, substr.size()), substr)) {
      return i;
    }
  }

  return std::string_view::npos;
}

std::string to_lower(std::string_view str) {
  std::string result(str);
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return result;
}

std::vector<std::string> split(std::string_view str, char delimiter) {
  std::vector<std::string> parts;
  std::size_t start = 0;
  while (true) {
    auto pos = str.find(delimiter, start);
    if (pos == std::string_view::npos) {
      parts.emplace_back(str.substr(start));
      break;
    }
    parts.emplace_back(str.substr(start, pos - start));
    start = pos + 1;
  }
  return parts;
}

// Numeric attributes and rollout percentages

std::optional<double> parse_double(std::string_view str) {
  str = trim(str);
  if (str.empty()) {
    return std::nullopt;
  }
  if (str.front() == '+') {
    str.remove_prefix(1);
    if (str.empty() || str.front() == '-') {
      return std::nullopt;
    }
  }

  double value = 0.0;
  const char *first = str.data();
  const char *last = str.data() + str.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last || !std::isfinite(value)) {
    return std::nullopt;
  }
  return value;
}

std::string format_number(double value) {
  if (std::isfinite(value) && std::trunc(value) == value &&
      std::fabs(value) < 1e15) {
    return std::to_string(static_cast<long long>(value));
  }

  std::array<char, 64> buffer{};
  auto [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(),
                                 value);
  if (ec != std::errc()) {
    return std::to_string(value);
  }
  return std::string(buffer.data(), ptr);
}

} // namespace string_utils
} // namespace flagkit
