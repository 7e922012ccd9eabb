#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace flagkit {

// Heterogeneous hasher so maps keyed by std::string accept string_view and
// const char* lookups without building a temporary string.
struct TransparentStringHash {
  using is_transparent = void;

  template <typename StringType>
  std::size_t operator()(const StringType &str) const {
    return std::hash<std::string_view>{}(str);
  }
};

template <typename Value>
using StringMap = std::unordered_map<std::string, Value, TransparentStringHash,
                                     std::equal_to<>>;

using StringSet =
    std::unordered_set<std::string, TransparentStringHash, std::equal_to<>>;

} // namespace flagkit
