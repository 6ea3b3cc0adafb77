#pragma once

#include <limits>
#include <optional>
#include <type_traits>

namespace pledge::common {

/// Sum of two integers, or std::nullopt when the result does not fit in T.
template <typename T>
  requires std::is_integral_v<T>
constexpr std::optional<T> checked_add(const T lhs, const T rhs) {
  if (rhs > 0 && lhs > std::numeric_limits<T>::max() - rhs) {
    return std::nullopt;
  }
  if constexpr (std::is_signed_v<T>) {
    if (rhs < 0 && lhs < std::numeric_limits<T>::min() - rhs) {
      return std::nullopt;
    }
  }
  return static_cast<T>(lhs + rhs);
}

}  // namespace pledge::common
