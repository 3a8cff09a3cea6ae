//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef VIBRA_UTILS_H_
#define VIBRA_UTILS_H_

//! @cond
#include <algorithm>
#include <cstddef>
#include <functional>
#include <iterator>
#include <numeric>
#include <string_view>
#include <type_traits>

#include <absl/base/optimization.h>
#include <absl/strings/ascii.h>
#include <Eigen/Dense>
//! @endcond

#include "vibra/eigen_config.h"
#include "vibra/meta.h"

namespace vibra {
template <class T, std::enable_if_t<std::is_trivially_copyable_v<T>, int> = 0>
constexpr T min(T a, T b) {
  return std::min(a, b);
}

template <class T, std::enable_if_t<std::is_trivially_copyable_v<T>, int> = 0>
constexpr T max(T a, T b) {
  return std::max(a, b);
}

template <class T, std::enable_if_t<std::is_trivially_copyable_v<T>, int> = 0>
constexpr T clamp(T v, T l, T h) {
  return std::clamp(v, l, h);
}

template <int N = Eigen::Dynamic>
auto generate_index(Eigen::Index size) {
  Array<int, N, 1> result(size);
  std::iota(result.begin(), result.end(), 0);
  return result;
}

/**
 * @brief Indices that would sort the container.
 *
 * The sort is stable, so equal elements keep their relative order. This is
 * required wherever the resulting order is observable by callers.
 */
template <int N = Eigen::Dynamic, class Container, class Comp = std::less<>>
auto argsort(const Container &container, Comp op = {}) {
  auto idxs = generate_index<N>(
      static_cast<Eigen::Index>(std::size(container)));
  std::stable_sort(idxs.begin(), idxs.end(),
                   [&](int i, int j) { return op(container[i], container[j]); });
  return idxs;
}

constexpr std::string_view slice(std::string_view str, std::size_t begin,
                                 std::size_t end) {
  return str.substr(begin, end - begin);
}

constexpr std::string_view safe_slice(std::string_view str, size_t begin,
                                      size_t end) {
  if (ABSL_PREDICT_FALSE(begin > str.size()))
    return "";

  return slice(str, begin, end);
}

inline std::string_view safe_slice_strip(std::string_view str, size_t begin,
                                         size_t end) {
  return absl::StripAsciiWhitespace(safe_slice(str, begin, end));
}

template <class Scalar, std::enable_if_t<std::is_arithmetic_v<Scalar>, int> = 0>
constexpr Scalar nonnegative(Scalar x) {
  return vibra::max(x, static_cast<Scalar>(0));
}

template <class T = int, std::enable_if_t<std::is_arithmetic_v<T>, int> = 0>
constexpr T value_if(bool cond, T val = 1) {
  return static_cast<T>(cond) * val;
}
}  // namespace vibra

#endif /* VIBRA_UTILS_H_ */
