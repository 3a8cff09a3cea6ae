//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef VIBRA_ENGINE_METHOD_H_
#define VIBRA_ENGINE_METHOD_H_

//! @cond
#include <cstdint>
#include <ostream>
#include <string_view>

#include <absl/status/statusor.h>
//! @endcond

namespace vibra {
/**
 * @brief Level of theory used for optimization and frequency analysis.
 *
 * GFNFF is the cheap force-field method, the others are semiempirical tight
 * binding methods with a looser atom count limit.
 */
enum class Method : std::uint8_t {
  kGFNFF,
  kGFN2xTB,
  kGFN1xTB,
};

/**
 * @brief Parse a method name.
 *
 * @param name One of "GFNFF", "GFN2xTB", or "GFN1xTB" (case sensitive).
 * @return The method, or an InvalidArgument error for an unknown name.
 */
extern absl::StatusOr<Method> parse_method(std::string_view name);

extern std::string_view method_name(Method method);

inline bool is_force_field(Method method) {
  return method == Method::kGFNFF;
}

// NOLINTNEXTLINE(clang-diagnostic-unused-function)
inline std::ostream &operator<<(std::ostream &os, Method method) {
  return os << method_name(method);
}
}  // namespace vibra

#endif /* VIBRA_ENGINE_METHOD_H_ */
