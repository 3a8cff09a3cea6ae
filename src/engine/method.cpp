//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "vibra/engine/method.h"

#include <string_view>

#include <absl/log/absl_log.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

#include "vibra/status.h"

namespace vibra {
namespace {
  struct MethodEntry {
    Method method;
    std::string_view name;
  };

  constexpr MethodEntry kMethods[] = {
    {   Method::kGFNFF,   "GFNFF" },
    { Method::kGFN2xTB, "GFN2xTB" },
    { Method::kGFN1xTB, "GFN1xTB" },
  };
}  // namespace

absl::StatusOr<Method> parse_method(std::string_view name) {
  for (const MethodEntry &entry: kMethods) {
    if (entry.name == name)
      return entry.method;
  }

  return invalid_input_error(absl::StrCat("unknown method: ", name));
}

std::string_view method_name(Method method) {
  for (const MethodEntry &entry: kMethods) {
    if (entry.method == method)
      return entry.name;
  }

  ABSL_LOG(DFATAL) << "invalid method: " << static_cast<int>(method);
  return "";
}
}  // namespace vibra
