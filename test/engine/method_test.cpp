//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "vibra/engine/method.h"

#include <sstream>

#include <absl/status/statusor.h>

#include <gtest/gtest.h>

#include "vibra/status.h"

namespace vibra {
namespace {
TEST(MethodTest, NamesRoundTrip) {
  for (Method method: { Method::kGFNFF, Method::kGFN2xTB, Method::kGFN1xTB }) {
    absl::StatusOr<Method> parsed = parse_method(method_name(method));
    ASSERT_TRUE(parsed.ok()) << parsed.status();
    EXPECT_EQ(*parsed, method);
  }

  EXPECT_EQ(method_name(Method::kGFN2xTB), "GFN2xTB");

  std::ostringstream oss;
  oss << Method::kGFN1xTB;
  EXPECT_EQ(oss.str(), "GFN1xTB");
}

TEST(MethodTest, UnknownName) {
  for (const char *name: { "gfnff", "GFN0xTB", "", "GFN2xTB " }) {
    absl::StatusOr<Method> parsed = parse_method(name);
    ASSERT_FALSE(parsed.ok()) << name;
    EXPECT_TRUE(is_invalid_input(parsed.status()));
  }
}

TEST(MethodTest, ForceField) {
  EXPECT_TRUE(is_force_field(Method::kGFNFF));
  EXPECT_FALSE(is_force_field(Method::kGFN2xTB));
  EXPECT_FALSE(is_force_field(Method::kGFN1xTB));
}
}  // namespace
}  // namespace vibra
