//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "vibra/service/hash.h"

#include <string>

#include <absl/strings/ascii.h>

#include <gtest/gtest.h>

namespace vibra {
namespace {
TEST(ContentHashTest, Format) {
  for (const char *data: { "", "O", "CCO GFN2xTB" }) {
    std::string hash = content_hash(data);
    ASSERT_EQ(hash.size(), 32) << data;
    for (char c: hash) {
      EXPECT_TRUE(absl::ascii_isxdigit(c)) << hash;
      EXPECT_FALSE(absl::ascii_isupper(c)) << hash;
    }
  }
}

TEST(ContentHashTest, Deterministic) {
  EXPECT_EQ(content_hash("c1ccccc1"), content_hash(std::string("c1ccccc1")));
  EXPECT_NE(content_hash("c1ccccc1"), content_hash("C1=CC=CC=C1"));
  EXPECT_NE(content_hash("CCO"), content_hash("CCO "));
  EXPECT_NE(content_hash(""), content_hash(std::string(1, '\0')));
}
}  // namespace
}  // namespace vibra
