//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "vibra/service/hash.h"

#include <string>
#include <string_view>

#include <absl/strings/str_format.h>
#include <boost/uuid/name_generator_md5.hpp>
#include <boost/uuid/nil_generator.hpp>
#include <boost/uuid/uuid.hpp>

namespace vibra {
std::string content_hash(std::string_view data) {
  boost::uuids::name_generator_md5 gen(boost::uuids::nil_uuid());
  const boost::uuids::uuid id = gen(data.data(), data.size());

  std::string hex;
  hex.reserve(2 * id.size());
  for (const auto byte: id)
    absl::StrAppendFormat(&hex, "%02x", static_cast<unsigned int>(byte));
  return hex;
}
}  // namespace vibra
