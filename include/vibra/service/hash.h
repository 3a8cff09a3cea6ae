//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef VIBRA_SERVICE_HASH_H_
#define VIBRA_SERVICE_HASH_H_

//! @cond
#include <string>
#include <string_view>
//! @endcond

namespace vibra {
/**
 * @brief Content hash of a string, as 32 lowercase hexadecimal digits.
 *
 * The hash is the MD5-based (version 3) name UUID of @p data, so it is stable
 * across processes and platforms.
 */
extern std::string content_hash(std::string_view data);
}  // namespace vibra

#endif /* VIBRA_SERVICE_HASH_H_ */
