//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef VIBRA_STATUS_H_
#define VIBRA_STATUS_H_

//! @cond
#include <string_view>

#include <absl/status/status.h>
//! @endcond

namespace vibra {
/**
 * @defgroup errors Pipeline error kinds
 *
 * The pipeline reports failures as absl::Status values. Each error kind maps
 * to one canonical status code:
 *
 * | Kind          | Code                 |
 * | ------------- | -------------------- |
 * | Invalid input | `kInvalidArgument`   |
 * | Too large     | `kResourceExhausted` |
 * | Engine        | `kInternal`          |
 * | Timeout       | `kDeadlineExceeded`  |
 *
 * @{
 */

inline absl::Status invalid_input_error(std::string_view msg) {
  return absl::InvalidArgumentError(msg);
}

inline absl::Status too_large_error(std::string_view msg) {
  return absl::ResourceExhaustedError(msg);
}

inline absl::Status engine_failure(std::string_view msg) {
  return absl::InternalError(msg);
}

inline absl::Status timeout_error(std::string_view msg) {
  return absl::DeadlineExceededError(msg);
}

inline bool is_invalid_input(const absl::Status &status) {
  return absl::IsInvalidArgument(status);
}

inline bool is_too_large(const absl::Status &status) {
  return absl::IsResourceExhausted(status);
}

inline bool is_engine_failure(const absl::Status &status) {
  return absl::IsInternal(status);
}

inline bool is_timeout(const absl::Status &status) {
  return absl::IsDeadlineExceeded(status);
}

/** @} */
}  // namespace vibra

#endif /* VIBRA_STATUS_H_ */
