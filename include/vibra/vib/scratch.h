//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef VIBRA_VIB_SCRATCH_H_
#define VIBRA_VIB_SCRATCH_H_

//! @cond
#include <filesystem>
#include <string_view>
#include <utility>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
//! @endcond

namespace vibra {
/**
 * @brief A working directory owned by a single computation.
 *
 * The directory is created (or reused, if a previous run left it behind) on
 * construction and removed recursively when the object is destroyed, on every
 * exit path of the owning scope.
 */
class ScratchDirectory {
public:
  /**
   * @brief Create the directory `root / name`.
   *
   * An existing directory of the same name is kept as-is so that records of
   * an interrupted computation can be reused.
   */
  static absl::StatusOr<ScratchDirectory> create(const std::filesystem::path &root,
                                                 std::string_view name);

  ScratchDirectory(const ScratchDirectory &) = delete;
  ScratchDirectory &operator=(const ScratchDirectory &) = delete;

  ScratchDirectory(ScratchDirectory &&other) noexcept
      : path_(std::move(other.path_)) {
    other.path_.clear();
  }

  ScratchDirectory &operator=(ScratchDirectory &&other) noexcept {
    if (this != &other) {
      remove();
      path_ = std::move(other.path_);
      other.path_.clear();
    }
    return *this;
  }

  ~ScratchDirectory() noexcept { remove(); }

  const std::filesystem::path &path() const { return path_; }

  /**
   * @brief Delete everything inside the directory, keeping the directory.
   */
  absl::Status clear();

private:
  explicit ScratchDirectory(std::filesystem::path path)
      : path_(std::move(path)) { }

  void remove() noexcept;

  std::filesystem::path path_;
};
}  // namespace vibra

#endif /* VIBRA_VIB_SCRATCH_H_ */
