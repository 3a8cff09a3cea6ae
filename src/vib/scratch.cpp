//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "vibra/vib/scratch.h"

#include <filesystem>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <absl/log/absl_log.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

#include "vibra/status.h"

namespace vibra {
namespace fs = std::filesystem;

absl::StatusOr<ScratchDirectory>
ScratchDirectory::create(const fs::path &root, std::string_view name) {
  if (name.empty() || name.find('/') != std::string_view::npos
      || name == "." || name == "..") {
    return invalid_input_error(
        absl::StrCat("invalid scratch directory name: '", name, "'"));
  }

  fs::path path = root / fs::path(name);

  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) {
    return engine_failure(absl::StrCat("cannot create scratch directory ",
                                       path.string(), ": ", ec.message()));
  }

  ABSL_DVLOG(1) << "scratch directory " << path;
  return ScratchDirectory(std::move(path));
}

absl::Status ScratchDirectory::clear() {
  std::error_code ec;
  std::vector<fs::path> entries;
  for (const fs::directory_entry &entry: fs::directory_iterator(path_, ec))
    entries.push_back(entry.path());

  for (const fs::path &entry: entries) {
    if (ec)
      break;
    fs::remove_all(entry, ec);
  }

  if (ec) {
    return engine_failure(absl::StrCat("cannot clear scratch directory ",
                                       path_.string(), ": ", ec.message()));
  }

  return absl::OkStatus();
}

void ScratchDirectory::remove() noexcept {
  if (path_.empty())
    return;

  std::error_code ec;
  fs::remove_all(path_, ec);
  ABSL_LOG_IF(ERROR, static_cast<bool>(ec))
      << "failed to remove scratch directory " << path_ << ": "
      << ec.message();
  path_.clear();
}
}  // namespace vibra
