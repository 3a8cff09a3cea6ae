//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "vibra/engine/engine.h"

#include <memory>
#include <utility>

#include <absl/log/absl_log.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

#include "vibra/eigen_config.h"
#include "vibra/status.h"
#include "vibra/core/structure.h"
#include "vibra/engine/method.h"
#include "vibra/engine/xtb_engine.h"

namespace vibra {
absl::StatusOr<Matrix3d>
ForceEngine::polarizability(const Matrix3Xd & /* pos */) {
  return absl::UnimplementedError("engine has no polarizability model");
}

absl::Status ForceEngine::check_positions(const Matrix3Xd &pos) const {
  if (pos.cols() != size()) {
    return engine_failure(absl::StrCat("expected ", size(),
                                       " atoms, got ", pos.cols()));
  }

  if (!pos.allFinite())
    return engine_failure("non-finite atomic positions");

  return absl::OkStatus();
}

absl::StatusOr<std::unique_ptr<ForceEngine>>
default_engine(const MolecularStructure &structure, const BondedGraph &bonds,
               Method method) {
  if (structure.empty())
    return invalid_input_error("empty structure");

  for (const BondPair &bond: bonds) {
    if (bond.src < 0 || bond.src >= structure.size() || bond.dst < 0
        || bond.dst >= structure.size()) {
      return invalid_input_error(
          absl::StrCat("bond ", bond.src, " - ", bond.dst, " out of range"));
    }
  }

  ABSL_DVLOG(1) << "building xtb engine for " << method << " with "
                << structure.size() << " atoms";

  absl::StatusOr<std::unique_ptr<XtbEngine>> engine =
      XtbEngine::create(structure, method);
  if (!engine.ok())
    return engine.status();
  return std::unique_ptr<ForceEngine>(std::move(*engine));
}
}  // namespace vibra
