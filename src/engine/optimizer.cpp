//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "vibra/engine/optimizer.h"

#include <limits>
#include <utility>

#include <absl/log/absl_log.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>
#include <absl/time/clock.h>
#include <absl/time/time.h>
#include <Eigen/Dense>

#include "vibra/eigen_config.h"
#include "vibra/status.h"
#include "vibra/algo/optim.h"
#include "vibra/core/structure.h"
#include "vibra/engine/engine.h"

namespace vibra {
absl::StatusOr<MolecularStructure>
optimize_geometry(ForceEngine &engine, const MolecularStructure &structure,
                  const OptimizerOptions &options, const absl::Time deadline) {
  const Eigen::Index n = structure.size();
  if (n != engine.size()) {
    return engine_failure(absl::StrCat("engine built for ", engine.size(),
                                       " atoms, structure has ", n));
  }

  ArrayXd x = structure.positions().reshaped().array();
  Matrix3Xd pos(3, n);

  absl::Status error;
  int nevals = 0;
  auto fg = [&](ArrayXd &ga, ConstRef<ArrayXd> xa) {
    if (!error.ok())
      return std::numeric_limits<double>::quiet_NaN();

    if (absl::Now() > deadline) {
      error = timeout_error("geometry optimization exceeded the deadline");
      return std::numeric_limits<double>::quiet_NaN();
    }

    pos = xa.reshaped(3, n).matrix();
    absl::StatusOr<EngineResult> res = engine.evaluate(pos);
    ++nevals;
    if (!res.ok()) {
      error = res.status();
      return std::numeric_limits<double>::quiet_NaN();
    }

    ga = res->gradient.reshaped().array();
    return res->energy;
  };

  Bfgs optim(x);
  BfgsResult res = optim.minimize(fg, options.gtol, 0, options.maxiter);
  if (!error.ok())
    return error;

  ABSL_LOG(INFO) << "geometry optimization finished after " << res.niter
                 << " iterations (" << nevals << " evaluations), E = "
                 << res.fx << " eV";

  switch (res.code) {
  case BfgsResultCode::kSuccess:
    break;
  case BfgsResultCode::kMaxIterReached:
    ABSL_LOG(WARNING) << "geometry optimization did not converge in "
                      << options.maxiter << " iterations";
    break;
  case BfgsResultCode::kAbnormalTerm:
    if (res.gx.abs().maxCoeff() <= options.stall_gtol) {
      ABSL_LOG(INFO) << "line search stalled near convergence; accepting";
      break;
    }
    return engine_failure("geometry optimization failed: line search failed");
  case BfgsResultCode::kInvalidInput:
    return engine_failure("geometry optimization failed: invalid start point");
  }

  return structure.with_positions(x.reshaped(3, n).matrix());
}
}  // namespace vibra
