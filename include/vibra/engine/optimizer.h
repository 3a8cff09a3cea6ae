//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef VIBRA_ENGINE_OPTIMIZER_H_
#define VIBRA_ENGINE_OPTIMIZER_H_

//! @cond
#include <absl/status/statusor.h>
#include <absl/time/time.h>
//! @endcond

#include "vibra/core/structure.h"
#include "vibra/engine/engine.h"

namespace vibra {
struct OptimizerOptions {
  // eV/A, max-norm of the gradient
  double gtol = 1e-4;
  int maxiter = 1000;
  // Accept a stalled line search if the gradient is already below this
  double stall_gtol = 1e-2;
};

/**
 * @brief Relax a structure on the potential energy surface of an engine.
 *
 * Runs BFGS on the engine energy and gradient.
 *
 * @param engine The engine. Must be built for the atoms of @p structure.
 * @param structure The starting structure.
 * @param options Convergence criteria.
 * @param deadline The optimization fails with a DeadlineExceeded error once
 *        this point in time is passed.
 * @return The relaxed structure, or an error. Engine errors are propagated
 *         as-is; failure to converge is reported as an Internal error.
 */
extern absl::StatusOr<MolecularStructure>
optimize_geometry(ForceEngine &engine, const MolecularStructure &structure,
                  const OptimizerOptions &options = {},
                  absl::Time deadline = absl::InfiniteFuture());
}  // namespace vibra

#endif /* VIBRA_ENGINE_OPTIMIZER_H_ */
