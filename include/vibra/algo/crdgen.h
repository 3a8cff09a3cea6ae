//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef VIBRA_ALGO_CRDGEN_H_
#define VIBRA_ALGO_CRDGEN_H_

#include "vibra/eigen_config.h"
#include "vibra/core/molecule.h"

namespace vibra {
/**
 * @brief Generate 3D coordinates for a molecule with distance geometry.
 *
 * @param mol The molecule. Hybridization must be assigned, and all hydrogens
 *        that should be placed must be explicit.
 * @param conf Output coordinates, resized to the number of atoms.
 * @param max_trial Maximum number of embedding trials.
 * @param seed Random seed. The result is deterministic for a given seed.
 * @return Whether the generation succeeded. On failure, @p conf is left in an
 *         unspecified state.
 */
extern bool generate_coords(const Molecule &mol, Matrix3Xd &conf,
                            int max_trial = 10, int seed = 42);
}  // namespace vibra

#endif /* VIBRA_ALGO_CRDGEN_H_ */
