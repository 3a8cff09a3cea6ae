//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef VIBRA_FMT_SMILES_H_
#define VIBRA_FMT_SMILES_H_

//! @cond
#include <string_view>
//! @endcond

#include "vibra/core/molecule.h"

namespace vibra {
/**
 * @brief Read a single SMILES string and return a molecule.
 *
 * Organic-subset and bracket atoms, branches, ring closures (including the
 * two-digit @c %nn form) and dot-disconnected components are supported.
 * Isotopes, chirality and directional bonds are accepted but not retained.
 * Implicit hydrogens are assigned to organic-subset atoms from their default
 * valences; bracket atoms carry exactly the hydrogens they specify.
 *
 * Anything after the first whitespace character is treated as the title of
 * the molecule and ignored.
 *
 * @param smiles the SMILES string to read.
 * @return A molecule. On failure, the returned molecule is empty.
 */
extern Molecule read_smiles(std::string_view smiles);
}  // namespace vibra

#endif /* VIBRA_FMT_SMILES_H_ */
