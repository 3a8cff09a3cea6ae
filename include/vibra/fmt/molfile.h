//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef VIBRA_FMT_MOLFILE_H_
#define VIBRA_FMT_MOLFILE_H_

//! @cond
#include <string_view>
//! @endcond

#include "vibra/core/molecule.h"

namespace vibra {
/**
 * @brief Read a V2000 molfile block and return a molecule.
 *
 * The atom coordinates are stored as the first conformer of the molecule.
 * Formal charges are read from both the atom block and the @c "M  CHG"
 * property lines (the latter takes precedence). Hydrogens are expected to be
 * explicit; no implicit hydrogens are assigned.
 *
 * @param block The molfile text, with or without the trailing @c "$$$$".
 * @return A molecule. On failure, the returned molecule is empty.
 */
extern Molecule read_molfile(std::string_view block);
}  // namespace vibra

#endif /* VIBRA_FMT_MOLFILE_H_ */
