//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef VIBRA_VIB_MODES_H_
#define VIBRA_VIB_MODES_H_

//! @cond
#include <complex>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>
//! @endcond

#include "vibra/eigen_config.h"
#include "vibra/core/structure.h"

namespace vibra {
enum class ModeType : std::uint8_t {
  kTranslation,
  kRotation,
  kVibration,
};

extern std::string_view mode_type_name(ModeType type);

// NOLINTNEXTLINE(clang-diagnostic-unused-function)
inline std::ostream &operator<<(std::ostream &os, ModeType type) {
  return os << mode_type_name(type);
}

/**
 * @brief Number of rigid-body (zero) modes: 5 for linear molecules, 6
 *        otherwise.
 */
constexpr int num_zero_modes(bool linear) {
  return linear ? 5 : 6;
}

/**
 * @brief Mean cosine distance over all pairs of atomic displacement vectors.
 *
 * Close to zero if every atom moves in the same direction. Atoms that do not
 * move are skipped; the result is 0 if fewer than two atoms move.
 *
 * @param mode Displacements, one atom per column.
 */
extern double displacement_alignment(const Matrix3Xd &mode);

/**
 * @brief Order in which modes are presented: ascending by the real part of
 *        the frequency, then by the imaginary part.
 *
 * @return Mode indices sorted by frequency. The sort is stable.
 */
extern std::vector<int> frequency_order(const ArrayXcd &frequencies);

/**
 * @brief Assign a mode type to every mode.
 *
 * The rank of a mode in @p order decides its type: ranks 0-2 are
 * translations, 3-4 rotations, and rank 5 is a vibration for linear
 * molecules. For nonlinear molecules, rank 5 is a translation if its
 * alignment is at least the third-highest alignment of all modes, and a
 * rotation otherwise. All higher ranks are vibrations.
 *
 * @param order Mode indices in presentation order, as returned by
 *        frequency_order().
 * @param alignments Alignment of each mode, indexed by mode index.
 * @param linear Whether the molecule is linear.
 * @return Type of each mode, indexed by mode index.
 */
extern std::vector<ModeType> classify_modes(const std::vector<int> &order,
                                            const ArrayXd &alignments,
                                            bool linear);

/**
 * @brief Absolute change of each bond length when the atoms are displaced
 *        along a mode.
 *
 * The net (summed) displacement of the mode is removed from the displaced
 * positions before the bond lengths are measured.
 */
extern ArrayXd bond_displacements(const Matrix3Xd &pos, const Matrix3Xd &mode,
                                  const BondedGraph &bonds);

/**
 * @brief Select the entries above an adaptive gap threshold.
 *
 * An entry is selected if it exceeds @p threshold times the largest gap
 * between consecutive values of @p relative once sorted.
 *
 * @return Indices of the selected entries, in ascending order.
 */
extern std::vector<int> select_above_gap(const ArrayXd &relative,
                                         double threshold = 0.4);

/**
 * @brief Bonds that contribute most to a mode.
 *
 * Bond displacements are normalized by their sum and selected with
 * select_above_gap(). A single bond is always selected; no bond is selected
 * if no bond length changes.
 */
extern std::vector<int>
select_most_contributing_bonds(const ArrayXd &displacements,
                               double threshold = 0.4);

/**
 * @brief Atoms that contribute most to a mode.
 *
 * Displacement magnitudes are normalized by their maximum and selected with
 * select_above_gap().
 */
extern std::vector<int> select_most_contributing_atoms(const Matrix3Xd &mode,
                                                       double threshold = 0.4);

/**
 * @brief Atoms ranked by how far they move relative to the net displacement,
 *        largest first.
 */
extern std::vector<int> most_displaced_atoms(const Matrix3Xd &mode);

/**
 * @brief Change of the norm of the principal moments of inertia when the
 *        atoms are displaced along a mode.
 */
extern double moment_of_inertia_change(const Matrix3Xd &pos,
                                       const Matrix3Xd &mode,
                                       const ArrayXd &masses);

/**
 * @brief Displaced-geometry XYZ block of a mode.
 *
 * The block has the atom count, a comment line with the mode number,
 * frequency and (if given) IR intensity, and one line per atom with the
 * position and displacement.
 *
 * @param structure The structure.
 * @param mode Displacements of the mode, one atom per column.
 * @param number The mode number printed in the comment line.
 * @param frequency The complex frequency of the mode, in cm^-1.
 * @param intensity The IR intensity; negative to omit it.
 */
extern std::string displacement_xyz(const MolecularStructure &structure,
                                    const Matrix3Xd &mode, int number,
                                    std::complex<double> frequency,
                                    double intensity);

/**
 * @brief For each atom, all modes ranked by the displacement of that atom,
 *        largest first.
 *
 * The first num_zero_modes() modes (in mode index order) count as zero
 * displacement.
 *
 * @param atom_displacements Displacement magnitudes, modes x atoms.
 * @param linear Whether the molecule is linear.
 */
extern std::vector<std::vector<int>>
most_relevant_modes_of_atoms(const ArrayXXd &atom_displacements, bool linear);

struct BondModeRecord {
  int start_atom;
  int end_atom;
  int mode;
  double displacement;
};

/**
 * @brief For each bond, the mode that changes its length the most.
 *
 * For more than two atoms, the first num_zero_modes() modes (in mode index
 * order) are excluded.
 *
 * @param bond_disps Bond displacements, modes x bonds.
 * @param bonds The bonds.
 * @param natoms Number of atoms.
 * @param linear Whether the molecule is linear.
 */
extern std::vector<BondModeRecord>
most_relevant_modes_of_bonds(const ArrayXXd &bond_disps,
                             const BondedGraph &bonds, int natoms,
                             bool linear);
}  // namespace vibra

#endif /* VIBRA_VIB_MODES_H_ */
