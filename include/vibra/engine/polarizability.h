//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef VIBRA_ENGINE_POLARIZABILITY_H_
#define VIBRA_ENGINE_POLARIZABILITY_H_

//! @cond
#include <optional>
#include <utility>
#include <vector>

#include <absl/status/statusor.h>
//! @endcond

#include "vibra/eigen_config.h"
#include "vibra/core/element.h"
#include "vibra/core/structure.h"

namespace vibra {
/**
 * @brief Lippincott-Stuttman parameters of an element.
 *
 * References:
 *   - E. R. Lippincott and J. M. Stutman, J. Phys. Chem. 1964, 68,
 *     2926-2940. DOI:10.1021/j100792a033
 *   - G. Marinov and N. Zotov, Phys. Rev. B 1997, 55, 2938-2944.
 *     DOI:10.1103/PhysRevB.55.2938
 */
struct LsParams {
  // Atomic polarizability, angstrom^3
  double polarizability;
  // Electronegativity relative to oxygen
  double reduced_electronegativity;
};

/**
 * @brief Parameters of the element, if it is parametrized (H, Be, B, C, N,
 *        O, Al, Si, P, S).
 */
extern std::optional<LsParams> lippincott_stuttman_params(const Element &elem);

/**
 * @brief Lippincott-Stuttman bond polarizability.
 *
 * @param a Parameters of the first atom.
 * @param b Parameters of the second atom.
 * @param same_element Whether both atoms are of the same element.
 * @param length The bond length, in angstroms.
 * @return Parallel and perpendicular components, in angstrom^3.
 */
extern std::pair<double, double>
lippincott_stuttman(const LsParams &a, const LsParams &b, bool same_element,
                    double length);

/**
 * @brief Bond-additive static polarizability.
 *
 * Every pair of atoms closer than 1.5 times the sum of their covalent radii
 * is a bond for this model, and contributes the axially symmetric tensor
 * @f$ \alpha_\perp I + (\alpha_\parallel - \alpha_\perp) \hat{e}
 * \hat{e}^T @f$ with the Lippincott-Stuttman components. The pairs are found
 * at every call, so they follow the geometry.
 */
class BondPolarizabilityModel {
public:
  explicit BondPolarizabilityModel(const MolecularStructure &structure);

  int size() const { return static_cast<int>(elements_.size()); }

  /**
   * @brief Polarizability tensor in angstrom^3.
   *
   * Fails with an Internal error if a bonded pair contains an element
   * without parameters, or two atoms (nearly) coincide.
   */
  absl::StatusOr<Matrix3d> operator()(const Matrix3Xd &pos) const;

private:
  std::vector<const Element *> elements_;
};
}  // namespace vibra

#endif /* VIBRA_ENGINE_POLARIZABILITY_H_ */
