//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef VIBRA_VIB_NORMAL_MODES_H_
#define VIBRA_VIB_NORMAL_MODES_H_

//! @cond
#include <utility>
#include <vector>

#include <absl/status/statusor.h>
//! @endcond

#include "vibra/eigen_config.h"

namespace vibra {
namespace constants {
  // hbar * 1e10 / sqrt(e * amu), converts sqrt(eV / (A^2 amu)) to eV
  constexpr double kHbarSqrtEvAmu = 0.06465415130134121;
  // eV per cm^-1
  constexpr double kInvCm = 1.2398419843320026e-4;
  // 1 Debye in e*A
  constexpr double kDebye = 0.20819433270935594;
}  // namespace constants

/**
 * @brief Harmonic normal modes of a molecule.
 *
 * The modes are the eigenvectors of the mass-weighted Hessian, in ascending
 * order of the eigenvalues. Negative eigenvalues give purely imaginary mode
 * energies.
 */
class NormalModes {
public:
  /**
   * @brief Diagonalize the mass-weighted Hessian.
   *
   * @param hessian Cartesian Hessian in eV/A^2, 3N x 3N.
   * @param masses Atomic masses in amu.
   * @return The normal modes, or an Internal error if the eigensolver fails.
   */
  static absl::StatusOr<NormalModes> from_hessian(const MatrixXd &hessian,
                                                  const ArrayXd &masses);

  int size() const { return static_cast<int>(hnu_.size()); }

  int num_atoms() const { return size() / 3; }

  /**
   * @brief Mode energies in eV, complex for imaginary modes.
   */
  const ArrayXcd &energies() const { return hnu_; }

  /**
   * @brief Mode wavenumbers in cm^-1, complex for imaginary modes.
   */
  ArrayXcd frequencies() const { return hnu_ / constants::kInvCm; }

  /**
   * @brief Cartesian displacement of mode @p n, one atom per column.
   *
   * This is the mass-weighted eigenvector divided by the square root of the
   * masses, not normalized.
   */
  Matrix3Xd mode(int n) const {
    return (evecs_.col(n).array() * im_).matrix().reshaped(3, num_atoms());
  }

  /**
   * @brief Half of the sum of the real mode energies, in eV.
   */
  double zero_point_energy() const { return 0.5 * hnu_.real().sum(); }

  /**
   * @brief Infrared intensities in (D/A)^2 amu^-1.
   *
   * @param dpdx Dipole derivatives, 3N x 3, in e.
   */
  ArrayXd ir_intensities(const MatrixX3d &dpdx) const;

  /**
   * @brief Static Raman activities @f$ 45 a'^2 + 7 \gamma'^2 @f$ in
   *        A^4 amu^-1.
   *
   * @param dadx Polarizability derivatives (one per Cartesian coordinate), in
   *        A^2.
   */
  ArrayXd raman_activities(const std::vector<Matrix3d> &dadx) const;

private:
  NormalModes(ArrayXd im, ArrayXcd hnu, MatrixXd evecs)
      : im_(std::move(im)), hnu_(std::move(hnu)), evecs_(std::move(evecs)) { }

  ArrayXd im_;
  ArrayXcd hnu_;
  MatrixXd evecs_;
};
}  // namespace vibra

#endif /* VIBRA_VIB_NORMAL_MODES_H_ */
