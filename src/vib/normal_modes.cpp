//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "vibra/vib/normal_modes.h"

#include <complex>
#include <vector>

#include <absl/log/absl_log.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>
#include <Eigen/Dense>

#include "vibra/eigen_config.h"
#include "vibra/status.h"

namespace vibra {
absl::StatusOr<NormalModes> NormalModes::from_hessian(const MatrixXd &hessian,
                                                      const ArrayXd &masses) {
  const Eigen::Index ndof = 3 * masses.size();
  if (hessian.rows() != ndof || hessian.cols() != ndof) {
    return engine_failure(absl::StrCat("hessian size ", hessian.rows(), "x",
                                       hessian.cols(), " does not match ",
                                       masses.size(), " atoms"));
  }

  if ((masses <= 0).any())
    return engine_failure("non-positive atomic mass");

  ArrayXd im = masses.rsqrt().replicate(1, 3).transpose().reshaped();

  MatrixXd mw = im.matrix().asDiagonal() * hessian * im.matrix().asDiagonal();
  Eigen::SelfAdjointEigenSolver<MatrixXd> eigs(mw);
  if (eigs.info() != Eigen::Success)
    return engine_failure("diagonalization of the hessian failed");

  ABSL_DVLOG(1) << "mass-weighted hessian eigenvalues: "
                << eigs.eigenvalues().transpose();

  ArrayXcd hnu(ndof);
  for (int i = 0; i < ndof; ++i) {
    hnu[i] = constants::kHbarSqrtEvAmu
             * std::sqrt(std::complex<double>(eigs.eigenvalues()[i], 0));
  }

  return NormalModes(std::move(im), std::move(hnu), eigs.eigenvectors());
}

ArrayXd NormalModes::ir_intensities(const MatrixX3d &dpdx) const {
  // dmu/dQ for each mode, 3N x 3
  const MatrixX3d dpdq =
      evecs_.transpose() * (dpdx.array().colwise() * im_).matrix();
  return dpdq.rowwise().squaredNorm().array()
         / (constants::kDebye * constants::kDebye);
}

ArrayXd NormalModes::raman_activities(const std::vector<Matrix3d> &dadx) const {
  ArrayXd activities(size());

  for (int k = 0; k < size(); ++k) {
    Matrix3d dadq = Matrix3d::Zero();
    for (int j = 0; j < size(); ++j)
      dadq += evecs_(j, k) * im_[j] * dadx[j];

    const double a = dadq.trace() / 3;
    const double gamma2 =
        0.5
        * ((dadq(0, 0) - dadq(1, 1)) * (dadq(0, 0) - dadq(1, 1))
           + (dadq(1, 1) - dadq(2, 2)) * (dadq(1, 1) - dadq(2, 2))
           + (dadq(2, 2) - dadq(0, 0)) * (dadq(2, 2) - dadq(0, 0))
           + 6
                 * (dadq(0, 1) * dadq(0, 1) + dadq(1, 2) * dadq(1, 2)
                    + dadq(0, 2) * dadq(0, 2)));

    activities[k] = 45 * a * a + 7 * gamma2;
  }

  return activities;
}
}  // namespace vibra
