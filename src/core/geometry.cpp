//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "vibra/core/geometry.h"

#include <algorithm>
#include <exception>

#include <absl/log/absl_check.h>
#include <absl/log/absl_log.h>
#include <Eigen/Dense>
#include <Spectra/MatOp/DenseSymMatProd.h>
#include <Spectra/SymEigsSolver.h>
#include <Spectra/Util/CompInfo.h>
#include <Spectra/Util/SelectionRule.h>

#include "vibra/eigen_config.h"

namespace vibra {
Vector3d center_of_mass(const Matrix3Xd &pts, const ArrayXd &masses) {
  ABSL_DCHECK(pts.cols() == masses.size());
  return pts * masses.matrix() / masses.sum();
}

Matrix3d inertia_tensor(const Matrix3Xd &pts, const ArrayXd &masses) {
  const Matrix3Xd centered = pts.colwise() - center_of_mass(pts, masses);

  Matrix3d tensor = Matrix3d::Zero();
  for (int i = 0; i < centered.cols(); ++i) {
    const Vector3d r = centered.col(i);
    tensor.diagonal().array() += masses[i] * r.squaredNorm();
    tensor.noalias() -= masses[i] * r * r.transpose();
  }
  return tensor;
}

Array3d principal_moments(const Matrix3Xd &pts, const ArrayXd &masses) {
  Eigen::SelfAdjointEigenSolver<Matrix3d> eigs(inertia_tensor(pts, masses),
                                               Eigen::EigenvaluesOnly);
  return eigs.eigenvalues().array();
}

bool is_linear(const Array3d &moments, const double threshold) {
  return (moments > threshold).count() == 2;
}

bool embed_distances_3d(Eigen::Ref<Matrix3Xd> pts, MatrixXd &dsqs) {
  using Spectra::CompInfo;
  using Spectra::SortRule;
  constexpr Eigen::Index ndim = 3;

  if (dsqs.cols() != dsqs.rows() || dsqs.cols() != pts.cols()) {
    ABSL_LOG(WARNING) << "size mismatch; cannot embed distances";
    return false;
  }

  const int n = static_cast<int>(dsqs.cols());
  if (n <= ndim) {
    ABSL_LOG(WARNING) << "too few points (" << n << ") for metric embedding";
    return false;
  }

  double norm_dist = 0;
  for (int i = 1; i < n; ++i)
    norm_dist += dsqs.col(i).head(i).sum();
  norm_dist /= n * n;

  VectorXd d0sq = dsqs.colwise().mean().transpose().array() - norm_dist;

  dsqs *= -1;
  dsqs.colwise() += d0sq;
  dsqs.rowwise() += d0sq.transpose();
  dsqs /= 2;

  ABSL_DVLOG(1) << "metric matrix:\n" << dsqs;

  try {
    Spectra::DenseSymMatProd<double> op(dsqs);
    // This constructor might throw
    Spectra::SymEigsSolver<decltype(op)> eigs(op, ndim,
                                              std::min<Eigen::Index>(n, ndim * 2));
    eigs.init();
    auto nconv = eigs.compute(SortRule::LargestAlge);
    if (eigs.info() != CompInfo::Successful || nconv < ndim) {
      ABSL_LOG(WARNING) << "solver failed";
      return false;
    }

    Array3d evals_sqrt = eigs.eigenvalues().head<ndim>();
    if ((evals_sqrt < 0).any())
      return false;
    evals_sqrt = evals_sqrt.sqrt();

    pts = (eigs.eigenvectors(ndim).transpose().array().colwise() * evals_sqrt)
              .matrix();
  } catch (const std::exception &e) {
    ABSL_LOG(WARNING) << "solver failed: " << e.what();
    return false;
  }

  return true;
}
}  // namespace vibra
