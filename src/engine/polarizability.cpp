//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "vibra/engine/polarizability.h"

#include <cmath>
#include <optional>
#include <utility>

#include <absl/log/absl_log.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>
#include <Eigen/Dense>

#include "vibra/eigen_config.h"
#include "vibra/status.h"
#include "vibra/core/element.h"
#include "vibra/core/structure.h"

namespace vibra {
namespace {
  constexpr double kBondCutoffScale = 1.5;
  constexpr double kMinBondLength = 1e-3;
}  // namespace

std::optional<LsParams> lippincott_stuttman_params(const Element &elem) {
  switch (elem.atomic_number()) {
  case 1:
    return LsParams { 0.592, 1.0 };
  case 4:
    return LsParams { 3.802, 0.538 };
  case 5:
    return LsParams { 1.358, 0.758 };
  case 6:
    return LsParams { 0.978, 0.846 };
  case 7:
    return LsParams { 0.743, 0.927 };
  case 8:
    return LsParams { 0.592, 1.0 };
  case 13:
    return LsParams { 3.918, 0.533 };
  case 14:
    return LsParams { 2.988, 0.583 };
  case 15:
    return LsParams { 2.367, 0.630 };
  case 16:
    return LsParams { 1.820, 0.688 };
  default:
    return std::nullopt;
  }
}

std::pair<double, double> lippincott_stuttman(const LsParams &a,
                                              const LsParams &b,
                                              bool same_element,
                                              double length) {
  double sigma = 1;
  if (!same_element) {
    const double dx =
        a.reduced_electronegativity - b.reduced_electronegativity;
    sigma = std::exp(-dx * dx / 4);
  }

  const double l2 = length * length;
  const double par =
      sigma * l2 * l2
      / std::pow(256 * a.polarizability * b.polarizability, 1.0 / 6);

  const double xa2 = a.reduced_electronegativity * a.reduced_electronegativity,
               xb2 = b.reduced_electronegativity * b.reduced_electronegativity;
  const double perp =
      (xa2 * a.polarizability + xb2 * b.polarizability) / (xa2 + xb2);

  return { par, perp };
}

BondPolarizabilityModel::BondPolarizabilityModel(
    const MolecularStructure &structure) {
  elements_.reserve(structure.size());
  for (int i = 0; i < structure.size(); ++i)
    elements_.push_back(&structure.element(i));
}

absl::StatusOr<Matrix3d>
BondPolarizabilityModel::operator()(const Matrix3Xd &pos) const {
  Matrix3d alpha = Matrix3d::Zero();
  int npairs = 0;

  for (int i = 1; i < size(); ++i) {
    for (int j = 0; j < i; ++j) {
      const Element &ei = *elements_[i], &ej = *elements_[j];

      Vector3d e = pos.col(i) - pos.col(j);
      const double r = e.norm();
      if (!std::isfinite(r)) {
        return engine_failure(
            absl::StrCat("non-finite distance between ", j, " and ", i));
      }

      const double cutoff =
          kBondCutoffScale * (ei.covalent_radius() + ej.covalent_radius());
      if (r >= cutoff)
        continue;

      if (r < kMinBondLength) {
        return engine_failure(absl::StrCat("atoms ", j, " and ", i,
                                           " coincide: distance ", r));
      }

      std::optional<LsParams> pi = lippincott_stuttman_params(ei),
                              pj = lippincott_stuttman_params(ej);
      if (!pi || !pj) {
        return engine_failure(absl::StrCat(
            "no bond polarizability parameters for ",
            pi ? ej.symbol() : ei.symbol(), " (atom ", pi ? j : i, ")"));
      }

      const auto [par, perp] = lippincott_stuttman(
          *pi, *pj, ei.atomic_number() == ej.atomic_number(), r);

      e /= r;
      alpha.diagonal().array() += perp;
      alpha.noalias() += (par - perp) * e * e.transpose();
      ++npairs;
    }
  }

  ABSL_DVLOG(3) << npairs << " bonded pairs, polarizability:\n" << alpha;
  return alpha;
}
}  // namespace vibra
