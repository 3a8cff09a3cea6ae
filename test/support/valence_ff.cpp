//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "valence_ff.h"

#include <cmath>
#include <utility>
#include <vector>

#include <absl/log/absl_log.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <Eigen/Dense>

#include "vibra/eigen_config.h"
#include "vibra/status.h"
#include "vibra/core/element.h"
#include "vibra/core/geometry.h"
#include "vibra/core/molecule.h"
#include "vibra/core/structure.h"
#include "vibra/engine/engine.h"
#include "vibra/engine/polarizability.h"

namespace vibra {
namespace internal {
namespace {
  // eV / A^2 per unit bond order
  constexpr double kBondStretch = 30.0;
  // eV / rad^2
  constexpr double kAngleBend = 4.0;
  // eV / A^6
  constexpr double kPlanarity = 2.0;
  // eV
  constexpr double kLjWellDepth = 0.005;
  // e per unit electronegativity difference
  constexpr double kBondIncrement = 0.25;

  bool is_period2(const Element &elem) {
    return elem.atomic_number() >= 3 && elem.atomic_number() <= 10;
  }

  bool is_group13(const Element &elem) {
    switch (elem.atomic_number()) {
    case 5:
    case 13:
    case 31:
    case 49:
      return true;
    default:
      return false;
    }
  }

  AngleKind perceive_angle_kind(const Element &elem, int degree, int ndouble,
                                int ntriple, int naromatic) {
    if (degree < 2)
      return AngleKind::kNone;
    if (degree >= 5)
      return AngleKind::kOctahedral;
    if (degree == 4)
      return AngleKind::kTetrahedral;

    if (ntriple > 0 || (ndouble >= 2 && degree == 2 && is_period2(elem)))
      return AngleKind::kLinear;

    if (ndouble > 0 || naromatic > 0 || (degree == 3 && is_group13(elem)))
      return AngleKind::kTrigonal;

    return AngleKind::kTetrahedral;
  }

  double ideal_cos(AngleKind kind) {
    switch (kind) {
    case AngleKind::kTrigonal:
      return constants::kCos120;
    case AngleKind::kTetrahedral:
      return constants::kCos109_47;
    case AngleKind::kLinear:
      return -1;
    case AngleKind::kOctahedral:
    case AngleKind::kNone:
      break;
    }
    return 0;
  }

  // Energy of an angle, with dE/dcos(theta) stored in dedc
  double angle_energy_deriv(AngleKind kind, double c, double c0,
                            double &dedc) {
    switch (kind) {
    case AngleKind::kLinear:
      dedc = kAngleBend;
      return kAngleBend * (1 + c);
    case AngleKind::kOctahedral: {
      const double c2 = c * c;
      dedc = kAngleBend * (c - 2 * c2 * c);
      return 0.5 * kAngleBend * (c2 - c2 * c2);
    }
    case AngleKind::kTrigonal:
    case AngleKind::kTetrahedral: {
      const double k = kAngleBend / (1 - c0 * c0);
      dedc = k * (c - c0);
      return 0.5 * k * (c - c0) * (c - c0);
    }
    case AngleKind::kNone:
      break;
    }

    dedc = 0;
    return 0;
  }
}  // namespace

ValenceForceField::ValenceForceField(const MolecularStructure &structure,
                                     const BondedGraph &bonds)
    : charges_(ArrayXd::Zero(structure.size())) {
  const int n = structure.size();

  std::vector<std::vector<int>> adj(n);
  std::vector<int> ndouble(n, 0), ntriple(n, 0), naromatic(n, 0);

  bonds_.reserve(bonds.size());
  for (const BondPair &bond: bonds) {
    const Element &src = structure.element(bond.src),
                  &dst = structure.element(bond.dst);

    double order = constants::kBondOrderToDouble[bond.order];
    if (order <= 0)
      order = 1;

    bonds_.push_back({ bond.src, bond.dst,
                       ideal_bond_length(src, dst, bond.order),
                       kBondStretch * order });

    adj[bond.src].push_back(bond.dst);
    adj[bond.dst].push_back(bond.src);

    switch (bond.order) {
    case constants::kDoubleBond:
      ++ndouble[bond.src];
      ++ndouble[bond.dst];
      break;
    case constants::kTripleBond:
    case constants::kQuadrupleBond:
      ++ntriple[bond.src];
      ++ntriple[bond.dst];
      break;
    case constants::kAromaticBond:
      ++naromatic[bond.src];
      ++naromatic[bond.dst];
      break;
    default:
      break;
    }

    if (src.electronegativity() > 0 && dst.electronegativity() > 0) {
      const double dq =
          kBondIncrement * (dst.electronegativity() - src.electronegativity());
      charges_[bond.src] += dq;
      charges_[bond.dst] -= dq;
    }
  }

  for (int c = 0; c < n; ++c) {
    const std::vector<int> &nei = adj[c];
    const AngleKind kind =
        perceive_angle_kind(structure.element(c), static_cast<int>(nei.size()),
                            ndouble[c], ntriple[c], naromatic[c]);
    if (kind == AngleKind::kNone)
      continue;

    for (int i = 0; i < nei.size(); ++i)
      for (int k = i + 1; k < nei.size(); ++k)
        angles_.push_back({ nei[i], c, nei[k], kind, ideal_cos(kind) });

    if (kind == AngleKind::kTrigonal && nei.size() == 3)
      planars_.push_back({
          c, { nei[0], nei[1], nei[2] }
      });
  }

  for (int i = 0; i < n; ++i) {
    std::vector<bool> excluded(n, false);
    excluded[i] = true;
    for (int j: adj[i]) {
      excluded[j] = true;
      for (int k: adj[j])
        excluded[k] = true;
    }

    for (int j = i + 1; j < n; ++j) {
      if (excluded[j])
        continue;

      pairs_.push_back({ i, j,
                         structure.element(i).vdw_radius()
                             + structure.element(j).vdw_radius() });
    }
  }

  ABSL_DVLOG(1) << "valence force field: " << bonds_.size() << " bonds, "
                << angles_.size() << " angles, " << planars_.size()
                << " planar centers, " << pairs_.size() << " nonbonded pairs";
  ABSL_DVLOG(2) << "bond increment charges: " << charges_.transpose();
}

ValenceForceField::ValenceForceField(const MolecularStructure &structure,
                                     const BondedGraph &bonds,
                                     BondPolarizabilityModel polarizability)
    : ValenceForceField(structure, bonds) {
  polar_.emplace(std::move(polarizability));
}

absl::StatusOr<EngineResult>
ValenceForceField::evaluate(const Matrix3Xd &pos) {
  if (absl::Status status = check_positions(pos); !status.ok())
    return status;

  EngineResult result { 0, Matrix3Xd::Zero(3, size()), Vector3d::Zero() };
  result.energy = bond_energy(result.gradient, pos)
                  + angle_energy(result.gradient, pos)
                  + planar_energy(result.gradient, pos)
                  + pair_energy(result.gradient, pos);

  if (!std::isfinite(result.energy) || !result.gradient.allFinite())
    return engine_failure("non-finite energy or gradient");

  result.dipole.noalias() = pos * charges_.matrix();
  return result;
}

absl::StatusOr<Matrix3d>
ValenceForceField::polarizability(const Matrix3Xd &pos) {
  if (!polar_)
    return ForceEngine::polarizability(pos);

  if (absl::Status status = check_positions(pos); !status.ok())
    return status;

  return (*polar_)(pos);
}

double ValenceForceField::bond_energy(MutRef<Matrix3Xd> g,
                                      const Matrix3Xd &pos) const {
  double energy = 0;

  for (const BondTerm &b: bonds_) {
    Vector3d d = pos.col(b.dst) - pos.col(b.src);
    const double r = d.norm(), dr = r - b.r0;

    energy += 0.5 * b.k * dr * dr;

    d *= b.k * dr / r;
    g.col(b.dst) += d;
    g.col(b.src) -= d;
  }

  return energy;
}

double ValenceForceField::angle_energy(MutRef<Matrix3Xd> g,
                                       const Matrix3Xd &pos) const {
  double energy = 0;

  for (const AngleTerm &t: angles_) {
    const Vector3d a = pos.col(t.i) - pos.col(t.center),
                   b = pos.col(t.k) - pos.col(t.center);
    const double ra_sq = a.squaredNorm(), rb_sq = b.squaredNorm();
    const double rab_inv = 1 / std::sqrt(ra_sq * rb_sq);
    const double c = a.dot(b) * rab_inv;

    double dedc;
    energy += angle_energy_deriv(t.kind, c, t.cos0, dedc);

    const Vector3d gi = dedc * (b * rab_inv - c / ra_sq * a),
                   gk = dedc * (a * rab_inv - c / rb_sq * b);
    g.col(t.i) += gi;
    g.col(t.k) += gk;
    g.col(t.center) -= gi + gk;
  }

  return energy;
}

double ValenceForceField::planar_energy(MutRef<Matrix3Xd> g,
                                        const Matrix3Xd &pos) const {
  double energy = 0;

  for (const PlanarTerm &p: planars_) {
    Matrix3d zs;
    for (int i = 0; i < 3; ++i)
      zs.col(i) = pos.col(p.nbrs[i]) - pos.col(p.center);

    Matrix3d grad;
    grad.col(0) = zs.col(1).cross(zs.col(2));
    const double vol = zs.col(0).dot(grad.col(0));
    grad.col(1) = zs.col(2).cross(zs.col(0));
    grad.col(2) = zs.col(0).cross(zs.col(1));
    grad *= 2 * kPlanarity * vol;

    for (int i = 0; i < 3; ++i)
      g.col(p.nbrs[i]) += grad.col(i);
    g.col(p.center) -= grad.rowwise().sum();

    energy += kPlanarity * vol * vol;
  }

  return energy;
}

double ValenceForceField::pair_energy(MutRef<Matrix3Xd> g,
                                      const Matrix3Xd &pos) const {
  double energy = 0;

  for (const PairTerm &p: pairs_) {
    Vector3d d = pos.col(p.j) - pos.col(p.i);
    const double r_sq = d.squaredNorm();

    double s6 = p.r0 * p.r0 / r_sq;
    s6 = s6 * s6 * s6;
    const double s12 = s6 * s6;

    energy += kLjWellDepth * (s12 - 2 * s6);

    // (dE/dr) / r
    d *= 12 * kLjWellDepth * (s6 - s12) / r_sq;
    g.col(p.j) += d;
    g.col(p.i) -= d;
  }

  return energy;
}
}  // namespace internal
}  // namespace vibra
