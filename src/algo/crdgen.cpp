//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "vibra/algo/crdgen.h"

#include <cmath>
#include <random>
#include <vector>

#include <absl/base/attributes.h>
#include <absl/log/absl_check.h>
#include <absl/log/absl_log.h>
#include <Eigen/Dense>

#include "vibra/eigen_config.h"
#include "vibra/algo/optim.h"
#include "vibra/core/element.h"
#include "vibra/core/geometry.h"
#include "vibra/core/molecule.h"
#include "vibra/utils.h"

namespace vibra {
namespace {
  using constants::kCos102;
  using constants::kCos112;
  using constants::kCos115;
  using constants::kCos125;
  using constants::kCos175;
  using constants::kCos75;
  using constants::kCos100;

  constexpr double kVdwRadDownscale = 0.85;
  constexpr double kMaxInterAtomDist = 5.0;

  class RandomSource {
  public:
    explicit RandomSource(int seed): rng_(seed) { }

    double uniform_real(double lo, double hi) {
      return std::uniform_real_distribution<double>(lo, hi)(rng_);
    }

  private:
    std::mt19937 rng_;
  };

  class DistanceBounds {
  public:
    explicit DistanceBounds(const int n)
        : lb_(MatrixXd::Zero(n, n)),
          ub_(MatrixXd::Constant(n, n, n * kMaxInterAtomDist)) {
      ub_.diagonal().setZero();
    }

    int n() const { return static_cast<int>(lb_.cols()); }

    double lb(int i, int j) const { return lb_(i, j); }

    double ub(int i, int j) const { return ub_(i, j); }

    void set_lb(int i, int j, double v) { lb_(i, j) = lb_(j, i) = v; }

    void set_ub(int i, int j, double v) { ub_(i, j) = ub_(j, i) = v; }

    // Triangle inequality smoothing, Floyd-Warshall style:
    // Crippen & Havel, Distance Geometry and Molecular Conformation, 1988.
    bool smooth() {
      const int n = this->n();
      for (int k = 0; k < n; ++k) {
        for (int i = 0; i < n - 1; ++i) {
          for (int j = i + 1; j < n; ++j) {
            const double ub_ikj = ub(i, k) + ub(k, j);
            if (ub_ikj < ub(i, j))
              set_ub(i, j, ub_ikj);

            const double lb_ikj =
                vibra::max(lb(i, k) - ub(k, j), lb(j, k) - ub(k, i));
            if (lb_ikj > lb(i, j))
              set_lb(i, j, lb_ikj);

            if (lb(i, j) > ub(i, j) + 1e-6) {
              ABSL_LOG(INFO) << "inconsistent bounds for pair (" << i << ", "
                             << j << "): " << lb(i, j) << " > " << ub(i, j);
              return false;
            }
          }
        }
      }

      return true;
    }

    // Havel's distribution function:
    // Eq. 43, Distance Geometry: Theory, Algorithms, and Chemical Applications.
    // In Encycl. Comput. Chem., 1998, p. 731.
    void fill_trial_distances(MatrixXd &dists, RandomSource &rng,
                              bool first) const {
      dists.diagonal().setZero();

      for (int i = 0; i < n() - 1; ++i) {
        for (int j = i + 1; j < n(); ++j) {
          double luq = lb(i, j) / ub(i, j);
          luq *= luq;
          luq *= luq;

          const double dq = first ? (1 + luq) * 0.5 : rng.uniform_real(luq, 1.0);
          dists(i, j) = dists(j, i) = ub(i, j) * std::sqrt(std::sqrt(dq));
        }
      }

      ABSL_DVLOG(1) << "trial distances:\n" << dists;
    }

    // Packed (1 / lb^2, 1 / ub^2) for each pair j < i.
    Eigen::Array2Xd bsq_inv() const {
      const int nc2 = n() * (n() - 1) / 2;
      Eigen::Array2Xd bsq(2, nc2);

      for (int i = 1, k = 0; i < n(); ++i) {
        for (int j = 0; j < i; ++j, ++k) {
          bsq(0, k) = 1 / (lb(i, j) * lb(i, j));
          bsq(1, k) = 1 / (ub(i, j) * ub(i, j));
        }
      }

      return bsq;
    }

  private:
    MatrixXd lb_;
    MatrixXd ub_;
  };

  double ideal_bond_length(const Molecule &mol, const Bond &bond) {
    ABSL_LOG_IF(INFO, bond.data.order() == constants::kOtherBond)
        << "unknown bond order, assuming single bond";
    return vibra::ideal_bond_length(mol.atom(bond.src).element(),
                                    mol.atom(bond.dst).element(),
                                    bond.data.order());
  }

  // Cosines of the widest and narrowest accepted angle around a center
  struct AngleWindow {
    double cos_wide;
    double cos_narrow;
  };

  AngleWindow angle_window(constants::Hybridization hyb, int atom) {
    switch (hyb) {
    case constants::kSP:
      return { -1, kCos175 };
    case constants::kSP2:
      return { kCos125, kCos115 };
    case constants::kSP3:
      // Narrow end admits five-membered rings
      return { kCos112, kCos102 };
    case constants::kSP3D:
      return { kCos125, kCos75 };
    case constants::kSP3D2:
      return { kCos100, kCos75 };
    case constants::kUnbound:
    case constants::kTerminal:
      ABSL_LOG(WARNING) << "Atom " << atom << " has " << hyb
                        << " hybridization but several neighbors; treated as "
                           "linear";
      return { -1, kCos175 };
    case constants::kOtherHyb:
      break;
    }

    ABSL_LOG(WARNING) << "Atom " << atom
                      << " has unknown hybridization; treated as sp3";
    return { kCos112, kCos102 };
  }

  DistanceBounds init_bounds(const Molecule &mol) {
    const int n = mol.num_atoms();
    DistanceBounds bounds(n);

    ArrayXd bds(mol.num_bonds());
    for (int b = 0; b < mol.num_bonds(); ++b) {
      const Bond &bond = mol.bond(b);
      bds[b] = ideal_bond_length(mol, bond);
      bounds.set_lb(bond.src, bond.dst, bds[b]);
      bounds.set_ub(bond.src, bond.dst, bds[b]);
    }

    ABSL_DVLOG(2) << "bond lengths: " << bds.transpose();

    const ArrayXd bdsq = bds.square();
    for (int a = 0; a < n; ++a) {
      const std::vector<Neighbor> &nei = mol.neighbors(a);
      if (nei.size() < 2)
        continue;

      const AngleWindow window = angle_window(mol.atom(a).hybridization(), a);

      for (int i = 0; i < nei.size() - 1; ++i) {
        for (int j = i + 1; j < nei.size(); ++j) {
          const double sq_sum = bdsq[nei[i].eid] + bdsq[nei[j].eid];
          const double twice_prod = 2 * bds[nei[i].eid] * bds[nei[j].eid];

          const int ni = nei[i].dst, nj = nei[j].dst;
          // 3-membered rings: the bond length constraint wins
          if (mol.find_bond(ni, nj) >= 0)
            continue;

          // Law of cosines on the two bonds
          const double far =
              std::sqrt(sq_sum - twice_prod * window.cos_wide);
          const double near =
              std::sqrt(sq_sum - twice_prod * window.cos_narrow);

          const double ub = vibra::min(bounds.ub(ni, nj), far);
          bounds.set_ub(ni, nj, ub);
          bounds.set_lb(ni, nj, vibra::clamp(near, bounds.lb(ni, nj), ub));
        }
      }
    }

    ArrayXd radii(n);
    for (int i = 0; i < n; ++i)
      radii[i] = mol.atom(i).element().vdw_radius();
    radii *= kVdwRadDownscale;

    for (int i = 1; i < n; ++i) {
      for (int j = 0; j < i; ++j) {
        if (bounds.lb(i, j) <= 0)
          bounds.set_lb(i, j, vibra::min(radii[i] + radii[j], bounds.ub(i, j)));
      }
    }

    return bounds;
  }

  // Havel's distance error function (E3), Distance Geometry in Molecular
  // Modeling, 1994, Ch.6, p. 311. Pairs are visited in the packed order of
  // DistanceBounds::bsq_inv().
  double distance_error(MutRef<Array3Xd> g, ConstRef<Array3Xd> x,
                        const Eigen::Array2Xd &bsq_inv) {
    double err = 0;
    Eigen::Index k = 0;

    for (Eigen::Index i = 1; i < x.cols(); ++i) {
      for (Eigen::Index j = 0; j < i; ++j) {
        const double inv_lsq = bsq_inv(0, k), inv_usq = bsq_inv(1, k);
        ++k;

        const Array3d r = x.col(i) - x.col(j);
        const double rsq = r.matrix().squaredNorm();

        // Too long: (d^2 / u^2 - 1)^2
        const double over = nonnegative(rsq * inv_usq - 1);
        // Too short: (2 l^2 / (l^2 + d^2) - 1)^2
        const double q = 2 / (1 + rsq * inv_lsq);
        const double under = nonnegative(q - 1);

        err += over * over + under * under;

        const double scale =
            4 * over * inv_usq - 2 * under * q * q * inv_lsq;
        g.col(i) += scale * r;
        g.col(j) -= scale * r;
      }
    }

    return err;
  }

  struct PlanarCenter {
    int center;
    int nbrs[3];
  };

  // Signed volume of the (n0 - c, n1 - c, n2 - c) parallelepiped, pushed
  // towards zero.
  double planarity_loss(MutRef<Array3Xd> g, ConstRef<Array3Xd> x,
                        const PlanarCenter &p) {
    Matrix3d zs;
    for (int i = 0; i < 3; ++i)
      zs.col(i) = (x.col(p.nbrs[i]) - x.col(p.center)).matrix();

    Matrix3d grad;
    grad.col(0) = zs.col(1).cross(zs.col(2));
    const double vol = zs.col(0).dot(grad.col(0));

    grad.col(1) = zs.col(2).cross(zs.col(0));
    grad.col(2) = zs.col(0).cross(zs.col(1));
    grad *= 2 * vol;

    for (int i = 0; i < 3; ++i)
      g.col(p.nbrs[i]) += grad.col(i).array();
    g.col(p.center) -= grad.rowwise().sum().array();

    return vol * vol;
  }

  double error_funcgrad(ArrayXd &ga, ConstRef<ArrayXd> xa,
                        const Eigen::Array2Xd &bsq_inv,
                        const std::vector<PlanarCenter> &planars,
                        const Eigen::Index n) {
    ga.setZero();

    auto g = ga.reshaped(3, n);
    auto x = xa.reshaped(3, n);

    double err = distance_error(g, x, bsq_inv);
    for (const PlanarCenter &p: planars)
      err += planarity_loss(g, x, p);
    return err;
  }

  std::vector<PlanarCenter> find_planar_centers(const Molecule &mol) {
    std::vector<PlanarCenter> planars;
    for (int i = 0; i < mol.num_atoms(); ++i) {
      if (mol.atom(i).hybridization() != constants::kSP2 || mol.degree(i) != 3)
        continue;

      const std::vector<Neighbor> &nei = mol.neighbors(i);
      planars.push_back({
          i, { nei[0].dst, nei[1].dst, nei[2].dst }
      });
    }
    return planars;
  }

  bool generate_coords_impl(const Molecule &mol, Matrix3Xd &conf,
                            const int max_trial, const int seed) {
    const Eigen::Index n = mol.num_atoms();

    DistanceBounds bounds = init_bounds(mol);
    if (!bounds.smooth()) {
      ABSL_LOG(WARNING) << "triangle smoothing failed";
      return false;
    }

    const Eigen::Array2Xd bsq_inv = bounds.bsq_inv();
    const std::vector<PlanarCenter> planars = find_planar_centers(mol);

    const bool init_random = n <= 4;
    ABSL_LOG_IF(INFO, init_random)
        << "too few atoms; randomly initializing trial coordinates";

    ArrayXd trial(3 * n);
    MatrixXd dists(n, n);
    auto trial_mat = trial.reshaped(3, n);

    Bfgs optim(trial);
    auto fg = [&](ArrayXd &ga, ConstRef<ArrayXd> xa) {
      return error_funcgrad(ga, xa, bsq_inv, planars, n);
    };

    RandomSource rng(seed);
    for (int iter = 0; iter < max_trial; ++iter) {
      if (init_random) {
        for (int i = 0; i < trial.size(); ++i)
          trial[i] = rng.uniform_real(-1.0 * n, 1.0 * n);
      } else {
        bounds.fill_trial_distances(dists, rng, iter == 0);
        dists = dists.cwiseAbs2();
        Matrix3Xd embedded(3, n);
        if (!embed_distances_3d(embedded, dists))
          continue;
        trial_mat = embedded.array();
      }

      ABSL_DVLOG(1) << "initial trial coordinates:\n" << trial_mat.transpose();

      BfgsResult res = optim.minimize(fg, 1e-5, 0, 1000);
      ABSL_DVLOG(1) << "trial " << iter << ": code "
                    << static_cast<int>(res.code) << ", error " << res.fx;

      if (res.code == BfgsResultCode::kInvalidInput)
        continue;

      // Remaining error comes from conflicting bounds (e.g. strained rings)
      if (res.fx > 1e-2 * static_cast<double>(n))
        continue;

      conf = trial_mat.matrix();
      conf.colwise() -= conf.rowwise().mean();
      return true;
    }

    return false;
  }
}  // namespace

bool generate_coords(const Molecule &mol, Matrix3Xd &conf, int max_trial,
                     int seed) {
  const int n = mol.num_atoms();
  conf.resize(3, n);

  if (n == 0) {
    ABSL_LOG(WARNING) << "empty molecule";
    return false;
  }

  if (n == 1) {
    conf.setZero();
    return true;
  }

  if (n == 2) {
    double len = 0;
    if (mol.num_bonds() == 1) {
      len = ideal_bond_length(mol, mol.bond(0));
    } else {
      len = kVdwRadDownscale
            * (mol.atom(0).element().vdw_radius()
               + mol.atom(1).element().vdw_radius());
    }

    conf.setZero();
    conf(0, 0) = -len / 2;
    conf(0, 1) = len / 2;
    return true;
  }

  return generate_coords_impl(mol, conf, max_trial, seed);
}
}  // namespace vibra
