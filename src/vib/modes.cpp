//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "vibra/vib/modes.h"

#include <algorithm>
#include <cmath>
#include <complex>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/log/absl_check.h>
#include <absl/log/absl_log.h>
#include <absl/strings/str_format.h>
#include <Eigen/Dense>

#include "vibra/eigen_config.h"
#include "vibra/utils.h"
#include "vibra/core/geometry.h"
#include "vibra/core/structure.h"

namespace vibra {
std::string_view mode_type_name(ModeType type) {
  switch (type) {
  case ModeType::kTranslation:
    return "translation";
  case ModeType::kRotation:
    return "rotation";
  case ModeType::kVibration:
    return "vibration";
  }

  ABSL_LOG(DFATAL) << "invalid mode type: " << static_cast<int>(type);
  return "";
}

double displacement_alignment(const Matrix3Xd &mode) {
  double sum = 0;
  int npairs = 0;

  for (int i = 0; i < mode.cols(); ++i) {
    if (mode.col(i).squaredNorm() <= 0)
      continue;

    for (int j = i + 1; j < mode.cols(); ++j) {
      if (mode.col(j).squaredNorm() <= 0)
        continue;

      sum += cosine_distance(mode.col(i), mode.col(j));
      ++npairs;
    }
  }

  return npairs > 0 ? sum / npairs : 0.0;
}

std::vector<int> frequency_order(const ArrayXcd &frequencies) {
  ArrayXi idxs = argsort(frequencies, [](const std::complex<double> &a,
                                         const std::complex<double> &b) {
    if (a.real() != b.real())
      return a.real() < b.real();
    return a.imag() < b.imag();
  });
  return std::vector<int>(idxs.begin(), idxs.end());
}

std::vector<ModeType> classify_modes(const std::vector<int> &order,
                                     const ArrayXd &alignments,
                                     const bool linear) {
  ABSL_DCHECK(static_cast<Eigen::Index>(order.size()) == alignments.size());

  std::vector<ModeType> types(order.size(), ModeType::kVibration);

  double third_best = -1;
  if (alignments.size() >= 3) {
    ArrayXd sorted = alignments;
    std::sort(sorted.begin(), sorted.end(), std::greater<>());
    third_best = sorted[2];
  }

  const int nmodes = static_cast<int>(order.size());
  for (int rank = 0; rank < nmodes; ++rank) {
    const int n = order[rank];

    if (rank < 3) {
      types[n] = ModeType::kTranslation;
    } else if (rank < 5) {
      types[n] = ModeType::kRotation;
    } else if (rank == 5 && !linear) {
      types[n] = alignments[n] >= third_best ? ModeType::kTranslation
                                             : ModeType::kRotation;
    }
  }

  return types;
}

ArrayXd bond_displacements(const Matrix3Xd &pos, const Matrix3Xd &mode,
                           const BondedGraph &bonds) {
  const Vector3d net = mode.rowwise().sum();
  const Matrix3Xd displaced = (pos + mode).colwise() - net;

  ArrayXd changes(bonds.size());
  for (int b = 0; b < bonds.size(); ++b) {
    const BondPair &bond = bonds[b];
    const double before = (pos.col(bond.dst) - pos.col(bond.src)).norm(),
                 after =
                     (displaced.col(bond.dst) - displaced.col(bond.src)).norm();
    changes[b] = std::abs(before - after);
  }
  return changes;
}

std::vector<int> select_above_gap(const ArrayXd &relative,
                                  const double threshold) {
  std::vector<int> selected;
  if (relative.size() == 0)
    return selected;

  ArrayXd sorted = relative;
  std::sort(sorted.begin(), sorted.end());

  double gap = 0;
  for (int i = 1; i < sorted.size(); ++i)
    gap = std::max(gap, std::abs(sorted[i] - sorted[i - 1]));

  const double cutoff = threshold * gap;
  for (int i = 0; i < relative.size(); ++i) {
    if (relative[i] > cutoff)
      selected.push_back(i);
  }

  ABSL_DVLOG(3) << "gap " << gap << ", selected " << selected.size() << " of "
                << relative.size();
  return selected;
}

std::vector<int> select_most_contributing_bonds(const ArrayXd &displacements,
                                                const double threshold) {
  if (displacements.size() == 1)
    return { 0 };

  const double sum = displacements.sum();
  if (displacements.size() == 0 || sum <= 0)
    return {};

  return select_above_gap(displacements / sum, threshold);
}

std::vector<int> select_most_contributing_atoms(const Matrix3Xd &mode,
                                                const double threshold) {
  const ArrayXd norms = mode.colwise().norm().transpose().array();
  if (norms.size() == 0)
    return {};

  const double max = norms.maxCoeff();
  if (max <= 0)
    return {};

  return select_above_gap(norms / max, threshold);
}

std::vector<int> most_displaced_atoms(const Matrix3Xd &mode) {
  const Vector3d net = mode.rowwise().sum();
  const ArrayXd norms =
      (mode.colwise() - net).colwise().norm().transpose().array();

  ArrayXi idxs = argsort(norms);
  std::vector<int> ranked(idxs.begin(), idxs.end());
  std::reverse(ranked.begin(), ranked.end());
  return ranked;
}

double moment_of_inertia_change(const Matrix3Xd &pos, const Matrix3Xd &mode,
                                const ArrayXd &masses) {
  const double before = principal_moments(pos, masses).matrix().norm(),
               after = principal_moments(pos + mode, masses).matrix().norm();
  return std::abs(after - before);
}

std::string displacement_xyz(const MolecularStructure &structure,
                             const Matrix3Xd &mode, const int number,
                             const std::complex<double> frequency,
                             const double intensity) {
  const bool imaginary = frequency.imag() != 0;

  std::string xyz = absl::StrFormat("%6d\n", structure.size());
  absl::StrAppendFormat(&xyz, "Mode #%d, f = %.1f%s cm^-1", number,
                        imaginary ? frequency.imag() : frequency.real(),
                        imaginary ? "i" : " ");
  if (intensity >= 0) {
    absl::StrAppendFormat(&xyz, ", I = %.4f (D/Å)^2 amu^-1.\n", intensity);
  } else {
    xyz.append(".\n");
  }

  const Matrix3Xd &pos = structure.positions();
  for (int i = 0; i < structure.size(); ++i) {
    absl::StrAppendFormat(
        &xyz, "%2s %12.5f %12.5f %12.5f %12.5f %12.5f %12.5f\n",
        structure.symbol(i), pos(0, i), pos(1, i), pos(2, i), mode(0, i),
        mode(1, i), mode(2, i));
  }

  return xyz;
}

std::vector<std::vector<int>>
most_relevant_modes_of_atoms(const ArrayXXd &atom_displacements,
                             const bool linear) {
  ArrayXXd masked = atom_displacements;
  const int nzero = std::min(num_zero_modes(linear),
                             static_cast<int>(masked.rows()));
  masked.topRows(nzero).setZero();

  std::vector<std::vector<int>> result;
  result.reserve(masked.cols());
  for (int i = 0; i < masked.cols(); ++i) {
    ArrayXd col = masked.col(i);
    ArrayXi idxs = argsort(col);
    std::vector<int> &ranked = result.emplace_back(idxs.begin(), idxs.end());
    std::reverse(ranked.begin(), ranked.end());
  }
  return result;
}

std::vector<BondModeRecord>
most_relevant_modes_of_bonds(const ArrayXXd &bond_disps,
                             const BondedGraph &bonds, const int natoms,
                             const bool linear) {
  ABSL_DCHECK(bond_disps.cols() == bonds.size());

  int first = 0;
  if (natoms > 2)
    first = num_zero_modes(linear);

  std::vector<BondModeRecord> result;
  if (first >= bond_disps.rows())
    return result;

  result.reserve(bonds.size());
  for (int b = 0; b < bonds.size(); ++b) {
    Eigen::Index mode;
    bond_disps.col(b).tail(bond_disps.rows() - first).maxCoeff(&mode);
    mode += first;

    result.push_back({ bonds[b].src, bonds[b].dst, static_cast<int>(mode),
                       bond_disps(mode, b) });
  }
  return result;
}
}  // namespace vibra
