//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef VIBRA_CORE_GEOMETRY_H_
#define VIBRA_CORE_GEOMETRY_H_

//! @cond
#include <cmath>

#include <Eigen/Dense>
//! @endcond

#include "vibra/eigen_config.h"

namespace vibra {
namespace constants {
  constexpr double kPi = 3.14159265358979323846264338327950288419716939937510;

  constexpr double kCos75 = 0.25881904510252076234889883762404832834906890131993;
  constexpr double kCos100 =
      -0.17364817766693034885171662676931479600040424959181;
  constexpr double kCos102 =
      -0.20791169081775933710174228440512516621536787471943;
  constexpr double kCos112 =
      -0.37460659341591203541496377450119513269700440112862;
  constexpr double kCos115 =
      -0.42261826174069943618697848964773018155103083141486;
  constexpr double kCos120 = -0.5;
  constexpr double kCos125 =
      -0.57357643635104609610803191282615786532892082917015;
  constexpr double kCos175 =
      -0.99619469809174553229501040247388845891142213060200;
  constexpr double kCos109_47 = -1.0 / 3;
}  // namespace constants

/**
 * @brief Mass-weighted center of the points.
 *
 * @param pts Cartesian coordinates, one point per column.
 * @param masses Masses of the points.
 */
extern Vector3d center_of_mass(const Matrix3Xd &pts, const ArrayXd &masses);

/**
 * @brief Inertia tensor about the center of mass.
 *
 * @param pts Cartesian coordinates in angstroms, one point per column.
 * @param masses Masses of the points in amu.
 * @return The inertia tensor, in amu * angstrom^2.
 */
extern Matrix3d inertia_tensor(const Matrix3Xd &pts, const ArrayXd &masses);

/**
 * @brief Principal moments of inertia, in ascending order.
 *
 * @param pts Cartesian coordinates in angstroms, one point per column.
 * @param masses Masses of the points in amu.
 * @return The eigenvalues of the inertia tensor, in amu * angstrom^2.
 */
extern Array3d principal_moments(const Matrix3Xd &pts, const ArrayXd &masses);

/**
 * @brief Whether the principal moments describe a linear arrangement.
 *
 * A molecule is linear when exactly two moments exceed @p threshold; a
 * single atom (no moment above the threshold) is not linear.
 */
extern bool is_linear(const Array3d &moments, double threshold = 0.01);

/**
 * @brief Cosine distance, 1 - cos(theta), between two vectors.
 * @note The result is undefined if either vector has zero norm.
 */
inline double cosine_distance(const Vector3d &a, const Vector3d &b) {
  return 1 - a.dot(b) / std::sqrt(a.squaredNorm() * b.squaredNorm());
}

/**
 * @brief Embed points from their squared distance matrix using the metric
 *        matrix method.
 *
 * @param pts Output coordinates. The number of columns must match the size of
 *        the distance matrix.
 * @param dsqs Squared distance matrix. Will be overwritten by the metric
 *        matrix.
 * @return Whether the embedding succeeded.
 */
extern bool embed_distances_3d(Eigen::Ref<Matrix3Xd> pts, MatrixXd &dsqs);
}  // namespace vibra

#endif /* VIBRA_CORE_GEOMETRY_H_ */
