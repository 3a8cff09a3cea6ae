//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "vibra/vib/normal_modes.h"

#include <cmath>
#include <vector>

#include <absl/status/statusor.h>
#include <Eigen/Dense>

#include <gtest/gtest.h>

#include "vibra/eigen_config.h"
#include "vibra/status.h"
#include "test_utils.h"

namespace vibra {
namespace {
using constants::kHbarSqrtEvAmu;
using constants::kInvCm;

TEST(NormalModesTest, IsotropicOscillator) {
  const double k = 20, m = 4;
  ArrayXd masses = ArrayXd::Constant(1, m);
  MatrixXd hessian = MatrixXd::Identity(3, 3) * k;

  absl::StatusOr<NormalModes> modes =
      NormalModes::from_hessian(hessian, masses);
  ASSERT_TRUE(modes.ok()) << modes.status();
  ASSERT_EQ(modes->size(), 3);
  EXPECT_EQ(modes->num_atoms(), 1);

  const double hnu = kHbarSqrtEvAmu * std::sqrt(k / m);
  for (int i = 0; i < 3; ++i) {
    EXPECT_NEAR(modes->energies()[i].real(), hnu, 1e-12);
    EXPECT_EQ(modes->energies()[i].imag(), 0);
    EXPECT_NEAR(modes->frequencies()[i].real(), hnu / kInvCm, 1e-8);
  }
  EXPECT_NEAR(modes->zero_point_energy(), 1.5 * hnu, 1e-12);

  // Mass-weighted normalization
  for (int i = 0; i < 3; ++i)
    EXPECT_NEAR(modes->mode(i).squaredNorm() * m, 1, 1e-12);
}

TEST(NormalModesTest, NegativeCurvatureIsImaginary) {
  ArrayXd masses = ArrayXd::Ones(1);
  MatrixXd hessian = Vector3d(-4, 1, 9).asDiagonal();

  absl::StatusOr<NormalModes> modes =
      NormalModes::from_hessian(hessian, masses);
  ASSERT_TRUE(modes.ok()) << modes.status();

  const ArrayXcd &hnu = modes->energies();
  EXPECT_EQ(hnu[0].real(), 0);
  EXPECT_NEAR(hnu[0].imag(), 2 * kHbarSqrtEvAmu, 1e-12);
  EXPECT_NEAR(hnu[1].real(), kHbarSqrtEvAmu, 1e-12);
  EXPECT_NEAR(hnu[2].real(), 3 * kHbarSqrtEvAmu, 1e-12);

  EXPECT_NEAR(modes->zero_point_energy(), 2 * kHbarSqrtEvAmu, 1e-12);
}

TEST(NormalModesTest, Intensities) {
  const double m = 2, q = 0.3, c = 0.5;
  ArrayXd masses = ArrayXd::Constant(1, m);
  MatrixXd hessian = Vector3d(1, 2, 3).asDiagonal();

  absl::StatusOr<NormalModes> modes =
      NormalModes::from_hessian(hessian, masses);
  ASSERT_TRUE(modes.ok()) << modes.status();

  MatrixX3d dpdx = MatrixX3d::Identity(3, 3) * q;
  ArrayXd ir = modes->ir_intensities(dpdx);
  ASSERT_EQ(ir.size(), 3);
  const double debye2 = constants::kDebye * constants::kDebye;
  for (int i = 0; i < 3; ++i)
    EXPECT_NEAR(ir[i], q * q / m / debye2, 1e-10);

  // Isotropic derivative along x only: activity 45 a^2 goes to the x mode
  std::vector<Matrix3d> dadx(3, Matrix3d::Zero());
  dadx[0] = Matrix3d::Identity() * c;
  ArrayXd raman = modes->raman_activities(dadx);
  ASSERT_EQ(raman.size(), 3);
  EXPECT_NEAR(raman[0], 45 * c * c / m, 1e-10);
  EXPECT_NEAR(raman[1], 0, 1e-12);
  EXPECT_NEAR(raman[2], 0, 1e-12);

  // Traceless derivative: only the anisotropy contributes
  dadx[0] = Vector3d(1, -1, 0).asDiagonal();
  raman = modes->raman_activities(dadx);
  EXPECT_NEAR(raman[0], 7 * 3.0 / m, 1e-10);
}

TEST(NormalModesTest, RejectsInvalidInput) {
  ArrayXd masses = ArrayXd::Ones(2);
  absl::StatusOr<NormalModes> modes =
      NormalModes::from_hessian(MatrixXd::Identity(3, 3), masses);
  ASSERT_FALSE(modes.ok());
  EXPECT_TRUE(is_engine_failure(modes.status()));

  masses[1] = 0;
  modes = NormalModes::from_hessian(MatrixXd::Identity(6, 6), masses);
  ASSERT_FALSE(modes.ok());
  EXPECT_TRUE(is_engine_failure(modes.status()));
}
}  // namespace
}  // namespace vibra
