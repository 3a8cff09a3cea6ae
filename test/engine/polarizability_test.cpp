//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "vibra/engine/polarizability.h"

#include <cmath>
#include <optional>

#include <absl/status/statusor.h>
#include <Eigen/Dense>

#include <gtest/gtest.h>

#include "vibra/eigen_config.h"
#include "vibra/status.h"
#include "vibra/core/element.h"
#include "vibra/core/structure.h"
#include "test_utils.h"

namespace vibra {
namespace {
MolecularStructure diatomic(int za, int zb, double r) {
  Matrix3Xd pos = Matrix3Xd::Zero(3, 2);
  pos(2, 1) = r;
  return MolecularStructure({ &kPt[za], &kPt[zb] }, pos);
}

TEST(LippincottStuttmanTest, Parameters) {
  std::optional<LsParams> h = lippincott_stuttman_params(kPt[1]);
  ASSERT_TRUE(h.has_value());
  EXPECT_DOUBLE_EQ(h->polarizability, 0.592);
  EXPECT_DOUBLE_EQ(h->reduced_electronegativity, 1.0);

  std::optional<LsParams> c = lippincott_stuttman_params(kPt[6]);
  ASSERT_TRUE(c.has_value());
  EXPECT_DOUBLE_EQ(c->polarizability, 0.978);
  EXPECT_DOUBLE_EQ(c->reduced_electronegativity, 0.846);

  EXPECT_FALSE(lippincott_stuttman_params(kPt[17]).has_value());
  EXPECT_FALSE(lippincott_stuttman_params(kPt[0]).has_value());
}

TEST(LippincottStuttmanTest, HomonuclearBond) {
  const LsParams c = *lippincott_stuttman_params(kPt[6]);
  const auto [par, perp] = lippincott_stuttman(c, c, true, 1.54);

  EXPECT_NEAR(par, std::pow(1.54, 4) / std::pow(256 * 0.978 * 0.978, 1.0 / 6),
              1e-12);
  EXPECT_NEAR(perp, 0.978, 1e-12);
}

TEST(LippincottStuttmanTest, HeteronuclearBond) {
  const LsParams c = *lippincott_stuttman_params(kPt[6]),
                 n = *lippincott_stuttman_params(kPt[7]);
  const auto [par, perp] = lippincott_stuttman(c, n, false, 1.16);

  const double sigma = std::exp(-(0.846 - 0.927) * (0.846 - 0.927) / 4);
  EXPECT_NEAR(par,
              sigma * std::pow(1.16, 4)
                  / std::pow(256 * 0.978 * 0.743, 1.0 / 6),
              1e-12);

  const double xc = 0.846 * 0.846, xn = 0.927 * 0.927;
  EXPECT_NEAR(perp, (xc * 0.978 + xn * 0.743) / (xc + xn), 1e-12);

  // Symmetric in the two atoms
  const auto [par2, perp2] = lippincott_stuttman(n, c, false, 1.16);
  EXPECT_DOUBLE_EQ(par, par2);
  EXPECT_DOUBLE_EQ(perp, perp2);
}

TEST(BondPolarizabilityTest, Diatomic) {
  MolecularStructure structure = diatomic(1, 1, 0.74);
  BondPolarizabilityModel model(structure);
  ASSERT_EQ(model.size(), 2);

  absl::StatusOr<Matrix3d> alpha = model(structure.positions());
  ASSERT_TRUE(alpha.ok()) << alpha.status();

  const LsParams h = *lippincott_stuttman_params(kPt[1]);
  const auto [par, perp] = lippincott_stuttman(h, h, true, 0.74);
  EXPECT_NEAR((*alpha)(0, 0), perp, 1e-12);
  EXPECT_NEAR((*alpha)(1, 1), perp, 1e-12);
  EXPECT_NEAR((*alpha)(2, 2), par, 1e-12);
  EXPECT_NEAR((*alpha)(0, 2), 0, 1e-12);
}

TEST(BondPolarizabilityTest, DistantAtomsDoNotContribute) {
  MolecularStructure structure = diatomic(6, 8, 4.0);
  BondPolarizabilityModel model(structure);

  absl::StatusOr<Matrix3d> alpha = model(structure.positions());
  ASSERT_TRUE(alpha.ok()) << alpha.status();
  VIBRA_EXPECT_EIGEN_EQ(*alpha, Matrix3d::Zero());
}

TEST(BondPolarizabilityTest, LongerBondIsMorePolarizable) {
  MolecularStructure structure = diatomic(6, 8, 1.20);
  BondPolarizabilityModel model(structure);

  Matrix3Xd stretched = structure.positions();
  stretched(2, 1) = 1.25;

  const Matrix3d a0 = *model(structure.positions()), a1 = *model(stretched);
  EXPECT_GT(a1(2, 2), a0(2, 2));
  EXPECT_NEAR(a1(0, 0), a0(0, 0), 1e-12);
}

TEST(BondPolarizabilityTest, RotationCovariance) {
  auto [structure, bonds] = internal::embed_smiles("C=CO");
  BondPolarizabilityModel model(structure);

  const Matrix3Xd &pos = structure.positions();
  const Matrix3d rot =
      Eigen::AngleAxisd(1.1, Vector3d(0.3, -1, 0.5).normalized())
          .toRotationMatrix();

  const Matrix3d alpha = *model(pos), rotated = *model(rot * pos);
  VIBRA_EXPECT_EIGEN_EQ(rotated, rot * alpha * rot.transpose());
  VIBRA_EXPECT_EIGEN_EQ(alpha, alpha.transpose());
}

TEST(BondPolarizabilityTest, MissingParameters) {
  MolecularStructure structure = diatomic(1, 17, 1.27);
  BondPolarizabilityModel model(structure);

  absl::StatusOr<Matrix3d> alpha = model(structure.positions());
  ASSERT_FALSE(alpha.ok());
  EXPECT_TRUE(is_engine_failure(alpha.status()));
  EXPECT_NE(alpha.status().message().find("Cl"), absl::string_view::npos)
      << alpha.status();
}

TEST(BondPolarizabilityTest, CoincidentAtoms) {
  MolecularStructure structure = diatomic(1, 1, 0);
  BondPolarizabilityModel model(structure);

  absl::StatusOr<Matrix3d> alpha = model(structure.positions());
  ASSERT_FALSE(alpha.ok());
  EXPECT_TRUE(is_engine_failure(alpha.status()));
}
}  // namespace
}  // namespace vibra
