//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "vibra/engine/xtb_engine.h"

#include <cmath>
#include <memory>
#include <vector>

#include <absl/status/statusor.h>
#include <Eigen/Dense>

#include <gtest/gtest.h>

#include "vibra/eigen_config.h"
#include "vibra/status.h"
#include "vibra/core/structure.h"
#include "vibra/engine/engine.h"
#include "vibra/engine/method.h"
#include "vibra/engine/polarizability.h"
#include "test_utils.h"

namespace vibra {
namespace {
class XtbEngineTest: public ::testing::TestWithParam<Method> {
protected:
  void SetUp() override { structure_ = internal::embed_smiles("O").first; }

  MolecularStructure structure_;
};

TEST_P(XtbEngineTest, Evaluate) {
  absl::StatusOr<std::unique_ptr<XtbEngine>> engine =
      XtbEngine::create(structure_, GetParam());
  ASSERT_TRUE(engine.ok()) << engine.status();
  EXPECT_EQ((*engine)->method(), GetParam());
  EXPECT_EQ((*engine)->size(), 3);

  absl::StatusOr<EngineResult> res =
      (*engine)->evaluate(structure_.positions());
  ASSERT_TRUE(res.ok()) << res.status();
  EXPECT_TRUE(std::isfinite(res->energy));
  EXPECT_LT(res->energy, 0);
  ASSERT_EQ(res->gradient.cols(), 3);
  EXPECT_TRUE(res->gradient.allFinite());

  // No net force on an isolated molecule
  EXPECT_LT(res->gradient.rowwise().sum().norm(), 1e-4);
  // Water is polar
  if (!is_force_field(GetParam()))
    EXPECT_GT(res->dipole.norm(), 0.1);
}

TEST_P(XtbEngineTest, GradientMatchesFiniteDifference) {
  std::unique_ptr<XtbEngine> engine =
      *XtbEngine::create(structure_, GetParam());

  const Matrix3Xd &pos = structure_.positions();
  const Matrix3Xd grad = engine->evaluate(pos)->gradient;

  constexpr double h = 1e-4;
  Matrix3Xd disp = pos;
  for (int i = 0; i < pos.cols(); ++i) {
    for (int k = 0; k < 3; ++k) {
      disp(k, i) = pos(k, i) + h;
      const double ep = engine->evaluate(disp)->energy;
      disp(k, i) = pos(k, i) - h;
      const double em = engine->evaluate(disp)->energy;
      disp(k, i) = pos(k, i);

      EXPECT_NEAR(grad(k, i), (ep - em) / (2 * h), 1e-3) << i << ", " << k;
    }
  }
}

TEST_P(XtbEngineTest, PolarizabilityFromBondModel) {
  std::unique_ptr<XtbEngine> engine =
      *XtbEngine::create(structure_, GetParam());

  absl::StatusOr<Matrix3d> alpha =
      engine->polarizability(structure_.positions());
  ASSERT_TRUE(alpha.ok()) << alpha.status();
  VIBRA_EXPECT_EIGEN_EQ(*alpha,
                        *BondPolarizabilityModel(structure_)(
                            structure_.positions()));
}

TEST_P(XtbEngineTest, RejectsBadPositions) {
  std::unique_ptr<XtbEngine> engine =
      *XtbEngine::create(structure_, GetParam());

  absl::StatusOr<EngineResult> res = engine->evaluate(Matrix3Xd::Zero(3, 2));
  ASSERT_FALSE(res.ok());
  EXPECT_TRUE(is_engine_failure(res.status()));
}

INSTANTIATE_TEST_SUITE_P(Methods, XtbEngineTest,
                         ::testing::Values(Method::kGFNFF, Method::kGFN1xTB,
                                           Method::kGFN2xTB));

TEST(XtbMethodTest, MethodsGiveDifferentSurfaces) {
  auto [structure, bonds] = internal::embed_smiles("CO");

  std::vector<double> energies;
  for (Method method: { Method::kGFNFF, Method::kGFN1xTB, Method::kGFN2xTB }) {
    absl::StatusOr<std::unique_ptr<XtbEngine>> engine =
        XtbEngine::create(structure, method);
    ASSERT_TRUE(engine.ok()) << method << ": " << engine.status();

    absl::StatusOr<EngineResult> res =
        (*engine)->evaluate(structure.positions());
    ASSERT_TRUE(res.ok()) << method << ": " << res.status();
    energies.push_back(res->energy);
  }

  EXPECT_GT(std::abs(energies[0] - energies[1]), 1e-3);
  EXPECT_GT(std::abs(energies[0] - energies[2]), 1e-3);
  EXPECT_GT(std::abs(energies[1] - energies[2]), 1e-3);
}

TEST(DefaultEngineTest, BuildsXtbEngineForMethod) {
  auto [structure, bonds] = internal::embed_smiles("CO");

  for (Method method: { Method::kGFNFF, Method::kGFN1xTB, Method::kGFN2xTB }) {
    absl::StatusOr<std::unique_ptr<ForceEngine>> engine =
        default_engine(structure, bonds, method);
    ASSERT_TRUE(engine.ok()) << engine.status();

    const auto *xtb = dynamic_cast<const XtbEngine *>(engine->get());
    ASSERT_NE(xtb, nullptr);
    EXPECT_EQ(xtb->method(), method);
    EXPECT_EQ(xtb->size(), structure.size());
  }
}

TEST(DefaultEngineTest, RejectsInvalidInput) {
  auto [structure, bonds] = internal::embed_smiles("CO");

  absl::StatusOr<std::unique_ptr<ForceEngine>> engine =
      default_engine(MolecularStructure(), BondedGraph(), Method::kGFNFF);
  ASSERT_FALSE(engine.ok());
  EXPECT_TRUE(is_invalid_input(engine.status()));

  BondedGraph bad(std::vector<BondPair> {
      { 0, structure.size(), constants::kSingleBond }
  });
  engine = default_engine(structure, bad, Method::kGFNFF);
  ASSERT_FALSE(engine.ok());
  EXPECT_TRUE(is_invalid_input(engine.status()));
}
}  // namespace
}  // namespace vibra
