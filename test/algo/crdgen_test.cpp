//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "vibra/algo/crdgen.h"

#include <cmath>
#include <string_view>

#include <Eigen/Dense>

#include <gtest/gtest.h>

#include "vibra/eigen_config.h"
#include "vibra/core/molecule.h"
#include "vibra/fmt/smiles.h"
#include "test_utils.h"

namespace vibra {
namespace {
Molecule prepare(std::string_view smiles) {
  Molecule mol = read_smiles(smiles);
  add_hydrogens(mol);
  assign_hybridization(mol);
  return mol;
}

void expect_bond_lengths(const Molecule &mol, const Matrix3Xd &conf,
                         double tol) {
  for (const Bond &bond: mol.bonds()) {
    const double ideal =
        ideal_bond_length(mol.atom(bond.src).element(),
                          mol.atom(bond.dst).element(), bond.data.order());
    const double len = (conf.col(bond.src) - conf.col(bond.dst)).norm();
    EXPECT_NEAR(len, ideal, tol) << bond.src << " - " << bond.dst;
  }
}

TEST(CrdgenTest, Ethanol) {
  Molecule mol = prepare("CCO");
  ASSERT_EQ(mol.num_atoms(), 9);

  Matrix3Xd &conf = mol.confs().emplace_back(3, mol.num_atoms());
  ASSERT_TRUE(generate_coords(mol, conf));
  EXPECT_TRUE(conf.allFinite());
  expect_bond_lengths(mol, conf, 0.15);

  VIBRA_EXPECT_EIGEN_EQ_TOL(conf.rowwise().mean(), Vector3d::Zero(), 1e-9);

  for (int i = 1; i < mol.num_atoms(); ++i)
    for (int j = 0; j < i; ++j)
      EXPECT_GT((conf.col(i) - conf.col(j)).norm(), 0.5);
}

TEST(CrdgenTest, Deterministic) {
  Molecule mol = prepare("CC(=O)N");

  Matrix3Xd a, b;
  ASSERT_TRUE(generate_coords(mol, a, 10, 7));
  ASSERT_TRUE(generate_coords(mol, b, 10, 7));
  VIBRA_EXPECT_EIGEN_EQ(a, b);
}

TEST(CrdgenTest, BenzeneIsPlanar) {
  Molecule mol = prepare("c1ccccc1");
  ASSERT_EQ(mol.num_atoms(), 12);

  Matrix3Xd conf;
  ASSERT_TRUE(generate_coords(mol, conf));
  expect_bond_lengths(mol, conf, 0.15);

  Matrix3Xd centered = conf.colwise() - conf.rowwise().mean();
  Eigen::JacobiSVD<Matrix3Xd> svd(centered);
  EXPECT_LT(svd.singularValues()[2] / std::sqrt(12.0), 0.2);
}

TEST(CrdgenTest, SmallMolecules) {
  Molecule atom = prepare("[Ne]");
  Matrix3Xd conf;
  ASSERT_TRUE(generate_coords(atom, conf));
  ASSERT_EQ(conf.cols(), 1);
  VIBRA_EXPECT_EIGEN_EQ(conf.col(0), Vector3d::Zero());

  Molecule diatomic = prepare("[H][H]");
  ASSERT_TRUE(generate_coords(diatomic, conf));
  ASSERT_EQ(conf.cols(), 2);
  EXPECT_NEAR((conf.col(0) - conf.col(1)).norm(), 0.62, 1e-12);
  EXPECT_NEAR(conf(1, 0), 0, 1e-12);
  EXPECT_NEAR(conf(2, 1), 0, 1e-12);

  Molecule water = prepare("O");
  ASSERT_TRUE(generate_coords(water, conf));
  expect_bond_lengths(water, conf, 0.1);
}

TEST(CrdgenTest, EmptyMolecule) {
  Molecule mol;
  Matrix3Xd conf;
  EXPECT_FALSE(generate_coords(mol, conf));
}
}  // namespace
}  // namespace vibra
