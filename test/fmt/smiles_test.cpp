//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "vibra/fmt/smiles.h"

#include <gtest/gtest.h>

#include "vibra/core/molecule.h"

namespace vibra {
namespace {
int total_hydrogens(const Molecule &mol) {
  int sum = 0;
  for (int i = 0; i < mol.num_atoms(); ++i)
    sum += mol.atom(i).implicit_hydrogens();
  return sum;
}

TEST(SmilesTest, OrganicSubset) {
  Molecule mol = read_smiles("CC(=O)O");
  ASSERT_EQ(mol.num_atoms(), 4);
  EXPECT_EQ(mol.num_bonds(), 3);
  EXPECT_EQ(mol.atom(0).implicit_hydrogens(), 3);
  EXPECT_EQ(mol.atom(1).implicit_hydrogens(), 0);
  EXPECT_EQ(mol.atom(2).implicit_hydrogens(), 0);
  EXPECT_EQ(mol.atom(3).implicit_hydrogens(), 1);
  EXPECT_EQ(mol.bond(mol.find_bond(1, 2)).data.order(),
            constants::kDoubleBond);
}

TEST(SmilesTest, BondSymbols) {
  Molecule mol = read_smiles("C#N");
  ASSERT_EQ(mol.num_atoms(), 2);
  EXPECT_EQ(mol.bond(0).data.order(), constants::kTripleBond);
  EXPECT_EQ(total_hydrogens(mol), 1);

  mol = read_smiles("F/C=C/F");
  ASSERT_EQ(mol.num_atoms(), 4);
  EXPECT_EQ(mol.bond(0).data.order(), constants::kSingleBond);
  EXPECT_EQ(mol.bond(1).data.order(), constants::kDoubleBond);
}

TEST(SmilesTest, Aromatic) {
  Molecule mol = read_smiles("c1ccccc1");
  ASSERT_EQ(mol.num_atoms(), 6);
  EXPECT_EQ(mol.num_bonds(), 6);
  for (int i = 0; i < 6; ++i) {
    EXPECT_TRUE(mol.atom(i).is_aromatic());
    EXPECT_EQ(mol.atom(i).implicit_hydrogens(), 1);
  }
  for (const Bond &bond: mol.bonds())
    EXPECT_EQ(bond.data.order(), constants::kAromaticBond);
}

TEST(SmilesTest, RingClosures) {
  Molecule mol = read_smiles("C1CC1");
  ASSERT_EQ(mol.num_atoms(), 3);
  EXPECT_EQ(mol.num_bonds(), 3);
  EXPECT_EQ(total_hydrogens(mol), 6);

  mol = read_smiles("C%12CCC%12");
  ASSERT_EQ(mol.num_atoms(), 4);
  EXPECT_EQ(mol.num_bonds(), 4);
  EXPECT_GE(mol.find_bond(0, 3), 0);
}

TEST(SmilesTest, BracketAtoms) {
  Molecule mol = read_smiles("[NH4+]");
  ASSERT_EQ(mol.num_atoms(), 1);
  EXPECT_EQ(mol.atom(0).implicit_hydrogens(), 4);
  EXPECT_EQ(mol.atom(0).formal_charge(), 1);

  mol = read_smiles("[13CH4]");
  ASSERT_EQ(mol.num_atoms(), 1);
  EXPECT_EQ(mol.atom(0).atomic_number(), 6);
  EXPECT_NEAR(mol.atom(0).atomic_weight(), 12.011, 1e-9);

  mol = read_smiles("C[C@H](N)O");
  ASSERT_EQ(mol.num_atoms(), 4);
  EXPECT_EQ(mol.atom(1).implicit_hydrogens(), 1);

  mol = read_smiles("[O-]C");
  ASSERT_EQ(mol.num_atoms(), 2);
  EXPECT_EQ(mol.atom(0).formal_charge(), -1);
  EXPECT_EQ(mol.atom(0).implicit_hydrogens(), 0);
}

TEST(SmilesTest, Disconnected) {
  Molecule mol = read_smiles("C.O");
  ASSERT_EQ(mol.num_atoms(), 2);
  EXPECT_EQ(mol.num_bonds(), 0);
  EXPECT_EQ(total_hydrogens(mol), 6);
}

TEST(SmilesTest, TitleIsIgnored) {
  Molecule mol = read_smiles("CCO ethanol");
  EXPECT_EQ(mol.num_atoms(), 3);
}

TEST(SmilesTest, InvalidInputs) {
  EXPECT_TRUE(read_smiles("").empty());
  EXPECT_TRUE(read_smiles("   ").empty());
  EXPECT_TRUE(read_smiles("C1CC").empty());
  EXPECT_TRUE(read_smiles("C(C").empty());
  EXPECT_TRUE(read_smiles("[Xx]").empty());
  EXPECT_TRUE(read_smiles("C=1CC#1").empty());
  EXPECT_TRUE(read_smiles("not a smiles").empty());
}
}  // namespace
}  // namespace vibra
