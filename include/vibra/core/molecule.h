//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef VIBRA_CORE_MOLECULE_H_
#define VIBRA_CORE_MOLECULE_H_

//! @cond
#include <cstdint>
#include <ostream>
#include <utility>
#include <vector>

#include <absl/log/absl_check.h>
//! @endcond

#include "vibra/eigen_config.h"
#include "vibra/core/element.h"

namespace vibra {
namespace constants {
  enum BondOrder : std::int8_t {
    kOtherBond = 0,
    kSingleBond = 1,
    kDoubleBond = 2,
    kTripleBond = 3,
    kQuadrupleBond = 4,
    kAromaticBond = 5,
  };

  // NOLINTNEXTLINE(clang-diagnostic-unused-function)
  inline std::ostream &operator<<(std::ostream &os, BondOrder order) {
    return os << static_cast<int>(order);
  }

  /**
   * @brief Hybridization states, ordered by the steric number so that
   *        a steric number can be converted directly.
   */
  enum Hybridization : std::int8_t {
    kUnbound = 0,
    kTerminal = 1,
    kSP = 2,
    kSP2 = 3,
    kSP3 = 4,
    kSP3D = 5,
    kSP3D2 = 6,
    kOtherHyb = 7,
  };

  // NOLINTNEXTLINE(clang-diagnostic-unused-function)
  inline std::ostream &operator<<(std::ostream &os, Hybridization hyb) {
    return os << static_cast<int>(hyb);
  }

  constexpr double kBondOrderToDouble[] = { 0, 1, 2, 3, 4, 1.5 };
}  // namespace constants

class AtomData {
public:
  AtomData(): AtomData(kPt[0]) { }

  explicit AtomData(const Element &element) : element_(&element) { }

  const Element &element() const { return *element_; }

  int atomic_number() const { return element_->atomic_number(); }

  double atomic_weight() const { return element_->atomic_weight(); }

  int implicit_hydrogens() const { return implicit_hydrogens_; }

  AtomData &set_implicit_hydrogens(int count) {
    implicit_hydrogens_ = count;
    return *this;
  }

  int formal_charge() const { return formal_charge_; }

  AtomData &set_formal_charge(int charge) {
    formal_charge_ = charge;
    return *this;
  }

  bool is_aromatic() const { return aromatic_; }

  AtomData &set_aromatic(bool aromatic) {
    aromatic_ = aromatic;
    return *this;
  }

  constants::Hybridization hybridization() const { return hyb_; }

  AtomData &set_hybridization(constants::Hybridization hyb) {
    hyb_ = hyb;
    return *this;
  }

private:
  const Element *element_;
  int implicit_hydrogens_ = 0;
  int formal_charge_ = 0;
  bool aromatic_ = false;
  constants::Hybridization hyb_ = constants::kOtherHyb;
};

class BondData {
public:
  BondData() = default;

  explicit BondData(constants::BondOrder order): order_(order) { }

  constants::BondOrder order() const { return order_; }

  constants::BondOrder &order() { return order_; }

private:
  constants::BondOrder order_ = constants::kSingleBond;
};

struct Bond {
  int src;
  int dst;
  BondData data;
};

struct Neighbor {
  int dst;
  int eid;
};

/**
 * @brief A molecular graph with optional 3D conformers.
 *
 * Atoms and bonds are referenced by their insertion index, which never
 * changes once assigned. Bonds are undirected; for each bond, @c src is the
 * atom that was added to the molecule first.
 */
class Molecule {
public:
  int num_atoms() const { return static_cast<int>(atoms_.size()); }

  int num_bonds() const { return static_cast<int>(bonds_.size()); }

  bool empty() const { return atoms_.empty(); }

  AtomData &atom(int idx) { return atoms_[idx]; }

  const AtomData &atom(int idx) const { return atoms_[idx]; }

  const Bond &bond(int idx) const { return bonds_[idx]; }

  Bond &bond(int idx) { return bonds_[idx]; }

  const std::vector<Bond> &bonds() const { return bonds_; }

  const std::vector<Neighbor> &neighbors(int idx) const { return adj_[idx]; }

  int degree(int idx) const { return static_cast<int>(adj_[idx].size()); }

  /**
   * @brief Total number of neighbors, including implicit hydrogens.
   */
  int all_neighbors(int idx) const {
    return degree(idx) + atoms_[idx].implicit_hydrogens();
  }

  /**
   * @brief Find the bond between two atoms.
   * @return Index of the bond, or -1 if the atoms are not bonded.
   */
  int find_bond(int src, int dst) const;

  int add_atom(AtomData data);

  /**
   * @brief Add a bond between two existing atoms.
   *
   * @return A pair of the bond index and whether the bond was added. If the
   *         bond already exists, the index of the existing bond is returned.
   *         Self-loops are rejected with index -1.
   */
  std::pair<int, bool> add_bond(int src, int dst, BondData data);

  void reserve(int natoms) {
    atoms_.reserve(natoms);
    adj_.reserve(natoms);
  }

  void clear() {
    atoms_.clear();
    bonds_.clear();
    adj_.clear();
    confs_.clear();
  }

  std::vector<Matrix3Xd> &confs() { return confs_; }

  const std::vector<Matrix3Xd> &confs() const { return confs_; }

  /**
   * @brief Sum of bond orders of an atom.
   *
   * @param idx The atom index.
   * @param include_implicit Whether to count implicit hydrogens as single
   *        bonds.
   * @note Aromatic bonds count as 1.5, and the sum is rounded down. Atoms
   *       with odd number of aromatic bonds get an extra 1 (e.g. pyridine N).
   */
  int sum_bond_order(int idx, bool include_implicit) const;

private:
  std::vector<AtomData> atoms_;
  std::vector<Bond> bonds_;
  std::vector<std::vector<Neighbor>> adj_;
  std::vector<Matrix3Xd> confs_;
};

/**
 * @brief Convert all implicit hydrogens to explicit hydrogen atoms.
 *
 * New hydrogens are appended after the existing atoms, in the order of the
 * heavy atoms they are attached to. Existing conformers are discarded.
 *
 * @return The number of hydrogens added.
 */
extern int add_hydrogens(Molecule &mol);

/**
 * @brief Assign the hybridization state of every atom from its bonding
 *        pattern.
 *
 * @return false if any atom has more valence electrons than allowed.
 */
extern bool assign_hybridization(Molecule &mol);

/**
 * @brief Estimated equilibrium length of a bond, in angstroms.
 *
 * Sum of the covalent radii, shortened for multiple and aromatic bonds.
 */
extern double ideal_bond_length(const Element &src, const Element &dst,
                                constants::BondOrder order);
}  // namespace vibra

#endif /* VIBRA_CORE_MOLECULE_H_ */
