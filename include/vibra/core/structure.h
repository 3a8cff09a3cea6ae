//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef VIBRA_CORE_STRUCTURE_H_
#define VIBRA_CORE_STRUCTURE_H_

//! @cond
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <absl/log/absl_check.h>
//! @endcond

#include "vibra/eigen_config.h"
#include "vibra/core/element.h"
#include "vibra/core/molecule.h"

namespace vibra {
/**
 * @brief An ordered set of atoms with 3D positions.
 *
 * The atom count and ordering are fixed at construction. Positions are in
 * angstroms, one atom per column.
 */
class MolecularStructure {
public:
  MolecularStructure() = default;

  MolecularStructure(std::vector<const Element *> elements, Matrix3Xd positions)
      : elements_(std::move(elements)), positions_(std::move(positions)) {
    ABSL_DCHECK(static_cast<Eigen::Index>(elements_.size())
                == positions_.cols());
  }

  int size() const { return static_cast<int>(elements_.size()); }

  bool empty() const { return elements_.empty(); }

  const Element &element(int i) const { return *elements_[i]; }

  std::string_view symbol(int i) const { return elements_[i]->symbol(); }

  const Matrix3Xd &positions() const { return positions_; }

  ArrayXd masses() const;

  /**
   * @brief A copy of this structure with the same atoms at new positions.
   */
  MolecularStructure with_positions(Matrix3Xd positions) const {
    return { elements_, std::move(positions) };
  }

  /**
   * @brief Canonical text representation, used for content hashing.
   *
   * The representation contains the element symbols in order followed by
   * the positions printed with fixed precision, so structures compare equal
   * if and only if their representations do (up to the printed precision).
   */
  std::string canonical_repr() const;

private:
  std::vector<const Element *> elements_;
  Matrix3Xd positions_;
};

struct BondPair {
  int src;
  int dst;
  constants::BondOrder order;
};

/**
 * @brief Bonds of a structure, as unordered pairs of atom indices.
 *
 * Bond indices are stable and index-aligned with the bonds of the molecule
 * the graph was derived from.
 */
class BondedGraph {
public:
  BondedGraph() = default;

  explicit BondedGraph(std::vector<BondPair> bonds): bonds_(std::move(bonds)) { }

  int size() const { return static_cast<int>(bonds_.size()); }

  bool empty() const { return bonds_.empty(); }

  const BondPair &operator[](int i) const { return bonds_[i]; }

  auto begin() const { return bonds_.begin(); }
  auto end() const { return bonds_.end(); }

private:
  std::vector<BondPair> bonds_;
};

/**
 * @brief Extract the structure and the bonded graph of a molecule.
 *
 * @param mol The molecule. Must have no implicit hydrogens.
 * @param conf Index of the conformer to take positions from.
 */
extern std::pair<MolecularStructure, BondedGraph>
to_structure(const Molecule &mol, int conf = 0);
}  // namespace vibra

#endif /* VIBRA_CORE_STRUCTURE_H_ */
