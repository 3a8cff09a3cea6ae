//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "vibra/core/structure.h"

#include <string>
#include <utility>
#include <vector>

#include <absl/log/absl_check.h>
#include <absl/log/absl_log.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>

#include "vibra/eigen_config.h"
#include "vibra/core/molecule.h"

namespace vibra {
ArrayXd MolecularStructure::masses() const {
  ArrayXd m(size());
  for (int i = 0; i < size(); ++i)
    m[i] = elements_[i]->atomic_weight();
  return m;
}

std::string MolecularStructure::canonical_repr() const {
  std::string repr;
  for (const Element *elem: elements_)
    absl::StrAppend(&repr, elem->symbol(), " ");

  for (int i = 0; i < positions_.cols(); ++i) {
    absl::StrAppendFormat(&repr, "\n%.8f %.8f %.8f", positions_(0, i),
                          positions_(1, i), positions_(2, i));
  }

  return repr;
}

std::pair<MolecularStructure, BondedGraph> to_structure(const Molecule &mol,
                                                        int conf) {
  ABSL_CHECK(conf >= 0 && conf < static_cast<int>(mol.confs().size()))
      << "conformer index out of range: " << conf;

  std::vector<const Element *> elements;
  elements.reserve(mol.num_atoms());
  for (int i = 0; i < mol.num_atoms(); ++i) {
    ABSL_LOG_IF(WARNING, mol.atom(i).implicit_hydrogens() > 0)
        << "Atom " << i << " has " << mol.atom(i).implicit_hydrogens()
        << " implicit hydrogens; they will be ignored";
    elements.push_back(&mol.atom(i).element());
  }

  std::vector<BondPair> bonds;
  bonds.reserve(mol.num_bonds());
  for (const Bond &bond: mol.bonds())
    bonds.push_back({ bond.src, bond.dst, bond.data.order() });

  return {
    MolecularStructure(std::move(elements), mol.confs()[conf]),
    BondedGraph(std::move(bonds)),
  };
}
}  // namespace vibra
