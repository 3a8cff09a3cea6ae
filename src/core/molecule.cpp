//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "vibra/core/molecule.h"

#include <algorithm>
#include <utility>

#include <absl/algorithm/container.h>
#include <absl/log/absl_check.h>
#include <absl/log/absl_log.h>

#include "vibra/core/element.h"
#include "vibra/utils.h"

namespace vibra {
int Molecule::find_bond(int src, int dst) const {
  const std::vector<Neighbor> &adj = adj_[src];
  auto it = absl::c_find_if(adj, [&](Neighbor nei) { return nei.dst == dst; });
  return it != adj.end() ? it->eid : -1;
}

int Molecule::add_atom(AtomData data) {
  const int idx = num_atoms();
  atoms_.push_back(data);
  adj_.emplace_back();
  return idx;
}

std::pair<int, bool> Molecule::add_bond(int src, int dst, BondData data) {
  ABSL_DCHECK(src >= 0 && src < num_atoms());
  ABSL_DCHECK(dst >= 0 && dst < num_atoms());

  if (src == dst)
    return { -1, false };

  const int existing = find_bond(src, dst);
  if (existing >= 0)
    return { existing, false };

  const int eid = num_bonds();
  bonds_.push_back({ min(src, dst), max(src, dst), data });
  adj_[src].push_back({ dst, eid });
  adj_[dst].push_back({ src, eid });
  return { eid, true };
}

int Molecule::sum_bond_order(int idx, bool include_implicit) const {
  int sum_order = value_if(include_implicit, atoms_[idx].implicit_hydrogens()),
      num_aromatic = 0, num_multiple_bond = 0;

  for (Neighbor nei: adj_[idx]) {
    const constants::BondOrder order = bonds_[nei.eid].data.order();
    if (order == constants::kAromaticBond) {
      ++num_aromatic;
    } else {
      sum_order += max(order, constants::kSingleBond);
      num_multiple_bond += value_if(order > constants::kSingleBond);
    }
  }

  if (num_aromatic == 0)
    return sum_order;

  if (num_aromatic == 1) {
    ABSL_LOG(INFO) << "Atom " << idx << " has a single aromatic bond; "
                   << "assuming single bond for bond order calculation";
    return sum_order + 1;
  }

  // 2 aromatic bonds -> 1.5 each (benzene), 3 aromatic bonds -> 2, 1, 1
  // (ring fusion atoms). A non-aromatic multiple bond takes the place of the
  // aromatic double bond (e.g. c1(=O)ccccc1).
  return sum_order + num_aromatic + 1 - num_multiple_bond;
}

int add_hydrogens(Molecule &mol) {
  const int n = mol.num_atoms();
  const Element &hydrogen = kPt[1];

  int added = 0;
  for (int i = 0; i < n; ++i) {
    const int nh = mol.atom(i).implicit_hydrogens();
    for (int j = 0; j < nh; ++j) {
      const int h = mol.add_atom(
          AtomData(hydrogen).set_hybridization(constants::kTerminal));
      mol.add_bond(i, h, BondData(constants::kSingleBond));
    }
    mol.atom(i).set_implicit_hydrogens(0);
    added += nh;
  }

  ABSL_LOG_IF(INFO, !mol.confs().empty() && added > 0)
      << "Discarding " << mol.confs().size() << " conformer(s) after adding "
      << added << " hydrogens";
  if (added > 0)
    mol.confs().clear();

  return added;
}

namespace {
  bool has_pi_bond(const Molecule &mol, int idx) {
    return absl::c_any_of(mol.neighbors(idx), [&](Neighbor nei) {
      return mol.bond(nei.eid).data.order() > constants::kSingleBond;
    });
  }

  constants::Hybridization from_steric_number(int total_degree, int nbe) {
    const int sn = total_degree + nbe / 2 + nbe % 2;
    return static_cast<constants::Hybridization>(
        min(sn, static_cast<int>(constants::kOtherHyb)));
  }
}  // namespace

bool assign_hybridization(Molecule &mol) {
  for (int i = 0; i < mol.num_atoms(); ++i) {
    AtomData &data = mol.atom(i);
    const int total_degree = mol.all_neighbors(i);

    if (total_degree <= 1) {
      data.set_hybridization(static_cast<constants::Hybridization>(total_degree));
      continue;
    }

    const int valence = mol.sum_bond_order(i, true);

    int nbe;
    if (data.element().is_dummy()) {
      nbe = nonnegative(8 - valence);
    } else if (data.element().main_group()) {
      nbe = data.element().valence_electrons() - valence - data.formal_charge();
      if (nbe < 0) {
        ABSL_LOG(WARNING) << "Valence electrons exceeded for atom " << i << " ("
                          << data.element().symbol() << "): total valence "
                          << valence << ", formal charge "
                          << data.formal_charge();
        return false;
      }
    } else {
      // Assume non-main-group atoms do not have lone pairs
      nbe = 0;
    }

    constants::Hybridization hyb = from_steric_number(total_degree, nbe);

    // Lone pair conjugated with a neighboring pi system (amides, anilines,
    // pyrrole-type nitrogens) is delocalized.
    if (hyb == constants::kSP3 && nbe > 0 && total_degree <= 3
        && (has_pi_bond(mol, i)
            || absl::c_any_of(mol.neighbors(i), [&](Neighbor nei) {
                 return has_pi_bond(mol, nei.dst);
               }))) {
      hyb = constants::kSP2;
    }

    data.set_hybridization(hyb);
  }

  return true;
}
double ideal_bond_length(const Element &src, const Element &dst,
                         constants::BondOrder order) {
  double len = src.covalent_radius() + dst.covalent_radius();

  switch (order) {
  case constants::kOtherBond:
  case constants::kSingleBond:
    break;
  case constants::kDoubleBond:
    len *= 0.87;
    break;
  case constants::kTripleBond:
    len *= 0.78;
    break;
  case constants::kQuadrupleBond:
    len *= 0.7;
    break;
  case constants::kAromaticBond:
    len *= 0.9;
    break;
  }

  return len;
}
}  // namespace vibra
