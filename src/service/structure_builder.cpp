//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "vibra/service/structure_builder.h"

#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <absl/log/absl_log.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

#include "vibra/eigen_config.h"
#include "vibra/status.h"
#include "vibra/algo/crdgen.h"
#include "vibra/core/molecule.h"
#include "vibra/core/structure.h"
#include "vibra/fmt/molfile.h"
#include "vibra/fmt/smiles.h"
#include "vibra/service/hash.h"

namespace vibra {
namespace {
  absl::Status check_max_atoms(int natoms, int max_atoms) {
    if (natoms > max_atoms) {
      return too_large_error(absl::StrCat("Molecule can have maximal ",
                                          max_atoms, " atoms, got ", natoms));
    }
    return absl::OkStatus();
  }
}  // namespace

template <class Reader>
absl::StatusOr<std::shared_ptr<const BuiltStructure>>
StructureBuilder::build(std::string_view input, int max_atoms, Reader reader,
                        bool add_hs) {
  const std::string key = content_hash(input);

  // Concurrent requests for the same input (e.g. with different methods)
  // embed only once.
  KeyedMutex::Lock lock(locks_, key);

  if (std::shared_ptr<const BuiltStructure> cached = cache_->get(key)) {
    ABSL_LOG(INFO) << "structure cache hit for " << key;
    if (absl::Status status = check_max_atoms(cached->input_atoms, max_atoms);
        !status.ok())
      return status;
    return cached;
  }

  absl::StatusOr<Molecule> mol = reader(input);
  if (!mol.ok())
    return mol.status();

  const int input_atoms = mol->num_atoms();
  if (absl::Status status = check_max_atoms(input_atoms, max_atoms);
      !status.ok())
    return status;

  if (add_hs) {
    const int nh = add_hydrogens(*mol);
    ABSL_DVLOG(1) << "added " << nh << " hydrogens";
  }

  absl::StatusOr<BuiltStructure> built = embed(*mol);
  if (!built.ok())
    return built.status();
  built->input_atoms = input_atoms;

  auto result = std::make_shared<const BuiltStructure>(*std::move(built));
  cache_->set(key, result);
  return result;
}

absl::StatusOr<BuiltStructure> StructureBuilder::embed(Molecule &mol) {
  if (!assign_hybridization(mol))
    return invalid_input_error("invalid valence in molecule");

  ++embeddings_;
  Matrix3Xd conf;
  if (!generate_coords(mol, conf, 10, seed_))
    return engine_failure("conformer embedding failed");

  mol.confs().clear();
  mol.confs().push_back(std::move(conf));

  auto [structure, bonds] = to_structure(mol, 0);
  return BuiltStructure { std::move(structure), std::move(bonds),
                         mol.num_atoms() };
}

absl::StatusOr<std::shared_ptr<const BuiltStructure>>
StructureBuilder::from_smiles(std::string_view smiles, int max_atoms) {
  return build(
      smiles, max_atoms,
      [](std::string_view input) -> absl::StatusOr<Molecule> {
        Molecule mol = read_smiles(input);
        if (mol.empty())
          return invalid_input_error(absl::StrCat("invalid SMILES: ", input));
        return mol;
      },
      true);
}

absl::StatusOr<std::shared_ptr<const BuiltStructure>>
StructureBuilder::from_molfile(std::string_view molfile, int max_atoms) {
  return build(
      molfile, max_atoms,
      [](std::string_view input) -> absl::StatusOr<Molecule> {
        Molecule mol = read_molfile(input);
        if (mol.empty())
          return invalid_input_error("invalid molfile");
        return mol;
      },
      false);
}
}  // namespace vibra
