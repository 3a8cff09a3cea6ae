//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef VIBRA_SERVICE_STRUCTURE_BUILDER_H_
#define VIBRA_SERVICE_STRUCTURE_BUILDER_H_

//! @cond
#include <atomic>
#include <memory>
#include <string_view>
#include <utility>

#include <absl/status/statusor.h>
//! @endcond

#include "vibra/core/molecule.h"
#include "vibra/core/structure.h"
#include "vibra/service/cache.h"

namespace vibra {
struct BuiltStructure {
  MolecularStructure structure;
  BondedGraph bonds;
  // Atoms of the parsed input graph, before hydrogens were added
  int input_atoms;
};

/**
 * @brief Builds 3D structures from SMILES or molfile text, with a cache keyed
 *        by the content hash of the raw input.
 *
 * Chemically identical inputs that differ as text are cached separately.
 */
class StructureBuilder {
public:
  explicit StructureBuilder(
      std::shared_ptr<KeyValueStore<BuiltStructure>> cache, int seed = 42)
      : cache_(std::move(cache)), seed_(seed) { }

  /**
   * @brief Build a structure from a SMILES string.
   *
   * The atom limit applies to the parsed graph, before implicit hydrogens
   * are made explicit.
   *
   * @return The structure, or an InvalidArgument error for unparsable input,
   *         or a ResourceExhausted error when the parsed molecule has more
   *         than @p max_atoms atoms. The size check is done before adding
   *         hydrogens and embedding, and also on cache hits.
   */
  absl::StatusOr<std::shared_ptr<const BuiltStructure>>
  from_smiles(std::string_view smiles, int max_atoms);

  /**
   * @brief Build a structure from a V2000 molfile.
   *
   * The molfile is expected to list all hydrogens explicitly. Errors are
   * reported as for from_smiles().
   */
  absl::StatusOr<std::shared_ptr<const BuiltStructure>>
  from_molfile(std::string_view molfile, int max_atoms);

  /**
   * @brief Number of conformer embeddings run so far.
   */
  int embeddings() const { return embeddings_.load(); }

  const std::shared_ptr<KeyValueStore<BuiltStructure>> &cache() const {
    return cache_;
  }

private:
  template <class Reader>
  absl::StatusOr<std::shared_ptr<const BuiltStructure>>
  build(std::string_view input, int max_atoms, Reader reader,
        bool add_hs);

  absl::StatusOr<BuiltStructure> embed(Molecule &mol);

  std::shared_ptr<KeyValueStore<BuiltStructure>> cache_;
  KeyedMutex locks_;
  int seed_;
  std::atomic<int> embeddings_ = 0;
};
}  // namespace vibra

#endif /* VIBRA_SERVICE_STRUCTURE_BUILDER_H_ */
