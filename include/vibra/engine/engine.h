//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef VIBRA_ENGINE_ENGINE_H_
#define VIBRA_ENGINE_ENGINE_H_

//! @cond
#include <functional>
#include <memory>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
//! @endcond

#include "vibra/eigen_config.h"
#include "vibra/core/structure.h"
#include "vibra/engine/method.h"

namespace vibra {
/**
 * @brief Energy and first-order properties at a single geometry.
 *
 * Units: energy in eV, gradient in eV/angstrom (one atom per column), dipole
 * in e*angstrom.
 */
struct EngineResult {
  double energy;
  Matrix3Xd gradient;
  Vector3d dipole;
};

/**
 * @brief A potential energy surface for one fixed set of atoms.
 *
 * An engine is bound to the atoms (and bonds, if it needs them) of a single
 * structure at construction. All methods take positions in angstroms, one
 * atom per column, in the same atom order.
 */
class ForceEngine {
public:
  virtual ~ForceEngine() = default;

  /**
   * @brief Number of atoms the engine was built for.
   */
  virtual int size() const = 0;

  virtual absl::StatusOr<EngineResult> evaluate(const Matrix3Xd &pos) = 0;

  /**
   * @brief Static polarizability tensor at the given positions, in
   *        angstrom^3.
   *
   * Engines without a polarizability model return an Unimplemented error.
   */
  virtual absl::StatusOr<Matrix3d> polarizability(const Matrix3Xd &pos);

protected:
  ForceEngine() = default;
  ForceEngine(const ForceEngine &) = default;
  ForceEngine &operator=(const ForceEngine &) = default;
  ForceEngine(ForceEngine &&) noexcept = default;
  ForceEngine &operator=(ForceEngine &&) noexcept = default;

  /**
   * @brief Check that the positions are usable for this engine.
   */
  absl::Status check_positions(const Matrix3Xd &pos) const;
};

using EngineFactory =
    std::function<absl::StatusOr<std::unique_ptr<ForceEngine>>(
        const MolecularStructure &, const BondedGraph &, Method)>;

/**
 * @brief The default engine factory, building an XtbEngine for the method.
 *
 * The bonds are only validated; xtb perceives its own topology.
 */
extern absl::StatusOr<std::unique_ptr<ForceEngine>>
default_engine(const MolecularStructure &structure, const BondedGraph &bonds,
               Method method);
}  // namespace vibra

#endif /* VIBRA_ENGINE_ENGINE_H_ */
