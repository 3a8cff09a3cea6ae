//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef VIBRA_VIB_DISPLACEMENT_H_
#define VIBRA_VIB_DISPLACEMENT_H_

//! @cond
#include <filesystem>
#include <optional>
#include <utility>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/time/time.h>
//! @endcond

#include "vibra/eigen_config.h"
#include "vibra/engine/engine.h"

namespace vibra {
/**
 * @brief Engine output at one displaced geometry, as stored in the scratch
 *        directory.
 */
struct DisplacementRecord {
  double energy;
  Matrix3Xd gradient;
  Vector3d dipole;
  std::optional<Matrix3d> polarizability;
};

/**
 * @brief Write a record as text.
 */
extern absl::Status write_record(const std::filesystem::path &file,
                                 const DisplacementRecord &record);

/**
 * @brief Read a record written by write_record().
 *
 * @param file The record file.
 * @param record Output record.
 * @param natoms Expected number of atoms.
 * @return Whether the file exists and holds a complete record for @p natoms
 *         atoms.
 */
extern bool read_record(const std::filesystem::path &file,
                        DisplacementRecord &record, int natoms);

/**
 * @brief Central finite-difference derivatives at a reference geometry.
 *
 * Units: hessian in eV/A^2 (3N x 3N, symmetrized), dipole derivatives in e
 * (3N x 3, one row per Cartesian coordinate), polarizability derivatives in
 * A^2 (one tensor per Cartesian coordinate).
 */
struct FiniteDifferenceData {
  MatrixXd hessian;
  MatrixX3d dipole_derivatives;
  std::optional<std::vector<Matrix3d>> polarizability_derivatives;
};

/**
 * @brief Drives the engine over the +/- displacements of every Cartesian
 *        coordinate, caching each evaluation in a scratch directory.
 *
 * A displacement whose record already exists in the directory is read back
 * instead of being recomputed, so a second pass over the same geometry (or a
 * restarted computation) does not call the engine again.
 */
class DisplacementRunner {
public:
  DisplacementRunner(ForceEngine &engine, std::filesystem::path dir,
                     double delta = 0.01)
      : engine_(&engine), dir_(std::move(dir)), delta_(delta) { }

  /**
   * @brief Compute the finite-difference derivatives.
   *
   * @param pos Reference positions.
   * @param polarizability Whether to also compute polarizability derivatives.
   *        Records without a polarizability are recomputed in that case.
   * @param deadline Checked before each engine call.
   */
  absl::StatusOr<FiniteDifferenceData>
  run(const Matrix3Xd &pos, bool polarizability,
      absl::Time deadline = absl::InfiniteFuture());

  int engine_calls() const { return engine_calls_; }

  int reused_records() const { return reused_; }

  double delta() const { return delta_; }

private:
  absl::StatusOr<DisplacementRecord> displaced(const Matrix3Xd &pos, int atom,
                                               int axis, int sign,
                                               bool polarizability,
                                               absl::Time deadline);

  std::filesystem::path record_path(int atom, int axis, int sign) const;

  ForceEngine *engine_;
  std::filesystem::path dir_;
  double delta_;
  int engine_calls_ = 0;
  int reused_ = 0;
};
}  // namespace vibra

#endif /* VIBRA_VIB_DISPLACEMENT_H_ */
