//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef VIBRA_VIB_RESULT_H_
#define VIBRA_VIB_RESULT_H_

//! @cond
#include <optional>
#include <string>
#include <vector>
//! @endcond

#include "vibra/eigen_config.h"
#include "vibra/core/structure.h"
#include "vibra/vib/modes.h"

namespace vibra {
/**
 * @brief Per-mode annotations.
 *
 * Wavenumbers are in cm^-1. For imaginary modes, @p wavenumber holds the
 * magnitude of the imaginary part and @p imaginary is set.
 */
struct ModeRecord {
  int number;
  std::string displacements;
  double intensity;
  std::optional<double> raman_intensity;
  double wavenumber;
  bool imaginary;
  std::vector<int> most_displaced_atoms;
  std::vector<int> most_contributing_atoms;
  std::vector<BondPair> most_contributing_bonds;
  ModeType mode_type;
  double center_of_mass_displacement;
  double total_change_of_moment_of_inertia;
  double displacement_alignment;
};

/**
 * @brief Result of a vibrational analysis.
 *
 * @p wavenumbers and @p intensities are the folded IR spectrum;
 * @p raman_intensities is the folded Raman spectrum on the same grid, absent
 * if the Raman calculation failed. Modes are listed in ascending frequency
 * order.
 */
struct SpectrumResult {
  ArrayXd wavenumbers;
  ArrayXd intensities;
  std::optional<ArrayXd> raman_intensities;
  double zero_point_energy;
  std::vector<ModeRecord> modes;
  bool has_imaginary_frequency;
  bool has_large_imaginary_frequency;
  std::vector<std::vector<int>> most_relevant_modes_of_atoms;
  std::vector<BondModeRecord> most_relevant_modes_of_bonds;
  bool is_linear;
  Array3d moments_of_inertia;
};
}  // namespace vibra

#endif /* VIBRA_VIB_RESULT_H_ */
