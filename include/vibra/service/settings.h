//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef VIBRA_SERVICE_SETTINGS_H_
#define VIBRA_SERVICE_SETTINGS_H_

//! @cond
#include <filesystem>

#include <absl/time/time.h>
//! @endcond

#include "vibra/engine/method.h"
#include "vibra/vib/analyzer.h"
#include "vibra/vib/spectrum.h"

namespace vibra {
struct Settings {
  // Atom count limit of the force field method
  int max_atoms_ff = 60;
  // Atom count limit of the tight binding methods
  int max_atoms_xtb = 100;
  // cm^-1
  double imaginary_freq_threshold = 20;
  absl::Duration timeout = absl::Seconds(100);
  // Empty means the system temporary directory
  std::filesystem::path scratch_root;
  // Finite-difference step, in angstroms
  double displacement_step = 0.01;
  FoldOptions spectrum;

  /**
   * @brief Default settings, overridden by the environment.
   *
   * Reads `VIBRA_MAX_ATOMS_FF`, `VIBRA_MAX_ATOMS_XTB`,
   * `VIBRA_IMAGINARY_FREQ_THRESHOLD`, `VIBRA_TIMEOUT` (seconds, or an
   * absl::Duration string such as "90s"), and `VIBRA_SCRATCH_DIR`. Values that
   * fail to parse are logged and ignored.
   */
  static Settings from_env();
};

extern int max_atoms(Method method, const Settings &settings);

extern AnalyzerOptions analyzer_options(const Settings &settings);
}  // namespace vibra

#endif /* VIBRA_SERVICE_SETTINGS_H_ */
