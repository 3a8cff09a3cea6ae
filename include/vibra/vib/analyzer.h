//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef VIBRA_VIB_ANALYZER_H_
#define VIBRA_VIB_ANALYZER_H_

//! @cond
#include <filesystem>
#include <string_view>
#include <utility>

#include <absl/status/statusor.h>
#include <absl/time/time.h>
//! @endcond

#include "vibra/core/structure.h"
#include "vibra/engine/engine.h"
#include "vibra/vib/result.h"
#include "vibra/vib/spectrum.h"

namespace vibra {
struct AnalyzerOptions {
  // Parent of the per-computation scratch directories. Empty means the
  // system temporary directory.
  std::filesystem::path scratch_root;
  // Finite-difference step, in angstroms
  double delta = 0.01;
  // Imaginary wavenumbers above this (cm^-1) are flagged as large
  double imaginary_freq_threshold = 20;
  FoldOptions fold;
  bool raman = true;
};

/**
 * @brief Harmonic vibrational analysis on top of a force engine.
 *
 * For each call, a scratch directory named after the computation is created
 * under the scratch root and removed before the call returns, whatever the
 * outcome. The Raman part is computed first; if it fails for any reason other
 * than the deadline, the scratch directory is emptied and the result carries
 * no Raman data. Failures of the IR part fail the whole analysis.
 */
class VibrationalAnalyzer {
public:
  explicit VibrationalAnalyzer(AnalyzerOptions options = {})
      : options_(std::move(options)) { }

  /**
   * @brief Analyze a (relaxed) structure.
   *
   * @param engine Engine built for @p structure.
   * @param structure The structure.
   * @param bonds Bonds used for bond attribution.
   * @param name Name of the scratch directory, usually a content hash.
   * @param deadline Fails with DeadlineExceeded once passed.
   */
  absl::StatusOr<SpectrumResult>
  analyze(ForceEngine &engine, const MolecularStructure &structure,
          const BondedGraph &bonds, std::string_view name,
          absl::Time deadline = absl::InfiniteFuture()) const;

  const AnalyzerOptions &options() const { return options_; }

private:
  AnalyzerOptions options_;
};
}  // namespace vibra

#endif /* VIBRA_VIB_ANALYZER_H_ */
