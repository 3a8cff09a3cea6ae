//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef VIBRA_VIB_SPECTRUM_H_
#define VIBRA_VIB_SPECTRUM_H_

//! @cond
#include <cstdint>
#include <string_view>
//! @endcond

#include "vibra/eigen_config.h"

namespace vibra {
enum class BroadeningKernel : std::uint8_t {
  kGaussian,
  kLorentzian,
};

extern bool parse_kernel(std::string_view name, BroadeningKernel &kernel);

struct FoldOptions {
  double start = 0;
  double end = 4000;
  // Full width at half maximum
  double width = 4;
  // Number of grid points; non-positive means (end - start) / width * 10 + 1
  int npts = 0;
  BroadeningKernel kernel = BroadeningKernel::kGaussian;
  // Scale each peak to unit area instead of unit height
  bool normalize = false;
};

struct FoldedSpectrum {
  ArrayXd energies;
  ArrayXd intensities;
};

/**
 * @brief Broaden a line spectrum onto an evenly spaced grid.
 *
 * @param frequencies Line positions.
 * @param intensities Line intensities; same size as @p frequencies.
 * @param options Grid and kernel settings.
 * @return The grid and the summed broadened intensities on the grid.
 */
extern FoldedSpectrum fold(const ArrayXd &frequencies,
                           const ArrayXd &intensities,
                           const FoldOptions &options = {});
}  // namespace vibra

#endif /* VIBRA_VIB_SPECTRUM_H_ */
