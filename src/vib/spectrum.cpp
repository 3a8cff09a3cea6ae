//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "vibra/vib/spectrum.h"

#include <cmath>
#include <string_view>

#include <absl/log/absl_check.h>
#include <absl/log/absl_log.h>
#include <Eigen/Dense>

#include "vibra/eigen_config.h"
#include "vibra/core/geometry.h"

namespace vibra {
bool parse_kernel(std::string_view name, BroadeningKernel &kernel) {
  if (name == "Gaussian" || name == "gaussian") {
    kernel = BroadeningKernel::kGaussian;
    return true;
  }
  if (name == "Lorentzian" || name == "lorentzian") {
    kernel = BroadeningKernel::kLorentzian;
    return true;
  }
  return false;
}

FoldedSpectrum fold(const ArrayXd &frequencies, const ArrayXd &intensities,
                    const FoldOptions &options) {
  ABSL_DCHECK(frequencies.size() == intensities.size());

  int npts = options.npts;
  if (npts <= 0) {
    npts = static_cast<int>((options.end - options.start) / options.width * 10
                            + 1);
  }

  FoldedSpectrum spectrum {
    ArrayXd::LinSpaced(npts, options.start, options.end),
    ArrayXd::Zero(npts),
  };

  double prefactor = 1;
  if (options.kernel == BroadeningKernel::kLorentzian) {
    const double hw = 0.5 * options.width;
    // Unit height at the peak unless normalized
    ArrayXd heights = intensities * hw * hw;
    if (options.normalize)
      heights = intensities * hw / constants::kPi;

    for (int i = 0; i < npts; ++i) {
      spectrum.intensities[i] =
          (heights
           / ((frequencies - spectrum.energies[i]).square() + hw * hw))
              .sum();
    }
  } else {
    const double sigma = options.width / 2 / std::sqrt(2 * std::log(2.0));
    if (options.normalize)
      prefactor = 1 / (sigma * std::sqrt(2 * constants::kPi));

    const double inv_2s2 = 1 / (2 * sigma * sigma);
    for (int i = 0; i < npts; ++i) {
      spectrum.intensities[i] =
          (intensities
           * (-(frequencies - spectrum.energies[i]).square() * inv_2s2).exp())
              .sum();
    }
  }

  spectrum.intensities *= prefactor;

  ABSL_DVLOG(2) << "folded " << frequencies.size() << " lines onto " << npts
                << " points";
  return spectrum;
}
}  // namespace vibra
