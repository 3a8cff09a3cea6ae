//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef VIBRA_FMT_REPORT_H_
#define VIBRA_FMT_REPORT_H_

//! @cond
#include <string>
//! @endcond

#include "vibra/vib/result.h"

namespace vibra {
struct ReportOptions {
  // Include the displacement XYZ block of each mode
  bool displacements = true;
  // Include the folded spectrum; every n-th grid point is written
  bool spectrum = true;
  int spectrum_stride = 10;
};

/**
 * @brief Append a human-readable report of a spectrum result.
 *
 * The report has a summary section, a mode table (optionally followed by the
 * displacement block of each mode), the most relevant modes of each atom and
 * bond, and the folded spectrum as whitespace-separated columns.
 *
 * @param out The output string. The report is appended to it.
 * @param result The result to write.
 * @param options What to include.
 */
extern void write_spectrum_report(std::string &out,
                                  const SpectrumResult &result,
                                  const ReportOptions &options = {});
}  // namespace vibra

#endif /* VIBRA_FMT_REPORT_H_ */
