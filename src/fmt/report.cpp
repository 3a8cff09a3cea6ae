//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "vibra/fmt/report.h"

#include <algorithm>
#include <string>
#include <vector>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>
#include <absl/strings/str_join.h>

#include "vibra/vib/modes.h"
#include "vibra/vib/result.h"

namespace vibra {
namespace {
  void write_summary(std::string &out, const SpectrumResult &result) {
    absl::StrAppendFormat(&out, "Zero-point energy: %.6f eV\n",
                          result.zero_point_energy);
    absl::StrAppendFormat(&out, "Linear: %s\n",
                          result.is_linear ? "yes" : "no");
    absl::StrAppendFormat(&out, "Moments of inertia: %.5f %.5f %.5f\n",
                          result.moments_of_inertia[0],
                          result.moments_of_inertia[1],
                          result.moments_of_inertia[2]);
    absl::StrAppendFormat(&out, "Imaginary frequencies: %s%s\n",
                          result.has_imaginary_frequency ? "yes" : "no",
                          result.has_large_imaginary_frequency ? " (large)"
                                                               : "");
    absl::StrAppendFormat(&out, "Raman: %s\n",
                          result.raman_intensities ? "available"
                                                   : "unavailable");
  }

  void write_bonds(std::string &out, const std::vector<BondPair> &bonds) {
    absl::StrAppend(
        &out, absl::StrJoin(bonds, ",", [](std::string *s, const BondPair &b) {
          absl::StrAppend(s, b.src, "-", b.dst);
        }));
  }

  void write_modes(std::string &out, const SpectrumResult &result,
                   const ReportOptions &options) {
    absl::StrAppend(&out, "\nModes\n");
    absl::StrAppendFormat(&out, "%5s %12s %-11s %12s %12s %8s %8s  %s\n",
                          "#", "cm^-1", "type", "IR", "Raman", "align",
                          "dCOM", "atoms / bonds");

    for (const ModeRecord &mode: result.modes) {
      std::string freq =
          absl::StrFormat("%.2f%s", mode.wavenumber, mode.imaginary ? "i" : "");
      std::string raman = mode.raman_intensity
                              ? absl::StrFormat("%.4f", *mode.raman_intensity)
                              : "-";

      absl::StrAppendFormat(&out, "%5d %12s %-11s %12.4f %12s %8.4f %8.4f  ",
                            mode.number, freq, mode_type_name(mode.mode_type),
                            mode.intensity, raman, mode.displacement_alignment,
                            mode.center_of_mass_displacement);
      absl::StrAppend(&out, absl::StrJoin(mode.most_contributing_atoms, ","),
                      " / ");
      write_bonds(out, mode.most_contributing_bonds);
      out.push_back('\n');
    }

    if (!options.displacements)
      return;

    for (const ModeRecord &mode: result.modes) {
      absl::StrAppend(&out, "\n", mode.displacements);
      if (!mode.displacements.empty() && mode.displacements.back() != '\n')
        out.push_back('\n');
    }
  }

  void write_relevance(std::string &out, const SpectrumResult &result) {
    absl::StrAppend(&out, "\nMost relevant modes of atoms\n");
    const int natoms =
        static_cast<int>(result.most_relevant_modes_of_atoms.size());
    for (int i = 0; i < natoms; ++i) {
      const std::vector<int> &ranked = result.most_relevant_modes_of_atoms[i];
      const int n = std::min(static_cast<int>(ranked.size()), 5);
      absl::StrAppendFormat(
          &out, "%5d  %s\n", i,
          absl::StrJoin(ranked.begin(), ranked.begin() + n, " "));
    }

    absl::StrAppend(&out, "\nMost relevant modes of bonds\n");
    for (const BondModeRecord &rec: result.most_relevant_modes_of_bonds) {
      absl::StrAppendFormat(&out, "%5d %5d  %5d %12.6f\n", rec.start_atom,
                            rec.end_atom, rec.mode, rec.displacement);
    }
  }

  void write_spectrum(std::string &out, const SpectrumResult &result,
                      const ReportOptions &options) {
    absl::StrAppend(&out, "\nSpectrum\n");
    const int stride = std::max(options.spectrum_stride, 1);
    for (int i = 0; i < result.wavenumbers.size(); i += stride) {
      absl::StrAppendFormat(&out, "%10.2f %14.6e", result.wavenumbers[i],
                            result.intensities[i]);
      if (result.raman_intensities)
        absl::StrAppendFormat(&out, " %14.6e", (*result.raman_intensities)[i]);
      out.push_back('\n');
    }
  }
}  // namespace

void write_spectrum_report(std::string &out, const SpectrumResult &result,
                           const ReportOptions &options) {
  write_summary(out, result);
  write_modes(out, result, options);
  write_relevance(out, result);
  if (options.spectrum)
    write_spectrum(out, result, options);
}
}  // namespace vibra
