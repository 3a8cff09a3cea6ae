//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include <absl/flags/flag.h>
#include <absl/flags/parse.h>
#include <absl/flags/usage.h>
#include <absl/log/absl_log.h>
#include <absl/log/initialize.h>
#include <absl/status/statusor.h>
#include <absl/time/time.h>

#include "vibra/engine/method.h"
#include "vibra/fmt/report.h"
#include "vibra/service/ir_service.h"
#include "vibra/service/settings.h"
#include "vibra/vib/spectrum.h"

ABSL_FLAG(std::string, smiles, "", "Input SMILES string");
ABSL_FLAG(std::string, molfile, "", "Input V2000 molfile path");
ABSL_FLAG(std::string, method, "GFN2xTB",
          "Method: GFNFF, GFN2xTB, or GFN1xTB");
ABSL_FLAG(int, max_atoms_ff, -1, "Atom limit of GFNFF (-1: default)");
ABSL_FLAG(int, max_atoms_xtb, -1, "Atom limit of the xTB methods (-1: default)");
ABSL_FLAG(double, imaginary_freq_threshold, -1,
          "Large imaginary frequency threshold in cm^-1 (-1: default)");
ABSL_FLAG(double, timeout, -1, "Timeout in seconds (-1: default)");
ABSL_FLAG(std::string, scratch_dir, "", "Scratch root directory");
ABSL_FLAG(double, start, 0, "Spectrum start, cm^-1");
ABSL_FLAG(double, end, 4000, "Spectrum end, cm^-1");
ABSL_FLAG(double, width, 4, "Peak full width at half maximum, cm^-1");
ABSL_FLAG(std::string, kernel, "Gaussian", "Gaussian or Lorentzian");
ABSL_FLAG(bool, displacements, false, "Write the displacement of each mode");
ABSL_FLAG(int, stride, 10, "Write every n-th point of the spectrum");

namespace vibra {
namespace {
  bool read_file(const std::string &path, std::string &content) {
    std::ifstream ifs(path);
    if (!ifs)
      return false;

    std::ostringstream oss;
    oss << ifs.rdbuf();
    content = oss.str();
    return true;
  }

  bool apply_flags(Settings &settings) {
    if (int n = absl::GetFlag(FLAGS_max_atoms_ff); n > 0)
      settings.max_atoms_ff = n;
    if (int n = absl::GetFlag(FLAGS_max_atoms_xtb); n > 0)
      settings.max_atoms_xtb = n;
    if (double t = absl::GetFlag(FLAGS_imaginary_freq_threshold); t >= 0)
      settings.imaginary_freq_threshold = t;
    if (double t = absl::GetFlag(FLAGS_timeout); t >= 0)
      settings.timeout = absl::Seconds(t);
    if (std::string dir = absl::GetFlag(FLAGS_scratch_dir); !dir.empty())
      settings.scratch_root = dir;

    settings.spectrum.start = absl::GetFlag(FLAGS_start);
    settings.spectrum.end = absl::GetFlag(FLAGS_end);
    settings.spectrum.width = absl::GetFlag(FLAGS_width);
    if (settings.spectrum.end <= settings.spectrum.start
        || settings.spectrum.width <= 0) {
      ABSL_LOG(ERROR) << "Invalid spectrum window";
      return false;
    }

    if (!parse_kernel(absl::GetFlag(FLAGS_kernel), settings.spectrum.kernel)) {
      ABSL_LOG(ERROR) << "Unknown kernel: " << absl::GetFlag(FLAGS_kernel);
      return false;
    }

    return true;
  }

  int run() {
    const std::string smiles = absl::GetFlag(FLAGS_smiles),
                      molfile_path = absl::GetFlag(FLAGS_molfile);
    if (smiles.empty() == molfile_path.empty()) {
      ABSL_LOG(ERROR) << "Exactly one of --smiles and --molfile is required";
      return 2;
    }

    Settings settings = Settings::from_env();
    if (!apply_flags(settings))
      return 2;

    IrService service(settings);

    absl::StatusOr<std::shared_ptr<const SpectrumResult>> result;
    if (!smiles.empty()) {
      result = service.ir_from_smiles(smiles, absl::GetFlag(FLAGS_method));
    } else {
      std::string molfile;
      if (!read_file(molfile_path, molfile)) {
        ABSL_LOG(ERROR) << "Cannot read " << molfile_path;
        return 2;
      }
      result = service.ir_from_molfile(molfile, absl::GetFlag(FLAGS_method));
    }

    if (!result.ok()) {
      ABSL_LOG(ERROR) << "Calculation failed: " << result.status();
      return 1;
    }

    ReportOptions options;
    options.displacements = absl::GetFlag(FLAGS_displacements);
    options.spectrum_stride = absl::GetFlag(FLAGS_stride);

    std::string report;
    write_spectrum_report(report, **result, options);
    std::cout << report;
    return 0;
  }
}  // namespace
}  // namespace vibra

int main(int argc, char *argv[]) {
  absl::SetProgramUsageMessage(
      "Compute IR and Raman spectra of a molecule.\n"
      "Usage: vibrakit (--smiles=SMILES | --molfile=FILE) [--method=NAME]");
  absl::ParseCommandLine(argc, argv);
  absl::InitializeLog();

  return vibra::run();
}
