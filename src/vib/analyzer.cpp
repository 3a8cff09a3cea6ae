//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "vibra/vib/analyzer.h"

#include <filesystem>
#include <optional>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <absl/log/absl_log.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>
#include <absl/time/time.h>
#include <Eigen/Dense>

#include "vibra/eigen_config.h"
#include "vibra/status.h"
#include "vibra/core/geometry.h"
#include "vibra/core/structure.h"
#include "vibra/engine/engine.h"
#include "vibra/vib/displacement.h"
#include "vibra/vib/modes.h"
#include "vibra/vib/normal_modes.h"
#include "vibra/vib/result.h"
#include "vibra/vib/scratch.h"
#include "vibra/vib/spectrum.h"

namespace vibra {
namespace fs = std::filesystem;

namespace {
  absl::StatusOr<fs::path> resolve_scratch_root(const fs::path &root) {
    if (!root.empty())
      return root;

    std::error_code ec;
    fs::path tmp = fs::temp_directory_path(ec);
    if (ec) {
      return engine_failure(absl::StrCat(
          "cannot determine temporary directory: ", ec.message()));
    }
    return tmp;
  }

  SpectrumResult assemble_result(const MolecularStructure &structure,
                                 const BondedGraph &bonds,
                                 const NormalModes &modes, const ArrayXd &ir,
                                 const std::optional<ArrayXd> &raman,
                                 const bool linear, const Array3d &moments,
                                 const AnalyzerOptions &options) {
    const int nmodes = modes.size(), natoms = structure.size();
    const Matrix3Xd &pos = structure.positions();
    const ArrayXd masses = structure.masses();
    const ArrayXcd freqs = modes.frequencies();

    std::vector<Matrix3Xd> disps;
    disps.reserve(nmodes);
    ArrayXd alignments(nmodes);
    ArrayXXd atom_norms(nmodes, natoms);
    ArrayXXd bond_disps(nmodes, bonds.size());
    for (int n = 0; n < nmodes; ++n) {
      const Matrix3Xd &mode = disps.emplace_back(modes.mode(n));
      alignments[n] = displacement_alignment(mode);
      atom_norms.row(n) = mode.colwise().norm().array();
      bond_disps.row(n) = bond_displacements(pos, mode, bonds).transpose();
    }

    ABSL_DVLOG(1) << "alignments: " << alignments.transpose();

    const std::vector<int> order = frequency_order(freqs);
    const std::vector<ModeType> types =
        classify_modes(order, alignments, linear);

    SpectrumResult result;
    result.is_linear = linear;
    result.moments_of_inertia = moments;
    result.zero_point_energy = modes.zero_point_energy();
    result.has_imaginary_frequency = false;
    result.has_large_imaginary_frequency = false;

    FoldedSpectrum ir_spectrum = fold(freqs.real(), ir, options.fold);
    result.wavenumbers = std::move(ir_spectrum.energies);
    result.intensities = std::move(ir_spectrum.intensities);
    if (raman)
      result.raman_intensities =
          fold(freqs.real(), *raman, options.fold).intensities;

    result.modes.reserve(nmodes);
    for (const int n: order) {
      const Matrix3Xd &mode = disps[n];
      const bool imaginary = freqs[n].imag() != 0;
      const double wavenumber = imaginary ? freqs[n].imag() : freqs[n].real();

      if (imaginary) {
        result.has_imaginary_frequency = true;
        if (wavenumber > options.imaginary_freq_threshold)
          result.has_large_imaginary_frequency = true;
      }

      const ArrayXd bond_disp = bond_disps.row(n).transpose();
      std::vector<BondPair> contributing;
      for (const int b: select_most_contributing_bonds(bond_disp))
        contributing.push_back(bonds[b]);

      result.modes.push_back({
          n,
          displacement_xyz(structure, mode, n, freqs[n], ir[n]),
          ir[n],
          raman ? std::make_optional((*raman)[n]) : std::nullopt,
          wavenumber,
          imaginary,
          most_displaced_atoms(mode),
          select_most_contributing_atoms(mode),
          std::move(contributing),
          types[n],
          mode.rowwise().sum().norm(),
          moment_of_inertia_change(pos, mode, masses),
          alignments[n],
      });
    }

    result.most_relevant_modes_of_atoms =
        most_relevant_modes_of_atoms(atom_norms, linear);
    result.most_relevant_modes_of_bonds =
        most_relevant_modes_of_bonds(bond_disps, bonds, natoms, linear);

    return result;
  }
}  // namespace

absl::StatusOr<SpectrumResult>
VibrationalAnalyzer::analyze(ForceEngine &engine,
                             const MolecularStructure &structure,
                             const BondedGraph &bonds, std::string_view name,
                             absl::Time deadline) const {
  if (structure.empty())
    return invalid_input_error("empty structure");

  if (engine.size() != structure.size()) {
    return engine_failure(absl::StrCat("engine built for ", engine.size(),
                                       " atoms, structure has ",
                                       structure.size()));
  }

  ABSL_LOG(INFO) << "running vibrational analysis " << name << " ("
                 << structure.size() << " atoms)";

  const Matrix3Xd &pos = structure.positions();
  const ArrayXd masses = structure.masses();
  const Array3d moments = principal_moments(pos, masses);
  const bool linear = is_linear(moments);

  absl::StatusOr<fs::path> root = resolve_scratch_root(options_.scratch_root);
  if (!root.ok())
    return root.status();

  absl::StatusOr<ScratchDirectory> scratch =
      ScratchDirectory::create(*root, name);
  if (!scratch.ok())
    return scratch.status();

  DisplacementRunner runner(engine, scratch->path(), options_.delta);

  std::optional<std::vector<Matrix3d>> dadx;
  if (options_.raman) {
    absl::StatusOr<FiniteDifferenceData> raman_data =
        runner.run(pos, true, deadline);
    if (raman_data.ok()) {
      dadx = std::move(raman_data->polarizability_derivatives);
    } else if (is_timeout(raman_data.status())) {
      return raman_data.status();
    } else {
      ABSL_LOG(WARNING) << "Raman calculation failed, continuing without: "
                        << raman_data.status();
      if (absl::Status status = scratch->clear(); !status.ok())
        return status;
    }
  }

  absl::StatusOr<FiniteDifferenceData> data = runner.run(pos, false, deadline);
  if (!data.ok())
    return data.status();

  absl::StatusOr<NormalModes> modes =
      NormalModes::from_hessian(data->hessian, masses);
  if (!modes.ok())
    return modes.status();

  const ArrayXd ir = modes->ir_intensities(data->dipole_derivatives);

  std::optional<ArrayXd> raman;
  if (dadx) {
    raman = modes->raman_activities(*dadx);
    if (!raman->isFinite().all()) {
      ABSL_LOG(WARNING) << "non-finite Raman activities, discarding";
      raman.reset();
    }
  }

  ABSL_LOG(INFO) << "vibrational analysis " << name << " done: "
                 << runner.engine_calls() << " engine calls, "
                 << runner.reused_records() << " reused records";

  return assemble_result(structure, bonds, *modes, ir, raman, linear, moments,
                         options_);
}
}  // namespace vibra
