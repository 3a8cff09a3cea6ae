//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "vibra/vib/displacement.h"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <absl/log/absl_log.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/ascii.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>
#include <absl/strings/str_split.h>
#include <absl/time/clock.h>
#include <absl/time/time.h>
#include <Eigen/Dense>

#include "vibra/eigen_config.h"
#include "vibra/status.h"
#include "vibra/engine/engine.h"

namespace vibra {
namespace fs = std::filesystem;

namespace {
  template <class MatrixType>
  void append_values(std::string &out, std::string_view key,
                     const MatrixType &values) {
    absl::StrAppend(&out, key);
    for (int i = 0; i < values.size(); ++i)
      absl::StrAppendFormat(&out, " %.17g", values.data()[i]);
    out.push_back('\n');
  }

  // Parse "key v1 v2 ..." into exactly values.size() numbers
  template <class MatrixType>
  bool parse_values(std::string_view line, std::string_view key,
                    MatrixType &values) {
    std::vector<std::string_view> tokens =
        absl::StrSplit(line, ' ', absl::SkipEmpty());
    if (tokens.empty() || tokens[0] != key
        || tokens.size() != static_cast<size_t>(values.size()) + 1)
      return false;

    for (int i = 0; i < values.size(); ++i) {
      if (!absl::SimpleAtod(tokens[i + 1], values.data() + i))
        return false;
    }
    return true;
  }
}  // namespace

absl::Status write_record(const fs::path &file,
                          const DisplacementRecord &record) {
  std::string out = absl::StrFormat("energy %.17g\n", record.energy);
  append_values(out, "dipole", record.dipole);
  if (record.polarizability)
    append_values(out, "polarizability", *record.polarizability);
  append_values(out, "gradient", record.gradient);

  std::ofstream ofs(file, std::ios::out | std::ios::trunc);
  ofs << out;
  ofs.close();
  if (!ofs) {
    return engine_failure(
        absl::StrCat("cannot write scratch record ", file.string()));
  }

  return absl::OkStatus();
}

bool read_record(const fs::path &file, DisplacementRecord &record,
                 const int natoms) {
  std::ifstream ifs(file);
  if (!ifs)
    return false;

  const std::string data((std::istreambuf_iterator<char>(ifs)),
                         std::istreambuf_iterator<char>());
  std::vector<std::string_view> lines =
      absl::StrSplit(data, '\n', absl::SkipWhitespace());

  if (lines.size() != 3 && lines.size() != 4)
    return false;

  std::vector<std::string_view> energy =
      absl::StrSplit(lines[0], ' ', absl::SkipEmpty());
  if (energy.size() != 2 || energy[0] != "energy"
      || !absl::SimpleAtod(energy[1], &record.energy))
    return false;

  if (!parse_values(lines[1], "dipole", record.dipole))
    return false;

  record.polarizability.reset();
  if (lines.size() == 4) {
    Matrix3d pol;
    if (!parse_values(lines[2], "polarizability", pol))
      return false;
    record.polarizability = pol;
  }

  record.gradient.resize(3, natoms);
  return parse_values(lines.back(), "gradient", record.gradient);
}

fs::path DisplacementRunner::record_path(int atom, int axis, int sign) const {
  return dir_ / absl::StrFormat("disp.%d%c%c.rec", atom, "xyz"[axis],
                                sign > 0 ? '+' : '-');
}

absl::StatusOr<DisplacementRecord>
DisplacementRunner::displaced(const Matrix3Xd &pos, int atom, int axis,
                              int sign, bool polarizability,
                              absl::Time deadline) {
  const fs::path file = record_path(atom, axis, sign);

  DisplacementRecord record;
  if (read_record(file, record, static_cast<int>(pos.cols()))
      && (!polarizability || record.polarizability)) {
    ABSL_DVLOG(2) << "reusing " << file;
    ++reused_;
    return record;
  }

  if (absl::Now() > deadline)
    return timeout_error("finite displacements exceeded the deadline");

  Matrix3Xd disp = pos;
  disp(axis, atom) += sign * delta_;

  absl::StatusOr<EngineResult> res = engine_->evaluate(disp);
  ++engine_calls_;
  if (!res.ok())
    return res.status();

  record.energy = res->energy;
  record.gradient = std::move(res->gradient);
  record.dipole = res->dipole;
  record.polarizability.reset();

  if (polarizability) {
    absl::StatusOr<Matrix3d> pol = engine_->polarizability(disp);
    if (!pol.ok())
      return pol.status();
    record.polarizability = *pol;
  }

  if (absl::Status status = write_record(file, record); !status.ok())
    return status;

  return record;
}

absl::StatusOr<FiniteDifferenceData>
DisplacementRunner::run(const Matrix3Xd &pos, bool polarizability,
                        absl::Time deadline) {
  const Eigen::Index n = pos.cols(), ndof = 3 * n;
  const double scale = 1 / (2 * delta_);

  MatrixXd hc(ndof, ndof);
  MatrixX3d dpdx(ndof, 3);
  std::vector<Matrix3d> dadx;
  if (polarizability)
    dadx.reserve(ndof);

  for (int atom = 0; atom < n; ++atom) {
    for (int axis = 0; axis < 3; ++axis) {
      const int j = 3 * atom + axis;

      absl::StatusOr<DisplacementRecord> plus =
          displaced(pos, atom, axis, 1, polarizability, deadline);
      if (!plus.ok())
        return plus.status();

      absl::StatusOr<DisplacementRecord> minus =
          displaced(pos, atom, axis, -1, polarizability, deadline);
      if (!minus.ok())
        return minus.status();

      hc.col(j) = (plus->gradient - minus->gradient).reshaped() * scale;
      dpdx.row(j) = (plus->dipole - minus->dipole).transpose() * scale;
      if (polarizability)
        dadx.push_back((*plus->polarizability - *minus->polarizability)
                       * scale);
    }
  }

  ABSL_DVLOG(1) << "finite differences done: " << engine_calls_
                << " engine calls, " << reused_ << " reused records";

  FiniteDifferenceData data;
  data.hessian = 0.5 * (hc + hc.transpose());
  data.dipole_derivatives = std::move(dpdx);
  if (polarizability)
    data.polarizability_derivatives = std::move(dadx);

  ABSL_DVLOG(3) << "hessian:\n" << data.hessian;
  return data;
}
}  // namespace vibra
