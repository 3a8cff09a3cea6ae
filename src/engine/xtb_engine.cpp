//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "vibra/engine/xtb_engine.h"

#include <memory>
#include <string_view>

#include <absl/log/absl_log.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>
#include <Eigen/Dense>
#include <xtb.h>

#include "vibra/eigen_config.h"
#include "vibra/status.h"
#include "vibra/core/structure.h"
#include "vibra/engine/method.h"
#include "vibra/engine/polarizability.h"

namespace vibra {
namespace {
  // CODATA 2018
  constexpr double kBohr = 0.529177210903;
  constexpr double kHartree = 27.211386245988;

  constexpr int kErrorBufferSize = 1024;
}  // namespace

XtbEngine::XtbEngine(const MolecularStructure &structure, Method method)
    : method_(method), polar_(structure) {
  numbers_.reserve(structure.size());
  for (int i = 0; i < structure.size(); ++i)
    numbers_.push_back(structure.element(i).atomic_number());
}

XtbEngine::~XtbEngine() {
  xtb_delResults(&res_);
  xtb_delCalculator(&calc_);
  xtb_delMolecule(&mol_);
  xtb_delEnvironment(&env_);
}

absl::StatusOr<std::unique_ptr<XtbEngine>>
XtbEngine::create(const MolecularStructure &structure, Method method,
                  const XtbOptions &options) {
  // Private constructor
  std::unique_ptr<XtbEngine> engine(new XtbEngine(structure, method));

  absl::Status status = engine->load_calculator(structure.positions(), options);
  if (!status.ok())
    return status;

  ABSL_DVLOG(1) << "xtb " << method << " calculator ready for "
                << engine->size() << " atoms";
  return engine;
}

absl::Status XtbEngine::check_environment(std::string_view what) const {
  if (xtb_checkEnvironment(env_) == 0)
    return absl::OkStatus();

  char buffer[kErrorBufferSize] = {};
  const int size = kErrorBufferSize;
  xtb_getError(env_, buffer, &size);

  ABSL_LOG(WARNING) << "xtb " << what << " failed: " << buffer;
  return engine_failure(absl::StrCat("xtb ", what, " failed: ", buffer));
}

absl::Status XtbEngine::load_calculator(const Matrix3Xd &pos,
                                        const XtbOptions &options) {
  env_ = xtb_newEnvironment();
  calc_ = xtb_newCalculator();
  res_ = xtb_newResults();
  if (env_ == nullptr || calc_ == nullptr || res_ == nullptr)
    return engine_failure("could not allocate xtb handles");

  xtb_setVerbosity(env_, XTB_VERBOSITY_MUTED);

  const int natoms = size();
  const double charge = 0;
  const int uhf = 0;
  const Matrix3Xd bohr = pos / kBohr;
  mol_ = xtb_newMolecule(env_, &natoms, numbers_.data(), bohr.data(), &charge,
                         &uhf, nullptr, nullptr);
  if (absl::Status status = check_environment("molecule setup");
      !status.ok()) {
    return status;
  }

  switch (method_) {
  case Method::kGFNFF:
    xtb_loadGFNFF(env_, mol_, calc_, nullptr);
    break;
  case Method::kGFN1xTB:
    xtb_loadGFN1xTB(env_, mol_, calc_, nullptr);
    break;
  case Method::kGFN2xTB:
    xtb_loadGFN2xTB(env_, mol_, calc_, nullptr);
    break;
  }
  if (absl::Status status =
          check_environment(absl::StrCat("loading ", method_name(method_)));
      !status.ok()) {
    return status;
  }

  if (!is_force_field(method_)) {
    xtb_setAccuracy(env_, calc_, options.accuracy);
    xtb_setMaxIter(env_, calc_, options.max_scf_iterations);
    xtb_setElectronicTemp(env_, calc_, options.electronic_temperature);
  }

  return check_environment("calculator setup");
}

absl::StatusOr<EngineResult> XtbEngine::evaluate(const Matrix3Xd &pos) {
  if (absl::Status status = check_positions(pos); !status.ok())
    return status;

  const Matrix3Xd bohr = pos / kBohr;
  xtb_updateMolecule(env_, mol_, bohr.data(), nullptr);
  if (absl::Status status = check_environment("update"); !status.ok())
    return status;

  xtb_singlepoint(env_, mol_, calc_, res_);
  if (absl::Status status = check_environment("singlepoint"); !status.ok())
    return status;

  double energy;
  Matrix3Xd gradient(3, size());
  Vector3d dipole;
  xtb_getEnergy(env_, res_, &energy);
  xtb_getGradient(env_, res_, gradient.data());
  xtb_getDipole(env_, res_, dipole.data());
  if (absl::Status status = check_environment("result query"); !status.ok())
    return status;

  EngineResult result {
    energy * kHartree,
    gradient * (kHartree / kBohr),
    dipole * kBohr,
  };
  ABSL_DVLOG(3) << "xtb energy " << result.energy << " eV";
  return result;
}

absl::StatusOr<Matrix3d> XtbEngine::polarizability(const Matrix3Xd &pos) {
  if (absl::Status status = check_positions(pos); !status.ok())
    return status;

  return polar_(pos);
}
}  // namespace vibra
