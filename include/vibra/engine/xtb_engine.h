//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef VIBRA_ENGINE_XTB_ENGINE_H_
#define VIBRA_ENGINE_XTB_ENGINE_H_

//! @cond
#include <memory>
#include <string_view>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <xtb.h>
//! @endcond

#include "vibra/eigen_config.h"
#include "vibra/core/structure.h"
#include "vibra/engine/engine.h"
#include "vibra/engine/method.h"
#include "vibra/engine/polarizability.h"

namespace vibra {
struct XtbOptions {
  // Numerical accuracy of the SCF, smaller is tighter
  double accuracy = 1.0;
  int max_scf_iterations = 250;
  // Kelvin
  double electronic_temperature = 300.0;
};

/**
 * @brief An engine backed by the xtb library.
 *
 * The calculator is chosen by the method: GFN-FF for Method::kGFNFF, GFN1-xTB
 * and GFN2-xTB for the tight binding methods. The molecule is neutral and
 * closed shell. Polarizabilities come from a BondPolarizabilityModel of the
 * same structure, as xtb has no polarizability output.
 */
class XtbEngine: public ForceEngine {
public:
  /**
   * @brief Set up an xtb calculator for the structure.
   *
   * @return The engine, or an Internal error if xtb rejects the molecule or
   *         fails to load the parametrization.
   */
  static absl::StatusOr<std::unique_ptr<XtbEngine>>
  create(const MolecularStructure &structure, Method method,
         const XtbOptions &options = {});

  XtbEngine(const XtbEngine &) = delete;
  XtbEngine &operator=(const XtbEngine &) = delete;
  XtbEngine(XtbEngine &&) = delete;
  XtbEngine &operator=(XtbEngine &&) = delete;

  ~XtbEngine() override;

  int size() const override { return static_cast<int>(numbers_.size()); }

  Method method() const { return method_; }

  absl::StatusOr<EngineResult> evaluate(const Matrix3Xd &pos) override;

  absl::StatusOr<Matrix3d> polarizability(const Matrix3Xd &pos) override;

private:
  XtbEngine(const MolecularStructure &structure, Method method);

  absl::Status load_calculator(const Matrix3Xd &pos,
                               const XtbOptions &options);

  absl::Status check_environment(std::string_view what) const;

  Method method_;
  std::vector<int> numbers_;
  BondPolarizabilityModel polar_;

  xtb_TEnvironment env_ = nullptr;
  xtb_TMolecule mol_ = nullptr;
  xtb_TCalculator calc_ = nullptr;
  xtb_TResults res_ = nullptr;
};
}  // namespace vibra

#endif /* VIBRA_ENGINE_XTB_ENGINE_H_ */
