//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef VIBRA_SERVICE_IR_SERVICE_H_
#define VIBRA_SERVICE_IR_SERVICE_H_

//! @cond
#include <memory>
#include <string>
#include <string_view>

#include <absl/status/statusor.h>
//! @endcond

#include "vibra/engine/engine.h"
#include "vibra/engine/method.h"
#include "vibra/service/cache.h"
#include "vibra/service/settings.h"
#include "vibra/service/structure_builder.h"
#include "vibra/vib/analyzer.h"
#include "vibra/vib/result.h"

namespace vibra {
/**
 * @brief The stores used by IrService. Null members are replaced by fresh
 *        in-memory stores.
 */
struct IrStores {
  std::shared_ptr<KeyValueStore<BuiltStructure>> structures;
  std::shared_ptr<KeyValueStore<SpectrumResult>> spectra;
  std::shared_ptr<KeyValueStore<SpectrumResult>> results;
};

/**
 * @brief IR/Raman spectra of molecules given as SMILES or molfile text.
 *
 * Results are memoized in three stores: built structures keyed by the hash of
 * the input text, raw spectra keyed by the hash of the structure and method,
 * and final results keyed by the hash of the input text and method. At most
 * one computation runs per key; concurrent callers with the same key wait for
 * it and then return the cached result.
 *
 * Each computation is bounded by Settings::timeout. A computation that runs
 * out of time fails with DeadlineExceeded and caches nothing.
 */
class IrService {
public:
  explicit IrService(Settings settings = {},
                     EngineFactory factory = default_engine,
                     IrStores stores = {});

  absl::StatusOr<std::shared_ptr<const SpectrumResult>>
  ir_from_smiles(std::string_view smiles, Method method);

  absl::StatusOr<std::shared_ptr<const SpectrumResult>>
  ir_from_smiles(std::string_view smiles, std::string_view method);

  absl::StatusOr<std::shared_ptr<const SpectrumResult>>
  ir_from_molfile(std::string_view molfile, Method method);

  absl::StatusOr<std::shared_ptr<const SpectrumResult>>
  ir_from_molfile(std::string_view molfile, std::string_view method);

  const Settings &settings() const { return settings_; }

  const IrStores &stores() const { return stores_; }

  const StructureBuilder &builder() const { return builder_; }

private:
  enum class InputKind {
    kSmiles,
    kMolfile,
  };

  absl::StatusOr<std::shared_ptr<const SpectrumResult>>
  ir_from(InputKind kind, std::string_view input, Method method);

  absl::StatusOr<std::shared_ptr<const SpectrumResult>>
  compute(InputKind kind, std::string_view input, Method method,
          absl::Time deadline);

  absl::StatusOr<std::shared_ptr<const SpectrumResult>>
  raw_spectrum(const BuiltStructure &built, Method method,
               absl::Time deadline);

  Settings settings_;
  EngineFactory factory_;
  IrStores stores_;
  StructureBuilder builder_;
  VibrationalAnalyzer analyzer_;
  KeyedMutex result_locks_;
  KeyedMutex spectrum_locks_;
};
}  // namespace vibra

#endif /* VIBRA_SERVICE_IR_SERVICE_H_ */
