//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "vibra/service/ir_service.h"

#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <absl/log/absl_log.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>
#include <absl/time/clock.h>
#include <absl/time/time.h>

#include "vibra/status.h"
#include "vibra/engine/optimizer.h"
#include "vibra/service/hash.h"

namespace vibra {
namespace {
  template <class V>
  std::shared_ptr<KeyValueStore<V>>
  store_or_default(std::shared_ptr<KeyValueStore<V>> store,
                   std::string_view name) {
    if (store)
      return store;
    return std::make_shared<InMemoryStore<V>>(std::string(name));
  }

  IrStores fill_stores(IrStores stores) {
    stores.structures =
        store_or_default(std::move(stores.structures), "structures");
    stores.spectra = store_or_default(std::move(stores.spectra), "spectra");
    stores.results = store_or_default(std::move(stores.results), "results");
    return stores;
  }

  absl::Status check_deadline(absl::Time deadline, std::string_view stage) {
    if (absl::Now() > deadline)
      return timeout_error(absl::StrCat("deadline exceeded ", stage));
    return absl::OkStatus();
  }
}  // namespace

IrService::IrService(Settings settings, EngineFactory factory,
                     IrStores stores)
    : settings_(std::move(settings)), factory_(std::move(factory)),
      stores_(fill_stores(std::move(stores))), builder_(stores_.structures),
      analyzer_(analyzer_options(settings_)) { }

absl::StatusOr<std::shared_ptr<const SpectrumResult>>
IrService::ir_from_smiles(std::string_view smiles, Method method) {
  return ir_from(InputKind::kSmiles, smiles, method);
}

absl::StatusOr<std::shared_ptr<const SpectrumResult>>
IrService::ir_from_smiles(std::string_view smiles, std::string_view method) {
  absl::StatusOr<Method> m = parse_method(method);
  if (!m.ok())
    return m.status();
  return ir_from(InputKind::kSmiles, smiles, *m);
}

absl::StatusOr<std::shared_ptr<const SpectrumResult>>
IrService::ir_from_molfile(std::string_view molfile, Method method) {
  return ir_from(InputKind::kMolfile, molfile, method);
}

absl::StatusOr<std::shared_ptr<const SpectrumResult>>
IrService::ir_from_molfile(std::string_view molfile, std::string_view method) {
  absl::StatusOr<Method> m = parse_method(method);
  if (!m.ok())
    return m.status();
  return ir_from(InputKind::kMolfile, molfile, *m);
}

absl::StatusOr<std::shared_ptr<const SpectrumResult>>
IrService::ir_from(InputKind kind, std::string_view input, Method method) {
  const std::string key = content_hash(absl::StrCat(input, method_name(method)));

  if (std::shared_ptr<const SpectrumResult> cached =
          stores_.results->get(key)) {
    ABSL_LOG(INFO) << "result cache hit for " << key;
    return cached;
  }

  KeyedMutex::Lock lock(result_locks_, key);

  // Another caller may have finished the same computation while we waited.
  if (std::shared_ptr<const SpectrumResult> cached =
          stores_.results->get(key)) {
    ABSL_LOG(INFO) << "result cache hit for " << key << " after wait";
    return cached;
  }

  ABSL_LOG(INFO) << "computing spectrum " << key << " with " << method;

  const absl::Time deadline = absl::Now() + settings_.timeout;
  absl::StatusOr<std::shared_ptr<const SpectrumResult>> result =
      compute(kind, input, method, deadline);
  if (!result.ok()) {
    ABSL_LOG(WARNING) << "spectrum " << key << " failed: " << result.status();
    return result.status();
  }

  if (absl::Status status = check_deadline(deadline, "before caching result");
      !status.ok())
    return status;

  stores_.results->set(key, *result);
  return result;
}

absl::StatusOr<std::shared_ptr<const SpectrumResult>>
IrService::compute(InputKind kind, std::string_view input, Method method,
                   absl::Time deadline) {
  const int limit = max_atoms(method, settings_);

  absl::StatusOr<std::shared_ptr<const BuiltStructure>> built =
      kind == InputKind::kSmiles ? builder_.from_smiles(input, limit)
                                 : builder_.from_molfile(input, limit);
  if (!built.ok())
    return built.status();

  return raw_spectrum(**built, method, deadline);
}

absl::StatusOr<std::shared_ptr<const SpectrumResult>>
IrService::raw_spectrum(const BuiltStructure &built, Method method,
                        absl::Time deadline) {
  const std::string key = content_hash(absl::StrCat(
      content_hash(built.structure.canonical_repr()), method_name(method)));

  if (std::shared_ptr<const SpectrumResult> cached =
          stores_.spectra->get(key)) {
    ABSL_LOG(INFO) << "spectrum cache hit for " << key;
    return cached;
  }

  // Also serializes access to the scratch directory named after the key.
  KeyedMutex::Lock lock(spectrum_locks_, key);

  if (std::shared_ptr<const SpectrumResult> cached =
          stores_.spectra->get(key)) {
    ABSL_LOG(INFO) << "spectrum cache hit for " << key << " after wait";
    return cached;
  }

  absl::StatusOr<std::unique_ptr<ForceEngine>> engine =
      factory_(built.structure, built.bonds, method);
  if (!engine.ok())
    return engine.status();

  if (absl::Status status = check_deadline(deadline, "before optimization");
      !status.ok())
    return status;

  absl::StatusOr<MolecularStructure> relaxed =
      optimize_geometry(**engine, built.structure, {}, deadline);
  if (!relaxed.ok())
    return relaxed.status();

  absl::StatusOr<SpectrumResult> spectrum =
      analyzer_.analyze(**engine, *relaxed, built.bonds, key, deadline);
  if (!spectrum.ok())
    return spectrum.status();

  if (absl::Status status = check_deadline(deadline, "before caching spectrum");
      !status.ok())
    return status;

  auto result = std::make_shared<const SpectrumResult>(*std::move(spectrum));
  stores_.spectra->set(key, result);
  return result;
}
}  // namespace vibra
