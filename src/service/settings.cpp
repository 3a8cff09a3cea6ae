//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "vibra/service/settings.h"

#include <cstdlib>
#include <string_view>

#include <absl/log/absl_log.h>
#include <absl/strings/numbers.h>
#include <absl/time/time.h>

#include "vibra/engine/method.h"
#include "vibra/vib/analyzer.h"

namespace vibra {
namespace {
  const char *get_env(const char *name) {
    const char *value = std::getenv(name);
    if (value == nullptr || *value == '\0')
      return nullptr;
    return value;
  }

  void read_positive_int(const char *name, int &value) {
    const char *str = get_env(name);
    if (str == nullptr)
      return;

    int parsed;
    if (!absl::SimpleAtoi(str, &parsed) || parsed <= 0) {
      ABSL_LOG(WARNING) << "Ignoring invalid value of " << name << ": " << str;
      return;
    }
    value = parsed;
  }

  void read_double(const char *name, double &value) {
    const char *str = get_env(name);
    if (str == nullptr)
      return;

    double parsed;
    if (!absl::SimpleAtod(str, &parsed)) {
      ABSL_LOG(WARNING) << "Ignoring invalid value of " << name << ": " << str;
      return;
    }
    value = parsed;
  }

  void read_duration(const char *name, absl::Duration &value) {
    const char *str = get_env(name);
    if (str == nullptr)
      return;

    if (double seconds; absl::SimpleAtod(str, &seconds) && seconds >= 0) {
      value = absl::Seconds(seconds);
      return;
    }

    if (absl::Duration parsed;
        absl::ParseDuration(str, &parsed) && parsed >= absl::ZeroDuration()) {
      value = parsed;
      return;
    }

    ABSL_LOG(WARNING) << "Ignoring invalid value of " << name << ": " << str;
  }
}  // namespace

Settings Settings::from_env() {
  Settings settings;

  read_positive_int("VIBRA_MAX_ATOMS_FF", settings.max_atoms_ff);
  read_positive_int("VIBRA_MAX_ATOMS_XTB", settings.max_atoms_xtb);
  read_double("VIBRA_IMAGINARY_FREQ_THRESHOLD",
              settings.imaginary_freq_threshold);
  read_duration("VIBRA_TIMEOUT", settings.timeout);

  if (const char *dir = get_env("VIBRA_SCRATCH_DIR"); dir != nullptr)
    settings.scratch_root = dir;

  return settings;
}

int max_atoms(Method method, const Settings &settings) {
  return is_force_field(method) ? settings.max_atoms_ff
                                : settings.max_atoms_xtb;
}

AnalyzerOptions analyzer_options(const Settings &settings) {
  AnalyzerOptions options;
  options.scratch_root = settings.scratch_root;
  options.delta = settings.displacement_step;
  options.imaginary_freq_threshold = settings.imaginary_freq_threshold;
  options.fold = settings.spectrum;
  return options;
}
}  // namespace vibra
