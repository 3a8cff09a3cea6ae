//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "vibra/core/element.h"

#include <absl/log/absl_check.h>

namespace vibra {
namespace {
  // Covalent radii: Cordero et al., Dalton Trans. 2008, 2832.
  // van der Waals radii: Bondi, with Alvarez (Dalton Trans. 2013, 8617) for
  // elements Bondi did not tabulate.
  constexpr Element kElementData[] = {
    {  0,  "*",   0.0,     0.0,  0.0,  0.0 },
    {  1,  "H",   1.008,   0.31, 1.20, 2.20 },
    {  2, "He",   4.0026,  0.28, 1.40, 0.0 },
    {  3, "Li",   6.94,    1.28, 1.82, 0.98 },
    {  4, "Be",   9.0122,  0.96, 1.53, 1.57 },
    {  5,  "B",  10.81,    0.84, 1.92, 2.04 },
    {  6,  "C",  12.011,   0.76, 1.70, 2.55 },
    {  7,  "N",  14.007,   0.71, 1.55, 3.04 },
    {  8,  "O",  15.999,   0.66, 1.52, 3.44 },
    {  9,  "F",  18.998,   0.57, 1.47, 3.98 },
    { 10, "Ne",  20.180,   0.58, 1.54, 0.0 },
    { 11, "Na",  22.990,   1.66, 2.27, 0.93 },
    { 12, "Mg",  24.305,   1.41, 1.73, 1.31 },
    { 13, "Al",  26.982,   1.21, 1.84, 1.61 },
    { 14, "Si",  28.085,   1.11, 2.10, 1.90 },
    { 15,  "P",  30.974,   1.07, 1.80, 2.19 },
    { 16,  "S",  32.06,    1.05, 1.80, 2.58 },
    { 17, "Cl",  35.45,    1.02, 1.75, 3.16 },
    { 18, "Ar",  39.948,   1.06, 1.88, 0.0 },
    { 19,  "K",  39.098,   2.03, 2.75, 0.82 },
    { 20, "Ca",  40.078,   1.76, 2.31, 1.00 },
    { 21, "Sc",  44.956,   1.70, 2.15, 1.36 },
    { 22, "Ti",  47.867,   1.60, 2.11, 1.54 },
    { 23,  "V",  50.942,   1.53, 2.07, 1.63 },
    { 24, "Cr",  51.996,   1.39, 2.06, 1.66 },
    { 25, "Mn",  54.938,   1.39, 2.05, 1.55 },
    { 26, "Fe",  55.845,   1.32, 2.04, 1.83 },
    { 27, "Co",  58.933,   1.26, 2.00, 1.88 },
    { 28, "Ni",  58.693,   1.24, 1.63, 1.91 },
    { 29, "Cu",  63.546,   1.32, 1.40, 1.90 },
    { 30, "Zn",  65.38,    1.22, 1.39, 1.65 },
    { 31, "Ga",  69.723,   1.22, 1.87, 1.81 },
    { 32, "Ge",  72.630,   1.20, 2.11, 2.01 },
    { 33, "As",  74.922,   1.19, 1.85, 2.18 },
    { 34, "Se",  78.971,   1.20, 1.90, 2.55 },
    { 35, "Br",  79.904,   1.20, 1.85, 2.96 },
    { 36, "Kr",  83.798,   1.16, 2.02, 3.00 },
    { 37, "Rb",  85.468,   2.20, 3.03, 0.82 },
    { 38, "Sr",  87.62,    1.95, 2.49, 0.95 },
    { 39,  "Y",  88.906,   1.90, 2.32, 1.22 },
    { 40, "Zr",  91.224,   1.75, 2.23, 1.33 },
    { 41, "Nb",  92.906,   1.64, 2.18, 1.60 },
    { 42, "Mo",  95.95,    1.54, 2.17, 2.16 },
    { 43, "Tc",  98.0,     1.47, 2.16, 1.90 },
    { 44, "Ru", 101.07,    1.46, 2.13, 2.20 },
    { 45, "Rh", 102.91,    1.42, 2.10, 2.28 },
    { 46, "Pd", 106.42,    1.39, 1.63, 2.20 },
    { 47, "Ag", 107.87,    1.45, 1.72, 1.93 },
    { 48, "Cd", 112.41,    1.44, 1.58, 1.69 },
    { 49, "In", 114.82,    1.42, 1.93, 1.78 },
    { 50, "Sn", 118.71,    1.39, 2.17, 1.96 },
    { 51, "Sb", 121.76,    1.39, 2.06, 2.05 },
    { 52, "Te", 127.60,    1.38, 2.06, 2.10 },
    { 53,  "I", 126.90,    1.39, 1.98, 2.66 },
    { 54, "Xe", 131.29,    1.40, 2.16, 2.60 },
  };

  static_assert(sizeof(kElementData) / sizeof(Element)
                == PeriodicTable::kElementCount_);
}  // namespace

PeriodicTable::PeriodicTable() noexcept {
  for (int i = 0; i < kElementCount_; ++i) {
    // GCOV_EXCL_START
    ABSL_DCHECK(kElementData[i].atomic_number() == i);
    // GCOV_EXCL_STOP
    elements_[i] = kElementData[i];
    symbol_to_element_[elements_[i].symbol()] = &elements_[i];
  }
}
}  // namespace vibra
