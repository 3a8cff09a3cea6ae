//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "vibra/vib/spectrum.h"

#include <gtest/gtest.h>

#include "vibra/eigen_config.h"

namespace vibra {
namespace {
ArrayXd single(double value) {
  return ArrayXd::Constant(1, value);
}

TEST(SpectrumTest, DefaultGrid) {
  FoldedSpectrum spectrum = fold(ArrayXd(0), ArrayXd(0));
  ASSERT_EQ(spectrum.energies.size(), 10001);
  ASSERT_EQ(spectrum.intensities.size(), 10001);
  EXPECT_DOUBLE_EQ(spectrum.energies[0], 0);
  EXPECT_DOUBLE_EQ(spectrum.energies[10000], 4000);
  EXPECT_NEAR(spectrum.energies[1], 0.4, 1e-12);
  EXPECT_TRUE((spectrum.intensities == 0).all());
}

TEST(SpectrumTest, CustomGrid) {
  FoldOptions options;
  options.start = 500;
  options.end = 1500;
  options.width = 10;
  FoldedSpectrum spectrum = fold(single(1000), single(1), options);
  EXPECT_EQ(spectrum.energies.size(), 1001);

  options.npts = 11;
  spectrum = fold(single(1000), single(1), options);
  ASSERT_EQ(spectrum.energies.size(), 11);
  EXPECT_NEAR(spectrum.energies[5], 1000, 1e-9);
  EXPECT_NEAR(spectrum.intensities[5], 1, 1e-9);
}

TEST(SpectrumTest, GaussianHeightAndWidth) {
  FoldedSpectrum spectrum = fold(single(1000), single(2));

  // Grid spacing 0.4: 1000 -> 2500, 1002 -> 2505
  EXPECT_NEAR(spectrum.energies[2500], 1000, 1e-9);
  EXPECT_NEAR(spectrum.intensities[2500], 2, 1e-6);
  EXPECT_NEAR(spectrum.intensities[2505], 1, 1e-6);
  EXPECT_NEAR(spectrum.intensities[2495], 1, 1e-6);
  EXPECT_LT(spectrum.intensities[2600], 1e-12);
}

TEST(SpectrumTest, GaussianNormalized) {
  FoldOptions options;
  options.normalize = true;
  FoldedSpectrum spectrum = fold(single(1000), single(2), options);
  EXPECT_NEAR(spectrum.intensities.sum() * 0.4, 2, 1e-6);
}

TEST(SpectrumTest, Lorentzian) {
  FoldOptions options;
  options.kernel = BroadeningKernel::kLorentzian;
  FoldedSpectrum spectrum = fold(single(2000), single(3), options);
  EXPECT_NEAR(spectrum.intensities[5000], 3, 1e-9);
  EXPECT_NEAR(spectrum.intensities[5005], 1.5, 1e-9);
  EXPECT_NEAR(spectrum.intensities[4995], 1.5, 1e-9);

  options.normalize = true;
  spectrum = fold(single(2000), single(3), options);
  EXPECT_NEAR(spectrum.intensities.sum() * 0.4, 3, 1e-2);
}

TEST(SpectrumTest, Superposition) {
  ArrayXd freqs(2), ints(2);
  freqs << 1000, 3000;
  ints << 1, 0.5;

  FoldedSpectrum both = fold(freqs, ints);
  FoldedSpectrum first = fold(freqs.head(1), ints.head(1)),
                 second = fold(freqs.tail(1), ints.tail(1));
  EXPECT_TRUE(
      ((both.intensities - first.intensities - second.intensities).abs()
       < 1e-12)
          .all());
}

TEST(SpectrumTest, ParseKernel) {
  BroadeningKernel kernel = BroadeningKernel::kGaussian;
  EXPECT_TRUE(parse_kernel("Lorentzian", kernel));
  EXPECT_EQ(kernel, BroadeningKernel::kLorentzian);
  EXPECT_TRUE(parse_kernel("gaussian", kernel));
  EXPECT_EQ(kernel, BroadeningKernel::kGaussian);
  EXPECT_FALSE(parse_kernel("voigt", kernel));
  EXPECT_EQ(kernel, BroadeningKernel::kGaussian);
}
}  // namespace
}  // namespace vibra
