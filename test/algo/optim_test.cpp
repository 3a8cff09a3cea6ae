//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "vibra/algo/optim.h"

#include <cmath>
#include <limits>

#include <Eigen/Dense>

#include <gtest/gtest.h>

#include "vibra/eigen_config.h"
#include "test_utils.h"

namespace vibra {
namespace {
TEST(BfgsTest, Quadratic) {
  Vector3d center(1, -2, 0.5);
  Array3d scale(1, 10, 100);

  auto fg = [&](ArrayXd &gx, ConstRef<ArrayXd> xa) {
    ArrayXd d = xa - center.array();
    gx = 2 * scale * d;
    return (scale * d.square()).sum();
  };

  ArrayXd x = ArrayXd::Zero(3);
  Bfgs optim(x);
  BfgsResult res = optim.minimize(fg, 1e-8);

  ASSERT_EQ(res.code, BfgsResultCode::kSuccess);
  VIBRA_EXPECT_EIGEN_EQ_TOL(x.matrix(), center, 1e-6);
  EXPECT_NEAR(res.fx, 0, 1e-10);
}

TEST(BfgsTest, Rosenbrock) {
  auto fg = [](ArrayXd &gx, ConstRef<ArrayXd> xa) {
    const double a = 1 - xa[0], b = xa[1] - xa[0] * xa[0];
    gx[0] = -2 * a - 400 * xa[0] * b;
    gx[1] = 200 * b;
    return a * a + 100 * b * b;
  };

  ArrayXd x(2);
  x << -1.2, 1;
  Bfgs optim(x);
  BfgsResult res = optim.minimize(fg, 1e-6, 0, 2000);

  ASSERT_EQ(res.code, BfgsResultCode::kSuccess);
  EXPECT_NEAR(x[0], 1, 1e-4);
  EXPECT_NEAR(x[1], 1, 1e-4);
  EXPECT_GT(res.niter, 0);
}

TEST(BfgsTest, ConvergedAtStart) {
  auto fg = [](ArrayXd &gx, ConstRef<ArrayXd> xa) {
    gx = 2 * xa;
    return xa.square().sum();
  };

  ArrayXd x = ArrayXd::Zero(4);
  Bfgs optim(x);
  BfgsResult res = optim.minimize(fg);
  EXPECT_EQ(res.code, BfgsResultCode::kSuccess);
  EXPECT_EQ(res.niter, 0);
}

TEST(BfgsTest, NonFiniteStart) {
  auto fg = [](ArrayXd &gx, ConstRef<ArrayXd> /* xa */) {
    gx.setZero();
    return std::numeric_limits<double>::quiet_NaN();
  };

  ArrayXd x = ArrayXd::Ones(2);
  Bfgs optim(x);
  BfgsResult res = optim.minimize(fg);
  EXPECT_EQ(res.code, BfgsResultCode::kInvalidInput);
}

TEST(BfgsTest, MaxIterations) {
  auto fg = [](ArrayXd &gx, ConstRef<ArrayXd> xa) {
    const double a = 1 - xa[0], b = xa[1] - xa[0] * xa[0];
    gx[0] = -2 * a - 400 * xa[0] * b;
    gx[1] = 200 * b;
    return a * a + 100 * b * b;
  };

  ArrayXd x(2);
  x << -1.2, 1;
  Bfgs optim(x);
  BfgsResult res = optim.minimize(fg, 1e-10, 0, 2);
  EXPECT_EQ(res.code, BfgsResultCode::kMaxIterReached);
  EXPECT_EQ(res.niter, 2);
}
}  // namespace
}  // namespace vibra
