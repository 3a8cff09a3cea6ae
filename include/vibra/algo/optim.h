//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef VIBRA_ALGO_OPTIM_H_
#define VIBRA_ALGO_OPTIM_H_

//! @cond
#include <cmath>
#include <limits>
#include <utility>

#include <absl/log/absl_log.h>
#include <Eigen/Dense>
//! @endcond

#include "vibra/eigen_config.h"
#include "vibra/utils.h"

namespace vibra {
namespace internal {
  constexpr double kEpsMach = std::numeric_limits<double>::epsilon();
  const double kSqrtEpsMach = std::sqrt(kEpsMach);
}  // namespace internal

enum class BfgsResultCode {
  kSuccess,
  kMaxIterReached,
  kInvalidInput,
  kAbnormalTerm,
};

struct BfgsResult {
  BfgsResultCode code;
  int niter;
  double fx;
  ArrayXd gx;
};

/**
 * @brief BFGS minimizer with a backtracking (Armijo) line search.
 *
 * References:
 *   - "Broyden-Fletcher-Goldfarb-Shanno algorithm",
 *     [Wikipedia](https://en.wikipedia.org/wiki/Broyden%E2%80%93Fletcher%E2%80%93Goldfarb%E2%80%93Shanno_algorithm)
 *     (Accessed 2024-10-25).
 *   - J. Nocedal and S. J. Wright, Numerical Optimization, 2nd ed., Algorithm
 *     3.1 (backtracking line search).
 *
 * The inverse Hessian approximation is reset to the identity whenever the line
 * search fails along the quasi-Newton direction, so a failed search along the
 * steepest descent direction is the only abnormal termination.
 */
class Bfgs {
public:
  /**
   * @brief Prepare BFGS minimization algorithm.
   *
   * @param x Initial guess. Will be modified in-place.
   */
  Bfgs(MutRef<ArrayXd> x);

  /**
   * @brief Minimize a function using BFGS algorithm.
   *
   * @tparam FuncGrad Function object that computes the function value and
   *         gradient. Function value should be returned and gradient should be
   *         updated in the input gradient vector.
   * @param fg Function object.
   * @param pgtol Stop when the max-norm of the gradient is less than this value.
   * @param xrtol Stop when the relative change in x is less than this value.
   * @param maxiter Maximum number of iterations. If negative, it will be set to
   *        200 times the number of variables.
   * @param maxls Maximum number of backtracking steps per line search.
   * @param ftol Sufficient decrease parameter of the Armijo condition.
   * @return A struct with the result code, number of iterations, final function
   *         value, and final gradient.
   */
  template <class FuncGrad>
  BfgsResult minimize(FuncGrad fg, const double pgtol = 1e-5,
                      const double xrtol = 0, int maxiter = -1,
                      const int maxls = 50, const double ftol = 1e-4) {
    if (maxiter < 0)
      maxiter = 200 * static_cast<int>(x().size());

    Hk_.setIdentity();

    ArrayXd gfk(x().size());

    const double f0 = fg(gfk, x());
    if (!std::isfinite(f0) || !gfk.isFinite().all()) {
      ABSL_LOG(WARNING) << "non-finite function value or gradient at start";
      return { BfgsResultCode::kInvalidInput, 0, f0, std::move(gfk) };
    }

    double gnorm = gfk.abs().maxCoeff();
    if (gnorm <= pgtol)
      return { BfgsResultCode::kSuccess, 0, f0, std::move(gfk) };

    int k = 0;
    double fk = f0, fkm1 = fk + gfk.matrix().norm() * 0.5;
    for (; k < maxiter; ++k) {
      double step = prepare_lnsrch(gfk, fk, fkm1);
      double gk = gfk.matrix().dot(pk());
      if (gk >= 0) {
        ABSL_DVLOG(1) << "not a descent direction; resetting Hessian";
        Hk_.setIdentity();
        step = prepare_lnsrch(gfk, fk, fkm1);
        gk = gfk.matrix().dot(pk());
      }
      fkm1 = fk;

      bool success = false;
      for (int attempt = 0; attempt < 2 && !success; ++attempt) {
        for (int iter = 0; iter < maxls; ++iter) {
          xk() = x() + step * pk().array();
          const double fnew = fg(gfkp1(), xk());
          if (std::isfinite(fnew) && fnew <= fk + ftol * step * gk) {
            fk = fnew;
            success = true;
            break;
          }
          step *= 0.5;
        }

        if (!success && attempt == 0) {
          ABSL_DVLOG(1) << "line search failed; resetting Hessian";
          Hk_.setIdentity();
          step = prepare_lnsrch(gfk, fk, fkm1);
          gk = gfk.matrix().dot(pk());
        }
      }

      if (!success) {
        ABSL_LOG(INFO) << "line search failed at iteration " << k;
        return { BfgsResultCode::kAbnormalTerm, k, fk, std::move(gfk) };
      }

      if (prepare_next_iter(gfk, step, pgtol, xrtol))
        return { BfgsResultCode::kSuccess, k + 1, fk, std::move(gfk) };
    }

    return { BfgsResultCode::kMaxIterReached, k, fk, std::move(gfk) };
  }

private:
  double prepare_lnsrch(const ArrayXd &gfk, double fk, double fkm1);

  bool prepare_next_iter(ArrayXd &gfk, double step, double pgtol,
                         double xrtol);

  MutRef<ArrayXd> &x() { return x_; }

  ArrayXd &xk() { return xk_; }

  ArrayXd &gfkp1() { return gfkp1_; }

  // NOLINTNEXTLINE(readability-identifier-naming)
  Eigen::SelfAdjointView<MatrixXd, Eigen::Upper> Hk() {
    return Hk_.selfadjointView<Eigen::Upper>();
  }

  VectorXd &pk() { return pk_; }

  Eigen::MatrixWrapper<ArrayXd> sk() { return xk_.matrix(); }

  VectorXd &yk() { return yk_; }

  // NOLINTNEXTLINE(readability-identifier-naming)
  Eigen::MatrixWrapper<ArrayXd> Hk_yk() { return gfkp1_.matrix(); }

  MutRef<ArrayXd> x_;
  ArrayXd xk_;
  ArrayXd gfkp1_;
  MatrixXd Hk_;
  VectorXd pk_;
  VectorXd yk_;
};
}  // namespace vibra

#endif /* VIBRA_ALGO_OPTIM_H_ */
