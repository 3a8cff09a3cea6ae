//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//
#ifndef VIBRA_EIGEN_CONFIG_H_
#define VIBRA_EIGEN_CONFIG_H_

//! @cond
#include <complex>
#include <type_traits>

#include <Eigen/Dense>
//! @endcond

#include "vibra/meta.h"

namespace vibra {
//! @privatesection

// NOLINTNEXTLINE(*-naming)
namespace E = Eigen;

using E::Array;
using E::Array3d;
using E::Array3Xd;
using E::ArrayXd;
using E::ArrayXi;
using E::ArrayXXd;
using ArrayXcd = E::ArrayX<std::complex<double>>;

using E::Matrix3d;
using E::Matrix3Xd;
using E::MatrixX3d;
using E::MatrixXd;

using E::Vector3d;
using E::VectorXd;

template <class Raw, int Options = 0,
          class StrideType = std::conditional_t<
              Raw::IsVectorAtCompileTime, E::InnerStride<1>, E::OuterStride<>>>
using MutRef = E::Ref<internal::remove_cvref_t<Raw>, Options, StrideType>;

template <class Raw, int Options = 0,
          class StrideType = std::conditional_t<
              Raw::IsVectorAtCompileTime, E::InnerStride<1>, E::OuterStride<>>>
using ConstRef =
    const E::Ref<const internal::remove_cvref_t<Raw>, Options, StrideType> &;
}  // namespace vibra

#endif /* VIBRA_EIGEN_CONFIG_H_ */
