//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef VIBRA_META_H_
#define VIBRA_META_H_

//! @cond
#include <type_traits>
//! @endcond

//! @privatesection

namespace vibra {
namespace internal {
#if __cplusplus >= 202002L
  using std::remove_cvref_t;
#else
  template <class T>
  using remove_cvref_t = std::remove_cv_t<std::remove_reference_t<T>>;
#endif
}  // namespace internal
}  // namespace vibra

#endif /* VIBRA_META_H_ */
