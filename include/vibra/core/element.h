//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef VIBRA_CORE_ELEMENT_H_
#define VIBRA_CORE_ELEMENT_H_

//! @cond
#include <string_view>

#include <absl/container/flat_hash_map.h>
//! @endcond

namespace vibra {
/**
 * @brief An element of the periodic table.
 *
 * Only the data required for geometry generation and vibrational analysis is
 * stored. Radii are in angstroms and the atomic weight is the standard atomic
 * weight in amu (the conventional value is used for elements with no stable
 * isotope).
 */
class Element {
public:
  constexpr Element() noexcept
      : atomic_number_(0), symbol_("*"), atomic_weight_(0), cov_rad_(0),
        vdw_rad_(0), eneg_(0) { }

  constexpr Element(int atomic_number, std::string_view symbol,
                    double atomic_weight, double covalent_radius,
                    double vdw_radius, double electronegativity) noexcept
      : atomic_number_(atomic_number), symbol_(symbol),
        atomic_weight_(atomic_weight), cov_rad_(covalent_radius),
        vdw_rad_(vdw_radius), eneg_(electronegativity) { }

  constexpr int atomic_number() const noexcept { return atomic_number_; }

  constexpr std::string_view symbol() const noexcept { return symbol_; }

  constexpr double atomic_weight() const noexcept { return atomic_weight_; }

  constexpr double covalent_radius() const noexcept { return cov_rad_; }

  constexpr double vdw_radius() const noexcept { return vdw_rad_; }

  /**
   * @brief Pauling electronegativity of the element.
   * @note Returns 0 for noble gases and the dummy atom.
   */
  constexpr double electronegativity() const noexcept { return eneg_; }

  constexpr bool is_dummy() const noexcept { return atomic_number_ == 0; }

  constexpr bool main_group() const noexcept {
    return atomic_number_ < 21 || (atomic_number_ > 30 && atomic_number_ < 39)
           || atomic_number_ > 48;
  }

  /**
   * @brief Number of valence electrons of the neutral atom.
   * @note Transition metals report their group number.
   */
  constexpr int valence_electrons() const noexcept {
    if (atomic_number_ <= 2)
      return atomic_number_;
    if (atomic_number_ <= 10)
      return atomic_number_ - 2;
    if (atomic_number_ <= 18)
      return atomic_number_ - 10;
    if (atomic_number_ <= 30)
      return atomic_number_ - 18;
    if (atomic_number_ <= 36)
      return atomic_number_ - 28;
    if (atomic_number_ <= 48)
      return atomic_number_ - 36;
    return atomic_number_ - 46;
  }

private:
  int atomic_number_;
  std::string_view symbol_;
  double atomic_weight_;
  double cov_rad_;
  double vdw_rad_;
  double eneg_;
};

constexpr bool operator==(const Element &lhs, const Element &rhs) noexcept {
  return lhs.atomic_number() == rhs.atomic_number();
}

constexpr bool operator!=(const Element &lhs, const Element &rhs) noexcept {
  return lhs.atomic_number() != rhs.atomic_number();
}

/**
 * @brief The periodic table, from the dummy atom (atomic number 0) to xenon.
 */
class PeriodicTable final {
public:
  PeriodicTable(const PeriodicTable &) = delete;
  PeriodicTable(PeriodicTable &&) noexcept = delete;
  PeriodicTable &operator=(const PeriodicTable &) = delete;
  PeriodicTable &operator=(PeriodicTable &&) noexcept = delete;

  ~PeriodicTable() noexcept = default;

  static const PeriodicTable &get() noexcept {
    static const PeriodicTable the_table;

    return the_table;
  }

  const Element &operator[](int atomic_number) const noexcept {
    return elements_[atomic_number];
  }

  const Element *find_element(int atomic_number) const noexcept {
    return has_element(atomic_number) ? &elements_[atomic_number] : nullptr;
  }

  /**
   * @brief Find an element by its symbol.
   *
   * @param symbol The symbol of the element, case sensitive (e.g. "Cl").
   * @return A pointer to the element, or nullptr if not found.
   */
  const Element *find_element(std::string_view symbol) const noexcept {
    auto it = symbol_to_element_.find(symbol);
    return it != symbol_to_element_.end() ? it->second : nullptr;
  }

  constexpr static bool has_element(int atomic_number) noexcept {
    return static_cast<unsigned int>(atomic_number)
           < static_cast<unsigned int>(kElementCount_);
  }

  const Element *begin() const noexcept { return elements_ + 1; }
  const Element *end() const noexcept { return elements_ + kElementCount_; }

  // 54 elements + dummy
  // NOLINTNEXTLINE(readability-identifier-naming)
  constexpr static int kElementCount_ = 54 + 1;

private:
  PeriodicTable() noexcept;

  Element elements_[kElementCount_];
  absl::flat_hash_map<std::string_view, const Element *> symbol_to_element_;
};

// NOLINTNEXTLINE(readability-identifier-naming)
static const PeriodicTable &kPt = PeriodicTable::get();
}  // namespace vibra

#endif /* VIBRA_CORE_ELEMENT_H_ */
