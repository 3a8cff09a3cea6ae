//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "vibra/fmt/smiles.h"

#include <functional>
#include <initializer_list>
#include <optional>
#include <string_view>
#include <vector>

#include <absl/base/optimization.h>
#include <absl/container/flat_hash_map.h>
#include <absl/log/absl_check.h>
#include <absl/log/absl_log.h>
#include <absl/strings/ascii.h>
#include <boost/fusion/include/at_c.hpp>
#include <boost/fusion/include/deque.hpp>
#include <boost/spirit/home/x3.hpp>

#include "vibra/core/element.h"
#include "vibra/core/molecule.h"
#include "vibra/utils.h"

namespace vibra {
namespace {
namespace x3 = boost::spirit::x3;

// Bond symbol of an open ring closure and the atom it starts from
struct RingOpening {
  char bond;
  int atom;
};

// State shared by the semantic actions. A pending bond of '.' means the next
// atom starts a new component, '\0' means the default (single or aromatic)
// bond.
struct SmilesState {
  Molecule &mol;
  std::vector<int> roots = { -1 };
  char pending = '.';
  absl::flat_hash_map<int, RingOpening> rings;
  std::vector<int> bracket_atoms;
};

struct state_tag;

template <class Ctx>
SmilesState &state(Ctx &ctx) {
  return x3::get<state_tag>(ctx).get();
}

x3::symbols<const Element *>
element_table(std::initializer_list<std::string_view> symbols, bool aromatic) {
  x3::symbols<const Element *> table;
  for (const std::string_view symbol: symbols) {
    const Element *elem = kPt.find_element(symbol);
    ABSL_DCHECK(elem != nullptr) << "Element not found: " << symbol;
    if (aromatic) {
      table.add(absl::AsciiStrToLower(symbol), elem);
    } else {
      table.add(symbol, elem);
    }
  }
  return table;
}

x3::symbols<const Element *> all_elements() {
  x3::symbols<const Element *> table;
  for (const Element &e: kPt)
    table.add(e.symbol(), &e);
  table.add("*", &kPt[0]);
  return table;
}

const x3::symbols<const Element *> organic_subset = element_table(
    { "Cl", "Br", "B", "C", "N", "O", "F", "P", "S", "I", "*" }, false);
const x3::symbols<const Element *> aromatic_subset =
    element_table({ "B", "C", "N", "O", "P", "S" }, true);
const x3::symbols<const Element *> bracket_elements = all_elements();
const x3::symbols<const Element *> bracket_aromatics =
    element_table({ "Se", "As", "B", "C", "N", "O", "P", "S" }, true);

bool is_directional(char bond) {
  return bond == '/' || bond == '\\';
}

bool is_single_like(char bond) {
  return bond == '\0' || bond == '-' || is_directional(bond);
}

constants::BondOrder bond_order(char bond) {
  switch (bond) {
  case '-':
  case '/':
  case '\\':
    return constants::kSingleBond;
  case '=':
    return constants::kDoubleBond;
  case '#':
    return constants::kTripleBond;
  case '$':
    return constants::kQuadrupleBond;
  case ':':
    return constants::kAromaticBond;
  default:
    ABSL_LOG(DFATAL) << "Unknown bond symbol: " << bond;
    return constants::kOtherBond;
  }
}

// The bond written at both ends of a ring closure must agree. Directional
// marks only combine with single bonds.
std::optional<char> resolve_ring_bond(char open, char close) {
  if (is_directional(open) || is_directional(close)) {
    if (!is_single_like(open) || !is_single_like(close))
      return std::nullopt;
    return '\0';
  }

  if (open == close || close == '\0')
    return open;
  if (open == '\0')
    return close;
  return std::nullopt;
}

bool connect(Molecule &mol, int src, int dst, char bond) {
  if (src == dst)
    return false;

  BondData data;
  if (bond == '\0' || is_directional(bond)) {
    const bool aromatic =
        mol.atom(src).is_aromatic() && mol.atom(dst).is_aromatic();
    data.order() =
        aromatic ? constants::kAromaticBond : constants::kSingleBond;
  } else {
    data.order() = bond_order(bond);
  }

  ABSL_DVLOG(3) << "bond " << src << " - " << dst << ": " << data.order();
  return mol.add_bond(src, dst, data).second;
}

template <class Ctx>
int push_atom(Ctx &ctx, const Element *elem, bool aromatic) {
  SmilesState &st = state(ctx);

  const int idx = st.mol.add_atom(AtomData(*elem));
  st.mol.atom(idx).set_aromatic(aromatic);

  if (st.pending != '.' && !connect(st.mol, st.roots.back(), idx, st.pending)) {
    ABSL_LOG(WARNING) << "Failed to add bond from " << st.roots.back()
                      << " to " << idx;
    x3::_pass(ctx) = false;
    return -1;
  }

  st.roots.back() = idx;
  st.pending = '\0';
  return idx;
}

constexpr auto organic_atom(bool aromatic) {
  return [aromatic](auto &ctx) { push_atom(ctx, x3::_attr(ctx), aromatic); };
}

constexpr auto bracket_atom(bool aromatic) {
  return [aromatic](auto &ctx) {
    const int idx = push_atom(ctx, x3::_attr(ctx), aromatic);
    if (ABSL_PREDICT_TRUE(idx >= 0))
      state(ctx).bracket_atoms.push_back(idx);
  };
}

template <class Ctx>
void set_charge(Ctx &ctx, int charge) {
  SmilesState &st = state(ctx);
  st.mol.atom(st.roots.back()).set_formal_charge(charge);
}

constexpr auto set_hydrogens = [](auto &ctx) {
  SmilesState &st = state(ctx);
  const auto &count = x3::_attr(ctx);
  st.mol.atom(st.roots.back())
      .set_implicit_hydrogens(count ? static_cast<int>(*count) : 1);
};

constexpr auto positive_charge = [](auto &ctx) {
  set_charge(ctx, static_cast<int>(x3::_attr(ctx)));
};

constexpr auto negative_charge = [](auto &ctx) {
  set_charge(ctx, -static_cast<int>(x3::_attr(ctx)));
};

constexpr auto plus_signs = [](auto &ctx) {
  set_charge(ctx, static_cast<int>(x3::_attr(ctx).size()));
};

constexpr auto minus_signs = [](auto &ctx) {
  set_charge(ctx, -static_cast<int>(x3::_attr(ctx).size()));
};

constexpr auto close_ring = [](auto &ctx) {
  using boost::fusion::at_c;

  SmilesState &st = state(ctx);
  const char bond = at_c<0>(x3::_attr(ctx)).value_or('\0');
  const int number = at_c<1>(x3::_attr(ctx));
  const int atom = st.roots.back();

  auto [it, inserted] = st.rings.insert({
      number, { bond, atom }
  });
  if (inserted)
    return;

  std::optional<char> resolved = resolve_ring_bond(it->second.bond, bond);
  if (!resolved) {
    ABSL_LOG(WARNING) << "Conflicting bonds for ring closure " << number
                      << ": '" << it->second.bond << "' vs '" << bond << "'";
    x3::_pass(ctx) = false;
    return;
  }

  if (!connect(st.mol, it->second.atom, atom, *resolved)) {
    ABSL_LOG(WARNING) << "Failed to close ring " << number << " between "
                      << it->second.atom << " and " << atom;
    x3::_pass(ctx) = false;
    return;
  }

  st.rings.erase(it);
};

constexpr auto set_pending = [](auto &ctx) {
  state(ctx).pending = x3::_attr(ctx);
};

constexpr auto open_branch = [](auto &ctx) {
  SmilesState &st = state(ctx);
  st.roots.push_back(st.roots.back());
};

constexpr auto close_branch = [](auto &ctx) {
  SmilesState &st = state(ctx);
  st.roots.pop_back();
  st.pending = '\0';
};

const auto bond_char = x3::char_("-=#$:/\\");

const auto hydrogen_count =
    (x3::lit('H') >> -x3::uint_parser<unsigned, 10, 1, 1>())[set_hydrogens];

const auto charge = (x3::lit('+') >> x3::uint_)[positive_charge]
                    | (x3::lit('-') >> x3::uint_)[negative_charge]
                    | x3::raw[+x3::lit('+')][plus_signs]
                    | x3::raw[+x3::lit('-')][minus_signs];

const auto bracket =
    x3::lit('[')
    >> ((x3::omit[-x3::uint_] >> bracket_elements)[bracket_atom(false)]
        | (x3::omit[-x3::uint_] >> bracket_aromatics)[bracket_atom(true)])
    >> -(x3::lit('@') >> -x3::lit('@')) >> -hydrogen_count >> -charge
    >> -(x3::lit(':') >> x3::omit[x3::uint_]) >> x3::lit(']');

const auto atom = organic_subset[organic_atom(false)]
                  | aromatic_subset[organic_atom(true)] | bracket;

const auto ring_number = x3::uint_parser<int, 10, 1, 1>()
                         | (x3::lit('%') >> x3::uint_parser<int, 10, 2, 2>());

const auto ring_closure = (-bond_char >> ring_number)[close_ring];

const auto bond_or_dot = bond_char[set_pending] | x3::char_('.')[set_pending];

constexpr x3::rule<class chain_tag> chain = "chain";

const auto branch = x3::lit('(')[open_branch] >> -bond_or_dot >> chain
                    >> x3::lit(')')[close_branch];

const auto branched_atom = atom >> *ring_closure >> *branch;

const auto chain_def = branched_atom >> *(-bond_or_dot >> branched_atom);

BOOST_SPIRIT_DEFINE(chain)

// Smallest default valence that fits the explicit bonds
int default_valence(int atomic_number, int bond_sum) {
  switch (atomic_number) {
  case 5:
  case 7:
    return 3;
  case 6:
    return 4;
  case 8:
    return 2;
  case 15:
    return bond_sum > 3 ? 5 : 3;
  case 16:
    return bond_sum > 4 ? 6 : bond_sum > 2 ? 4 : 2;
  default:
    return 1;
  }
}

void assign_implicit_hydrogens(Molecule &mol,
                               const std::vector<int> &bracket_atoms) {
  std::vector<bool> fixed(mol.num_atoms(), false);
  for (const int i: bracket_atoms)
    fixed[i] = true;

  for (int i = 0; i < mol.num_atoms(); ++i) {
    if (fixed[i] || mol.atom(i).atomic_number() == 0)
      continue;

    const int bond_sum = mol.sum_bond_order(i, false);
    mol.atom(i).set_implicit_hydrogens(
        nonnegative(default_valence(mol.atom(i).atomic_number(), bond_sum)
                    - bond_sum));
  }
}
}  // namespace

Molecule read_smiles(std::string_view smiles) {
  Molecule mol;

  smiles = absl::StripLeadingAsciiWhitespace(smiles);
  if (smiles.empty()) {
    ABSL_LOG(WARNING) << "Empty SMILES";
    return mol;
  }

  SmilesState st { mol };
  auto it = smiles.begin();
  bool ok = x3::parse(it, smiles.end(),
                      x3::with<state_tag>(std::ref(st))[chain]);

  if (ok && it != smiles.end()
      && absl::ascii_isspace(static_cast<unsigned char>(*it)) == 0) {
    ABSL_LOG(WARNING) << "Unexpected character '" << *it << "' at position "
                      << it - smiles.begin();
    ok = false;
  }

  if (ok && !st.rings.empty()) {
    ABSL_LOG(WARNING) << st.rings.size() << " unclosed ring(s)";
    ok = false;
  }

  if (!ok) {
    ABSL_LOG(ERROR) << "Parsing failed: " << smiles;
    mol.clear();
    return mol;
  }

  assign_implicit_hydrogens(mol, st.bracket_atoms);
  return mol;
}
}  // namespace vibra
