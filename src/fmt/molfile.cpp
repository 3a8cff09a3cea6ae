//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "vibra/fmt/molfile.h"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <absl/base/optimization.h>
#include <absl/log/absl_log.h>
#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_split.h>
#include <boost/spirit/home/x3.hpp>

#include "vibra/eigen_config.h"
#include "vibra/core/element.h"
#include "vibra/core/molecule.h"
#include "vibra/utils.h"

namespace vibra {
namespace {
namespace x3 = boost::spirit::x3;

using Lines = std::vector<std::string_view>;

struct CountsLine {
  int natoms;
  int nbonds;
};

bool parse_counts_line(CountsLine &counts, std::string_view line) {
  if (absl::StrContains(line, "V3000")) {
    ABSL_LOG(WARNING) << "V3000 molfiles are not supported";
    return false;
  }

  ABSL_LOG_IF(INFO, !absl::StrContains(line, "V2000"))
      << "Counts line without version tag; assuming V2000";

  if (!absl::SimpleAtoi(safe_slice(line, 0, 3), &counts.natoms)
      || !absl::SimpleAtoi(safe_slice(line, 3, 6), &counts.nbonds)) {
    ABSL_LOG(WARNING) << "Failed to parse counts line: " << line;
    return false;
  }

  if (counts.natoms < 0 || counts.nbonds < 0) {
    ABSL_LOG(WARNING) << "Negative counts in counts line: " << line;
    return false;
  }

  return true;
}

const Element *parse_molfile_element(std::string_view symbol) {
  std::string normalized = absl::AsciiStrToLower(symbol);
  if (normalized.empty())
    return nullptr;

  normalized[0] = absl::ascii_toupper(static_cast<unsigned char>(normalized[0]));

  // Deuterium and tritium
  if (normalized == "D" || normalized == "T")
    return &kPt[1];

  return kPt.find_element(normalized);
}

bool parse_molfile_bond(BondData &data, unsigned int type) {
  switch (type) {
  case 1:
  case 5:
    data = BondData(constants::kSingleBond);
    break;
  case 2:
    data = BondData(constants::kDoubleBond);
    break;
  case 3:
    data = BondData(constants::kTripleBond);
    break;
  case 4:
  case 6:
  case 7:
    data = BondData(constants::kAromaticBond);
    break;
  case 8:
    data = BondData(constants::kOtherBond);
    break;
  default:
    return false;
  }

  return true;
}

// clang-format off
/*
0        1         2         3         4         5         6         7
1234567890123456789012345678901234567890123456789012345678901234567890
xxxxx.xxxxyyyyy.yyyyzzzzz.zzzz aaaddcccssshhhbbbvvvHHHrrriiimmmnnneee

aaa: symbol
dd:  mass diff
ccc: charge

(the rest are ignored)
*/
// clang-format on
bool read_atom_line(Molecule &mol, Matrix3Xd &pos, std::string_view line) {
  if (line.size() < 32) {
    ABSL_LOG(WARNING) << "Line too short for atom line: " << line;
    return false;
  }

  const int idx = mol.num_atoms();
  for (int i = 0; i < 3; ++i) {
    if (!absl::SimpleAtod(line.substr(static_cast<size_t>(i) * 10, 10),
                          &pos(i, idx))) {
      ABSL_LOG(WARNING) << "Failed to parse atom position: " << line;
      return false;
    }
  }

  const std::string_view symbol = safe_slice_strip(line, 30, 34);
  const Element *elem = parse_molfile_element(symbol);
  if (elem == nullptr) {
    ABSL_LOG(WARNING) << "Unknown element: " << symbol;
    return false;
  }

  AtomData data(*elem);

  if (int charge;
      absl::SimpleAtoi(safe_slice(line, 36, 39), &charge) && charge != 0) {
    // charge == 4 -> doublet radical, unimplemented
    if (charge >= 1 && charge <= 7 && charge != 4)
      data.set_formal_charge(4 - charge);
    else
      ABSL_LOG(WARNING) << "Ignoring unknown charge attribute: " << charge;
  }

  mol.add_atom(data);
  return true;
}

bool read_bond_line(Molecule &mol, std::string_view line) {
  if (line.size() < 9) {
    ABSL_LOG(WARNING) << "Line too short for bond line: " << line;
    return false;
  }

  unsigned int src, dst;
  if (!absl::SimpleAtoi(line.substr(0, 3), &src)
      || !absl::SimpleAtoi(line.substr(3, 3), &dst)) {
    ABSL_LOG(WARNING) << "Failed to parse bond indices: " << line;
    return false;
  }

  --src;
  --dst;
  if (src >= static_cast<unsigned int>(mol.num_atoms())
      || dst >= static_cast<unsigned int>(mol.num_atoms()) || src == dst) {
    ABSL_LOG(WARNING) << "Invalid bond indices: " << line;
    return false;
  }

  BondData data;
  unsigned int bt;
  if (!absl::SimpleAtoi(line.substr(6, 3), &bt)) {
    ABSL_LOG(WARNING) << "Failed to parse bond order: " << line;
    return false;
  }
  if (!parse_molfile_bond(data, bt)) {
    ABSL_LOG(WARNING) << "Invalid bond order: " << bt;
    return false;
  }

  auto [_, added] =
      mol.add_bond(static_cast<int>(src), static_cast<int>(dst), data);
  ABSL_LOG_IF(WARNING, !added) << "Duplicate bond " << src << " - " << dst;

  return true;
}

// NOLINTBEGIN(readability-identifier-naming)
namespace parser {
constexpr auto property_values =  //
    *x3::omit[x3::blank] >> x3::int_ % +x3::blank
    >> x3::omit[*x3::space | x3::eoi];
}  // namespace parser
// NOLINTEND(readability-identifier-naming)

bool read_chg(Molecule &mol, std::string_view line) {
  // "M  CHGnn8 aaa vvv ..."
  unsigned int count = 0;
  if (!absl::SimpleAtoi(safe_slice(line, 6, 9), &count)) {
    ABSL_LOG(WARNING) << "Failed to parse charge count: " << line;
    return false;
  }

  std::string_view value_data = safe_slice(line, 9, line.size());
  std::vector<int> values;
  if (!x3::parse(value_data.begin(), value_data.end(), parser::property_values,
                 values)) {
    ABSL_LOG(WARNING) << "Failed to parse data: " << line;
    return false;
  }

  if (values.size() != static_cast<size_t>(count) * 2) {
    ABSL_LOG(WARNING) << "Inconsistent element count: " << line;
    return false;
  }

  for (size_t i = 0; i + 1 < values.size(); i += 2) {
    const unsigned int atom = values[i] - 1;
    if (atom >= static_cast<unsigned int>(mol.num_atoms())) {
      ABSL_LOG(WARNING) << "Atom index out of range: " << values[i];
      return false;
    }
    mol.atom(static_cast<int>(atom)).set_formal_charge(values[i + 1]);
  }

  return true;
}

bool read_properties(Molecule &mol, Lines::const_iterator it,
                     const Lines::const_iterator end) {
  bool charges_reset = false;

  for (; it != end; ++it) {
    std::string_view line = *it;
    if (absl::StartsWith(line, "M  END"))
      return true;

    if (absl::StartsWith(line, "M  CHG")) {
      // Any CHG line supersedes all charges in the atom block
      if (!charges_reset) {
        for (int i = 0; i < mol.num_atoms(); ++i)
          mol.atom(i).set_formal_charge(0);
        charges_reset = true;
      }

      if (!read_chg(mol, line))
        return false;
    } else if (absl::StartsWith(line, "M  ")) {
      ABSL_LOG(INFO) << "Unimplemented property line: " << line;
    } else if (!line.empty()) {
      ABSL_LOG(INFO) << "Skipping line: " << line;
    }
  }

  ABSL_LOG(WARNING) << "Missing M  END line";
  return true;
}
}  // namespace

Molecule read_molfile(std::string_view block) {
  Molecule mol;

  Lines lines = absl::StrSplit(block, '\n');
  for (std::string_view &line: lines)
    line = absl::StripTrailingAsciiWhitespace(line);

  if (lines.size() < 4) {
    ABSL_LOG(WARNING) << "Molfile too short: " << lines.size() << " lines";
    return mol;
  }

  CountsLine counts;
  if (!parse_counts_line(counts, lines[3]))
    return mol;

  if (lines.size() < 4 + static_cast<size_t>(counts.natoms) + counts.nbonds) {
    ABSL_LOG(WARNING) << "Molfile truncated: expected " << counts.natoms
                      << " atoms and " << counts.nbonds << " bonds";
    return mol;
  }

  mol.reserve(counts.natoms);
  Matrix3Xd pos(3, counts.natoms);

  auto it = lines.cbegin() + 4;
  for (int i = 0; i < counts.natoms; ++i, ++it) {
    if (!read_atom_line(mol, pos, *it)) {
      ABSL_LOG(ERROR) << "Failed to read atom block";
      mol.clear();
      return mol;
    }
  }

  for (int i = 0; i < counts.nbonds; ++i, ++it) {
    if (!read_bond_line(mol, *it)) {
      ABSL_LOG(ERROR) << "Failed to read bond block";
      mol.clear();
      return mol;
    }
  }

  if (!read_properties(mol, it, lines.cend())) {
    ABSL_LOG(ERROR) << "Failed to read property block";
    mol.clear();
    return mol;
  }

  if (!mol.empty())
    mol.confs().push_back(std::move(pos));
  return mol;
}
}  // namespace vibra
