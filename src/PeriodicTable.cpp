#include "PeriodicTable.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <iterator>

namespace {
// Index is the proton number
constexpr std::array<const char*, periodic_table::max_Z + 1> symbols{
    "n",  "H",  "He", "Li", "Be", "B",  "C",  "N",  "O",  "F",  "Ne", "Na",
    "Mg", "Al", "Si", "P",  "S",  "Cl", "Ar", "K",  "Ca", "Sc", "Ti", "V",
    "Cr", "Mn", "Fe", "Co", "Ni", "Cu", "Zn", "Ga", "Ge", "As", "Se", "Br",
    "Kr", "Rb", "Sr", "Y",  "Zr", "Nb", "Mo", "Tc", "Ru", "Rh", "Pd", "Ag",
    "Cd", "In", "Sn", "Sb", "Te", "I",  "Xe", "Cs", "Ba", "La", "Ce", "Pr",
    "Nd", "Pm", "Sm", "Eu", "Gd", "Tb", "Dy", "Ho", "Er", "Tm", "Yb", "Lu",
    "Hf", "Ta", "W",  "Re", "Os", "Ir", "Pt", "Au", "Hg", "Tl", "Pb", "Bi",
    "Po", "At", "Rn", "Fr", "Ra", "Ac", "Th", "Pa", "U",  "Np", "Pu", "Am",
    "Cm", "Bk", "Cf", "Es", "Fm", "Md", "No", "Lr", "Rf", "Db", "Sg", "Bh",
    "Hs", "Mt", "Ds", "Rg", "Cn", "Nh", "Fl", "Mc", "Lv", "Ts", "Og"};

std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}
} // namespace

std::string periodic_table::Symbol(NucleonCount Z) {
  if (Z < 0 || Z > max_Z) {
    return "X" + std::to_string(Z);
  }
  return symbols[static_cast<size_t>(Z)];
}

std::optional<NucleonCount>
periodic_table::AtomicNumber(const std::string& symbol) {
  const auto lowered = ToLower(symbol);
  // the free neutron is not addressable by symbol, "n" would shadow nitrogen
  const auto symbol_it = std::find_if(
      std::next(symbols.cbegin()), symbols.cend(),
      [&lowered](const char* s) { return ToLower(s) == lowered; });
  if (symbol_it == symbols.cend()) {
    return std::nullopt;
  }
  return static_cast<NucleonCount>(std::distance(symbols.cbegin(), symbol_it));
}
