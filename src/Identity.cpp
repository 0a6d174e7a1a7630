#include "Identity.hpp"

#include "Errors.hpp"
#include "PeriodicTable.hpp"

#include <algorithm>
#include <cctype>
#include <string>

// Identity

//// public

Identity Identity::Parse(const std::string& symbol_and_mass) {
  // strip surrounding whitespace
  const auto first = symbol_and_mass.find_first_not_of(" \t\r\n");
  const auto last = symbol_and_mass.find_last_not_of(" \t\r\n");
  const std::string s{
      first == std::string::npos
          ? std::string{}
          : symbol_and_mass.substr(first, last - first + 1)};
  const auto is_alpha = [](unsigned char c) { return std::isalpha(c) != 0; };
  const auto is_digit = [](unsigned char c) { return std::isdigit(c) != 0; };
  // accept "Fe56", "Fe-56", "56Fe", and "56-Fe"
  std::string symbol;
  std::string mass;
  if (!s.empty() && is_alpha(s.front())) {
    const auto symbol_end = std::find_if_not(s.cbegin(), s.cend(), is_alpha);
    symbol.assign(s.cbegin(), symbol_end);
    auto mass_begin = symbol_end;
    if (mass_begin != s.cend() && *mass_begin == '-') {
      mass_begin++;
    }
    mass.assign(mass_begin, s.cend());
  }
  else {
    const auto mass_end = std::find_if_not(s.cbegin(), s.cend(), is_digit);
    mass.assign(s.cbegin(), mass_end);
    auto symbol_begin = mass_end;
    if (symbol_begin != s.cend() && *symbol_begin == '-') {
      symbol_begin++;
    }
    symbol.assign(symbol_begin, s.cend());
  }
  if (symbol.empty() || !std::all_of(symbol.cbegin(), symbol.cend(), is_alpha)) {
    throw MalformedIdentity(
        "Cannot parse \"" + symbol_and_mass +
        "\": expected element symbol and mass number, e.g. \"Fe56\"");
  }
  if (mass.empty() || mass.size() > 3 ||
      !std::all_of(mass.cbegin(), mass.cend(), is_digit)) {
    throw MalformedIdentity(
        "Cannot parse \"" + symbol_and_mass + "\": mass number \"" + mass +
        "\" is not a number between 0 and 999");
  }
  const auto Z = periodic_table::AtomicNumber(symbol);
  if (!Z) {
    throw MalformedIdentity(
        "Cannot parse \"" + symbol_and_mass + "\": unknown element symbol \"" +
        symbol + "\"");
  }
  const NucleonCount A = std::stoi(mass);
  if (A < Z.value()) {
    throw MalformedIdentity(
        "Cannot parse \"" + symbol_and_mass + "\": mass number " +
        std::to_string(A) + " is smaller than Z = " +
        std::to_string(Z.value()));
  }
  return Identity{Z.value(), A - Z.value()};
}

std::string Identity::Name() const {
  return periodic_table::Symbol(Z) + "-" + std::to_string(A());
}

std::optional<Identity>
Identity::Offset(NucleonCount dZ, NucleonCount dN) const {
  const Identity result{Z + dZ, N + dN};
  if (!result.IsPhysical()) {
    return std::nullopt;
  }
  return result;
}
