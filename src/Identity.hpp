#pragma once

#include "BasicTypes.hpp"

#include <optional>
#include <string>

/// @brief Proton and neutron numbers identifying a nuclide
struct Identity {
  /// @brief Parses element symbol and mass number, e.g. "Fe56", "fe-56",
  ///        "56Fe"
  /// @exception MalformedIdentity Unknown symbol, missing or non-numeric mass
  ///            number, or a mass number smaller than @f$ Z @f$
  static Identity Parse(const std::string& symbol_and_mass);
  /// @brief Mass number @f$ A = Z + N @f$
  NucleonCount A() const noexcept { return Z + N; }
  /// @brief Element symbol followed by mass number, e.g. "Fe-56"
  std::string Name() const;
  /// @brief Returns true if neither count is negative
  bool IsPhysical() const noexcept { return Z >= 0 && N >= 0; }
  /// @brief Returns an identity offset by the given counts, or std::nullopt
  ///        if the result is not a physical nucleus
  std::optional<Identity> Offset(NucleonCount dZ, NucleonCount dN) const;
  bool operator==(const Identity& other) const noexcept {
    return Z == other.Z && N == other.N;
  }
  bool operator!=(const Identity& other) const noexcept {
    return !(*this == other);
  }
  /// @brief Orders by Z, then by N
  bool operator<(const Identity& other) const noexcept {
    return Z < other.Z || (Z == other.Z && N < other.N);
  }
  /// @brief Number of protons
  NucleonCount Z;
  /// @brief Number of neutrons
  NucleonCount N;
};
