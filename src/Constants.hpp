#pragma once

#include "BasicTypes.hpp"

#include <array>

namespace constants {
/// @brief Number of keV in one MeV. The experimental export stores energies
///        in keV.
constexpr Real keV_per_MeV = 1000;
/// @brief Total binding energy of @f$ ^{4}\mathrm{He} @f$ in MeV (AME2020)
/// @details Used for every source when computing @f$ Q_{\alpha} @f$ since
///          theoretical tables seldom tabulate the alpha particle itself.
constexpr Energy alpha_binding_energy = 28.295674;
/// @brief Neutron mass minus hydrogen atom mass in MeV (AME2020)
/// @details @f$ Q_{\beta^-} = \Delta m + B(Z + 1, N - 1) - B(Z, N) @f$ and
///          @f$ Q_{EC} = -\Delta m + B(Z - 1, N + 1) - B(Z, N) @f$ when
///          written in terms of atomic binding energies.
constexpr Energy neutron_hydrogen_mass_difference = 0.78234697;
/// @brief Token marking a cell that the nuclear model did not compute
constexpr const char* no_data_token = "No_Data";
/// @brief Minimum number of whitespace-separated columns in a theoretical
///        table row: symbol, Z, N, A, BE, Sp, S2p, Sn, S2n, Q_alpha
constexpr size_t theoretical_columns = 10;
/// @brief Proton and neutron magic numbers
constexpr std::array<NucleonCount, 7> magic_numbers{2, 8, 20, 28, 50, 82, 126};
/// @brief Longest decay chain followed before giving up. Every physical chain
///        ends long before this.
constexpr size_t decay_chain_limit = 64;
/// @brief Seconds in one Julian year
constexpr Seconds julian_year = 31557600;
} // namespace constants
