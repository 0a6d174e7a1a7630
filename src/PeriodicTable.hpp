#pragma once

#include "BasicTypes.hpp"

#include <optional>
#include <string>

/// @brief Fixed element symbol lookup shared by every source
namespace periodic_table {
/// @brief Largest proton number with an assigned symbol
constexpr NucleonCount max_Z = 118;
/// @brief Returns the element symbol for a proton number
/// @details Z = 0 maps to "n" (free neutron). Proton numbers without an
///          assigned symbol map to "X" followed by the number.
std::string Symbol(NucleonCount Z);
/// @brief Returns the proton number for an element symbol, case-insensitive.
///        Only Z >= 1 can be found this way.
std::optional<NucleonCount> AtomicNumber(const std::string& symbol);
} // namespace periodic_table
