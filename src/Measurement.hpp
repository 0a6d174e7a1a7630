#pragma once

#include "BasicTypes.hpp"

#include <optional>
#include <string>

/// @brief A value with an optional uncertainty and a unit
/// @details A missing uncertainty means the value is exact or its uncertainty
///          was not reported. It does not mean the uncertainty is zero.
struct Measurement {
  /// @brief Returns a Measurement with value and uncertainty multiplied by
  ///        `factor` and the unit replaced by `new_unit`
  Measurement Scaled(Real factor, const std::string& new_unit) const;
  /// @brief Returns the contents of Measurement as a string suitable for
  ///        printing, e.g. "8.790 +/- 0.001 MeV"
  std::string to_string() const;
  /// @brief Central value
  Real value;
  /// @brief One standard deviation, if reported
  std::optional<Real> uncertainty;
  /// @brief Unit of both value and uncertainty; empty if dimensionless
  std::string unit;
};
