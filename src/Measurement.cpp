#include "Measurement.hpp"

#include <sstream>

// Measurement

//// public

Measurement
Measurement::Scaled(Real factor, const std::string& new_unit) const {
  Measurement result{value * factor, std::nullopt, new_unit};
  if (uncertainty) {
    result.uncertainty = uncertainty.value() * factor;
  }
  return result;
}

std::string Measurement::to_string() const {
  std::stringstream ss;
  ss << value;
  if (uncertainty) {
    ss << " +/- " << uncertainty.value();
  }
  if (!unit.empty()) {
    ss << " " << unit;
  }
  return ss.str();
}
