#include "HalfLife.hpp"

#include "Constants.hpp"

#include <cmath>
#include <map>
#include <sstream>
#include <utility>

namespace {
// Seconds per unit of time
const std::map<std::string, Seconds> time_units{
    {"ys", 1e-24},
    {"zs", 1e-21},
    {"as", 1e-18},
    {"fs", 1e-15},
    {"ps", 1e-12},
    {"ns", 1e-9},
    {"us", 1e-6},
    {"μs", 1e-6},
    {"ms", 1e-3},
    {"s", 1},
    {"m", 60},
    {"h", 3600},
    {"d", 86400},
    {"y", constants::julian_year},
    {"ky", 1e3 * constants::julian_year},
    {"My", 1e6 * constants::julian_year},
    {"Gy", 1e9 * constants::julian_year},
    {"Ty", 1e12 * constants::julian_year},
    {"Py", 1e15 * constants::julian_year},
    {"Ey", 1e18 * constants::julian_year},
    {"Zy", 1e21 * constants::julian_year},
    {"Yy", 1e24 * constants::julian_year},
};
// eV per unit of width
const std::map<std::string, Real> width_units{
    {"eV", 1},
    {"keV", 1e3},
    {"MeV", 1e6},
};
// Reduced Planck constant in eV s
constexpr Real hbar = 6.582119569e-16;
} // namespace

// HalfLife

//// public

HalfLife HalfLife::Stable() noexcept { return HalfLife{Kind::stable, {}}; }

HalfLife HalfLife::Unknown() noexcept { return HalfLife{Kind::unknown, {}}; }

HalfLife::HalfLife(const Measurement& duration)
    : kind{Kind::timed}, duration{duration} {}

HalfLife::Kind HalfLife::GetKind() const noexcept { return kind; }

const std::optional<Measurement>& HalfLife::GetDuration() const noexcept {
  return duration;
}

std::optional<Seconds> HalfLife::InSeconds() const {
  if (kind != Kind::timed) {
    return std::nullopt;
  }
  const auto& d = duration.value();
  if (const auto time_it = time_units.find(d.unit);
      time_it != time_units.cend()) {
    return d.value * time_it->second;
  }
  if (const auto width_it = width_units.find(d.unit);
      width_it != width_units.cend() && d.value > 0) {
    return hbar * std::log(2.) / (d.value * width_it->second);
  }
  return std::nullopt;
}

std::string HalfLife::to_string() const {
  switch (kind) {
  case Kind::stable:
    return "STABLE";
  case Kind::unknown:
    return "unknown";
  case Kind::timed:
    break;
  }
  std::stringstream ss;
  ss << duration->value;
  if (!duration->unit.empty()) {
    ss << " " << duration->unit;
  }
  return ss.str();
}

//// private

HalfLife::HalfLife(Kind kind, std::optional<Measurement> duration) noexcept
    : kind{kind}, duration{std::move(duration)} {}
