#pragma once

#include "BasicTypes.hpp"
#include "Measurement.hpp"

#include <optional>
#include <string>

/// @brief Ground-state or level half-life as reported by the experimental
///        source
/// @details A half-life is either the "STABLE" sentinel, unknown (not
///          reported), or a duration Measurement. Very short-lived states are
///          sometimes reported by their width in eV, keV, or MeV instead of a
///          time unit.
class HalfLife {
public:
  /// @brief Which of the three forms a HalfLife takes
  enum class Kind {
    stable,
    unknown,
    timed,
  };
  /// @brief Returns a HalfLife marking a stable nuclide
  static HalfLife Stable() noexcept;
  /// @brief Returns a HalfLife marking an unreported half-life
  static HalfLife Unknown() noexcept;
  /// @brief Constructs a timed HalfLife from a duration or width Measurement
  explicit HalfLife(const Measurement& duration);
  /// @brief Returns which form this HalfLife takes
  Kind GetKind() const noexcept;
  /// @brief Returns the duration as reported. Empty unless timed.
  const std::optional<Measurement>& GetDuration() const noexcept;
  /// @brief Converts a timed HalfLife to seconds
  /// @details Widths @f$ \Gamma @f$ are converted with
  ///          @f$ T_{1/2} = \hbar \ln 2 / \Gamma @f$. Returns std::nullopt
  ///          for stable, unknown, or unrecognized units.
  std::optional<Seconds> InSeconds() const;
  /// @brief Returns "STABLE", "unknown", or value and unit, e.g. "2.744 y"
  std::string to_string() const;

private:
  // Private so that Kind and duration cannot disagree
  HalfLife(Kind kind, std::optional<Measurement> duration) noexcept;
  Kind kind;
  std::optional<Measurement> duration;
};
