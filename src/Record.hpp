#pragma once

#include "BasicTypes.hpp"
#include "HalfLife.hpp"
#include "Identity.hpp"
#include "Measurement.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

/// @brief One decay mode of a level with its branching ratio
struct DecayMode {
  /// @brief Returns the nuclide reached from `parent` by this decay mode
  /// @details Returns std::nullopt for modes that do not lead to a single
  ///          daughter (e.g. spontaneous fission), for unrecognized modes, and
  ///          when the daughter would have a negative proton or neutron number.
  std::optional<Identity> Daughter(const Identity& parent) const;
  /// @brief Mode as written in the experimental export, e.g. "B-", "EC", "A"
  std::string mode;
  /// @brief Branching ratio, usually in percent
  std::optional<Measurement> branching;
};

/// @brief One nuclear level from the experimental export
struct Level {
  /// @brief Excitation energy in MeV; zero for the ground state
  Measurement energy;
  /// @brief Mass excess in MeV
  std::optional<Measurement> mass_excess;
  /// @brief Spin and parity, e.g. "0+", "(3/2-)"
  std::optional<std::string> spin_parity;
  /// @brief Half-life of the level
  HalfLife half_life{HalfLife::Unknown()};
  /// @brief Observed decay modes in the order the export lists them
  std::vector<DecayMode> observed_decay_modes;
  /// @brief Predicted but unobserved decay modes
  std::vector<DecayMode> predicted_decay_modes;
};

/// @brief Everything one source knows about one nuclide
/// @details Records are built once by a SourceLoader and are only handed out
///          by const reference afterwards. Which fields are present depends on
///          the source: callers must not assume a field present in one source
///          is present in another.
struct Record {
  /// @brief Quantities a source may tabulate directly
  enum class Quantity {
    binding_energy,
    mass_excess,
    neutron_separation,
    proton_separation,
    two_neutron_separation,
    two_proton_separation,
    alpha_q,
    alpha_q_difference,
    beta_minus_q,
    electron_capture_q,
    positron_emission_q,
    beta_minus_one_neutron_q,
    beta_minus_two_neutron_q,
    electron_capture_one_proton_q,
    double_beta_minus_q,
    double_electron_capture_q,
    pairing_gap,
    /// Quadrupole deformation @f$ \beta_2 @f$, dimensionless
    quadrupole_deformation,
  };
  /// @brief Low-lying excited states whose energies may be tabulated
  enum class ExcitedState {
    first,
    first_two_plus,
    first_four_plus,
    first_three_minus,
  };
  /// @brief Fission product yields for the parents in the experimental export
  enum class FissionYield {
    independent_U235,
    independent_U238,
    independent_Pu239,
    independent_Cf252,
    cumulative_U235,
    cumulative_U238,
    cumulative_Pu239,
    cumulative_Cf252,
  };
  /// @brief Mass number @f$ A = Z + N @f$
  NucleonCount A() const noexcept { return identity.A(); }
  /// @brief Element symbol derived from @f$ Z @f$
  std::string Symbol() const;
  /// @brief Formatted name, e.g. "Fe-56"
  std::string Name() const;
  /// @brief Returns a tabulated quantity, if the source provides it
  std::optional<Measurement> Get(Quantity q) const;
  /// @brief Returns a tabulated excitation energy in MeV, if present
  std::optional<Measurement> Get(ExcitedState s) const;
  /// @brief Returns a fission yield, if present
  std::optional<Measurement> Get(FissionYield y) const;
  /// @brief Returns the ground state level, if any level is known
  /// @details The ground state is the level with zero excitation energy, or
  ///          the first level if none is exactly zero.
  const Level* GetGroundState() const noexcept;
  /// @brief Proton and neutron numbers
  Identity identity;
  /// @brief Name of the source that produced this Record
  std::string source;
  /// @brief Tabulated energetics and decay Q-values in MeV, deformation
  ///        without unit
  std::map<Quantity, Measurement> quantities;
  /// @brief Tabulated excitation energies in MeV
  std::map<ExcitedState, Measurement> excited_states;
  /// @brief Fission yields (experimental source only)
  std::map<FissionYield, Measurement> fission_yields;
  /// @brief All known levels (experimental source only)
  std::vector<Level> levels;
};
