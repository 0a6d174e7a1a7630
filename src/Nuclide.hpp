#pragma once

#include "BasicTypes.hpp"
#include "HalfLife.hpp"
#include "Identity.hpp"
#include "Record.hpp"
#include "SourceRegistry.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

/// @brief Handle to one nuclide in one loaded source
/// @details A Nuclide may refer to an identity the source does not tabulate;
///          Exists() tells the two cases apart. Identity accessors always
///          succeed. Every data accessor throws NotFound if the nuclide does
///          not exist and otherwise returns std::nullopt for values the
///          source lacks. Derived quantities are computed on each call from
///          the binding energies of the same source.
///
///          A Nuclide shares ownership of its loaded source, so it remains
///          valid after the SourceRegistry that produced it is destroyed.
class Nuclide {
public:
  /// @brief Constructs a handle to an identity within a loaded source
  Nuclide(
      std::shared_ptr<const SourceRegistry::LoadedSource> source,
      const Identity& identity);
  /// @brief Mass number @f$ A = Z + N @f$
  NucleonCount A() const noexcept { return Z + N; }
  /// @brief Returns proton and neutron numbers
  Identity GetIdentity() const noexcept { return Identity{Z, N}; }
  /// @brief Element symbol, e.g. "Fe"
  std::string Symbol() const;
  /// @brief Formatted name, e.g. "Fe-56"
  std::string Name() const;
  /// @brief Canonical name of the source, e.g. "experiment"
  const std::string& Source() const noexcept;
  /// @brief Returns true if the source tabulates this nuclide
  bool Exists() const noexcept { return record != nullptr; }
  /// @brief Returns true if half-life, spin-parity, and decay modes are
  ///        meaningful for the source
  bool SupportsDecay() const noexcept;
  /// @brief Returns the underlying Record
  /// @exception NotFound The source does not tabulate this nuclide
  const Record& GetRecord() const;

  /// @brief Total binding energy in MeV
  std::optional<Energy> GetBindingEnergy() const;
  /// @brief Binding energy per nucleon in MeV
  std::optional<Energy> GetBindingEnergyPerNucleon() const;
  /// @brief Mass excess in MeV
  std::optional<Measurement> GetMassExcess() const;
  /// @brief @f$ S_n @f$ in MeV, derived from binding energies
  std::optional<Energy> GetNeutronSeparation() const;
  /// @brief @f$ S_p @f$ in MeV, derived from binding energies
  std::optional<Energy> GetProtonSeparation() const;
  /// @brief @f$ S_{2n} @f$ in MeV, derived from binding energies
  std::optional<Energy> GetTwoNeutronSeparation() const;
  /// @brief @f$ S_{2p} @f$ in MeV, derived from binding energies
  std::optional<Energy> GetTwoProtonSeparation() const;
  /// @brief @f$ Q_{\alpha} @f$ in MeV, derived from binding energies
  std::optional<Energy> GetAlphaQ() const;
  /// @brief @f$ Q_{\beta^-} @f$ in MeV, derived from binding energies
  std::optional<Energy> GetBetaMinusQ() const;
  /// @brief @f$ Q_{EC} @f$ in MeV, derived from binding energies
  std::optional<Energy> GetElectronCaptureQ() const;
  /// @brief Returns a quantity exactly as the source tabulates it, with its
  ///        uncertainty
  std::optional<Measurement> GetTabulated(Record::Quantity quantity) const;

  /// @brief Excitation energy of a low-lying state in MeV
  std::optional<Measurement>
  GetExcitationEnergy(Record::ExcitedState state) const;
  /// @brief @f$ E(4^+_1) / E(2^+_1) @f$
  std::optional<Real> GetFourPlusOverTwoPlus() const;

  /// @brief Ground-state half-life. Absent for sources without decay data.
  std::optional<HalfLife> GetHalfLife() const;
  /// @brief Ground-state spin and parity. Absent for sources without decay
  ///        data or when not reported.
  std::optional<std::string> GetSpinParity() const;
  /// @brief Observed ground-state decay modes in the order reported. Empty
  ///        for sources without decay data.
  std::vector<DecayMode> GetDecayModes() const;
  /// @brief Predicted but unobserved ground-state decay modes
  std::vector<DecayMode> GetPredictedDecayModes() const;
  /// @brief Returns true if the ground state is reported as stable
  bool IsStable() const;
  /// @brief Fission product yield
  std::optional<Measurement> GetFissionYield(Record::FissionYield yield) const;

  /// @brief Magic proton and neutron numbers of this nuclide, e.g.
  ///        {"Z=20", "N=28"}
  std::vector<std::string> GetMagicNumbers() const;

  /// @brief Number of protons
  const NucleonCount Z;
  /// @brief Number of neutrons
  const NucleonCount N;

private:
  // Returns the ground state of a decay-capable source, or nullptr
  const Level* GetGroundState() const;
  // Keeps the Index, and therefore Nuclide::record, alive
  std::shared_ptr<const SourceRegistry::LoadedSource> source;
  // Tabulated data, or nullptr if the source lacks this nuclide
  const Record* record;
};
