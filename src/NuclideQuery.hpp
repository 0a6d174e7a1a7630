#pragma once

#include "BasicTypes.hpp"
#include "Identity.hpp"
#include "Nuclide.hpp"
#include "SourceDescriptor.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

class SourceRegistry;

/// @brief Source-agnostic queries returning Nuclide handles
/// @details Every method takes a source name resolved by the SourceRegistry.
///          The first query against a source loads it.
class NuclideQuery {
public:
  /// @brief Which count is held fixed in QueryRange()
  enum class Axis {
    /// @brief Isotope chain: fixed @f$ Z @f$, ranging @f$ N @f$
    Z,
    /// @brief Isotone chain: fixed @f$ N @f$, ranging @f$ Z @f$
    N,
  };
  /// @brief Source queried when none is given
  static constexpr const char* default_source = "experiment";
  /// @brief Constructs a NuclideQuery sharing a SourceRegistry
  NuclideQuery(std::shared_ptr<const SourceRegistry> registry);
  /// @brief Returns an existing nuclide
  /// @exception NotFound The source does not tabulate the nuclide
  Nuclide Resolve(
      NucleonCount Z, NucleonCount N,
      const std::string& source = default_source) const;
  /// @brief Returns an existing nuclide, or std::nullopt
  std::optional<Nuclide> Find(
      NucleonCount Z, NucleonCount N,
      const std::string& source = default_source) const;
  /// @brief Returns an existing nuclide given by symbol and mass number, e.g.
  ///        "Fe56", "Fe-56", "56Fe"
  /// @exception MalformedIdentity The string cannot be parsed
  /// @exception NotFound The source does not tabulate the nuclide
  Nuclide ResolveBySymbol(
      const std::string& symbol_and_mass,
      const std::string& source = default_source) const;
  /// @brief Returns nuclides with one count fixed and the other within
  ///        [range_min, range_max], in ascending order of the ranging count
  /// @details Nuclides absent from the source are omitted. A missing bound
  ///          leaves that end of the chain open.
  std::vector<Nuclide> QueryRange(
      Axis fixed, NucleonCount value,
      std::optional<NucleonCount> range_min = std::nullopt,
      std::optional<NucleonCount> range_max = std::nullopt,
      const std::string& source = default_source) const;
  /// @brief Returns nuclides in a rectangular region ordered by
  ///        @f$ Z @f$, then by @f$ N @f$
  std::vector<Nuclide> QueryRegion(
      NucleonCount Z_min, NucleonCount Z_max, NucleonCount N_min,
      NucleonCount N_max, const std::string& source = default_source) const;
  /// @brief Returns the existing nuclides among `identities` in input order
  std::vector<Nuclide> QueryList(
      const std::vector<Identity>& identities,
      const std::string& source = default_source) const;
  /// @brief Returns one handle per source in request order
  /// @details With no sources given, every source whose backing file exists
  ///          is compared. Handles may refer to nuclides that do not exist.
  /// @exception SourceUnavailable A requested source could not be loaded
  std::vector<Nuclide> Compare(
      NucleonCount Z, NucleonCount N,
      const std::vector<std::string>& sources = {}) const;
  /// @brief Follows the first observed ground-state decay mode from nuclide
  ///        to daughter
  /// @details The chain starts with the given nuclide and ends at a stable
  ///          nuclide, at one without a usable decay mode, or before a
  ///          daughter missing from the source.
  /// @exception NotFound The source does not tabulate the first nuclide
  std::vector<Nuclide> DecayChain(
      NucleonCount Z, NucleonCount N,
      const std::string& source = default_source) const;
  /// @brief Returns every known source in a fixed order
  std::vector<SourceDescriptor> ListSources() const;
  /// @brief Returns known sources whose backing file exists
  std::vector<SourceDescriptor> ListAvailableSources() const;

private:
  // Returns the first observed decay mode leading to a different nuclide
  static std::optional<Identity> NextInChain(const Nuclide& parent);
  // Loads sources on demand
  const std::shared_ptr<const SourceRegistry> registry;
};
