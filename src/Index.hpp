#pragma once

#include "BasicTypes.hpp"
#include "Record.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <unordered_map>
#include <utility>
#include <vector>

/// @brief Lookup structures over the Record objects of one source
/// @details Owns the Record objects. Point lookups go through a hash map
///          keyed on @f$ (Z, N) @f$. For each @f$ Z @f$ the present @f$ N @f$
///          are kept sorted (and symmetrically for each @f$ N @f$) so that
///          isotope and isotone chains are found without scanning the whole
///          source. An Index is never modified after construction.
class Index {
public:
  /// @brief Takes ownership of Record objects and builds lookups
  /// @details When two Record objects share an identity the first one is
  ///          kept and the later one is counted by GetDuplicates().
  Index(std::vector<Record> records);
  /// @brief Returns the Record with a given identity, or nullptr
  const Record* Find(const Identity& identity) const noexcept;
  /// @brief Returns true if a Record with a given identity exists
  bool Contains(const Identity& identity) const noexcept;
  /// @brief Returns Record objects with fixed @f$ Z @f$ and
  ///        @f$ N_{min} \leq N \leq N_{max} @f$ in ascending @f$ N @f$
  std::vector<const Record*>
  Isotopes(NucleonCount Z, NucleonCount N_min, NucleonCount N_max) const;
  /// @brief Returns Record objects with fixed @f$ N @f$ and
  ///        @f$ Z_{min} \leq Z \leq Z_{max} @f$ in ascending @f$ Z @f$
  std::vector<const Record*>
  Isotones(NucleonCount N, NucleonCount Z_min, NucleonCount Z_max) const;
  /// @brief Returns Record objects in a rectangular region ordered by
  ///        @f$ Z @f$, then by @f$ N @f$
  std::vector<const Record*> Region(
      NucleonCount Z_min, NucleonCount Z_max, NucleonCount N_min,
      NucleonCount N_max) const;
  /// @brief Returns every identity in the Index ordered by Z, then by N
  std::vector<Identity> Identities() const;
  /// @brief Returns the number of unique Record objects
  size_t size() const noexcept;
  /// @brief Returns the number of Record objects dropped because their
  ///        identity was already present
  size_t GetDuplicates() const noexcept;

private:
  // Packs (Z, N) into one hashable key
  static std::uint64_t Key(const Identity& identity) noexcept;
  // Returns the values of a sorted chain within [min, max]
  static std::pair<
      std::vector<NucleonCount>::const_iterator,
      std::vector<NucleonCount>::const_iterator>
  Within(
      const std::vector<NucleonCount>& chain, NucleonCount min,
      NucleonCount max) noexcept;
  // Owns every unique Record. Node-based so that pointers stay valid.
  std::unordered_map<std::uint64_t, Record> records;
  // Sorted N values present for each Z
  std::map<NucleonCount, std::vector<NucleonCount>> neutrons_by_Z;
  // Sorted Z values present for each N
  std::map<NucleonCount, std::vector<NucleonCount>> protons_by_N;
  // Count of Record objects dropped during construction
  size_t duplicates{0};
};
