#pragma once

#include "SourceLoader.hpp"

#include <optional>
#include <string>
#include <vector>

/// @brief Reads a whitespace-delimited table computed by one nuclear energy
///        density functional model
/// @details Every model shares one layout. The first line is a header. Each
///          following row holds, in order:
///
///          | column | content                        |
///          |--------|--------------------------------|
///          | 0      | element symbol                 |
///          | 1      | @f$ Z @f$                      |
///          | 2      | @f$ N @f$                      |
///          | 3      | @f$ A @f$                      |
///          | 4      | binding energy (MeV, negative) |
///          | 5      | @f$ S_p @f$ (MeV)              |
///          | 6      | @f$ S_{2p} @f$ (MeV)           |
///          | 7      | @f$ S_n @f$ (MeV)              |
///          | 8      | @f$ S_{2n} @f$ (MeV)           |
///          | 9      | @f$ Q_{\alpha} @f$ (MeV)       |
///
///          Further columns are model-specific and ignored. A cell holding
///          `No_Data` or any other non-numeric token is absent, never zero.
class TheoreticalLoader : public SourceLoader {
public:
  /// @brief Constructs a TheoreticalLoader for a descriptor
  TheoreticalLoader(const SourceDescriptor& descriptor);

private:
  // Rows with too few columns or unreadable Z, N, A are skipped
  Result Parse(std::istream& is) const final;
  // Returns a Record for one row split into tokens, or std::nullopt if the
  // row is malformed
  std::optional<Record> ParseRow(const std::vector<std::string>& tokens) const;
  // Returns the integer in a token, or std::nullopt if it is not an integer
  static std::optional<NucleonCount> ParseCount(const std::string& token);
  // Returns the number in a token, or std::nullopt for the no-data token,
  // non-numeric tokens, and non-finite values
  static std::optional<Real> ParseCell(const std::string& token);
};
