#pragma once

#include "SourceLoader.hpp"

/// @brief Reads the NNDC NuDat JSON export of measured data
/// @details The export is one JSON object keyed by nuclide name (e.g.
///          "56Fe"). Each entry carries `z`, `n`, and `a`, energetics in
///          keV as `{"value", "uncertainty", "unit"}` objects, a list of
///          `levels` with half-lives and decay modes, and optional fission
///          yields. Energies are converted to MeV. `bindingEnergy` in the
///          export is per nucleon; the Record stores the total.
class ExperimentalLoader : public SourceLoader {
public:
  /// @brief Constructs an ExperimentalLoader for a descriptor
  ExperimentalLoader(const SourceDescriptor& descriptor);

private:
  // Entries whose identity cannot be read are skipped with a warning
  Result Parse(std::istream& is) const final;
};
