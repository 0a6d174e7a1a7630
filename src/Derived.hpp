#pragma once

#include "BasicTypes.hpp"
#include "Identity.hpp"

#include <optional>

class Index;
struct Record;

/// @brief Quantities computed uniformly from binding energies, whatever the
///        source
/// @details Every function returns std::nullopt when an input is absent or a
///          neighboring nuclide is missing from the Index. A computed zero is
///          a value like any other. All energies are in MeV.
namespace derived {
/// @brief Total binding energy @f$ B(Z, N) @f$ of a Record
std::optional<Energy> BindingEnergy(const Record& record);
/// @brief Total binding energy of the nuclide with a given identity
std::optional<Energy> BindingEnergy(const Index& index, const Identity& identity);
/// @brief Binding energy per nucleon @f$ B / A @f$. Absent if @f$ A = 0 @f$.
std::optional<Energy> BindingEnergyPerNucleon(const Record& record);
/// @brief @f$ S_n = B(Z, N) - B(Z, N - 1) @f$
std::optional<Energy>
NeutronSeparation(const Index& index, const Identity& identity);
/// @brief @f$ S_p = B(Z, N) - B(Z - 1, N) @f$
std::optional<Energy>
ProtonSeparation(const Index& index, const Identity& identity);
/// @brief @f$ S_{2n} = B(Z, N) - B(Z, N - 2) @f$
std::optional<Energy>
TwoNeutronSeparation(const Index& index, const Identity& identity);
/// @brief @f$ S_{2p} = B(Z, N) - B(Z - 2, N) @f$
std::optional<Energy>
TwoProtonSeparation(const Index& index, const Identity& identity);
/// @brief @f$ Q_{\alpha} = B(Z - 2, N - 2) + B(^{4}\mathrm{He}) - B(Z, N) @f$
std::optional<Energy> AlphaQ(const Index& index, const Identity& identity);
/// @brief @f$ Q_{\beta^-} = \Delta m + B(Z + 1, N - 1) - B(Z, N) @f$ where
///        @f$ \Delta m @f$ is the neutron-hydrogen mass difference
std::optional<Energy> BetaMinusQ(const Index& index, const Identity& identity);
/// @brief @f$ Q_{EC} = -\Delta m + B(Z - 1, N + 1) - B(Z, N) @f$
std::optional<Energy>
ElectronCaptureQ(const Index& index, const Identity& identity);
/// @brief Ratio @f$ E(4^+_1) / E(2^+_1) @f$ of a Record
std::optional<Real> FourPlusOverTwoPlus(const Record& record);
} // namespace derived
