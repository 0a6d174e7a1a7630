#include "Nuclide.hpp"

#include "Constants.hpp"
#include "Derived.hpp"
#include "Errors.hpp"
#include "PeriodicTable.hpp"

#include <algorithm>
#include <utility>

// Nuclide

//// public

Nuclide::Nuclide(
    std::shared_ptr<const SourceRegistry::LoadedSource> source,
    const Identity& identity)
    : Z{identity.Z}, N{identity.N}, source{std::move(source)},
      record{this->source->index.Find(identity)} {}

std::string Nuclide::Symbol() const { return periodic_table::Symbol(Z); }

std::string Nuclide::Name() const { return GetIdentity().Name(); }

const std::string& Nuclide::Source() const noexcept {
  return source->descriptor.name;
}

bool Nuclide::SupportsDecay() const noexcept {
  return source->descriptor.SupportsDecay();
}

const Record& Nuclide::GetRecord() const {
  if (!record) {
    throw NotFound(
        "Nuclide \"" + Name() + "\" (Z = " + std::to_string(Z) +
        ", N = " + std::to_string(N) + ") not found in source \"" + Source() +
        "\"");
  }
  return *record;
}

std::optional<Energy> Nuclide::GetBindingEnergy() const {
  return derived::BindingEnergy(GetRecord());
}

std::optional<Energy> Nuclide::GetBindingEnergyPerNucleon() const {
  return derived::BindingEnergyPerNucleon(GetRecord());
}

std::optional<Measurement> Nuclide::GetMassExcess() const {
  return GetRecord().Get(Record::Quantity::mass_excess);
}

std::optional<Energy> Nuclide::GetNeutronSeparation() const {
  return derived::NeutronSeparation(source->index, GetRecord().identity);
}

std::optional<Energy> Nuclide::GetProtonSeparation() const {
  return derived::ProtonSeparation(source->index, GetRecord().identity);
}

std::optional<Energy> Nuclide::GetTwoNeutronSeparation() const {
  return derived::TwoNeutronSeparation(source->index, GetRecord().identity);
}

std::optional<Energy> Nuclide::GetTwoProtonSeparation() const {
  return derived::TwoProtonSeparation(source->index, GetRecord().identity);
}

std::optional<Energy> Nuclide::GetAlphaQ() const {
  return derived::AlphaQ(source->index, GetRecord().identity);
}

std::optional<Energy> Nuclide::GetBetaMinusQ() const {
  return derived::BetaMinusQ(source->index, GetRecord().identity);
}

std::optional<Energy> Nuclide::GetElectronCaptureQ() const {
  return derived::ElectronCaptureQ(source->index, GetRecord().identity);
}

std::optional<Measurement>
Nuclide::GetTabulated(Record::Quantity quantity) const {
  return GetRecord().Get(quantity);
}

std::optional<Measurement>
Nuclide::GetExcitationEnergy(Record::ExcitedState state) const {
  return GetRecord().Get(state);
}

std::optional<Real> Nuclide::GetFourPlusOverTwoPlus() const {
  return derived::FourPlusOverTwoPlus(GetRecord());
}

std::optional<HalfLife> Nuclide::GetHalfLife() const {
  const auto& r = GetRecord();
  if (!SupportsDecay()) {
    return std::nullopt;
  }
  const auto ground_state = r.GetGroundState();
  return ground_state ? ground_state->half_life : HalfLife::Unknown();
}

std::optional<std::string> Nuclide::GetSpinParity() const {
  const auto ground_state = GetGroundState();
  if (!ground_state) {
    return std::nullopt;
  }
  return ground_state->spin_parity;
}

std::vector<DecayMode> Nuclide::GetDecayModes() const {
  const auto ground_state = GetGroundState();
  if (!ground_state) {
    return {};
  }
  return ground_state->observed_decay_modes;
}

std::vector<DecayMode> Nuclide::GetPredictedDecayModes() const {
  const auto ground_state = GetGroundState();
  if (!ground_state) {
    return {};
  }
  return ground_state->predicted_decay_modes;
}

bool Nuclide::IsStable() const {
  const auto half_life = GetHalfLife();
  return half_life && half_life->GetKind() == HalfLife::Kind::stable;
}

std::optional<Measurement>
Nuclide::GetFissionYield(Record::FissionYield yield) const {
  return GetRecord().Get(yield);
}

std::vector<std::string> Nuclide::GetMagicNumbers() const {
  std::vector<std::string> tags;
  const auto is_magic = [](NucleonCount count) {
    return std::find(
               constants::magic_numbers.cbegin(),
               constants::magic_numbers.cend(),
               count) != constants::magic_numbers.cend();
  };
  if (is_magic(Z)) {
    tags.push_back("Z=" + std::to_string(Z));
  }
  if (is_magic(N)) {
    tags.push_back("N=" + std::to_string(N));
  }
  return tags;
}

//// private

const Level* Nuclide::GetGroundState() const {
  const auto& r = GetRecord();
  if (!SupportsDecay()) {
    return nullptr;
  }
  return r.GetGroundState();
}
