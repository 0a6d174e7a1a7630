#include "Derived.hpp"

#include "Constants.hpp"
#include "Index.hpp"
#include "Record.hpp"

namespace {
// Returns B(Z, N) - B(Z + dZ, N + dN). Absent if either nuclide or its
// binding energy is absent.
std::optional<Energy> Difference(
    const Index& index, const Identity& minuend, NucleonCount dZ,
    NucleonCount dN) {
  const auto subtrahend = minuend.Offset(dZ, dN);
  if (!subtrahend) {
    return std::nullopt;
  }
  const auto B_minuend = derived::BindingEnergy(index, minuend);
  const auto B_subtrahend = derived::BindingEnergy(index, subtrahend.value());
  if (!B_minuend || !B_subtrahend) {
    return std::nullopt;
  }
  return B_minuend.value() - B_subtrahend.value();
}
} // namespace

std::optional<Energy> derived::BindingEnergy(const Record& record) {
  const auto BE = record.Get(Record::Quantity::binding_energy);
  if (!BE) {
    return std::nullopt;
  }
  return BE->value;
}

std::optional<Energy>
derived::BindingEnergy(const Index& index, const Identity& identity) {
  const auto record = index.Find(identity);
  if (!record) {
    return std::nullopt;
  }
  return BindingEnergy(*record);
}

std::optional<Energy> derived::BindingEnergyPerNucleon(const Record& record) {
  const auto BE = BindingEnergy(record);
  if (!BE || record.A() == 0) {
    return std::nullopt;
  }
  return BE.value() / record.A();
}

std::optional<Energy>
derived::NeutronSeparation(const Index& index, const Identity& identity) {
  return Difference(index, identity, 0, -1);
}

std::optional<Energy>
derived::ProtonSeparation(const Index& index, const Identity& identity) {
  return Difference(index, identity, -1, 0);
}

std::optional<Energy>
derived::TwoNeutronSeparation(const Index& index, const Identity& identity) {
  return Difference(index, identity, 0, -2);
}

std::optional<Energy>
derived::TwoProtonSeparation(const Index& index, const Identity& identity) {
  return Difference(index, identity, -2, 0);
}

std::optional<Energy>
derived::AlphaQ(const Index& index, const Identity& identity) {
  // B(daughter) - B(parent) is the negated parent-minus-daughter difference
  const auto difference = Difference(index, identity, -2, -2);
  if (!difference) {
    return std::nullopt;
  }
  return constants::alpha_binding_energy - difference.value();
}

std::optional<Energy>
derived::BetaMinusQ(const Index& index, const Identity& identity) {
  const auto difference = Difference(index, identity, 1, -1);
  if (!difference) {
    return std::nullopt;
  }
  return constants::neutron_hydrogen_mass_difference - difference.value();
}

std::optional<Energy>
derived::ElectronCaptureQ(const Index& index, const Identity& identity) {
  const auto difference = Difference(index, identity, -1, 1);
  if (!difference) {
    return std::nullopt;
  }
  return -constants::neutron_hydrogen_mass_difference - difference.value();
}

std::optional<Real> derived::FourPlusOverTwoPlus(const Record& record) {
  const auto E2 = record.Get(Record::ExcitedState::first_two_plus);
  const auto E4 = record.Get(Record::ExcitedState::first_four_plus);
  if (!E2 || !E4 || E2->value == 0) {
    return std::nullopt;
  }
  return E4->value / E2->value;
}
