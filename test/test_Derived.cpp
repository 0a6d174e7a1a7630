#include "Derived.hpp"
#include "Index.hpp"
#include "Record.hpp"
#include "catch2/catch.hpp"

namespace {
Record MakeRecord(NucleonCount Z, NucleonCount N, std::optional<Real> BE) {
  Record record{Identity{Z, N}, "test"};
  if (BE) {
    record.quantities.emplace(
        Record::Quantity::binding_energy,
        Measurement{BE.value(), std::nullopt, "MeV"});
  }
  return record;
}
} // namespace

TEST_CASE("binding energy per nucleon") {
  REQUIRE(
      derived::BindingEnergyPerNucleon(MakeRecord(26, 30, 492.26)).value() ==
      Approx(492.26 / 56));
  REQUIRE_FALSE(derived::BindingEnergyPerNucleon(MakeRecord(26, 30, {})));
  REQUIRE_FALSE(derived::BindingEnergyPerNucleon(MakeRecord(0, 0, 0.0)));
}

TEST_CASE("separation energies from neighboring binding energies") {
  const Index index{std::vector<Record>{
      MakeRecord(20, 26, 398.77),
      MakeRecord(20, 27, 404.91),
      MakeRecord(20, 28, 416.00),
      MakeRecord(19, 28, 400.20),
      MakeRecord(18, 28, 382.50),
      MakeRecord(20, 30, {}),
      MakeRecord(20, 31, 440.00),
  }};
  const Identity ca48{20, 28};
  REQUIRE(
      derived::NeutronSeparation(index, ca48).value() ==
      Approx(416.00 - 404.91));
  REQUIRE(
      derived::TwoNeutronSeparation(index, ca48).value() ==
      Approx(416.00 - 398.77));
  REQUIRE(
      derived::ProtonSeparation(index, ca48).value() ==
      Approx(416.00 - 400.20));
  REQUIRE(
      derived::TwoProtonSeparation(index, ca48).value() ==
      Approx(416.00 - 382.50));
  REQUIRE(
      derived::TwoNeutronSeparation(index, ca48).value() ==
      Approx(
          derived::NeutronSeparation(index, ca48).value() +
          derived::NeutronSeparation(index, Identity{20, 27}).value()));
  SECTION("missing neighbors and missing binding energies give absent values") {
    // Ca-45 is absent
    REQUIRE_FALSE(derived::NeutronSeparation(index, Identity{20, 26}));
    // Ca-50 has no binding energy
    REQUIRE_FALSE(derived::NeutronSeparation(index, Identity{20, 31}));
    REQUIRE_FALSE(derived::NeutronSeparation(index, Identity{20, 30}));
    // Ca-49 itself is absent
    REQUIRE_FALSE(derived::NeutronSeparation(index, Identity{20, 29}));
    // no nucleus with a negative neutron number
    REQUIRE_FALSE(derived::NeutronSeparation(index, Identity{1, 0}));
  }
}

TEST_CASE("zero is a value, not an absent marker") {
  const Index index{
      std::vector<Record>{MakeRecord(2, 1, 7.718), MakeRecord(2, 2, 7.718)}};
  const auto Sn = derived::NeutronSeparation(index, Identity{2, 2});
  REQUIRE(Sn.has_value());
  REQUIRE(Sn.value() == 0);
}

TEST_CASE("decay Q-values") {
  const Index index{std::vector<Record>{
      MakeRecord(24, 28, 456.351428),
      MakeRecord(25, 31, 489.346816),
      MakeRecord(26, 30, 492.259936),
      MakeRecord(27, 29, 486.910816),
  }};
  const Identity fe56{26, 30};
  REQUIRE(
      derived::AlphaQ(index, fe56).value() ==
      Approx(456.351428 + 28.295674 - 492.259936));
  REQUIRE(
      derived::BetaMinusQ(index, Identity{25, 31}).value() ==
      Approx(0.78234697 + 492.259936 - 489.346816));
  REQUIRE(
      derived::ElectronCaptureQ(index, Identity{27, 29}).value() ==
      Approx(-0.78234697 + 492.259936 - 486.910816));
  // daughters absent from the source
  REQUIRE_FALSE(derived::BetaMinusQ(index, Identity{27, 29}));
  REQUIRE_FALSE(derived::ElectronCaptureQ(index, Identity{25, 31}));
  REQUIRE_FALSE(derived::AlphaQ(index, Identity{25, 31}));
}

TEST_CASE("ratio of first 4+ and 2+ excitation energies") {
  auto record = MakeRecord(26, 30, 492.26);
  REQUIRE_FALSE(derived::FourPlusOverTwoPlus(record));
  record.excited_states.emplace(
      Record::ExcitedState::first_two_plus,
      Measurement{0.846778, std::nullopt, "MeV"});
  REQUIRE_FALSE(derived::FourPlusOverTwoPlus(record));
  record.excited_states.emplace(
      Record::ExcitedState::first_four_plus,
      Measurement{2.0851, std::nullopt, "MeV"});
  REQUIRE(
      derived::FourPlusOverTwoPlus(record).value() ==
      Approx(2.0851 / 0.846778));
}
