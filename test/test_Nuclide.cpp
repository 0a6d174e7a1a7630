#include "Errors.hpp"
#include "Nuclide.hpp"
#include "SourceRegistry.hpp"
#include "catch2/catch.hpp"

#include <memory>
#include <string>
#include <vector>

namespace {
// Total binding energies in MeV from per-nucleon keV values in the export
constexpr Real BE_Fe56 = 8.790356 * 56;
constexpr Real BE_Fe55 = 8.746595 * 55;
constexpr Real BE_Fe54 = 8.736382 * 54;
constexpr Real BE_Mn55 = 8.765022 * 55;
constexpr Real BE_Cr52 = 8.775989 * 52;
constexpr Real BE_Co56 = 8.694836 * 56;
constexpr Real BE_Mn56 = 8.738336 * 56;
} // namespace

TEST_CASE("experimental nuclide properties") {
  const SourceRegistry registry{"data"};
  const Nuclide fe56{registry.GetRecords("experiment"), Identity{26, 30}};
  REQUIRE(fe56.Exists());
  REQUIRE(fe56.Z == 26);
  REQUIRE(fe56.N == 30);
  REQUIRE(fe56.A() == 56);
  REQUIRE(fe56.Symbol() == "Fe");
  REQUIRE(fe56.Name() == "Fe-56");
  REQUIRE(fe56.Source() == "experiment");
  REQUIRE(fe56.SupportsDecay());
  SECTION("energetics") {
    REQUIRE(fe56.GetBindingEnergy().value() == Approx(BE_Fe56));
    REQUIRE(fe56.GetBindingEnergyPerNucleon().value() == Approx(8.790356));
    REQUIRE(
        fe56.GetBindingEnergyPerNucleon().value() ==
        Approx(fe56.GetBindingEnergy().value() / 56));
    REQUIRE(fe56.GetMassExcess()->value == Approx(-60.6071));
    REQUIRE(fe56.GetNeutronSeparation().value() == Approx(BE_Fe56 - BE_Fe55));
    REQUIRE(fe56.GetProtonSeparation().value() == Approx(BE_Fe56 - BE_Mn55));
    REQUIRE(
        fe56.GetTwoNeutronSeparation().value() == Approx(BE_Fe56 - BE_Fe54));
    // Cr-54 is not in the export
    REQUIRE_FALSE(fe56.GetTwoProtonSeparation());
    REQUIRE(
        fe56.GetAlphaQ().value() == Approx(BE_Cr52 + 28.295674 - BE_Fe56));
    REQUIRE(
        fe56.GetBetaMinusQ().value() ==
        Approx(0.78234697 + BE_Co56 - BE_Fe56));
    REQUIRE(
        fe56.GetElectronCaptureQ().value() ==
        Approx(-0.78234697 + BE_Mn56 - BE_Fe56));
    // tabulated and derived values agree to the precision of the export
    REQUIRE(
        fe56.GetTabulated(Record::Quantity::neutron_separation)->value ==
        Approx(fe56.GetNeutronSeparation().value()).margin(1e-3));
    REQUIRE_FALSE(fe56.GetTabulated(Record::Quantity::beta_minus_q));
  }
  SECTION("excited states") {
    REQUIRE(
        fe56.GetExcitationEnergy(Record::ExcitedState::first_two_plus)->value ==
        Approx(0.846778));
    REQUIRE(
        fe56.GetExcitationEnergy(Record::ExcitedState::first)->value ==
        Approx(0.846778));
    REQUIRE(fe56.GetFourPlusOverTwoPlus().value() == Approx(2.0851 / 0.846778));
  }
  SECTION("decay properties") {
    REQUIRE(fe56.IsStable());
    REQUIRE(fe56.GetHalfLife()->to_string() == "STABLE");
    REQUIRE(fe56.GetSpinParity() == "0+");
    REQUIRE(fe56.GetDecayModes().empty());
    REQUIRE(fe56.GetMagicNumbers().empty());
  }
}

TEST_CASE("radioactive nuclide properties") {
  const SourceRegistry registry{"data"};
  const Nuclide cs137{registry.GetRecords("exp"), Identity{55, 82}};
  REQUIRE_FALSE(cs137.IsStable());
  const auto half_life = cs137.GetHalfLife().value();
  REQUIRE(half_life.GetKind() == HalfLife::Kind::timed);
  REQUIRE(half_life.InSeconds().value() == Approx(30.04 * 31557600));
  REQUIRE(cs137.GetSpinParity() == "7/2+");
  const auto modes = cs137.GetDecayModes();
  REQUIRE(modes.size() == 1);
  REQUIRE(modes.front().mode == "B-");
  REQUIRE(modes.front().Daughter(cs137.GetIdentity()) == Identity{56, 81});
  REQUIRE(
      cs137.GetFissionYield(Record::FissionYield::independent_U235)->value ==
      Approx(0.0621));
  REQUIRE_FALSE(cs137.GetFissionYield(Record::FissionYield::cumulative_Cf252));
  REQUIRE(cs137.GetMagicNumbers() == std::vector<std::string>{"N=82"});
  REQUIRE(
      cs137.GetTabulated(Record::Quantity::pairing_gap)->value ==
      Approx(0.8623));
  REQUIRE(
      cs137.GetTabulated(Record::Quantity::quadrupole_deformation)->value ==
      Approx(0.05));
  REQUIRE(
      cs137.GetBetaMinusQ().value() ==
      Approx(0.78234697 + 137 * (8.391827 - 8.388956)));
}

TEST_CASE("theoretical nuclide properties") {
  const SourceRegistry registry{"data"};
  const Nuclide ca48{registry.GetRecords("SKMS"), Identity{20, 28}};
  REQUIRE(ca48.Exists());
  REQUIRE_FALSE(ca48.SupportsDecay());
  REQUIRE(ca48.GetBindingEnergy().value() == Approx(416.0));
  REQUIRE(ca48.GetNeutronSeparation().value() == Approx(416.0 - 404.91));
  REQUIRE(
      ca48.GetTabulated(Record::Quantity::neutron_separation)->value ==
      Approx(11.09));
  REQUIRE(
      ca48.GetMagicNumbers() == std::vector<std::string>{"Z=20", "N=28"});
  // decay data is absent, not unknown, for theoretical sources
  REQUIRE_FALSE(ca48.GetHalfLife());
  REQUIRE_FALSE(ca48.GetSpinParity());
  REQUIRE(ca48.GetDecayModes().empty());
  REQUIRE_FALSE(ca48.IsStable());
  REQUIRE_FALSE(ca48.GetFourPlusOverTwoPlus());
  REQUIRE_FALSE(ca48.GetMassExcess());
}

TEST_CASE("nuclides missing from a source") {
  const SourceRegistry registry{"data"};
  const Nuclide ca45{registry.GetRecords("SKMS"), Identity{20, 25}};
  REQUIRE_FALSE(ca45.Exists());
  REQUIRE(ca45.Name() == "Ca-45");
  REQUIRE(ca45.Source() == "SKMS");
  REQUIRE(ca45.GetMagicNumbers() == std::vector<std::string>{"Z=20"});
  REQUIRE_THROWS_MATCHES(
      ca45.GetBindingEnergy(), NotFound,
      Catch::Matchers::Message(
          "Nuclide \"Ca-45\" (Z = 20, N = 25) not found in source \"SKMS\""));
  REQUIRE_THROWS_AS(ca45.GetNeutronSeparation(), NotFound);
  REQUIRE_THROWS_AS(ca45.GetHalfLife(), NotFound);
  REQUIRE_THROWS_AS(ca45.GetRecord(), NotFound);
  SECTION("an existing nuclide with an absent neighbor") {
    const Nuclide ca46{registry.GetRecords("SKMS"), Identity{20, 26}};
    REQUIRE(ca46.Exists());
    REQUIRE_FALSE(ca46.GetNeutronSeparation());
    REQUIRE(ca46.GetTwoNeutronSeparation().value() == Approx(398.77 - 380.96));
  }
}

TEST_CASE("handles outlive their registry") {
  std::unique_ptr<Nuclide> fe56;
  {
    const SourceRegistry registry{"data"};
    fe56 = std::make_unique<Nuclide>(
        registry.GetRecords("experiment"), Identity{26, 30});
  }
  REQUIRE(fe56->GetBindingEnergy().value() == Approx(BE_Fe56));
}
