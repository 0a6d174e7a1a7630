#include "Errors.hpp"
#include "Identity.hpp"
#include "PeriodicTable.hpp"
#include "catch2/catch.hpp"

TEST_CASE("periodic table lookups") {
  REQUIRE(periodic_table::Symbol(26) == "Fe");
  REQUIRE(periodic_table::Symbol(1) == "H");
  REQUIRE(periodic_table::Symbol(118) == "Og");
  REQUIRE(periodic_table::Symbol(0) == "n");
  REQUIRE(periodic_table::Symbol(119) == "X119");
  REQUIRE(periodic_table::AtomicNumber("Fe") == 26);
  REQUIRE(periodic_table::AtomicNumber("fE") == 26);
  // nitrogen, not the free neutron
  REQUIRE(periodic_table::AtomicNumber("N") == 7);
  REQUIRE(periodic_table::AtomicNumber("n") == 7);
  REQUIRE_FALSE(periodic_table::AtomicNumber("Xx").has_value());
  REQUIRE_FALSE(periodic_table::AtomicNumber("").has_value());
}

TEST_CASE("symbol and mass number strings are parsed") {
  const Identity fe56{26, 30};
  REQUIRE(Identity::Parse("Fe56") == fe56);
  REQUIRE(Identity::Parse("fe-56") == fe56);
  REQUIRE(Identity::Parse("56Fe") == fe56);
  REQUIRE(Identity::Parse("56-Fe") == fe56);
  REQUIRE(Identity::Parse("  FE56 ") == fe56);
  REQUIRE(Identity::Parse("H1") == Identity{1, 0});
  REQUIRE(Identity::Parse("Og294") == Identity{118, 176});
}

TEST_CASE("malformed identities throw MalformedIdentity") {
  REQUIRE_THROWS_AS(Identity::Parse(""), MalformedIdentity);
  REQUIRE_THROWS_AS(Identity::Parse("Fe"), MalformedIdentity);
  REQUIRE_THROWS_AS(Identity::Parse("56"), MalformedIdentity);
  REQUIRE_THROWS_AS(Identity::Parse("Xx56"), MalformedIdentity);
  REQUIRE_THROWS_AS(Identity::Parse("Fe5x6"), MalformedIdentity);
  REQUIRE_THROWS_AS(Identity::Parse("Fe1000"), MalformedIdentity);
  REQUIRE_THROWS_WITH(
      Identity::Parse("Fe20"),
      Catch::Contains("mass number 20 is smaller than Z = 26"));
  REQUIRE_THROWS_WITH(
      Identity::Parse("Qq12"),
      Catch::Contains("unknown element symbol \"Qq\""));
}

TEST_CASE("Identity member functions") {
  const Identity ca48{20, 28};
  REQUIRE(ca48.A() == 48);
  REQUIRE(ca48.Name() == "Ca-48");
  REQUIRE(ca48.IsPhysical());
  REQUIRE(ca48.Offset(-2, -2) == Identity{18, 26});
  REQUIRE_FALSE(Identity{1, 0}.Offset(0, -1).has_value());
  REQUIRE(Identity{20, 28} < Identity{20, 29});
  REQUIRE(Identity{19, 40} < Identity{20, 0});
  REQUIRE(Identity{20, 28} != Identity{28, 20});
}
