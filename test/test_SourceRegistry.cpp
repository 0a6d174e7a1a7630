#include "Errors.hpp"
#include "SourceRegistry.hpp"
#include "XMLDocument.hpp"
#include "catch2/catch.hpp"

#include <future>
#include <stdexcept>
#include <vector>

TEST_CASE("source names are resolved case-insensitively") {
  const SourceRegistry registry{"data"};
  REQUIRE(registry.Resolve("experiment").name == "experiment");
  REQUIRE(registry.Resolve("EXP").name == "experiment");
  REQUIRE(registry.Resolve("nndc").name == "experiment");
  REQUIRE(registry.Resolve("skms").name == "SKMS");
  REQUIRE(registry.Resolve("sv-min").name == "SV-MIN");
  REQUIRE(
      registry.Resolve("Sly4").filepath.string() == "data/SLY4_all_nuclei.dat");
}

TEST_CASE("unknown source names throw UnknownSource") {
  const SourceRegistry registry{"data"};
  REQUIRE_THROWS_MATCHES(
      registry.Resolve("NOPE"), UnknownSource,
      Catch::Matchers::Message(
          "Source \"NOPE\" not found. Must be one of: [\"experiment\", "
          "\"SKMS\", \"UNEDF0\", \"UNEDF1\", \"SLY4\", \"SKP\", \"SV-MIN\", ]"));
  REQUIRE_THROWS_AS(registry.GetRecords("NOPE"), UnknownSource);
  REQUIRE(registry.LoadCount() == 0);
}

TEST_CASE("sources are listed in a fixed order") {
  const SourceRegistry registry{"data"};
  const auto& sources = registry.ListSources();
  REQUIRE(sources.size() == 7);
  REQUIRE(sources.front().name == "experiment");
  REQUIRE(sources.front().kind == SourceDescriptor::Kind::experimental);
  REQUIRE(sources.front().SupportsDecay());
  for (size_t i = 1; i < sources.size(); i++) {
    REQUIRE(sources[i].kind == SourceDescriptor::Kind::theoretical);
    REQUIRE_FALSE(sources[i].SupportsDecay());
  }
  REQUIRE(SourceDescriptor::ToString(sources.back().kind) == "theoretical");
  const auto available = registry.ListAvailableSources();
  REQUIRE(available.size() == 3);
  REQUIRE(available[0].name == "experiment");
  REQUIRE(available[1].name == "SKMS");
  REQUIRE(available[2].name == "SLY4");
}

TEST_CASE("sources are loaded lazily and at most once") {
  const SourceRegistry registry{"data"};
  REQUIRE_FALSE(registry.IsLoaded("SKMS"));
  const auto first = registry.GetRecords("SKMS");
  REQUIRE(registry.IsLoaded("skms"));
  const auto second = registry.GetRecords("skms");
  REQUIRE(first == second);
  REQUIRE(registry.LoadCount() == 1);
  REQUIRE(first->descriptor.name == "SKMS");
  REQUIRE(first->index.size() == 11);
  REQUIRE(first->index.GetDuplicates() == 1);
  REQUIRE_FALSE(registry.IsLoaded("experiment"));
}

TEST_CASE("concurrent first access loads once") {
  const SourceRegistry registry{"data"};
  std::vector<std::future<std::shared_ptr<const SourceRegistry::LoadedSource>>>
      futures;
  for (int i = 0; i < 8; i++) {
    futures.push_back(std::async(std::launch::async, [&registry]() {
      return registry.GetRecords("experiment");
    }));
  }
  std::vector<std::shared_ptr<const SourceRegistry::LoadedSource>> results;
  for (auto& future : futures) {
    results.push_back(future.get());
  }
  REQUIRE(registry.LoadCount() == 1);
  for (const auto& result : results) {
    REQUIRE(result == results.front());
  }
  REQUIRE(results.front()->index.size() == 11);
}

TEST_CASE("concurrent first access to a failing source shares the failure") {
  const SourceRegistry registry{"data"};
  std::vector<std::future<std::shared_ptr<const SourceRegistry::LoadedSource>>>
      futures;
  for (int i = 0; i < 8; i++) {
    futures.push_back(std::async(std::launch::async, [&registry]() {
      return registry.GetRecords("UNEDF0");
    }));
  }
  for (auto& future : futures) {
    REQUIRE_THROWS_AS(future.get(), SourceUnavailable);
  }
  REQUIRE(registry.LoadCount() == 1);
}

TEST_CASE("load failures are permanent for one source only") {
  const SourceRegistry registry{"data"};
  REQUIRE_THROWS_WITH(
      registry.GetRecords("UNEDF0"), Catch::Contains("file not found"));
  REQUIRE_THROWS_AS(registry.GetRecords("UNEDF0"), SourceUnavailable);
  REQUIRE_THROWS_AS(registry.GetRecords("SLY4"), SourceUnavailable);
  REQUIRE_THROWS_AS(registry.GetRecords("sly4"), SourceUnavailable);
  REQUIRE(registry.LoadCount() == 2);
  REQUIRE(registry.IsLoaded("UNEDF0"));
  // other sources remain usable
  REQUIRE(registry.GetRecords("SKMS")->index.size() == 11);
}

TEST_CASE("separate registries load identical contents") {
  const SourceRegistry a{"data"};
  const SourceRegistry b{"data"};
  const auto& index_a = a.GetRecords("experiment")->index;
  const auto& index_b = b.GetRecords("experiment")->index;
  REQUIRE(index_a.Identities() == index_b.Identities());
  for (const auto& identity : index_a.Identities()) {
    const auto& record_a = *index_a.Find(identity);
    const auto& record_b = *index_b.Find(identity);
    REQUIRE(record_a.quantities.size() == record_b.quantities.size());
    REQUIRE(record_a.levels.size() == record_b.levels.size());
    REQUIRE(
        record_a.Get(Record::Quantity::binding_energy)->value ==
        record_b.Get(Record::Quantity::binding_energy)->value);
  }
}

TEST_CASE("explicit descriptors are validated") {
  SECTION("names are canonicalized") {
    const SourceRegistry registry{std::vector<SourceDescriptor>{
        {"skms", SourceDescriptor::Kind::theoretical,
         "data/SKMS_all_nuclei-new.dat", "test table"}}};
    REQUIRE(registry.ListSources().size() == 1);
    REQUIRE(registry.GetRecords("SKMS")->descriptor.name == "SKMS");
    REQUIRE_THROWS_WITH(
        registry.Resolve("UNEDF1"), Catch::Contains("is not registered"));
  }
  SECTION("unknown names") {
    REQUIRE_THROWS_AS(
        SourceRegistry{std::vector<SourceDescriptor>{
            {"FRDM", SourceDescriptor::Kind::theoretical, "frdm.dat", ""}}},
        UnknownSource);
  }
  SECTION("repeated names") {
    REQUIRE_THROWS_AS(
        SourceRegistry{std::vector<SourceDescriptor>{
            {"exp", SourceDescriptor::Kind::experimental, "a.json", ""},
            {"experiment", SourceDescriptor::Kind::experimental, "b.json", ""}}},
        std::runtime_error);
  }
  SECTION("kind must match the named source") {
    REQUIRE_THROWS_WITH(
        SourceRegistry{std::vector<SourceDescriptor>{
            {"SKMS", SourceDescriptor::Kind::experimental,
             "data/SKMS_all_nuclei-new.dat", ""}}},
        Catch::Contains("is theoretical but was registered as experimental"));
    REQUIRE_THROWS_AS(
        SourceRegistry{std::vector<SourceDescriptor>{
            {"nndc", SourceDescriptor::Kind::theoretical,
             "data/nndc_nudat_data_export.json", ""}}},
        std::runtime_error);
  }
}

TEST_CASE("registry configured from XML") {
  const SourceRegistry registry{XMLDocument{"nucquery_valid.xml"}};
  REQUIRE(registry.ListSources().size() == 7);
  REQUIRE(
      registry.Resolve("UNEDF1").filepath.string() ==
      "data/SKMS_all_nuclei-new.dat");
  REQUIRE(
      registry.Resolve("SKP").filepath.string() == "data/SKP_all_nuclei.dat");
  const auto unedf1 = registry.GetRecords("UNEDF1");
  REQUIRE(unedf1->index.size() == 11);
  REQUIRE(unedf1->index.Find(Identity{20, 28})->source == "UNEDF1");
}
