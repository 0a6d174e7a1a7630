#include "NuclideQuery.hpp"

#include "Constants.hpp"
#include "SourceRegistry.hpp"

#include <algorithm>
#include <iterator>
#include <limits>
#include <utility>

namespace {
std::vector<Nuclide> ToNuclides(
    const std::shared_ptr<const SourceRegistry::LoadedSource>& loaded,
    const std::vector<const Record*>& records) {
  std::vector<Nuclide> nuclides;
  nuclides.reserve(records.size());
  std::transform(
      records.cbegin(), records.cend(), std::back_inserter(nuclides),
      [&loaded](const Record* record) {
        return Nuclide{loaded, record->identity};
      });
  return nuclides;
}
} // namespace

// NuclideQuery

//// public

NuclideQuery::NuclideQuery(std::shared_ptr<const SourceRegistry> registry)
    : registry{std::move(registry)} {}

Nuclide NuclideQuery::Resolve(
    NucleonCount Z, NucleonCount N, const std::string& source) const {
  Nuclide nuclide{registry->GetRecords(source), Identity{Z, N}};
  // throws NotFound with the nuclide and source in the message
  nuclide.GetRecord();
  return nuclide;
}

std::optional<Nuclide> NuclideQuery::Find(
    NucleonCount Z, NucleonCount N, const std::string& source) const {
  Nuclide nuclide{registry->GetRecords(source), Identity{Z, N}};
  if (!nuclide.Exists()) {
    return std::nullopt;
  }
  return nuclide;
}

Nuclide NuclideQuery::ResolveBySymbol(
    const std::string& symbol_and_mass, const std::string& source) const {
  const auto identity = Identity::Parse(symbol_and_mass);
  return Resolve(identity.Z, identity.N, source);
}

std::vector<Nuclide> NuclideQuery::QueryRange(
    Axis fixed, NucleonCount value, std::optional<NucleonCount> range_min,
    std::optional<NucleonCount> range_max, const std::string& source) const {
  const auto loaded = registry->GetRecords(source);
  const auto min = range_min.value_or(0);
  const auto max =
      range_max.value_or(std::numeric_limits<NucleonCount>::max());
  switch (fixed) {
  case Axis::Z:
    return ToNuclides(loaded, loaded->index.Isotopes(value, min, max));
  case Axis::N:
    return ToNuclides(loaded, loaded->index.Isotones(value, min, max));
  }
  return {};
}

std::vector<Nuclide> NuclideQuery::QueryRegion(
    NucleonCount Z_min, NucleonCount Z_max, NucleonCount N_min,
    NucleonCount N_max, const std::string& source) const {
  const auto loaded = registry->GetRecords(source);
  return ToNuclides(loaded, loaded->index.Region(Z_min, Z_max, N_min, N_max));
}

std::vector<Nuclide> NuclideQuery::QueryList(
    const std::vector<Identity>& identities, const std::string& source) const {
  const auto loaded = registry->GetRecords(source);
  std::vector<Nuclide> nuclides;
  for (const auto& identity : identities) {
    if (loaded->index.Contains(identity)) {
      nuclides.emplace_back(loaded, identity);
    }
  }
  return nuclides;
}

std::vector<Nuclide> NuclideQuery::Compare(
    NucleonCount Z, NucleonCount N,
    const std::vector<std::string>& sources) const {
  std::vector<std::string> names{sources};
  if (names.empty()) {
    for (const auto& descriptor : registry->ListAvailableSources()) {
      names.push_back(descriptor.name);
    }
  }
  std::vector<Nuclide> nuclides;
  for (const auto& name : names) {
    nuclides.emplace_back(registry->GetRecords(name), Identity{Z, N});
  }
  return nuclides;
}

std::vector<Nuclide> NuclideQuery::DecayChain(
    NucleonCount Z, NucleonCount N, const std::string& source) const {
  std::vector<Nuclide> chain{Resolve(Z, N, source)};
  const auto loaded = registry->GetRecords(source);
  while (chain.size() < constants::decay_chain_limit &&
         !chain.back().IsStable()) {
    const auto daughter = NextInChain(chain.back());
    if (!daughter || !loaded->index.Contains(daughter.value())) {
      break;
    }
    chain.emplace_back(loaded, daughter.value());
  }
  return chain;
}

std::vector<SourceDescriptor> NuclideQuery::ListSources() const {
  return registry->ListSources();
}

std::vector<SourceDescriptor> NuclideQuery::ListAvailableSources() const {
  return registry->ListAvailableSources();
}

//// private

std::optional<Identity> NuclideQuery::NextInChain(const Nuclide& parent) {
  const auto parent_identity = parent.GetIdentity();
  for (const auto& mode : parent.GetDecayModes()) {
    if (const auto daughter = mode.Daughter(parent_identity);
        daughter && daughter.value() != parent_identity) {
      return daughter;
    }
  }
  return std::nullopt;
}
