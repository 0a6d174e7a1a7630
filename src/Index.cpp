#include "Index.hpp"

#include <algorithm>
#include <iterator>

// Index

//// public

Index::Index(std::vector<Record> all_records) {
  records.reserve(all_records.size());
  for (auto& record : all_records) {
    const auto identity = record.identity;
    const auto [it, inserted] =
        records.try_emplace(Key(identity), std::move(record));
    if (!inserted) {
      duplicates++;
      continue;
    }
    neutrons_by_Z[identity.Z].push_back(identity.N);
    protons_by_N[identity.N].push_back(identity.Z);
  }
  for (auto& [Z, neutrons] : neutrons_by_Z) {
    std::sort(neutrons.begin(), neutrons.end());
  }
  for (auto& [N, protons] : protons_by_N) {
    std::sort(protons.begin(), protons.end());
  }
}

const Record* Index::Find(const Identity& identity) const noexcept {
  if (!identity.IsPhysical()) {
    return nullptr;
  }
  const auto it = records.find(Key(identity));
  return it != records.cend() ? &it->second : nullptr;
}

bool Index::Contains(const Identity& identity) const noexcept {
  return Find(identity) != nullptr;
}

std::vector<const Record*> Index::Isotopes(
    NucleonCount Z, NucleonCount N_min, NucleonCount N_max) const {
  std::vector<const Record*> result;
  const auto chain_it = neutrons_by_Z.find(Z);
  if (chain_it == neutrons_by_Z.cend()) {
    return result;
  }
  const auto [begin, end] = Within(chain_it->second, N_min, N_max);
  std::transform(begin, end, std::back_inserter(result), [this, Z](auto N) {
    return &records.at(Key(Identity{Z, N}));
  });
  return result;
}

std::vector<const Record*> Index::Isotones(
    NucleonCount N, NucleonCount Z_min, NucleonCount Z_max) const {
  std::vector<const Record*> result;
  const auto chain_it = protons_by_N.find(N);
  if (chain_it == protons_by_N.cend()) {
    return result;
  }
  const auto [begin, end] = Within(chain_it->second, Z_min, Z_max);
  std::transform(begin, end, std::back_inserter(result), [this, N](auto Z) {
    return &records.at(Key(Identity{Z, N}));
  });
  return result;
}

std::vector<const Record*> Index::Region(
    NucleonCount Z_min, NucleonCount Z_max, NucleonCount N_min,
    NucleonCount N_max) const {
  std::vector<const Record*> result;
  if (Z_min > Z_max) {
    return result;
  }
  for (auto chain_it = neutrons_by_Z.lower_bound(Z_min);
       chain_it != neutrons_by_Z.cend() && chain_it->first <= Z_max;
       chain_it++) {
    const auto isotopes = Isotopes(chain_it->first, N_min, N_max);
    result.insert(result.end(), isotopes.cbegin(), isotopes.cend());
  }
  return result;
}

std::vector<Identity> Index::Identities() const {
  std::vector<Identity> result;
  result.reserve(records.size());
  for (const auto& [Z, neutrons] : neutrons_by_Z) {
    for (const auto N : neutrons) {
      result.push_back(Identity{Z, N});
    }
  }
  return result;
}

size_t Index::size() const noexcept { return records.size(); }

size_t Index::GetDuplicates() const noexcept { return duplicates; }

//// private

std::uint64_t Index::Key(const Identity& identity) noexcept {
  return (static_cast<std::uint64_t>(static_cast<std::uint32_t>(identity.Z))
          << 32) |
         static_cast<std::uint32_t>(identity.N);
}

std::pair<
    std::vector<NucleonCount>::const_iterator,
    std::vector<NucleonCount>::const_iterator>
Index::Within(
    const std::vector<NucleonCount>& chain, NucleonCount min,
    NucleonCount max) noexcept {
  if (min > max) {
    return {chain.cend(), chain.cend()};
  }
  return {
      std::lower_bound(chain.cbegin(), chain.cend(), min),
      std::upper_bound(chain.cbegin(), chain.cend(), max)};
}
