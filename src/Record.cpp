#include "Record.hpp"

#include "PeriodicTable.hpp"

#include <algorithm>
#include <utility>

namespace {
// Change in (Z, N) for decay modes with a single daughter
const std::map<std::string, std::pair<NucleonCount, NucleonCount>>
    daughter_offsets{
        {"A", {-2, -2}},   {"B-", {1, -1}},   {"2B-", {2, -2}},
        {"B-N", {1, -2}},  {"B-2N", {1, -3}}, {"B-A", {-1, -3}},
        {"EC", {-1, 1}},   {"B+", {-1, 1}},   {"EC+B+", {-1, 1}},
        {"2EC", {-2, 2}},  {"2B+", {-2, 2}},  {"ECP", {-2, 1}},
        {"B+P", {-2, 1}},  {"EC2P", {-3, 1}}, {"B+2P", {-3, 1}},
        {"N", {0, -1}},    {"2N", {0, -2}},   {"P", {-1, 0}},
        {"2P", {-2, 0}},   {"IT", {0, 0}},
    };

template <typename Key>
std::optional<Measurement>
Find(const std::map<Key, Measurement>& values, Key k) {
  if (const auto it = values.find(k); it != values.cend()) {
    return it->second;
  }
  return std::nullopt;
}
} // namespace

// DecayMode

//// public

std::optional<Identity> DecayMode::Daughter(const Identity& parent) const {
  const auto offset_it = daughter_offsets.find(mode);
  if (offset_it == daughter_offsets.cend()) {
    return std::nullopt;
  }
  const auto& [dZ, dN] = offset_it->second;
  return parent.Offset(dZ, dN);
}

// Record

//// public

std::string Record::Symbol() const {
  return periodic_table::Symbol(identity.Z);
}

std::string Record::Name() const { return identity.Name(); }

std::optional<Measurement> Record::Get(Quantity q) const {
  return Find(quantities, q);
}

std::optional<Measurement> Record::Get(ExcitedState s) const {
  return Find(excited_states, s);
}

std::optional<Measurement> Record::Get(FissionYield y) const {
  return Find(fission_yields, y);
}

const Level* Record::GetGroundState() const noexcept {
  if (levels.empty()) {
    return nullptr;
  }
  const auto ground_it =
      std::find_if(levels.cbegin(), levels.cend(), [](const Level& level) {
        return level.energy.value == 0;
      });
  return ground_it != levels.cend() ? &*ground_it : &levels.front();
}
