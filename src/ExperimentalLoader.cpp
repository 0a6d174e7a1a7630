#include "ExperimentalLoader.hpp"

#include "Constants.hpp"
#include "Errors.hpp"
#include "nlohmann/json.hpp"

#include <array>
#include <istream>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace {
// Preserves file order so that the first of two duplicate entries wins
using json = nlohmann::ordered_json;

// Tabulated quantities stored in keV under these keys
const std::array<std::pair<const char*, Record::Quantity>, 15> quantity_keys{{
    {"neutronSeparationEnergy", Record::Quantity::neutron_separation},
    {"protonSeparationEnergy", Record::Quantity::proton_separation},
    {"twoNeutronSeparationEnergy", Record::Quantity::two_neutron_separation},
    {"twoProtonSeparationEnergy", Record::Quantity::two_proton_separation},
    {"alpha", Record::Quantity::alpha_q},
    {"deltaAlpha", Record::Quantity::alpha_q_difference},
    {"betaMinus", Record::Quantity::beta_minus_q},
    {"electronCapture", Record::Quantity::electron_capture_q},
    {"positronEmission", Record::Quantity::positron_emission_q},
    {"betaMinusOneNeutronEmission", Record::Quantity::beta_minus_one_neutron_q},
    {"betaMinusTwoNeutronEmission", Record::Quantity::beta_minus_two_neutron_q},
    {"electronCaptureOneProtonEmission",
     Record::Quantity::electron_capture_one_proton_q},
    {"doubleBetaMinus", Record::Quantity::double_beta_minus_q},
    {"doubleElectronCapture", Record::Quantity::double_electron_capture_q},
    {"pairingGap", Record::Quantity::pairing_gap},
}};

// Dimensionless tabulated quantities
const std::array<std::pair<const char*, Record::Quantity>, 1>
    dimensionless_keys{{
        {"quadrupoleDeformation", Record::Quantity::quadrupole_deformation},
    }};

// Excitation energies stored in keV under these keys
const std::array<std::pair<const char*, Record::ExcitedState>, 4>
    excited_state_keys{{
        {"firstExcitedStateEnergy", Record::ExcitedState::first},
        {"firstTwoPlusEnergy", Record::ExcitedState::first_two_plus},
        {"firstFourPlusEnergy", Record::ExcitedState::first_four_plus},
        {"firstThreeMinusEnergy", Record::ExcitedState::first_three_minus},
    }};

// Dimensionless fission yields stored under these keys
const std::array<std::pair<const char*, Record::FissionYield>, 8>
    fission_yield_keys{{
        {"FY235U", Record::FissionYield::independent_U235},
        {"FY238U", Record::FissionYield::independent_U238},
        {"FY239Pu", Record::FissionYield::independent_Pu239},
        {"FY252Cf", Record::FissionYield::independent_Cf252},
        {"cFY235U", Record::FissionYield::cumulative_U235},
        {"cFY238U", Record::FissionYield::cumulative_U238},
        {"cFY239Pu", Record::FissionYield::cumulative_Pu239},
        {"cFY252Cf", Record::FissionYield::cumulative_Cf252},
    }};

// Returns the named member of an object, or nullptr if absent or null
const json* Child(const json& node, const char* key) {
  if (!node.is_object()) {
    return nullptr;
  }
  const auto it = node.find(key);
  if (it == node.end() || it->is_null()) {
    return nullptr;
  }
  return &*it;
}

// Accepts a bare number or a {"value", "uncertainty", "unit"} object
std::optional<Measurement>
ToMeasurement(const json* node, const std::string& default_unit) {
  if (!node) {
    return std::nullopt;
  }
  if (node->is_number()) {
    return Measurement{node->get<Real>(), std::nullopt, default_unit};
  }
  const auto value = Child(*node, "value");
  if (!value || !value->is_number()) {
    return std::nullopt;
  }
  Measurement m{value->get<Real>(), std::nullopt, default_unit};
  if (const auto uncertainty = Child(*node, "uncertainty");
      uncertainty && uncertainty->is_number()) {
    m.uncertainty = uncertainty->get<Real>();
  }
  if (const auto unit = Child(*node, "unit"); unit && unit->is_string()) {
    m.unit = unit->get<std::string>();
  }
  return m;
}

// Energies in the export are in keV
std::optional<Measurement> ToMeV(const json* node) {
  const auto m = ToMeasurement(node, "keV");
  if (!m) {
    return std::nullopt;
  }
  return m->Scaled(1 / constants::keV_per_MeV, "MeV");
}

std::optional<NucleonCount> ToNucleonCount(const json* node) {
  if (!node || !node->is_number_integer()) {
    return std::nullopt;
  }
  const auto count = node->get<long long>();
  if (count < 0 || count > 1000) {
    return std::nullopt;
  }
  return static_cast<NucleonCount>(count);
}

HalfLife ToHalfLife(const json* node) {
  if (!node) {
    return HalfLife::Unknown();
  }
  const auto value = node->is_object() ? Child(*node, "value") : node;
  if (value && value->is_string() && value->get<std::string>() == "STABLE") {
    return HalfLife::Stable();
  }
  if (const auto duration = ToMeasurement(node, "s")) {
    return HalfLife{duration.value()};
  }
  return HalfLife::Unknown();
}

std::vector<DecayMode> ToDecayModes(const json* node) {
  std::vector<DecayMode> modes;
  if (!node || !node->is_array()) {
    return modes;
  }
  for (const auto& item : *node) {
    const auto mode = Child(item, "mode");
    if (!mode || !mode->is_string()) {
      continue;
    }
    modes.push_back(DecayMode{mode->get<std::string>(), ToMeasurement(&item, "%")});
  }
  return modes;
}

Level ToLevel(const json& node) {
  Level level{
      ToMeV(Child(node, "energy")).value_or(Measurement{0, std::nullopt, "MeV"}),
      ToMeV(Child(node, "massExcess"))};
  if (const auto spin_parity = Child(node, "spinParity");
      spin_parity && spin_parity->is_string()) {
    level.spin_parity = spin_parity->get<std::string>();
  }
  level.half_life = ToHalfLife(Child(node, "halflife"));
  // newer exports nest observed and predicted modes, older ones flatten them
  if (const auto decay_modes = Child(node, "decayModes")) {
    level.observed_decay_modes = ToDecayModes(Child(*decay_modes, "observed"));
    level.predicted_decay_modes =
        ToDecayModes(Child(*decay_modes, "predicted"));
  }
  else {
    level.observed_decay_modes =
        ToDecayModes(Child(node, "decayModesObserved"));
  }
  return level;
}
} // namespace

// ExperimentalLoader

//// public

ExperimentalLoader::ExperimentalLoader(const SourceDescriptor& descriptor)
    : SourceLoader{descriptor} {}

//// private

SourceLoader::Result ExperimentalLoader::Parse(std::istream& is) const {
  // a repeated top-level key keeps its first value
  std::set<std::string> seen_keys;
  std::vector<std::string> repeated_keys;
  const json::parser_callback_t keep_first =
      [&seen_keys, &repeated_keys](
          int depth, json::parse_event_t event, json& parsed) {
        if (depth != 1 || event != json::parse_event_t::key) {
          return true;
        }
        auto key = parsed.get<std::string>();
        if (!seen_keys.insert(key).second) {
          repeated_keys.push_back(std::move(key));
          return false;
        }
        return true;
      };
  json root;
  try {
    root = json::parse(is, keep_first);
  }
  catch (const json::parse_error& e) {
    throw SourceUnavailable(
        "Source \"" + descriptor.name + "\" unavailable: " +
        descriptor.filepath.string() + ": " + e.what());
  }
  if (!root.is_object()) {
    throw SourceUnavailable(
        "Source \"" + descriptor.name + "\" unavailable: " +
        descriptor.filepath.string() +
        ": expected a JSON object keyed by nuclide name");
  }
  Result result;
  for (const auto& key : repeated_keys) {
    Warn("dropping repeated entry \"" + key + "\"");
  }
  result.duplicates = repeated_keys.size();
  for (const auto& item : root.items()) {
    const auto& key = item.key();
    const auto& entry = item.value();
    const auto Z = ToNucleonCount(Child(entry, "z"));
    const auto N = ToNucleonCount(Child(entry, "n"));
    if (!Z || !N) {
      Warn("skipping \"" + key + "\": missing or invalid z or n");
      result.skipped++;
      continue;
    }
    const Identity identity{Z.value(), N.value()};
    if (const auto A = ToNucleonCount(Child(entry, "a"));
        A && A.value() != identity.A()) {
      Warn(
          "skipping \"" + key + "\": a = " + std::to_string(A.value()) +
          " but z + n = " + std::to_string(identity.A()));
      result.skipped++;
      continue;
    }
    Record record{identity, descriptor.name};
    if (const auto levels = Child(entry, "levels");
        levels && levels->is_array()) {
      for (const auto& level_node : *levels) {
        record.levels.push_back(ToLevel(level_node));
      }
    }
    if (const auto ground_state = record.GetGroundState();
        ground_state && ground_state->mass_excess) {
      record.quantities.emplace(
          Record::Quantity::mass_excess, ground_state->mass_excess.value());
    }
    // per-nucleon binding energy in the export, total binding energy here
    if (const auto be_per_nucleon = ToMeV(Child(entry, "bindingEnergy"));
        be_per_nucleon && identity.A() > 0) {
      record.quantities.emplace(
          Record::Quantity::binding_energy,
          be_per_nucleon->Scaled(identity.A(), "MeV"));
    }
    for (const auto& [key_name, quantity] : quantity_keys) {
      if (const auto m = ToMeV(Child(entry, key_name))) {
        record.quantities.emplace(quantity, m.value());
      }
    }
    for (const auto& [key_name, quantity] : dimensionless_keys) {
      if (const auto m = ToMeasurement(Child(entry, key_name), "")) {
        record.quantities.emplace(quantity, m.value());
      }
    }
    for (const auto& [key_name, state] : excited_state_keys) {
      if (const auto m = ToMeV(Child(entry, key_name))) {
        record.excited_states.emplace(state, m.value());
      }
    }
    for (const auto& [key_name, yield] : fission_yield_keys) {
      if (const auto m = ToMeasurement(Child(entry, key_name), "")) {
        record.fission_yields.emplace(yield, m.value());
      }
    }
    result.records.push_back(std::move(record));
  }
  return result;
}
