#include "TheoreticalLoader.hpp"

#include "Constants.hpp"

#include <array>
#include <cmath>
#include <istream>
#include <sstream>
#include <stdexcept>
#include <utility>

// TheoreticalLoader

//// public

TheoreticalLoader::TheoreticalLoader(const SourceDescriptor& descriptor)
    : SourceLoader{descriptor} {}

//// private

SourceLoader::Result TheoreticalLoader::Parse(std::istream& is) const {
  Result result;
  std::string line;
  // first line is the column header
  std::getline(is, line);
  while (std::getline(is, line)) {
    std::stringstream line_stream{line};
    std::vector<std::string> tokens;
    std::string token;
    while (line_stream >> token) {
      tokens.push_back(token);
    }
    if (tokens.empty() || tokens.front().front() == '#') {
      continue;
    }
    if (auto record = ParseRow(tokens)) {
      result.records.push_back(std::move(record.value()));
    }
    else {
      result.skipped++;
    }
  }
  return result;
}

std::optional<Record>
TheoreticalLoader::ParseRow(const std::vector<std::string>& tokens) const {
  if (tokens.size() < constants::theoretical_columns) {
    return std::nullopt;
  }
  const auto Z = ParseCount(tokens[1]);
  const auto N = ParseCount(tokens[2]);
  const auto A = ParseCount(tokens[3]);
  if (!Z || !N || !A || Z.value() + N.value() != A.value()) {
    return std::nullopt;
  }
  Record record{Identity{Z.value(), N.value()}, descriptor.name};
  // tables list binding energy as a negative total energy
  if (const auto BE = ParseCell(tokens[4])) {
    record.quantities.emplace(
        Record::Quantity::binding_energy,
        Measurement{std::abs(BE.value()), std::nullopt, "MeV"});
  }
  const std::array<std::pair<size_t, Record::Quantity>, 5> columns{{
      {5, Record::Quantity::proton_separation},
      {6, Record::Quantity::two_proton_separation},
      {7, Record::Quantity::neutron_separation},
      {8, Record::Quantity::two_neutron_separation},
      {9, Record::Quantity::alpha_q},
  }};
  for (const auto& [column, quantity] : columns) {
    if (const auto value = ParseCell(tokens[column])) {
      record.quantities.emplace(
          quantity, Measurement{value.value(), std::nullopt, "MeV"});
    }
  }
  return record;
}

std::optional<NucleonCount>
TheoreticalLoader::ParseCount(const std::string& token) {
  try {
    size_t consumed{0};
    const auto count = std::stoi(token, &consumed);
    if (consumed != token.size() || count < 0) {
      return std::nullopt;
    }
    return count;
  }
  catch (const std::invalid_argument&) {
    return std::nullopt;
  }
  catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

std::optional<Real> TheoreticalLoader::ParseCell(const std::string& token) {
  if (token == constants::no_data_token) {
    return std::nullopt;
  }
  try {
    size_t consumed{0};
    const auto value = std::stod(token, &consumed);
    if (consumed != token.size() || !std::isfinite(value)) {
      return std::nullopt;
    }
    return value;
  }
  catch (const std::invalid_argument&) {
    return std::nullopt;
  }
  catch (const std::out_of_range&) {
    return std::nullopt;
  }
}
