#include "SourceLoader.hpp"

#include "Errors.hpp"
#include "ExperimentalLoader.hpp"
#include "TheoreticalLoader.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>

// SourceLoader

//// public

std::unique_ptr<const SourceLoader>
SourceLoader::Create(const SourceDescriptor& descriptor) {
  switch (descriptor.kind) {
  case SourceDescriptor::Kind::experimental:
    return std::make_unique<const ExperimentalLoader>(descriptor);
  case SourceDescriptor::Kind::theoretical:
    return std::make_unique<const TheoreticalLoader>(descriptor);
  }
  throw std::logic_error(
      "Source \"" + descriptor.name + "\" has no loader for its kind");
}

SourceLoader::~SourceLoader() noexcept {}

SourceLoader::Result SourceLoader::Load() const {
  const auto& filepath = descriptor.filepath;
  if (!std::filesystem::exists(filepath)) {
    throw SourceUnavailable(
        "Source \"" + descriptor.name +
        "\" unavailable: file not found: " + filepath.string());
  }
  std::ifstream file{filepath};
  if (!file) {
    throw SourceUnavailable(
        "Source \"" + descriptor.name +
        "\" unavailable: cannot open file: " + filepath.string());
  }
  auto result = Parse(file);
  if (file.bad()) {
    throw SourceUnavailable(
        "Source \"" + descriptor.name +
        "\" unavailable: error while reading: " + filepath.string());
  }
  if (result.skipped != 0) {
    Warn(
        "skipped " + std::to_string(result.skipped) +
        " malformed entries in " + filepath.string());
  }
  if (result.duplicates != 0) {
    Warn(
        "dropped " + std::to_string(result.duplicates) +
        " entries whose key was already present in " + filepath.string());
  }
  if (result.records.empty()) {
    throw SourceUnavailable(
        "Source \"" + descriptor.name +
        "\" unavailable: no nuclides could be read from " + filepath.string());
  }
  return result;
}

//// protected

SourceLoader::SourceLoader(const SourceDescriptor& descriptor)
    : descriptor{descriptor} {}

void SourceLoader::Warn(const std::string& message) const {
  std::cerr << "Warning: " << descriptor.name << ": " << message << std::endl;
}
