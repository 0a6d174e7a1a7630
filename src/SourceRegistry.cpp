#include "SourceRegistry.hpp"

#include "Errors.hpp"
#include "SourceLoader.hpp"
#include "XMLDocument.hpp"
#include "pugixml.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <exception>
#include <iostream>
#include <iterator>
#include <numeric>
#include <stdexcept>
#include <utility>

namespace {
// Fixed set of known sources with their default file names
struct KnownSource {
  const char* name;
  SourceDescriptor::Kind kind;
  const char* filename;
  const char* description;
};

const std::array<KnownSource, 7> known_sources{{
    {"experiment", SourceDescriptor::Kind::experimental,
     "nndc_nudat_data_export.json", "NNDC NuDat measured data"},
    {"SKMS", SourceDescriptor::Kind::theoretical, "SKMS_all_nuclei-new.dat",
     "SkM* energy density functional"},
    {"UNEDF0", SourceDescriptor::Kind::theoretical, "UNEDF0_all_nuclei.dat",
     "UNEDF0 energy density functional"},
    {"UNEDF1", SourceDescriptor::Kind::theoretical, "UNEDF1_all_nuclei.dat",
     "UNEDF1 energy density functional"},
    {"SLY4", SourceDescriptor::Kind::theoretical, "SLY4_all_nuclei.dat",
     "Skyrme SLy4 energy density functional"},
    {"SKP", SourceDescriptor::Kind::theoretical, "SKP_all_nuclei.dat",
     "Skyrme SkP energy density functional"},
    {"SV-MIN", SourceDescriptor::Kind::theoretical, "SV-MIN_all_nuclei.dat",
     "SV-min energy density functional"},
}};

// Alternative spellings of the experimental source
const std::array<const char*, 2> experiment_aliases{"exp", "nndc"};

std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

// Returns the known source matching a name in any spelling, or nullptr
const KnownSource* FindKnownSource(const std::string& name) {
  auto lowered = ToLower(name);
  if (std::find(
          experiment_aliases.cbegin(), experiment_aliases.cend(), lowered) !=
      experiment_aliases.cend()) {
    lowered = "experiment";
  }
  const auto it = std::find_if(
      known_sources.cbegin(), known_sources.cend(),
      [&lowered](const auto& known) { return ToLower(known.name) == lowered; });
  return it != known_sources.cend() ? &*it : nullptr;
}

std::string ValidNames() {
  return "Must be one of: [" +
         std::accumulate(
             known_sources.cbegin(), known_sources.cend(), std::string{},
             [](const auto& accumulated, const auto& known) {
               return accumulated + "\"" + known.name + "\", ";
             }) +
         "]";
}

// Throws UnknownSource for names outside the fixed set
const KnownSource& RequireKnownSource(const std::string& name) {
  const auto known = FindKnownSource(name);
  if (!known) {
    throw UnknownSource("Source \"" + name + "\" not found. " + ValidNames());
  }
  return *known;
}

std::string RequireCanonicalName(const std::string& name) {
  return RequireKnownSource(name).name;
}

std::string ToString(SourceDescriptor::Kind kind) {
  switch (kind) {
  case SourceDescriptor::Kind::experimental:
    return "experimental";
  case SourceDescriptor::Kind::theoretical:
    return "theoretical";
  }
  return "unknown";
}
} // namespace

// SourceRegistry

//// public

std::vector<SourceDescriptor>
SourceRegistry::DefaultDescriptors(const std::filesystem::path& data_directory) {
  std::vector<SourceDescriptor> result;
  for (const auto& known : known_sources) {
    result.push_back(SourceDescriptor{
        known.name, known.kind, data_directory / known.filename,
        known.description});
  }
  return result;
}

SourceRegistry::SourceRegistry(const std::filesystem::path& data_directory)
    : descriptors{DefaultDescriptors(data_directory)} {}

SourceRegistry::SourceRegistry(std::vector<SourceDescriptor> descriptors)
    : descriptors{Canonicalize(std::move(descriptors))} {}

SourceRegistry::SourceRegistry(const XMLDocument& config)
    : descriptors{CreateDescriptors(config)} {}

const SourceDescriptor&
SourceRegistry::Resolve(const std::string& name) const {
  const auto canonical = RequireCanonicalName(name);
  const auto it = std::find_if(
      descriptors.cbegin(), descriptors.cend(),
      [&canonical](const auto& d) { return d.name == canonical; });
  if (it == descriptors.cend()) {
    throw UnknownSource(
        "Source \"" + name + "\" is not registered. Must be one of: [" +
        std::accumulate(
            descriptors.cbegin(), descriptors.cend(), std::string{},
            [](const auto& accumulated, const auto& d) {
              return accumulated + "\"" + d.name + "\", ";
            }) +
        "]");
  }
  return *it;
}

std::shared_ptr<const SourceRegistry::LoadedSource>
SourceRegistry::GetRecords(const std::string& name) const {
  const auto& descriptor = Resolve(name);
  std::promise<std::shared_ptr<const LoadedSource>> promise;
  std::shared_future<std::shared_ptr<const LoadedSource>> future;
  bool is_first{false};
  {
    const std::lock_guard<std::mutex> lock{cache_mutex};
    const auto it = cache.find(descriptor.name);
    if (it == cache.cend()) {
      future = promise.get_future().share();
      cache.emplace(descriptor.name, future);
      is_first = true;
    }
    else {
      future = it->second;
    }
  }
  if (is_first) {
    // other callers wait on the shared future, so the failure must reach it
    try {
      promise.set_value(Load(descriptor));
    }
    catch (...) {
      promise.set_exception(std::current_exception());
    }
  }
  return future.get();
}

const std::vector<SourceDescriptor>&
SourceRegistry::ListSources() const noexcept {
  return descriptors;
}

std::vector<SourceDescriptor> SourceRegistry::ListAvailableSources() const {
  std::vector<SourceDescriptor> result;
  std::copy_if(
      descriptors.cbegin(), descriptors.cend(), std::back_inserter(result),
      [](const auto& d) { return std::filesystem::exists(d.filepath); });
  return result;
}

bool SourceRegistry::IsLoaded(const std::string& name) const {
  const auto& descriptor = Resolve(name);
  const std::lock_guard<std::mutex> lock{cache_mutex};
  return cache.find(descriptor.name) != cache.cend();
}

size_t SourceRegistry::LoadCount() const noexcept { return load_count; }

//// private

std::vector<SourceDescriptor>
SourceRegistry::CreateDescriptors(const XMLDocument& config) {
  const auto sources_node = config.root.child("sources");
  std::filesystem::path data_directory{
      sources_node.attribute("directory").as_string(".")};
  if (data_directory.is_relative()) {
    data_directory = config.filepath.parent_path() / data_directory;
  }
  auto result = DefaultDescriptors(data_directory);
  const auto override_file = [&result, &data_directory](
                                 const std::string& name,
                                 const pugi::xml_node& node) {
    const auto canonical = RequireCanonicalName(name);
    const auto it = std::find_if(
        result.begin(), result.end(),
        [&canonical](const auto& d) { return d.name == canonical; });
    it->filepath = data_directory / node.attribute("file").as_string();
  };
  if (const auto experiment_node = sources_node.child("experiment")) {
    override_file("experiment", experiment_node);
  }
  for (const auto& theory_node : sources_node.children("theory")) {
    override_file(theory_node.attribute("name").as_string(), theory_node);
  }
  return result;
}

std::vector<SourceDescriptor>
SourceRegistry::Canonicalize(std::vector<SourceDescriptor> descriptors) {
  std::vector<std::string> seen;
  for (auto& descriptor : descriptors) {
    const auto& known = RequireKnownSource(descriptor.name);
    descriptor.name = known.name;
    if (descriptor.kind != known.kind) {
      throw std::runtime_error(
          "Source \"" + descriptor.name + "\" is " + ToString(known.kind) +
          " but was registered as " + ToString(descriptor.kind));
    }
    if (std::find(seen.cbegin(), seen.cend(), descriptor.name) !=
        seen.cend()) {
      throw std::runtime_error(
          "Source \"" + descriptor.name + "\" registered more than once");
    }
    seen.push_back(descriptor.name);
  }
  return descriptors;
}

std::shared_ptr<const SourceRegistry::LoadedSource>
SourceRegistry::Load(const SourceDescriptor& descriptor) const {
  load_count++;
  auto result = SourceLoader::Create(descriptor)->Load();
  auto loaded = std::make_shared<const LoadedSource>(
      LoadedSource{descriptor, Index{std::move(result.records)}});
  if (const auto duplicates = loaded->index.GetDuplicates(); duplicates != 0) {
    std::cerr << "Warning: " << descriptor.name << ": dropped " << duplicates
              << " entries whose identity was already present" << std::endl;
  }
  return loaded;
}
