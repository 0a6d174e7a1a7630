#pragma once

#include "Index.hpp"
#include "SourceDescriptor.hpp"

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

class XMLDocument;

/// @brief Holds the known sources by name and loads each one at most once
/// @details A SourceRegistry owns its cache. Two SourceRegistry objects never
///          share loaded data, so tests may construct a fresh one per test
///          case. After a source is loaded its Index is immutable and may be
///          read from any thread without synchronization.
class SourceRegistry {
public:
  /// @brief A loaded source: its descriptor and the Index over its Record
  ///        objects
  struct LoadedSource {
    /// @brief Source that was loaded
    SourceDescriptor descriptor;
    /// @brief Lookups over the Record objects of the source
    Index index;
  };
  /// @brief Returns a descriptor for every known source, each pointing at its
  ///        default file name inside `data_directory`
  /// @details The order is `experiment` followed by the theoretical models in
  ///          a fixed order. This is also the order of ListSources().
  static std::vector<SourceDescriptor>
  DefaultDescriptors(const std::filesystem::path& data_directory);
  /// @brief Registers every known source with its default file name
  SourceRegistry(const std::filesystem::path& data_directory);
  /// @brief Registers an explicit list of descriptors
  /// @exception UnknownSource A descriptor name is not a known source
  /// @exception std::runtime_error A source is listed twice, or with a Kind
  ///            other than its own
  SourceRegistry(std::vector<SourceDescriptor> descriptors);
  /// @brief Registers every known source using a `nucquery` XML document
  /// @details Reads `/nucquery/sources`. A relative `directory` is resolved
  ///          against the directory containing the XML file. `experiment` and
  ///          `theory` children override default file names.
  SourceRegistry(const XMLDocument& config);
  /// @brief Returns the descriptor of a known source
  /// @details Matching is case-insensitive. `exp` and `nndc` are aliases of
  ///          `experiment`.
  /// @exception UnknownSource `name` is not a known source. The message lists
  ///            every valid name.
  const SourceDescriptor& Resolve(const std::string& name) const;
  /// @brief Returns the loaded source, loading it on first access
  /// @details Concurrent first callers block until a single load completes.
  ///          A failed load is remembered and rethrown to every later caller.
  /// @exception UnknownSource `name` is not a known source
  /// @exception SourceUnavailable The backing file is missing, unreadable, or
  ///            yields no Record objects
  std::shared_ptr<const LoadedSource> GetRecords(const std::string& name) const;
  /// @brief Returns every registered source in a fixed order
  const std::vector<SourceDescriptor>& ListSources() const noexcept;
  /// @brief Returns registered sources whose backing file exists
  std::vector<SourceDescriptor> ListAvailableSources() const;
  /// @brief Returns true if a load of the source has completed or started
  bool IsLoaded(const std::string& name) const;
  /// @brief Returns the number of times any loader was run
  size_t LoadCount() const noexcept;

private:
  // Reads descriptors from the `sources` node of a `nucquery` document
  static std::vector<SourceDescriptor> CreateDescriptors(const XMLDocument& config);
  // Replaces names by their canonical spelling and rejects unknown, repeated,
  // or misclassified sources
  static std::vector<SourceDescriptor>
  Canonicalize(std::vector<SourceDescriptor> descriptors);
  // Runs the loader of a source and builds its Index
  std::shared_ptr<const LoadedSource>
  Load(const SourceDescriptor& descriptor) const;
  // Registered sources
  const std::vector<SourceDescriptor> descriptors;
  // Guards SourceRegistry::cache
  mutable std::mutex cache_mutex;
  // Pending or completed loads keyed by canonical source name
  mutable std::map<
      std::string, std::shared_future<std::shared_ptr<const LoadedSource>>>
      cache;
  // Number of loads started
  mutable std::atomic<size_t> load_count{0};
};
