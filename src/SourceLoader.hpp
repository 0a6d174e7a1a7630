#pragma once

#include "Record.hpp"
#include "SourceDescriptor.hpp"

#include <cstddef>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

/// @brief Reads the backing file of one source into Record objects
/// @details The polymorphism here shall be where the experimental export and
///          the theoretical tables are told apart. Every format shares the
///          same failure policy, implemented once in Load(): a missing or
///          unreadable file, or a file from which no Record could be read,
///          makes the whole source unavailable.
class SourceLoader {
public:
  /// @brief Records read from a file and the number of entries skipped
  struct Result {
    /// @brief Records in file order. May contain duplicate identities.
    std::vector<Record> records;
    /// @brief Number of malformed entries or rows that were skipped
    size_t skipped{0};
    /// @brief Number of entries dropped because an earlier entry had the same
    ///        key
    size_t duplicates{0};
  };
  /// @brief Factory method to create the loader matching a descriptor's Kind
  static std::unique_ptr<const SourceLoader>
  Create(const SourceDescriptor& descriptor);
  /// @brief Virtual destructor (C++ Core Guidelines C.127)
  virtual ~SourceLoader() noexcept;
  /// @brief Reads every Record from the backing file
  /// @exception SourceUnavailable File is missing, unreadable, structurally
  ///            invalid, or yields zero Record objects
  Result Load() const;

protected:
  /// @brief Constructs a SourceLoader reading the file of a descriptor
  SourceLoader(const SourceDescriptor& descriptor);
  /// @brief Parses an opened stream. Malformed entries are counted in
  ///        Result::skipped, not thrown.
  virtual Result Parse(std::istream& is) const = 0;
  /// @brief Writes a warning about this source to stderr
  void Warn(const std::string& message) const;
  /// @brief Source being loaded
  const SourceDescriptor descriptor;
};
