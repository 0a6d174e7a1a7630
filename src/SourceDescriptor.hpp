#pragma once

#include <filesystem>
#include <string>

/// @brief Describes one known data source. Established when a SourceRegistry
///        is constructed and never modified afterwards.
struct SourceDescriptor {
  /// @brief Determines which SourceLoader reads the backing file
  enum class Kind {
    experimental,
    theoretical,
  };
  /// @brief Returns "experimental" or "theoretical"
  static std::string ToString(Kind kind);
  /// @brief Returns true if half-life, spin-parity, and decay modes are
  ///        meaningful for this source
  bool SupportsDecay() const noexcept { return kind == Kind::experimental; }
  /// @brief Canonical name, e.g. "experiment", "SKMS", "SV-MIN"
  std::string name;
  /// @brief Format of the backing file
  Kind kind;
  /// @brief Path to the backing file
  std::filesystem::path filepath;
  /// @brief Human-readable description of the data
  std::string description;
};
