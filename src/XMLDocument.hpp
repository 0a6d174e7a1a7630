#pragma once

#include "pugixml.hpp"

#include <filesystem>
#include <memory>

/// @brief Validates document with Xerces-C++. Loads document with pugixml.
class XMLDocument {
public:
  /// @brief Loads a valid `nucquery` XML document
  /// @exception std::runtime_error Validation or DOM loading failed. Gives
  ///            file location and message information if validation failed.
  XMLDocument(const std::filesystem::path& xml_filepath);
  /// @brief Path the document was loaded from
  const std::filesystem::path filepath;

private:
  // Validates an XML file with Xerces-C++ and loads it with pugixml
  static std::unique_ptr<const pugi::xml_document>
  Load(const std::filesystem::path& xml_filepath);
  // Owns the entire XML document structure
  const std::unique_ptr<const pugi::xml_document> doc;

public:
  /// @brief Allows access to the root node of XMLDocument::doc
  /// @details pugi::xml_node objects are only pointers to the full document.
  ///          Therefore calling code must not let the owning XMLDocument go
  ///          out of scope. This member is declared after XMLDocument::doc
  ///          to guarantee construction order.
  const pugi::xml_node root{doc->child("nucquery")};
};
