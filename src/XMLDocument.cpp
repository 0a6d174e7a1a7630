#include "XMLDocument.hpp"

#include "ValidateXML.hpp"

#include <stdexcept>

// XMLDocument

//// public

XMLDocument::XMLDocument(const std::filesystem::path& xml_filepath)
    : filepath{xml_filepath}, doc{Load(xml_filepath)} {}

//// private

std::unique_ptr<const pugi::xml_document>
XMLDocument::Load(const std::filesystem::path& xml_filepath) {
  ValidateXML(xml_filepath);
  auto doc = std::make_unique<pugi::xml_document>();
  const auto result = doc->load_file(xml_filepath.c_str());
  if (!result) {
    throw std::runtime_error(
        xml_filepath.string() + ": offset " + std::to_string(result.offset) +
        ": " + result.description());
  }
  return doc;
}
