#pragma once

#include <filesystem>

/// @brief Validates an XML file against the schema it references
/// @exception std::runtime_error The file is not well-formed or does not
///            conform to its schema. The message gives the file location.
void ValidateXML(const std::filesystem::path& xml_filepath);
