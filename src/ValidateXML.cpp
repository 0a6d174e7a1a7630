#include "ValidateXML.hpp"

#include "xercesc/parsers/XercesDOMParser.hpp"
#include "xercesc/sax/ErrorHandler.hpp"
#include "xercesc/sax/SAXParseException.hpp"
#include "xercesc/util/PlatformUtils.hpp"
#include "xercesc/util/XMLException.hpp"
#include "xercesc/util/XMLString.hpp"

#include <memory>
#include <stdexcept>
#include <string>

namespace {
// Convert from XMLCh array to std::string
std::string toCharString(const XMLCh* const str) {
  // transcode gives us ownership of a char array
  std::unique_ptr<char[], void (*)(char*)> p{
      xercesc::XMLString::transcode(str),
      [](char* s) { xercesc::XMLString::release(&s); }};
  return p ? std::string{p.get()} : std::string{};
}

// RAII wrapper for initializing and terminating the Xerces system.
class XercesInitializer {
public:
  // Initializes Xerces
  XercesInitializer() { xercesc::XMLPlatformUtils::Initialize(); }
  // Terminates Xerces
  ~XercesInitializer() noexcept { xercesc::XMLPlatformUtils::Terminate(); }
  XercesInitializer(const XercesInitializer&) = delete;
  XercesInitializer& operator=(const XercesInitializer&) = delete;
};

// Error handler registered to xercesc::XercesDOMParser. Every warning or error
// aborts validation.
class XercesErrorHandler : public xercesc::ErrorHandler {
public:
  void warning(const xercesc::SAXParseException& exc) final {
    HandleException(exc);
  }
  void error(const xercesc::SAXParseException& exc) final {
    HandleException(exc);
  }
  void fatalError(const xercesc::SAXParseException& exc) final {
    HandleException(exc);
  }
  void resetErrors() noexcept final {}

private:
  // Throws with file location information if available
  [[noreturn]] static void
  HandleException(const xercesc::SAXParseException& exc) {
    std::string error_message;
    const auto filename = toCharString(exc.getSystemId());
    const auto line_number = exc.getLineNumber();
    const auto column_number = exc.getColumnNumber();
    if (!filename.empty() && line_number != 0 && column_number != 0) {
      error_message += filename + ": line " + std::to_string(line_number) +
                       ": column " + std::to_string(column_number) + "\n";
    }
    error_message += toCharString(exc.getMessage()) + "\n";
    throw std::runtime_error(error_message);
  }
};
} // namespace

void ValidateXML(const std::filesystem::path& xml_filepath) {
  if (!std::filesystem::exists(xml_filepath)) {
    throw std::runtime_error(
        "XML file not found: " + xml_filepath.string());
  }
  XercesInitializer init;
  XercesErrorHandler error_handler;
  xercesc::XercesDOMParser parser;
  parser.setValidationScheme(xercesc::XercesDOMParser::Val_Always);
  parser.setDoSchema(true);
  parser.setDoNamespaces(true);
  parser.setValidationSchemaFullChecking(true);
  parser.setErrorHandler(&error_handler);
  try {
    parser.parse(xml_filepath.string().c_str());
  }
  catch (const xercesc::XMLException& e) {
    throw std::runtime_error(
        xml_filepath.string() + ": " + toCharString(e.getMessage()));
  }
}
