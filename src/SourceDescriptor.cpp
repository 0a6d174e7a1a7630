#include "SourceDescriptor.hpp"

// SourceDescriptor

//// public

std::string SourceDescriptor::ToString(Kind kind) {
  switch (kind) {
  case Kind::experimental:
    return "experimental";
  case Kind::theoretical:
    return "theoretical";
  }
  return "unknown";
}
