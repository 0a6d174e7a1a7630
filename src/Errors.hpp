#pragma once

#include <stdexcept>

/// @file
/// @brief Exceptions thrown by nucquery. Each derives from std::runtime_error
///        so callers that do not care about the kind can catch that alone.

/// @brief The backing file of a source is missing, unreadable, or yielded no
///        nuclides
class SourceUnavailable : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// @brief A source name is not one of the known sources
class UnknownSource : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// @brief A nuclide string such as "Fe56" could not be turned into @f$ (Z, N)
///        @f$
class MalformedIdentity : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// @brief A well-formed identity has no record in the requested source
class NotFound : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};
