#ifndef MBPI_ERRORS_H_
#define MBPI_ERRORS_H_

#include <stdexcept>
#include <string>

namespace mbpi {

// Ambiguous or missing free-base body, non-quaternion floating joint,
// duplicate body identifiers, misaligned parameter tables.
class ConfigurationError : public std::runtime_error
{
public:
  explicit ConfigurationError(const std::string& what) : std::runtime_error(what)
  {
  }
};

// Geometry variant that cannot be represented in a URDF document.
class UnsupportedGeometryError : public std::runtime_error
{
public:
  explicit UnsupportedGeometryError(const std::string& what) : std::runtime_error(what)
  {
  }
};

// Geometry that is known but whose export is not implemented (e.g. polygons).
class UnsupportedOperationError : public UnsupportedGeometryError
{
public:
  explicit UnsupportedOperationError(const std::string& what) : UnsupportedGeometryError(what)
  {
  }
};

// More than one geometry attached to a single link.
class UnsupportedConfigurationError : public std::runtime_error
{
public:
  explicit UnsupportedConfigurationError(const std::string& what) : std::runtime_error(what)
  {
  }
};

// Name or index absent from the live topology or the lookup tables.
class LookupError : public std::runtime_error
{
public:
  explicit LookupError(const std::string& what) : std::runtime_error(what)
  {
  }
};

}  // namespace mbpi

#endif  // MBPI_ERRORS_H_
