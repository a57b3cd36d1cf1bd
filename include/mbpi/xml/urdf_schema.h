#ifndef MBPI_XML_URDF_SCHEMA_H_
#define MBPI_XML_URDF_SCHEMA_H_

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mbpi {
namespace xml {

// Ordered flat attribute map, written to elements in this order.
using AttributeMap = std::vector<std::pair<std::string, std::string>>;

// URDF elements that can be synthesized with defaults.
enum class UrdfElementType
{
  Origin,
  Mass,
  Inertia,
  Inertial,
  Geometry,
  Collision,
  Box,
  Sphere,
  Cylinder,
};

// clang-format off
/*
| Element   | Default attributes                        | Required children        |
|-----------|-------------------------------------------|--------------------------|
| origin    | xyz="0. 0. 0." rpy="0. 0. 0."             |                          |
| mass      | value="0."                                |                          |
| inertia   | ixx iyy izz ixy ixz iyz = "0."            |                          |
| inertial  |                                           | origin, mass, inertia    |
| geometry  |                                           |                          |
| collision |                                           | geometry, origin         |
| box       | size="0. 0. 0."                           |                          |
| sphere    | radius="0."                               |                          |
| cylinder  | radius="0." length="0."                   |                          |
*/
// clang-format on

namespace tags {
constexpr const char* ROBOT = "robot";
constexpr const char* LINK = "link";
constexpr const char* JOINT = "joint";
constexpr const char* PARENT = "parent";
constexpr const char* CHILD = "child";
}  // namespace tags

namespace attrs {
constexpr const char* NAME = "name";
constexpr const char* TYPE = "type";
constexpr const char* LINK = "link";
constexpr const char* VALUE = "value";
constexpr const char* SIZE = "size";
constexpr const char* RADIUS = "radius";
constexpr const char* LENGTH = "length";
constexpr const char* XYZ = "xyz";
constexpr const char* RPY = "rpy";
constexpr const char* IXX = "ixx";
constexpr const char* IYY = "iyy";
constexpr const char* IZZ = "izz";
constexpr const char* IXY = "ixy";
constexpr const char* IXZ = "ixz";
constexpr const char* IYZ = "iyz";
}  // namespace attrs

// Inertia attribute names in pi / InertiaEntries order.
constexpr const char* INERTIA_ATTRIBUTES[6] = { attrs::IXX, attrs::IYY, attrs::IZZ,
                                                attrs::IXY, attrs::IXZ, attrs::IYZ };

const char* tagName(UrdfElementType type);
std::optional<UrdfElementType> elementTypeFromTag(std::string_view tag);

AttributeMap defaultAttributes(UrdfElementType type);
std::vector<UrdfElementType> requiredChildren(UrdfElementType type);

}  // namespace xml
}  // namespace mbpi

#endif  // MBPI_XML_URDF_SCHEMA_H_
