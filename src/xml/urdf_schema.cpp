#include <mbpi/xml/urdf_schema.h>

namespace mbpi {
namespace xml {

namespace {

constexpr const char* ZERO_FLOAT = "0.";
constexpr const char* ZERO_FLOAT_3 = "0. 0. 0.";

constexpr UrdfElementType ALL_ELEMENT_TYPES[] = {
  UrdfElementType::Origin,    UrdfElementType::Mass, UrdfElementType::Inertia,
  UrdfElementType::Inertial,  UrdfElementType::Geometry, UrdfElementType::Collision,
  UrdfElementType::Box,       UrdfElementType::Sphere, UrdfElementType::Cylinder,
};

}  // namespace

// No default branches below: -Wswitch flags any UrdfElementType left out.

const char* tagName(UrdfElementType type)
{
  switch (type)
  {
    case UrdfElementType::Origin:
      return "origin";
    case UrdfElementType::Mass:
      return "mass";
    case UrdfElementType::Inertia:
      return "inertia";
    case UrdfElementType::Inertial:
      return "inertial";
    case UrdfElementType::Geometry:
      return "geometry";
    case UrdfElementType::Collision:
      return "collision";
    case UrdfElementType::Box:
      return "box";
    case UrdfElementType::Sphere:
      return "sphere";
    case UrdfElementType::Cylinder:
      return "cylinder";
  }
  return "unknown";
}

std::optional<UrdfElementType> elementTypeFromTag(std::string_view tag)
{
  for (UrdfElementType type : ALL_ELEMENT_TYPES)
    if (tag == tagName(type))
      return type;
  return std::nullopt;
}

AttributeMap defaultAttributes(UrdfElementType type)
{
  switch (type)
  {
    case UrdfElementType::Origin:
      return { { attrs::XYZ, ZERO_FLOAT_3 }, { attrs::RPY, ZERO_FLOAT_3 } };
    case UrdfElementType::Mass:
      return { { attrs::VALUE, ZERO_FLOAT } };
    case UrdfElementType::Inertia:
    {
      AttributeMap out;
      for (const char* name : INERTIA_ATTRIBUTES)
        out.emplace_back(name, ZERO_FLOAT);
      return out;
    }
    case UrdfElementType::Box:
      return { { attrs::SIZE, ZERO_FLOAT_3 } };
    case UrdfElementType::Sphere:
      return { { attrs::RADIUS, ZERO_FLOAT } };
    case UrdfElementType::Cylinder:
      return { { attrs::RADIUS, ZERO_FLOAT }, { attrs::LENGTH, ZERO_FLOAT } };
    case UrdfElementType::Inertial:
    case UrdfElementType::Geometry:
    case UrdfElementType::Collision:
      return {};
  }
  return {};
}

std::vector<UrdfElementType> requiredChildren(UrdfElementType type)
{
  switch (type)
  {
    case UrdfElementType::Inertial:
      return { UrdfElementType::Origin, UrdfElementType::Mass, UrdfElementType::Inertia };
    case UrdfElementType::Collision:
      return { UrdfElementType::Geometry, UrdfElementType::Origin };
    case UrdfElementType::Origin:
    case UrdfElementType::Mass:
    case UrdfElementType::Inertia:
    case UrdfElementType::Geometry:
    case UrdfElementType::Box:
    case UrdfElementType::Sphere:
    case UrdfElementType::Cylinder:
      return {};
  }
  return {};
}

}  // namespace xml
}  // namespace mbpi
