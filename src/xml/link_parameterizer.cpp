#include <mbpi/xml/link_parameterizer.h>

#include <cmath>
#include <iostream>
#include <string>

#include <mbpi/conversion.h>
#include <mbpi/errors.h>
#include <mbpi/xml/expression_parser.h>
#include <mbpi/xml/find_or_default.h>
#include <mbpi/xml/geometry_representation.h>
#include <mbpi/xml/utils.h>

namespace mbpi {
namespace xml {

namespace {

std::string linkName(const tinyxml2::XMLElement* link)
{
  const char* name = link->Attribute(attrs::NAME);
  return name ? name : "<unnamed>";
}

void warnOnDuplicates(const tinyxml2::XMLElement* link, UrdfElementType type)
{
  const int n = countChildren(link, type);
  if (n > 1)
    std::cerr << "[urdf] link '" << linkName(link) << "' has " << n << " <" << tagName(type)
              << "> elements; only the first is updated" << std::endl;
}

}  // namespace

void fillLinkWithParameterization(tinyxml2::XMLElement* link, const geometry::PiVector& pi,
                                  const std::vector<const geometry::CollisionGeometry*>& geometries)
{
  if (geometries.size() > 1)
    throw UnsupportedConfigurationError("Link '" + linkName(link) + "' has " + std::to_string(geometries.size()) +
                                        " geometries; URDF export supports one geometry per body");

  if (pi(0) == 0.0 || !std::isfinite(pi(0)))
    throw ConfigurationError("Link '" + linkName(link) + "' has non-invertible mass " + formatDouble(pi(0)));

  const geometry::UrdfInertial inertial = geometry::piToUrdf(pi);

  warnOnDuplicates(link, UrdfElementType::Inertial);
  tinyxml2::XMLElement* inertial_elem = findOrDefault(link, UrdfElementType::Inertial).element;

  findOrDefault(inertial_elem, UrdfElementType::Mass).element->SetAttribute(attrs::VALUE,
                                                                            formatDouble(inertial.mass).c_str());
  findOrDefault(inertial_elem, UrdfElementType::Origin)
      .element->SetAttribute(attrs::XYZ, joinDoubles(inertial.center_of_mass).c_str());

  AttributeMap inertia_attributes;
  for (int i = 0; i < 6; ++i)
    inertia_attributes.emplace_back(INERTIA_ATTRIBUTES[i], formatDouble(inertial.inertia(i)));
  replaceAttributes(findOrDefault(inertial_elem, UrdfElementType::Inertia).element, inertia_attributes);

  for (const geometry::CollisionGeometry* geometry : geometries)
  {
    warnOnDuplicates(link, UrdfElementType::Collision);
    tinyxml2::XMLElement* collision_elem = findOrDefault(link, UrdfElementType::Collision).element;
    tinyxml2::XMLElement* geometry_elem = findOrDefault(collision_elem, UrdfElementType::Geometry).element;

    const UrdfShapeRepresentation shape = representation(*geometry);
    replaceAttributes(findOrDefault(geometry_elem, shape.type).element, shape.attributes);
  }
}

geometry::UrdfInertial extractLinkInertial(const tinyxml2::XMLElement* link)
{
  geometry::UrdfInertial inertial;

  const tinyxml2::XMLElement* inertial_elem = findChild(link, UrdfElementType::Inertial);
  if (!inertial_elem)
    return inertial;

  inertial.mass = evalNumberAttribute(findChild(inertial_elem, UrdfElementType::Mass), attrs::VALUE, 0.0);
  inertial.center_of_mass = evalVector3Attribute(findChild(inertial_elem, UrdfElementType::Origin), attrs::XYZ,
                                                 Eigen::Vector3d::Zero());

  const tinyxml2::XMLElement* inertia_elem = findChild(inertial_elem, UrdfElementType::Inertia);
  for (int i = 0; i < 6; ++i)
    inertial.inertia(i) = evalNumberAttribute(inertia_elem, INERTIA_ATTRIBUTES[i], 0.0);

  return inertial;
}

geometry::PiVector extractLinkParameterization(const tinyxml2::XMLElement* link)
{
  return geometry::urdfToPi(extractLinkInertial(link));
}

}  // namespace xml
}  // namespace mbpi
