#ifndef MBPI_XML_GEOMETRY_REPRESENTATION_H_
#define MBPI_XML_GEOMETRY_REPRESENTATION_H_

#include <mbpi/geometry/collision_geometry.h>
#include <mbpi/xml/urdf_schema.h>

namespace mbpi {
namespace xml {

// Shape tag and attributes to put under <collision><geometry>.
struct UrdfShapeRepresentation
{
  UrdfElementType type = UrdfElementType::Box;
  AttributeMap attributes;
};

/**
 * URDF representation of a collision geometry.
 *
 * Example, for a Sphere of radius 5.1:
 *
 *     { UrdfElementType::Sphere, { { "radius", "5.1" } } }
 *
 * @throws UnsupportedOperationError for polygons (export not implemented).
 * @throws UnsupportedGeometryError for any other geometry that has no URDF form.
 */
UrdfShapeRepresentation representation(const geometry::CollisionGeometry& geometry);

UrdfShapeRepresentation boxRepresentation(const geometry::Box& box);
UrdfShapeRepresentation sphereRepresentation(const geometry::Sphere& sphere);

}  // namespace xml
}  // namespace mbpi

#endif  // MBPI_XML_GEOMETRY_REPRESENTATION_H_
