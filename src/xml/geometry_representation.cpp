#include <mbpi/xml/geometry_representation.h>

#include <type_traits>

#include <mbpi/conversion.h>
#include <mbpi/errors.h>

namespace mbpi {
namespace xml {

UrdfShapeRepresentation boxRepresentation(const geometry::Box& box)
{
  // URDF wants full edge lengths.
  const Eigen::Vector3d size = 2.0 * box.half_lengths;
  return { UrdfElementType::Box, { { attrs::SIZE, joinDoubles(size) } } };
}

UrdfShapeRepresentation sphereRepresentation(const geometry::Sphere& sphere)
{
  return { UrdfElementType::Sphere, { { attrs::RADIUS, formatDouble(sphere.radius) } } };
}

UrdfShapeRepresentation representation(const geometry::CollisionGeometry& geometry)
{
  if (geometry.valueless_by_exception())
    throw UnsupportedGeometryError("Unsupported collision geometry for URDF representation: " +
                                   geometry::geometryTypeName(geometry));

  return std::visit(
      [](const auto& g) -> UrdfShapeRepresentation {
        using T = std::decay_t<decltype(g)>;
        if constexpr (std::is_same_v<T, geometry::Box>)
          return boxRepresentation(g);
        else if constexpr (std::is_same_v<T, geometry::Sphere>)
          return sphereRepresentation(g);
        else
        {
          static_assert(std::is_same_v<T, geometry::Polygon>, "unhandled CollisionGeometry alternative");
          throw UnsupportedOperationError("Polygon URDF representation not implemented (" +
                                          std::to_string(g.vertices.size()) + " vertices)");
        }
      },
      geometry);
}

}  // namespace xml
}  // namespace mbpi
