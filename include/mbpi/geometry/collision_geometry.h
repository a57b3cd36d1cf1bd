#ifndef MBPI_GEOMETRY_COLLISION_GEOMETRY_H_
#define MBPI_GEOMETRY_COLLISION_GEOMETRY_H_

#include <string>
#include <variant>
#include <vector>

#include <Eigen/Core>

namespace mbpi {
namespace geometry {

// clang-format off
/*
| Geometry | Parameters          | URDF export                         |
|----------|---------------------|-------------------------------------|
| Box      | half_lengths (x,y,z)| <box size="2x 2y 2z"/>              |
| Sphere   | radius              | <sphere radius="r"/>                |
| Polygon  | vertices            | not exportable (contact-only shape) |
*/
// clang-format on

struct Box
{
  Eigen::Vector3d half_lengths = Eigen::Vector3d::Zero();
};

struct Sphere
{
  double radius = 0.0;
};

// Convex polygon/polytope given by its vertices in the body frame.
struct Polygon
{
  std::vector<Eigen::Vector3d> vertices;
};

// Closed set of collision geometries. Adding an alternative forces every
// std::visit over it to be updated.
using CollisionGeometry = std::variant<Box, Sphere, Polygon>;

// "Box", "Sphere", "Polygon", or "valueless".
std::string geometryTypeName(const CollisionGeometry& geometry);

}  // namespace geometry
}  // namespace mbpi

#endif  // MBPI_GEOMETRY_COLLISION_GEOMETRY_H_
