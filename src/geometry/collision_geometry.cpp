#include <mbpi/geometry/collision_geometry.h>

#include <type_traits>

namespace mbpi {
namespace geometry {

std::string geometryTypeName(const CollisionGeometry& geometry)
{
  if (geometry.valueless_by_exception())
    return "valueless";

  return std::visit(
      [](const auto& g) -> std::string {
        using T = std::decay_t<decltype(g)>;
        if constexpr (std::is_same_v<T, Box>)
          return "Box";
        else if constexpr (std::is_same_v<T, Sphere>)
          return "Sphere";
        else
        {
          static_assert(std::is_same_v<T, Polygon>, "unhandled CollisionGeometry alternative");
          return "Polygon";
        }
      },
      geometry);
}

}  // namespace geometry
}  // namespace mbpi
