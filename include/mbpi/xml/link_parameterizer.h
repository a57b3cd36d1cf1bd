#ifndef MBPI_XML_LINK_PARAMETERIZER_H_
#define MBPI_XML_LINK_PARAMETERIZER_H_

#include <vector>

#include <tinyxml2.h>

#include <mbpi/geometry/collision_geometry.h>
#include <mbpi/geometry/inertia.h>

namespace mbpi {
namespace xml {

/**
 * Writes one body's inertial parameters and collision geometry into its URDF
 * <link> element.
 *
 *   <inertial>
 *     <origin xyz="com"/>        (center of mass)
 *     <mass value="m"/>
 *     <inertia ixx iyy izz ixy ixz iyz/>   (about the center of mass)
 *   </inertial>
 *   <collision><geometry><box|sphere .../></geometry></collision>
 *
 * Missing elements are synthesized with defaults. The <inertia> and shape
 * elements have their attributes replaced wholesale; unrelated attributes on
 * them are dropped.
 *
 * @param link       URDF <link> element
 * @param pi         pi parameterization of the body
 * @param geometries geometries attached to the body (zero or one)
 * @throws UnsupportedConfigurationError if more than one geometry is given.
 * @throws ConfigurationError if the mass pi(0) is zero or not finite.
 */
void fillLinkWithParameterization(tinyxml2::XMLElement* link, const geometry::PiVector& pi,
                                  const std::vector<const geometry::CollisionGeometry*>& geometries);

/**
 * Reads the <inertial> subtree of a link back into a pi vector. Missing
 * elements or attributes read as zero; values may be math expressions.
 *
 * @throws std::runtime_error on malformed numbers.
 */
geometry::PiVector extractLinkParameterization(const tinyxml2::XMLElement* link);

/// Same, without the pi conversion.
geometry::UrdfInertial extractLinkInertial(const tinyxml2::XMLElement* link);

}  // namespace xml
}  // namespace mbpi

#endif  // MBPI_XML_LINK_PARAMETERIZER_H_
