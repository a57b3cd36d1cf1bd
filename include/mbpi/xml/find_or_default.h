#ifndef MBPI_XML_FIND_OR_DEFAULT_H_
#define MBPI_XML_FIND_OR_DEFAULT_H_

#include <tinyxml2.h>

#include <mbpi/xml/urdf_schema.h>

namespace mbpi {
namespace xml {

struct ResolvedElement
{
  tinyxml2::XMLElement* element = nullptr;
  bool synthesized = false;  // true if the subtree was created by this call
};

// First child of parent with the tag of `type`, or nullptr. Never mutates.
const tinyxml2::XMLElement* findChild(const tinyxml2::XMLElement* parent, UrdfElementType type);
tinyxml2::XMLElement* findChild(tinyxml2::XMLElement* parent, UrdfElementType type);

int countChildren(const tinyxml2::XMLElement* parent, UrdfElementType type);

/**
 * Creates a detached default subtree of `type` owned by `doc`: default
 * attributes from the schema, then each required child type, depth-first and in
 * schema order.
 */
tinyxml2::XMLElement* generateDefaultElement(tinyxml2::XMLDocument& doc, UrdfElementType type);

/**
 * Finds a child of `parent` of the given type, appending a default subtree if
 * there is none.
 *
 * Example, with parent an empty <inertial/>:
 *
 *     findOrDefault(parent, UrdfElementType::Mass)
 *     // parent is now <inertial><mass value="0."/></inertial>
 *     // returns { <mass value="0."/>, synthesized = true }
 *
 * An existing child is returned unmodified. When several children of that type
 * exist, the first one is returned; the others are left alone.
 */
ResolvedElement findOrDefault(tinyxml2::XMLElement* parent, UrdfElementType type);

}  // namespace xml
}  // namespace mbpi

#endif  // MBPI_XML_FIND_OR_DEFAULT_H_
