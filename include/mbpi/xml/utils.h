#ifndef MBPI_XML_UTILS_H_
#define MBPI_XML_UTILS_H_

#include <string>
#include <vector>

#include <tinyxml2.h>

#include <mbpi/xml/urdf_schema.h>

namespace mbpi {
namespace xml {

// Every element named `tag` under (and including) root, in document order.
void collectElements(tinyxml2::XMLElement* root, const char* tag, std::vector<tinyxml2::XMLElement*>& out);
void collectElements(const tinyxml2::XMLElement* root, const char* tag,
                     std::vector<const tinyxml2::XMLElement*>& out);

// Sets each attribute, keeping the others.
void setAttributes(tinyxml2::XMLElement* elem, const AttributeMap& attributes);

// Drops every existing attribute, then sets `attributes` in order.
void replaceAttributes(tinyxml2::XMLElement* elem, const AttributeMap& attributes);

AttributeMap attributesOf(const tinyxml2::XMLElement* elem);

// Serialized subtree rooted at elem (no declaration).
std::string printElement(const tinyxml2::XMLElement* elem, bool compact = false);

// "error name: detail (line N)" for a failed Parse()/LoadFile().
std::string describeError(const tinyxml2::XMLDocument& doc);

}  // namespace xml
}  // namespace mbpi

#endif  // MBPI_XML_UTILS_H_
