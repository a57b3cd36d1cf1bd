#include <mbpi/xml/find_or_default.h>

#include <stdexcept>
#include <string>

#include <mbpi/xml/utils.h>

namespace mbpi {
namespace xml {

const tinyxml2::XMLElement* findChild(const tinyxml2::XMLElement* parent, UrdfElementType type)
{
  return parent ? parent->FirstChildElement(tagName(type)) : nullptr;
}

tinyxml2::XMLElement* findChild(tinyxml2::XMLElement* parent, UrdfElementType type)
{
  return parent ? parent->FirstChildElement(tagName(type)) : nullptr;
}

int countChildren(const tinyxml2::XMLElement* parent, UrdfElementType type)
{
  int n = 0;
  for (const auto* kid = findChild(parent, type); kid; kid = kid->NextSiblingElement(tagName(type)))
    ++n;
  return n;
}

tinyxml2::XMLElement* generateDefaultElement(tinyxml2::XMLDocument& doc, UrdfElementType type)
{
  tinyxml2::XMLElement* elem = doc.NewElement(tagName(type));
  setAttributes(elem, defaultAttributes(type));
  for (UrdfElementType child : requiredChildren(type))
    elem->InsertEndChild(generateDefaultElement(doc, child));
  return elem;
}

ResolvedElement findOrDefault(tinyxml2::XMLElement* parent, UrdfElementType type)
{
  if (!parent)
    throw std::invalid_argument(std::string("findOrDefault: null parent for <") + tagName(type) + ">");

  if (tinyxml2::XMLElement* existing = findChild(parent, type))
    return { existing, false };

  tinyxml2::XMLElement* created = generateDefaultElement(*parent->GetDocument(), type);
  parent->InsertEndChild(created);
  return { created, true };
}

}  // namespace xml
}  // namespace mbpi
