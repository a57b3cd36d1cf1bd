#include <mbpi/xml/utils.h>

namespace mbpi {
namespace xml {

void collectElements(tinyxml2::XMLElement* root, const char* tag, std::vector<tinyxml2::XMLElement*>& out)
{
  if (!root)
    return;
  if (std::string(root->Name()) == tag)
    out.push_back(root);
  for (tinyxml2::XMLElement* kid = root->FirstChildElement(); kid; kid = kid->NextSiblingElement())
    collectElements(kid, tag, out);
}

void collectElements(const tinyxml2::XMLElement* root, const char* tag,
                     std::vector<const tinyxml2::XMLElement*>& out)
{
  if (!root)
    return;
  if (std::string(root->Name()) == tag)
    out.push_back(root);
  for (const tinyxml2::XMLElement* kid = root->FirstChildElement(); kid; kid = kid->NextSiblingElement())
    collectElements(kid, tag, out);
}

void setAttributes(tinyxml2::XMLElement* elem, const AttributeMap& attributes)
{
  for (const auto& [name, value] : attributes)
    elem->SetAttribute(name.c_str(), value.c_str());
}

void replaceAttributes(tinyxml2::XMLElement* elem, const AttributeMap& attributes)
{
  std::vector<std::string> names;
  for (const tinyxml2::XMLAttribute* a = elem->FirstAttribute(); a; a = a->Next())
    names.emplace_back(a->Name());
  for (const auto& name : names)
    elem->DeleteAttribute(name.c_str());

  setAttributes(elem, attributes);
}

AttributeMap attributesOf(const tinyxml2::XMLElement* elem)
{
  AttributeMap out;
  for (const tinyxml2::XMLAttribute* a = elem->FirstAttribute(); a; a = a->Next())
    out.emplace_back(a->Name(), a->Value());
  return out;
}

std::string printElement(const tinyxml2::XMLElement* elem, bool compact)
{
  tinyxml2::XMLPrinter printer(nullptr, compact);
  elem->Accept(&printer);
  return printer.CStr();
}

std::string describeError(const tinyxml2::XMLDocument& doc)
{
  std::string out = doc.ErrorName();
  if (const char* detail = doc.ErrorStr())
    out += std::string(": ") + detail;
  out += " (line " + std::to_string(doc.ErrorLineNum()) + ")";
  return out;
}

}  // namespace xml
}  // namespace mbpi
