#include <mbpi/xml/urdf_source.h>

#include <iostream>
#include <stdexcept>

#include <mbpi/uri_resolver.h>
#include <mbpi/xml/urdf_schema.h>
#include <mbpi/xml/utils.h>

namespace mbpi {
namespace xml {

UrdfSource UrdfSource::fromFile(const std::string& uri, const std::string& base_dir)
{
  return { Kind::File, uri, base_dir };
}

UrdfSource UrdfSource::fromText(const std::string& xml)
{
  return { Kind::Text, xml, "" };
}

std::unique_ptr<tinyxml2::XMLDocument> loadUrdfDocument(const UrdfSource& source, const char* env_roots)
{
  auto doc = std::make_unique<tinyxml2::XMLDocument>();

  std::string origin = "<inline text>";
  if (source.kind == UrdfSource::Kind::File)
  {
    const Resolved resolved = resolve_model_uri(source.location, source.base_dir, env_roots);
    origin = resolved.local_path;
    if (doc->LoadFile(resolved.local_path.c_str()) != tinyxml2::XML_SUCCESS)
    {
      std::cerr << "[urdf] Error loading URDF file: " << resolved.local_path << std::endl;
      throw std::runtime_error("Failed to load URDF '" + source.location + "': " + describeError(*doc));
    }
  }
  else if (doc->Parse(source.location.c_str()) != tinyxml2::XML_SUCCESS)
  {
    std::cerr << "[urdf] Error parsing URDF text" << std::endl;
    throw std::runtime_error("Failed to parse URDF text: " + describeError(*doc));
  }

  const tinyxml2::XMLElement* root = doc->RootElement();
  if (!root || std::string(root->Name()) != tags::ROBOT)
    throw std::runtime_error("URDF " + origin + " has root <" + (root ? root->Name() : "") + ">, expected <robot>");

  return doc;
}

}  // namespace xml
}  // namespace mbpi
