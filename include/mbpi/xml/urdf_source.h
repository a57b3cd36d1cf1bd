#ifndef MBPI_XML_URDF_SOURCE_H_
#define MBPI_XML_URDF_SOURCE_H_

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <tinyxml2.h>

namespace mbpi {
namespace xml {

/// Where a URDF template comes from: a file (path, file:// or model:// URI) or inline text.
struct UrdfSource
{
  enum class Kind
  {
    File,
    Text
  };

  Kind kind = Kind::File;
  std::string location;  // path/URI for File, XML for Text
  std::string base_dir;  // resolves relative File paths

  static UrdfSource fromFile(const std::string& uri, const std::string& base_dir = "");
  static UrdfSource fromText(const std::string& xml);
};

// (model name, template) pairs, in model order.
using UrdfTemplates = std::vector<std::pair<std::string, UrdfSource>>;

/**
 * Parses a fresh document from the source. Each call re-reads the source; no
 * document is cached.
 *
 * @param env_roots optional override for MBPI_MODEL_PATH
 * @throws std::runtime_error if the file cannot be resolved/loaded or the XML is
 *         malformed, or if the root element is not <robot>.
 */
std::unique_ptr<tinyxml2::XMLDocument> loadUrdfDocument(const UrdfSource& source, const char* env_roots = nullptr);

}  // namespace xml
}  // namespace mbpi

#endif  // MBPI_XML_URDF_SOURCE_H_
