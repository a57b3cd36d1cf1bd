#pragma once
#include <string>

namespace mbpi {

struct Resolved
{
  std::string local_path;   // path to feed the URDF loader
  std::string source_root;  // which MBPI_MODEL_PATH root matched (empty for plain paths)
};

/**
 * Resolve a URDF template URI to a local file path.
 *
 * Supported inputs:
 *  - model://robot/urdf/file.urdf  (searched under MBPI_MODEL_PATH roots)
 *  - file:///abs/path or absolute/relative filesystem paths
 *
 * Search roots:
 *  - Read from env var MBPI_MODEL_PATH (Unix ':' | Windows ';' separated)
 *
 * @param uri         The URI/path of the template
 * @param current_dir Used to resolve *relative* non-model paths
 * @param env_roots   Optional override for MBPI_MODEL_PATH (tests)
 * @throws std::runtime_error on failure (unset paths, not found, unsupported scheme)
 */
Resolved resolve_model_uri(const std::string& uri, const std::string& current_dir = "",
                           const char* env_roots = nullptr);

}  // namespace mbpi
