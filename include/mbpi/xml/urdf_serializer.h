#ifndef MBPI_XML_URDF_SERIALIZER_H_
#define MBPI_XML_URDF_SERIALIZER_H_

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <Eigen/Core>
#include <tinyxml2.h>

#include <mbpi/geometry/collision_geometry.h>
#include <mbpi/multibody/body_registry.h>
#include <mbpi/multibody/topology.h>
#include <mbpi/xml/urdf_source.h>

namespace mbpi {
namespace xml {

constexpr const char* URDF_DECLARATION = "<?xml version=\"1.0\"?>";

struct SerializerOptions
{
  // Fail if the template's link names and the instance's body names are not
  // in one-to-one correspondence. Off: links are matched by name, unchecked.
  bool verify_link_bijection = false;

  // MBPI_MODEL_PATH override for model:// templates (empty = environment).
  std::string model_path;

  // verify_link_bijection from MBPI_VERIFY_LINK_NAMES (1/true/on).
  static SerializerOptions fromEnvironment();
};

// Body identifier -> indices into MultibodyParameterization::geometries.
using GeometryAssignment = std::unordered_map<std::string, std::vector<std::size_t>>;

// Current learned parameters of every inertial body.
struct MultibodyParameterization
{
  multibody::BodyIdentifierList body_ids;  // row i of pi belongs to body_ids.at(i)
  GeometryAssignment geometry_body_assignment;
  std::vector<geometry::CollisionGeometry> geometries;
  Eigen::MatrixXd pi;  // body_ids.size() x 10
};

// (model name, URDF document) pairs, in template order.
using UrdfDocuments = std::vector<std::pair<std::string, std::string>>;

/**
 * Renders the current parameterization as one URDF document per template.
 *
 * Each template is parsed fresh; every <link> whose "{instance}_{name}"
 * identifier is in params.body_ids gets its inertial and collision elements
 * rewritten, other links are left untouched. The template key must be the exact
 * name of a model instance of the topology.
 *
 * Link names are assumed to equal the simulator's body names. Enable
 * options.verify_link_bijection to check it.
 *
 * @throws LookupError if a template name is not a model instance, or a geometry
 *         index is out of range.
 * @throws ConfigurationError if pi is not body_ids.size() x 10, a written row has
 *         zero or non-finite mass, or the bijection check fails.
 * @throws UnsupportedConfigurationError, UnsupportedGeometryError from the link
 *         writer. No partial output is returned once a link fails.
 */
UrdfDocuments representMultibodyAsUrdfs(const UrdfTemplates& urdfs, const MultibodyParameterization& params,
                                        const multibody::MultibodyTopology& topology,
                                        const SerializerOptions& options = {});

/// Single-template version of representMultibodyAsUrdfs().
std::string representModelAsUrdf(const std::string& model_name, const UrdfSource& source,
                                 const MultibodyParameterization& params,
                                 const multibody::MultibodyTopology& topology, const SerializerOptions& options = {});

/**
 * Checks that every link of the template (other than "world") names a body of
 * the instance, and every body of the instance has exactly one link.
 *
 * @throws ConfigurationError naming the first offending link or body.
 */
void verifyLinkBijection(const tinyxml2::XMLElement* robot, multibody::ModelInstanceIndex instance,
                         const multibody::MultibodyTopology& topology);

/// Writes each document to <directory>/<model name>.urdf. Throws std::runtime_error on I/O failure.
void writeUrdfs(const UrdfDocuments& urdfs, const std::string& directory);

}  // namespace xml
}  // namespace mbpi

#endif  // MBPI_XML_URDF_SERIALIZER_H_
