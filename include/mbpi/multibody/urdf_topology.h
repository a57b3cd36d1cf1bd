#ifndef MBPI_MULTIBODY_URDF_TOPOLOGY_H_
#define MBPI_MULTIBODY_URDF_TOPOLOGY_H_

#include <string>
#include <vector>

#include <tinyxml2.h>

#include <mbpi/multibody/topology.h>
#include <mbpi/xml/urdf_source.h>

namespace mbpi {
namespace multibody {

constexpr const char* WORLD_MODEL_INSTANCE_NAME = "WorldModelInstance";

/**
 * Topology of a system assembled from one URDF per model instance, the way a
 * URDF-parsing simulator lays it out:
 *
 *  - instance 0 is the world pseudo-instance, owning the single "world" body;
 *  - each URDF adds one instance, named after its template key, with one body
 *    per <link> in document order (a link named "world" is the world body);
 *  - a root link with no parent joint, or attached to "world" by a floating
 *    joint, becomes a quaternion free-base body (7 positions, 6 velocities).
 *
 * Joint DOFs (positions/velocities): fixed 0/0, revolute/continuous/prismatic
 * 1/1, planar 3/3, floating 7/6.
 */
class UrdfMultibodyTopology : public MultibodyTopology
{
public:
  /// @throws ConfigurationError, LookupError, std::runtime_error on malformed models.
  explicit UrdfMultibodyTopology(const xml::UrdfTemplates& urdfs, const char* env_roots = nullptr);

  std::vector<ModelInstanceIndex> modelInstances() const override;
  const std::string& modelInstanceName(ModelInstanceIndex instance) const override;
  ModelInstanceIndex modelInstanceByName(const std::string& name) const override;
  bool hasUniqueFreeBaseBody(ModelInstanceIndex instance) const override;
  BodyIndex uniqueFreeBaseBody(ModelInstanceIndex instance) const override;
  bool hasQuaternionDofs(BodyIndex body) const override;
  int numPositions(ModelInstanceIndex instance) const override;
  int numVelocities(ModelInstanceIndex instance) const override;
  std::vector<BodyIndex> bodies(ModelInstanceIndex instance) const override;
  int numBodies() const override;
  const std::string& bodyName(BodyIndex body) const override;
  ModelInstanceIndex bodyModelInstance(BodyIndex body) const override;

private:
  struct Body
  {
    std::string name;
    ModelInstanceIndex instance = WORLD_MODEL_INSTANCE;
    bool quaternion_dofs = false;
  };

  struct Instance
  {
    std::string name;
    std::vector<BodyIndex> bodies;
    std::vector<BodyIndex> free_bodies;
    int nq = 0;
    int nv = 0;
  };

  void addModel(const std::string& name, const tinyxml2::XMLElement* robot);

  const Instance& instance(ModelInstanceIndex index) const;
  const Body& body(BodyIndex index) const;

  std::vector<Body> bodies_;
  std::vector<Instance> instances_;
};

}  // namespace multibody
}  // namespace mbpi

#endif  // MBPI_MULTIBODY_URDF_TOPOLOGY_H_
