#include <mbpi/multibody/state_space_builder.h>

#include <string>

#include <mbpi/errors.h>

namespace mbpi {
namespace multibody {

FactorSpace buildFactorSpace(const MultibodyTopology& topology, ModelInstanceIndex instance)
{
  const int nv = topology.numVelocities(instance);

  if (!topology.hasUniqueFreeBaseBody(instance))
    return FixedBaseSpace{ nv };

  // Throws if the free body is not unique after all.
  const BodyIndex free_body = topology.uniqueFreeBaseBody(instance);

  // Rotation must be a quaternion (not, e.g., roll-pitch-yaw mobilizers).
  if (!topology.hasQuaternionDofs(free_body))
    throw ConfigurationError("Free-base body '" + topology.bodyName(free_body) + "' of model instance '" +
                             topology.modelInstanceName(instance) + "' is not quaternion parameterized");

  if (nv < FLOATING_BASE_VELOCITIES)
    throw ConfigurationError("Model instance '" + topology.modelInstanceName(instance) + "' has a free-base body but " +
                             std::to_string(nv) + " velocities");

  return FloatingBaseSpace{ nv - FLOATING_BASE_VELOCITIES };
}

ProductSpace buildStateSpace(const MultibodyTopology& topology, const std::vector<ModelInstanceIndex>& instances)
{
  ProductSpace space;
  space.factors.reserve(instances.size());
  for (ModelInstanceIndex instance : instances)
    space.factors.push_back(buildFactorSpace(topology, instance));
  return space;
}

ProductSpace buildStateSpace(const MultibodyTopology& topology)
{
  return buildStateSpace(topology, topology.modelInstances());
}

}  // namespace multibody
}  // namespace mbpi
