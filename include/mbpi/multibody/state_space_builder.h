#ifndef MBPI_MULTIBODY_STATE_SPACE_BUILDER_H_
#define MBPI_MULTIBODY_STATE_SPACE_BUILDER_H_

#include <vector>

#include <mbpi/multibody/state_space.h>
#include <mbpi/multibody/topology.h>

namespace mbpi {
namespace multibody {

/**
 * Infers the state space of one model instance under the one-chain-per-model
 * assumption: a FloatingBaseSpace if the instance has a unique free-base body,
 * a FixedBaseSpace otherwise.
 *
 * @throws ConfigurationError if the free-base body is not quaternion
 *         parameterized, or has fewer than 6 velocities.
 */
FactorSpace buildFactorSpace(const MultibodyTopology& topology, ModelInstanceIndex instance);

/**
 * Concatenates buildFactorSpace() over @p instances, in the given order.
 *
 * The caller supplies the instances in exactly the order the simulator lays out
 * its state vector (world first).
 */
ProductSpace buildStateSpace(const MultibodyTopology& topology, const std::vector<ModelInstanceIndex>& instances);

/// Same, over topology.modelInstances().
ProductSpace buildStateSpace(const MultibodyTopology& topology);

}  // namespace multibody
}  // namespace mbpi

#endif  // MBPI_MULTIBODY_STATE_SPACE_BUILDER_H_
