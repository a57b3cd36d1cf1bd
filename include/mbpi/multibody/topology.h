#ifndef MBPI_MULTIBODY_TOPOLOGY_H_
#define MBPI_MULTIBODY_TOPOLOGY_H_

#include <string>
#include <vector>

namespace mbpi {
namespace multibody {

using ModelInstanceIndex = int;
using BodyIndex = int;

// The world pseudo-instance always comes first and owns body 0 ("world").
constexpr ModelInstanceIndex WORLD_MODEL_INSTANCE = 0;
constexpr BodyIndex WORLD_BODY = 0;
constexpr const char* WORLD_BODY_NAME = "world";

/**
 * Read-only view of a multibody system's topology, as laid out by the
 * simulator that owns it.
 *
 * Orderings returned here are load-bearing: model instances come in the order
 * the simulator lays out its state vector, and bodies of an instance come in
 * the simulator's intrinsic body order.
 */
class MultibodyTopology
{
public:
  virtual ~MultibodyTopology() = default;

  /// All model instances, world first.
  virtual std::vector<ModelInstanceIndex> modelInstances() const = 0;

  virtual const std::string& modelInstanceName(ModelInstanceIndex instance) const = 0;

  /// @throws LookupError if no instance has this exact name.
  virtual ModelInstanceIndex modelInstanceByName(const std::string& name) const = 0;

  virtual bool hasUniqueFreeBaseBody(ModelInstanceIndex instance) const = 0;

  /// @throws ConfigurationError unless the instance has exactly one free-base body.
  virtual BodyIndex uniqueFreeBaseBody(ModelInstanceIndex instance) const = 0;

  /// True if the body's floating mobilizer is parameterized by a quaternion.
  virtual bool hasQuaternionDofs(BodyIndex body) const = 0;

  virtual int numPositions(ModelInstanceIndex instance) const = 0;
  virtual int numVelocities(ModelInstanceIndex instance) const = 0;

  /// Bodies of the instance in intrinsic order.
  virtual std::vector<BodyIndex> bodies(ModelInstanceIndex instance) const = 0;

  virtual int numBodies() const = 0;
  virtual const std::string& bodyName(BodyIndex body) const = 0;
  virtual ModelInstanceIndex bodyModelInstance(BodyIndex body) const = 0;

  // Totals over every instance.
  int totalPositions() const;
  int totalVelocities() const;
};

}  // namespace multibody
}  // namespace mbpi

#endif  // MBPI_MULTIBODY_TOPOLOGY_H_
