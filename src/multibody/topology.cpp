#include <mbpi/multibody/topology.h>

namespace mbpi {
namespace multibody {

int MultibodyTopology::totalPositions() const
{
  int nq = 0;
  for (ModelInstanceIndex instance : modelInstances())
    nq += numPositions(instance);
  return nq;
}

int MultibodyTopology::totalVelocities() const
{
  int nv = 0;
  for (ModelInstanceIndex instance : modelInstances())
    nv += numVelocities(instance);
  return nv;
}

}  // namespace multibody
}  // namespace mbpi
