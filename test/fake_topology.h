#ifndef MBPI_TEST_FAKE_TOPOLOGY_H_
#define MBPI_TEST_FAKE_TOPOLOGY_H_

#include <string>
#include <vector>

#include <mbpi/errors.h>
#include <mbpi/multibody/topology.h>

namespace mbpi {
namespace test {

// Hand-assembled topology; instance 0 is the world with body 0 "world".
class FakeTopology : public multibody::MultibodyTopology
{
public:
  struct Body
  {
    std::string name;
    multibody::ModelInstanceIndex instance;
    bool quaternion = true;
  };

  struct Instance
  {
    std::string name;
    int nq = 0;
    int nv = 0;
    std::vector<multibody::BodyIndex> free_bodies;
  };

  FakeTopology()
  {
    instances.push_back({ "WorldModelInstance", 0, 0, {} });
    bodies_.push_back({ "world", 0, false });
  }

  multibody::ModelInstanceIndex addInstance(const std::string& name, int nq, int nv)
  {
    instances.push_back({ name, nq, nv, {} });
    return static_cast<int>(instances.size()) - 1;
  }

  multibody::BodyIndex addBody(multibody::ModelInstanceIndex instance, const std::string& name, bool free = false,
                               bool quaternion = true)
  {
    bodies_.push_back({ name, instance, quaternion });
    const int index = static_cast<int>(bodies_.size()) - 1;
    if (free)
      instances[instance].free_bodies.push_back(index);
    return index;
  }

  std::vector<multibody::ModelInstanceIndex> modelInstances() const override
  {
    std::vector<multibody::ModelInstanceIndex> out;
    for (int i = 0; i < static_cast<int>(instances.size()); ++i)
      out.push_back(i);
    return out;
  }

  const std::string& modelInstanceName(multibody::ModelInstanceIndex instance) const override
  {
    return instances.at(instance).name;
  }

  multibody::ModelInstanceIndex modelInstanceByName(const std::string& name) const override
  {
    for (int i = 0; i < static_cast<int>(instances.size()); ++i)
      if (instances[i].name == name)
        return i;
    throw LookupError("No model instance named '" + name + "'");
  }

  bool hasUniqueFreeBaseBody(multibody::ModelInstanceIndex instance) const override
  {
    return instances.at(instance).free_bodies.size() == 1;
  }

  multibody::BodyIndex uniqueFreeBaseBody(multibody::ModelInstanceIndex instance) const override
  {
    if (!hasUniqueFreeBaseBody(instance))
      throw ConfigurationError("Model instance '" + modelInstanceName(instance) + "' has no unique free body");
    return instances.at(instance).free_bodies.front();
  }

  bool hasQuaternionDofs(multibody::BodyIndex body) const override
  {
    return bodies_.at(body).quaternion;
  }

  int numPositions(multibody::ModelInstanceIndex instance) const override
  {
    return instances.at(instance).nq;
  }

  int numVelocities(multibody::ModelInstanceIndex instance) const override
  {
    return instances.at(instance).nv;
  }

  std::vector<multibody::BodyIndex> bodies(multibody::ModelInstanceIndex instance) const override
  {
    std::vector<multibody::BodyIndex> out;
    for (int i = 0; i < static_cast<int>(bodies_.size()); ++i)
      if (bodies_[i].instance == instance)
        out.push_back(i);
    return out;
  }

  int numBodies() const override
  {
    return static_cast<int>(bodies_.size());
  }

  const std::string& bodyName(multibody::BodyIndex body) const override
  {
    return bodies_.at(body).name;
  }

  multibody::ModelInstanceIndex bodyModelInstance(multibody::BodyIndex body) const override
  {
    return bodies_.at(body).instance;
  }

  std::vector<Instance> instances;

private:
  std::vector<Body> bodies_;
};

}  // namespace test
}  // namespace mbpi

#endif  // MBPI_TEST_FAKE_TOPOLOGY_H_
