#include <mbpi/multibody/body_registry.h>

#include <algorithm>
#include <iterator>
#include <string>

#include <mbpi/errors.h>

namespace mbpi {
namespace multibody {

std::string uniqueBodyIdentifier(const std::string& model_instance_name, const std::string& body_name)
{
  return model_instance_name + "_" + body_name;
}

std::string uniqueBodyIdentifier(const MultibodyTopology& topology, BodyIndex body)
{
  return uniqueBodyIdentifier(topology.modelInstanceName(topology.bodyModelInstance(body)), topology.bodyName(body));
}

std::vector<BodyIdentity> enumerateBodies(const MultibodyTopology& topology,
                                          const std::vector<ModelInstanceIndex>& instances)
{
  std::vector<BodyIdentity> out;
  std::unordered_map<std::string, BodyIndex> seen;

  for (ModelInstanceIndex instance : instances)
  {
    for (BodyIndex body : topology.bodies(instance))
    {
      BodyIdentity identity{ body, uniqueBodyIdentifier(topology, body) };

      auto [it, inserted] = seen.emplace(identity.id, body);
      if (!inserted)
        throw ConfigurationError("Body identifier '" + identity.id + "' is shared by bodies " +
                                 std::to_string(it->second) + " and " + std::to_string(body));

      out.push_back(std::move(identity));
    }
  }
  return out;
}

std::vector<BodyIdentity> enumerateInertialBodies(const MultibodyTopology& topology,
                                                  const std::vector<ModelInstanceIndex>& instances)
{
  std::vector<ModelInstanceIndex> inertial;
  std::copy_if(instances.begin(), instances.end(), std::back_inserter(inertial),
               [](ModelInstanceIndex i) { return i != WORLD_MODEL_INSTANCE; });
  return enumerateBodies(topology, inertial);
}

std::vector<BodyIdentity> enumerateInertialBodies(const MultibodyTopology& topology)
{
  return enumerateInertialBodies(topology, topology.modelInstances());
}

BodyIdentifierList::BodyIdentifierList(std::vector<std::string> ids) : ids_(std::move(ids))
{
  index_.reserve(ids_.size());
  for (std::size_t i = 0; i < ids_.size(); ++i)
  {
    if (!index_.emplace(ids_[i], i).second)
      throw ConfigurationError("Duplicate body identifier '" + ids_[i] + "' at rows " +
                               std::to_string(index_[ids_[i]]) + " and " + std::to_string(i));
  }
}

BodyIdentifierList::BodyIdentifierList(const std::vector<BodyIdentity>& bodies)
  : BodyIdentifierList([&bodies] {
    std::vector<std::string> ids;
    ids.reserve(bodies.size());
    for (const auto& b : bodies)
      ids.push_back(b.id);
    return ids;
  }())
{
}

bool BodyIdentifierList::contains(const std::string& id) const
{
  return index_.count(id) != 0;
}

std::optional<std::size_t> BodyIdentifierList::indexOf(const std::string& id) const
{
  auto it = index_.find(id);
  if (it == index_.end())
    return std::nullopt;
  return it->second;
}

void BodyIdentifierList::verifyAlignment(const std::vector<std::string>& expected) const
{
  const std::size_t n = std::min(ids_.size(), expected.size());
  for (std::size_t i = 0; i < n; ++i)
  {
    if (ids_[i] != expected[i])
      throw ConfigurationError("Body ordering mismatch at row " + std::to_string(i) + ": '" + ids_[i] +
                               "' vs expected '" + expected[i] + "'");
  }
  if (ids_.size() != expected.size())
    throw ConfigurationError("Body ordering mismatch: " + std::to_string(ids_.size()) + " identifiers vs " +
                             std::to_string(expected.size()) + " expected");
}

}  // namespace multibody
}  // namespace mbpi
