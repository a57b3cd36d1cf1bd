#ifndef MBPI_MULTIBODY_BODY_REGISTRY_H_
#define MBPI_MULTIBODY_BODY_REGISTRY_H_

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <mbpi/multibody/topology.h>

namespace mbpi {
namespace multibody {

struct BodyIdentity
{
  BodyIndex body = WORLD_BODY;
  std::string id;  // "{model_instance_name}_{body_name}"
};

std::string uniqueBodyIdentifier(const std::string& model_instance_name, const std::string& body_name);
std::string uniqueBodyIdentifier(const MultibodyTopology& topology, BodyIndex body);

/**
 * Bodies of @p instances, in instance order then intrinsic body order.
 *
 * Parameter rows are aligned positionally to this sequence; it matches the
 * simulator's body indexing as long as @p instances is given in simulator order.
 *
 * @throws ConfigurationError if two bodies share the same identifier.
 */
std::vector<BodyIdentity> enumerateBodies(const MultibodyTopology& topology,
                                          const std::vector<ModelInstanceIndex>& instances);

/// enumerateBodies() without the world pseudo-instance.
std::vector<BodyIdentity> enumerateInertialBodies(const MultibodyTopology& topology,
                                                  const std::vector<ModelInstanceIndex>& instances);

std::vector<BodyIdentity> enumerateInertialBodies(const MultibodyTopology& topology);

/**
 * Ordered list of body identifiers where position == row index of the
 * parameter matrix.
 */
class BodyIdentifierList
{
public:
  BodyIdentifierList() = default;

  /// @throws ConfigurationError on duplicate identifiers.
  explicit BodyIdentifierList(std::vector<std::string> ids);
  explicit BodyIdentifierList(const std::vector<BodyIdentity>& bodies);

  std::size_t size() const
  {
    return ids_.size();
  }

  const std::string& at(std::size_t index) const
  {
    return ids_.at(index);
  }

  const std::vector<std::string>& ids() const
  {
    return ids_;
  }

  bool contains(const std::string& id) const;
  std::optional<std::size_t> indexOf(const std::string& id) const;

  /// @throws ConfigurationError at the first position where the two orderings differ.
  void verifyAlignment(const std::vector<std::string>& expected) const;

private:
  std::vector<std::string> ids_;
  std::unordered_map<std::string, std::size_t> index_;
};

}  // namespace multibody
}  // namespace mbpi

#endif  // MBPI_MULTIBODY_BODY_REGISTRY_H_
