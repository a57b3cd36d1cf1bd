#include <mbpi/multibody/urdf_topology.h>

#include <iostream>
#include <string>
#include <unordered_map>
#include <utility>

#include <mbpi/errors.h>
#include <mbpi/graph/kinematic_graph.h>
#include <mbpi/multibody/state_space.h>
#include <mbpi/xml/expression_parser.h>
#include <mbpi/xml/urdf_schema.h>
#include <mbpi/xml/utils.h>

namespace mbpi {
namespace multibody {

namespace {

struct JointDofs
{
  int nq = 0;
  int nv = 0;
};

JointDofs jointDofs(const std::string& type, const std::string& joint_name)
{
  if (type == "fixed")
    return { 0, 0 };
  if (type == "revolute" || type == "continuous" || type == "prismatic")
    return { 1, 1 };
  if (type == "planar")
    return { 3, 3 };
  if (type == "floating")
    return { FLOATING_BASE_POSITIONS, FLOATING_BASE_VELOCITIES };
  throw ConfigurationError("Joint '" + joint_name + "' has unsupported type '" + type + "'");
}

const char* childLinkName(const tinyxml2::XMLElement* joint, const char* which)
{
  const tinyxml2::XMLElement* elem = joint->FirstChildElement(which);
  return elem ? elem->Attribute(xml::attrs::LINK) : nullptr;
}

}  // namespace

UrdfMultibodyTopology::UrdfMultibodyTopology(const xml::UrdfTemplates& urdfs, const char* env_roots)
{
  bodies_.push_back(Body{ WORLD_BODY_NAME, WORLD_MODEL_INSTANCE, false });
  instances_.push_back(Instance{ WORLD_MODEL_INSTANCE_NAME, { WORLD_BODY }, {}, 0, 0 });

  for (const auto& [name, source] : urdfs)
  {
    for (const auto& existing : instances_)
      if (existing.name == name)
        throw ConfigurationError("Duplicate model instance name '" + name + "'");

    auto doc = xml::loadUrdfDocument(source, env_roots);
    addModel(name, doc->RootElement());
  }
}

void UrdfMultibodyTopology::addModel(const std::string& name, const tinyxml2::XMLElement* robot)
{
  const ModelInstanceIndex instance_index = static_cast<ModelInstanceIndex>(instances_.size());
  Instance inst;
  inst.name = name;

  // Links, in document order. "world" refers to the world body.
  std::vector<const tinyxml2::XMLElement*> links;
  xml::collectElements(robot, xml::tags::LINK, links);

  std::vector<std::string> link_names;
  std::unordered_map<std::string, int> local_index;
  for (const auto* link : links)
  {
    const std::string link_name = xml::evalTextAttributeRequired(link, xml::attrs::NAME);
    if (link_name == WORLD_BODY_NAME)
      continue;
    if (!local_index.emplace(link_name, static_cast<int>(link_names.size())).second)
      throw ConfigurationError("Model '" + name + "' declares link '" + link_name + "' twice");
    link_names.push_back(link_name);
  }

  std::vector<graph::KinematicGraph::Edge> edges;
  std::vector<bool> welded_to_world(link_names.size(), false);
  std::vector<bool> floating_from_world(link_names.size(), false);

  auto lookup = [&](const char* link_name, const std::string& joint_name) {
    if (!link_name)
      throw ConfigurationError("Joint '" + joint_name + "' of model '" + name + "' is missing a parent or child link");
    auto it = local_index.find(link_name);
    if (it == local_index.end())
      throw LookupError("Joint '" + joint_name + "' of model '" + name + "' references unknown link '" + link_name +
                        "'");
    return it->second;
  };

  std::vector<const tinyxml2::XMLElement*> joints;
  xml::collectElements(robot, xml::tags::JOINT, joints);
  for (const auto* joint : joints)
  {
    const std::string joint_name = xml::evalTextAttributeRequired(joint, xml::attrs::NAME);
    const std::string joint_type = xml::evalTextAttributeRequired(joint, xml::attrs::TYPE);
    const JointDofs dofs = jointDofs(joint_type, joint_name);

    const char* parent = childLinkName(joint, xml::tags::PARENT);
    const int child = lookup(childLinkName(joint, xml::tags::CHILD), joint_name);

    if (parent && std::string(parent) == WORLD_BODY_NAME)
    {
      if (welded_to_world[child])
        throw ConfigurationError("Link '" + link_names[child] + "' of model '" + name +
                                 "' is attached to world twice");
      welded_to_world[child] = true;
      floating_from_world[child] = joint_type == "floating";
    }
    else
    {
      edges.emplace_back(lookup(parent, joint_name), child);
    }

    inst.nq += dofs.nq;
    inst.nv += dofs.nv;
  }

  graph::KinematicGraph kinematic_graph(static_cast<int>(link_names.size()), std::move(edges));

  for (int v = 0; v < kinematic_graph.numVertices(); ++v)
  {
    const int parent_count = kinematic_graph.inDegree(v) + (welded_to_world[v] ? 1 : 0);
    if (parent_count > 1)
      throw ConfigurationError("Link '" + link_names[v] + "' of model '" + name + "' has " +
                               std::to_string(parent_count) + " parent joints");
  }

  std::vector<int> order;
  if (!kinematic_graph.topologicalOrder(order))
    throw ConfigurationError("Model '" + name + "' has a kinematic loop");

  std::vector<bool> free_body(link_names.size(), false);
  for (int root : kinematic_graph.roots())
  {
    if (welded_to_world[root])
    {
      // Floating joint to world: DOFs already counted with the joint.
      free_body[root] = floating_from_world[root];
      continue;
    }

    // Unattached root: implicit quaternion floating joint.
    free_body[root] = true;
    inst.nq += FLOATING_BASE_POSITIONS;
    inst.nv += FLOATING_BASE_VELOCITIES;
  }

  for (std::size_t i = 0; i < link_names.size(); ++i)
  {
    const BodyIndex body_index = static_cast<BodyIndex>(bodies_.size());
    bodies_.push_back(Body{ link_names[i], instance_index, free_body[i] });
    inst.bodies.push_back(body_index);
    if (free_body[i])
      inst.free_bodies.push_back(body_index);
  }

  if (inst.free_bodies.size() > 1)
    std::cerr << "[topology] model '" << name << "' has " << inst.free_bodies.size()
              << " unattached root links; its state space is not floating-base" << std::endl;

  instances_.push_back(std::move(inst));
}

const UrdfMultibodyTopology::Instance& UrdfMultibodyTopology::instance(ModelInstanceIndex index) const
{
  if (index < 0 || index >= static_cast<ModelInstanceIndex>(instances_.size()))
    throw LookupError("No model instance with index " + std::to_string(index));
  return instances_[index];
}

const UrdfMultibodyTopology::Body& UrdfMultibodyTopology::body(BodyIndex index) const
{
  if (index < 0 || index >= static_cast<BodyIndex>(bodies_.size()))
    throw LookupError("No body with index " + std::to_string(index));
  return bodies_[index];
}

std::vector<ModelInstanceIndex> UrdfMultibodyTopology::modelInstances() const
{
  std::vector<ModelInstanceIndex> out(instances_.size());
  for (std::size_t i = 0; i < out.size(); ++i)
    out[i] = static_cast<ModelInstanceIndex>(i);
  return out;
}

const std::string& UrdfMultibodyTopology::modelInstanceName(ModelInstanceIndex index) const
{
  return instance(index).name;
}

ModelInstanceIndex UrdfMultibodyTopology::modelInstanceByName(const std::string& name) const
{
  for (std::size_t i = 0; i < instances_.size(); ++i)
    if (instances_[i].name == name)
      return static_cast<ModelInstanceIndex>(i);
  throw LookupError("No model instance named '" + name + "'");
}

bool UrdfMultibodyTopology::hasUniqueFreeBaseBody(ModelInstanceIndex index) const
{
  return instance(index).free_bodies.size() == 1;
}

BodyIndex UrdfMultibodyTopology::uniqueFreeBaseBody(ModelInstanceIndex index) const
{
  const Instance& inst = instance(index);
  if (inst.free_bodies.size() != 1)
    throw ConfigurationError("Model instance '" + inst.name + "' has " + std::to_string(inst.free_bodies.size()) +
                             " free-base bodies, expected exactly one");
  return inst.free_bodies.front();
}

bool UrdfMultibodyTopology::hasQuaternionDofs(BodyIndex index) const
{
  return body(index).quaternion_dofs;
}

int UrdfMultibodyTopology::numPositions(ModelInstanceIndex index) const
{
  return instance(index).nq;
}

int UrdfMultibodyTopology::numVelocities(ModelInstanceIndex index) const
{
  return instance(index).nv;
}

std::vector<BodyIndex> UrdfMultibodyTopology::bodies(ModelInstanceIndex index) const
{
  return instance(index).bodies;
}

int UrdfMultibodyTopology::numBodies() const
{
  return static_cast<int>(bodies_.size());
}

const std::string& UrdfMultibodyTopology::bodyName(BodyIndex index) const
{
  return body(index).name;
}

ModelInstanceIndex UrdfMultibodyTopology::bodyModelInstance(BodyIndex index) const
{
  return body(index).instance;
}

}  // namespace multibody
}  // namespace mbpi
